// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "transfer.h"
#include <ferry/process_exec.h>
#include "../afs/abstract_impl.h"

using namespace ferry;
using namespace ffy;


namespace
{
std::wstring getTransferErrorMsg(const Endpoint& source, const Endpoint& dest)
{
    return replaceCpy(replaceCpy(L"Cannot transfer %x to %y.", L"%x", fmtPath(source.path)), L"%y", fmtPath(dest.path));
}


std::unique_ptr<InputStream> openSource(FileBackend& backend, const Endpoint& source, StepCallback& cb) //throw FileError
{
    cb.logInfo(formatEndpointMsg(L"Opening file %x on %y source %z.", source));
    return backend.openInput(source.path, "rb", cb); //throw FileError
}


std::unique_ptr<OutputStream> openDest(FileBackend& backend, const Endpoint& dest, StepCallback& cb) //throw FileError
{
    cb.logInfo(formatEndpointMsg(L"Opening file %x on %y dest %z.", dest));
    return backend.openOutput(dest.path, "w", cb); //throw FileError
}
}


TransferStep::TransferStep(const std::shared_ptr<const BackendRegistry>& backends, const Endpoint& source, const Endpoint& dest) : //throw FileError
    backends_(backends),
    source_(source),
    dest_(dest)
{
    checkEndpointType(backends_.get(), source_); //throw FileError
    checkEndpointType(backends_.get(), dest_);   //
}


void TransferStep::execute(StepCallback& cb) const //throw TransferError
{
    runStep(cb, [&]
    {
        try
        {
            //backends must outlive their streams
            const std::unique_ptr<FileBackend> sourceBackend = backends_->create(source_.typeTag, source_.connectionId); //throw FileError
            const std::unique_ptr<FileBackend> destBackend   = backends_->create(dest_  .typeTag, dest_  .connectionId); //

            const std::unique_ptr<InputStream>  streamIn  = openSource(*sourceBackend, source_, cb); //throw FileError
            const std::unique_ptr<OutputStream> streamOut = openDest  (*destBackend,   dest_,   cb); //throw FileError

            cb.logInfo(L"Transferring data from source to destination.");
            copyStream(*streamIn, *streamOut); //throw FileError
            streamOut->finalize();             //
        }
        catch (const FileError& e) { throw TransferError(getTransferErrorMsg(source_, dest_), e.toString()); }
    }); //throw TransferError
}

//------------------------------------------------------------------------------------------------------

TransformStep::TransformStep(const std::shared_ptr<const BackendRegistry>& backends, const Endpoint& source, const Endpoint& dest, const TransformCommand& command) : //throw FileError
    backends_(backends),
    source_(source),
    dest_(dest),
    command_(command)
{
    checkEndpointType(backends_.get(), source_); //throw FileError
    checkEndpointType(backends_.get(), dest_);   //

    if (command_.argv.empty() || command_.argv[0].empty())
        throw FileError(L"Transform command is missing.");

    if (command_.timeoutSec && *command_.timeoutSec <= 0)
        throw FileError(replaceCpy(L"Invalid transform timeout: %x seconds.", L"%x", numberTo<std::wstring>(*command_.timeoutSec)));
}


std::vector<std::string> TransformStep::getCommandLine(const std::string& sourceTmpPath, const std::string& outputTmpPath) const
{
    std::vector<std::string> argv = command_.argv;

    if (!command_.useStdin)
        argv.push_back(sourceTmpPath);

    if (!command_.useStdout)
        argv.push_back(outputTmpPath);

    return argv;
}


void TransformStep::execute(StepCallback& cb) const //throw TransformError, TransferError, TempResourceError
{
    runStep(cb, [&]
    {
        std::unique_ptr<FileBackend> sourceBackend;
        std::unique_ptr<FileBackend> destBackend;
        try
        {
            sourceBackend = backends_->create(source_.typeTag, source_.connectionId); //throw FileError
            destBackend   = backends_->create(dest_  .typeTag, dest_  .connectionId); //
        }
        catch (const FileError& e) { throw TransferError(getTransferErrorMsg(source_, dest_), e.toString()); }

        //1. source => temp file
        const TempFile sourceTmp = TempFile::create("ffy_transform_in_"); //throw TempResourceError
        try
        {
            const std::unique_ptr<InputStream> streamIn = openSource(*sourceBackend, source_, cb); //throw FileError

            cb.logInfo(replaceCpy(L"Dumping source data to a file: %x", L"%x", fmtPath(sourceTmp.getPath())));

            OutputStream streamOut(std::make_unique<LocalOutputStream>(sourceTmp.getPath(), FileOutputMode::truncate), sourceTmp.getPath()); //throw FileError
            copyStream(*streamIn, streamOut); //throw FileError
            streamOut.finalize();             //
        }
        catch (const FileError& e) { throw TransferError(getTransferErrorMsg(source_, dest_), e.toString()); }

        //2. run the command
        const TempFile outputTmp = TempFile::create("ffy_transform_out_"); //throw TempResourceError

        const std::vector<std::string> argv = getCommandLine(sourceTmp.getPath(), outputTmp.getPath());

        std::string cmdLine;
        for (const std::string& arg : argv)
            cmdLine += (cmdLine.empty() ? "" : " ") + arg;

        cb.logInfo(L"Running the transformation script command: " + utfTo<std::wstring>(cmdLine));

        ProcessStreams streams;
        if (command_.useStdin)
            streams.stdinFilePath = sourceTmp.getPath();
        if (command_.useStdout)
            streams.stdoutFilePath = outputTmp.getPath();

        const std::wstring errorMsg = replaceCpy(L"Transform script %x failed.", L"%x", fmtPath(argv[0]));
        try
        {
            const ProcessResult result = processExecute(argv, streams, command_.timeoutSec ? std::optional<int>(*command_.timeoutSec * 1000) : std::nullopt); //throw SysError, SysErrorTimeOut

            if (result.exitCode != 0)
                throw TransformError(errorMsg, replaceCpy(L"Exit code %x", L"%x", numberTo<std::wstring>(result.exitCode)) +
                                     (trimCpy(result.stdErr).empty() ? L"" : L"\n" + trimCpy(utfTo<std::wstring>(result.stdErr))));
        }
        catch (const SysErrorTimeOut& e)
        {
            throw TransformError(errorMsg, replaceCpy(L"Operation timed out after %x seconds.", L"%x", numberTo<std::wstring>(*command_.timeoutSec)) + L"\n" + e.toString());
        }
        catch (const SysError& e) { throw TransformError(errorMsg, e.toString()); }

        cb.logInfo(replaceCpy(L"Transform script successful. Output temporarily located at %x", L"%x", fmtPath(outputTmp.getPath())));

        //3. temp file => destination
        try
        {
            LocalInputStream streamIn(outputTmp.getPath()); //throw FileError

            const std::unique_ptr<OutputStream> streamOut = openDest(*destBackend, dest_, cb); //throw FileError

            cb.logInfo(L"Transferring transformed data to destination.");
            copyStream(streamIn, *streamOut); //throw FileError
            streamOut->finalize();            //
        }
        catch (const FileError& e) { throw TransferError(getTransferErrorMsg(source_, dest_), e.toString()); }
    }); //throw TransformError, TransferError, TempResourceError
}
