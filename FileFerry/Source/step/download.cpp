// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "download.h"

using namespace ferry;
using namespace ffy;


namespace
{
const char tempDownloadPrefix[] = "ffy_download_";


std::wstring formatDownloadMsg(const std::wstring& msgTemplate, const Endpoint& source, const std::string& localPath)
{
    return replaceCpy(formatEndpointMsg(msgTemplate, source), L"%w", fmtPath(localPath));
}
}


FileDownloadStep::FileDownloadStep(const std::shared_ptr<const BackendRegistry>& backends, const Endpoint& source, const std::optional<std::string>& destPath) : //throw FileError
    backends_(backends),
    source_(source),
    destPath_(destPath)
{
    checkEndpointType(backends_.get(), source_); //throw FileError
}


std::string FileDownloadStep::execute(StepCallback& cb) const //throw FileError, ConnectionError, TempResourceError
{
    return runStep(cb, [&]
    {
        const std::unique_ptr<FileBackend> backend = backends_->create(source_.typeTag, source_.connectionId); //throw FileError

        TempFile tmpFile; //before any network I/O
        if (!destPath_)
        {
            tmpFile = TempFile::create(tempDownloadPrefix); //throw TempResourceError
            cb.logInfo(replaceCpy(L"Created a temporary file for download at %x", L"%x", fmtPath(tmpFile.getPath())));
        }
        const std::string localPath = destPath_ ? *destPath_ : tmpFile.getPath();

        cb.logInfo(formatDownloadMsg(L"Downloading file %x from %y source %z to local file %w.", source_, localPath));

        backend->download(source_.path, localPath, true /*replace*/, cb); //throw FileError, ConnectionError

        tmpFile.release(); //caller owns it now
        return localPath;
    }); //throw FileError, ConnectionError, TempResourceError
}

//------------------------------------------------------------------------------------------------------

FolderDownloadStep::FolderDownloadStep(const std::shared_ptr<const BackendRegistry>& backends, const Endpoint& source, const std::optional<std::string>& destPath) : //throw FileError
    backends_(backends),
    source_(source),
    destPath_(destPath)
{
    checkEndpointType(backends_.get(), source_); //throw FileError
}


std::string FolderDownloadStep::execute(StepCallback& cb) const //throw FileError, ConnectionError, TempResourceError
{
    return runStep(cb, [&]
    {
        const std::unique_ptr<FileBackend> backend = backends_->create(source_.typeTag, source_.connectionId); //throw FileError

        TempFolder tmpFolder;
        if (!destPath_)
        {
            tmpFolder = TempFolder::create(tempDownloadPrefix); //throw TempResourceError
            cb.logInfo(replaceCpy(L"Created a temporary folder for download at %x", L"%x", fmtPath(tmpFolder.getPath())));
        }
        const std::string localPath = destPath_ ? *destPath_ : tmpFolder.getPath();

        cb.logInfo(formatDownloadMsg(L"Downloading folder %x from %y source %z to local folder %w.", source_, localPath));

        backend->downloadFolder(source_.path, localPath, true /*replace*/, cb); //throw FileError, ConnectionError

        tmpFolder.release();
        return localPath;
    }); //throw FileError, ConnectionError, TempResourceError
}
