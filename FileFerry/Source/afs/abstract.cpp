// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "abstract.h"
#include <algorithm>
#include <stdexcept>
#include <ferry/file_io.h>
#include <ferry/guid.h>

using namespace ferry;
using namespace ffy;


namespace
{
const char TEMP_FILE_ENDING[] = ".ffy_tmp";
}


OpenMode ffy::parseOpenMode(std::string_view mode)
{
    return
    {
        .isBinary = contains(mode, "b"),
        .canRead  = mode.empty() || startsWith(mode, "r"),
        .canWrite = startsWith(mode, "w") || startsWith(mode, "r+") || startsWith(mode, "a"),
        .replace  = startsWith(mode, "w"),
    };
}


OutputStream::OutputStream(std::unique_ptr<OutputStreamImpl>&& outStream, const std::string& displayPath) :
    outStream_(std::move(outStream)),
    displayPath_(displayPath) {}


void OutputStream::write(const void* buffer, size_t bytesToWrite) //throw FileError
{
    if (finalizeSucceeded_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    const char* it = static_cast<const char*>(buffer);
    const char* const itEnd = it + bytesToWrite;

    while (it != itEnd)
    {
        const size_t bytesWritten = outStream_->tryWrite(it, itEnd - it); //throw FileError; may return short! CONTRACT: bytesToWrite > 0
        if (bytesWritten == 0 || bytesWritten > static_cast<size_t>(itEnd - it))
            throw FileError(replaceCpy(L"Cannot write file %x.", L"%x", fmtPath(displayPath_)),
                            formatSystemError("OutputStreamImpl::tryWrite", L"", L"Unexpected number of bytes processed."));
        it += bytesWritten;
        bytesWritten_ += bytesWritten;
    }
}


void OutputStream::finalize() //throw FileError
{
    outStream_->finalize(); //throw FileError
    finalizeSucceeded_ = true;
}


uint64_t ffy::copyStream(InputStream& streamIn, OutputStream& streamOut) //throw FileError
{
    const size_t blockSize = std::max(streamIn.getBlockSize(), streamOut.getBlockSize()); //throw FileError
    std::vector<char> buffer(blockSize);
    uint64_t totalBytes = 0;

    for (;;)
    {
        const size_t bytesRead = streamIn.tryRead(buffer.data(), buffer.size()); //throw FileError; may return short, only 0 means EOF!
        if (bytesRead == 0)
            return totalBytes;

        streamOut.write(buffer.data(), bytesRead); //throw FileError
        totalBytes += bytesRead;
    }
}

//------------------------------------------------------------------------------------------------------

std::unique_ptr<InputStream> FileBackend::openInput(const std::string& path, const std::string& mode, StepCallback& cb) //throw FileError, UnsupportedModeError, ConnectionError
{
    const OpenMode om = parseOpenMode(mode);

    if (om.canRead && om.canWrite)
        throw UnsupportedModeError(L"Cannot open a read/write stream.", replaceCpy(L"Mode: %x", L"%x", fmtPath(mode)));

    if (!om.canRead)
        throw UnsupportedModeError(replaceCpy(L"Cannot open file %x for reading.", L"%x", fmtPath(path)), replaceCpy(L"Mode: %x", L"%x", fmtPath(mode)));

    return openInputImpl(path, cb); //throw FileError, ConnectionError
}


std::unique_ptr<OutputStream> FileBackend::openOutput(const std::string& path, const std::string& mode, StepCallback& cb) //throw FileError, UnsupportedModeError, ConnectionError
{
    const OpenMode om = parseOpenMode(mode);

    if (om.canRead && om.canWrite)
        throw UnsupportedModeError(L"Cannot open a read/write stream.", replaceCpy(L"Mode: %x", L"%x", fmtPath(mode)));

    if (!om.canWrite)
        throw UnsupportedModeError(replaceCpy(L"Cannot open file %x for writing.", L"%x", fmtPath(path)), replaceCpy(L"Mode: %x", L"%x", fmtPath(mode)));

    const bool append = !om.replace;
    if (append && !supportsAppend())
        throw UnsupportedModeError(replaceCpy(L"Cannot append to a file over %x.", L"%x", protocolName_), replaceCpy(L"Mode: %x", L"%x", fmtPath(mode)));

    return std::make_unique<OutputStream>(openOutputImpl(path, append, cb) /*throw FileError, ConnectionError*/, path);
}


void FileBackend::download(const std::string& remotePath, const std::string& localPath, bool replace, StepCallback& cb) //throw FileError, AlreadyExistsError, ConnectionError
{
    if (!replace && itemExists(localPath)) //throw FileError
        throw AlreadyExistsError(replaceCpy(L"Cannot download to %x.", L"%x", fmtPath(localPath)), L"The item already exists.");

    downloadImpl(remotePath, localPath, cb); //throw FileError, ConnectionError
}


void FileBackend::downloadFolder(const std::string& remotePath, const std::string& localPath, bool replace, StepCallback& cb) //throw FileError, AlreadyExistsError, ConnectionError
{
    if (const std::optional<ItemType> type = getItemTypeIfExists(localPath)) //throw FileError
    {
        if (!replace)
            throw AlreadyExistsError(replaceCpy(L"Cannot download to %x.", L"%x", fmtPath(localPath)), L"The item already exists.");

        //replace, don't merge
        if (*type == ItemType::folder)
            removeDirectoryPlainRecursion(localPath); //throw FileError
        else
            removeFilePlain(localPath); //throw FileError
    }

    downloadFolderImpl(remotePath, localPath, cb); //throw FileError, ConnectionError
}


void FileBackend::upload(const std::string& localPath, const std::string& remotePath, bool replace, StepCallback& cb) //throw FileError, AlreadyExistsError, ConnectionError
{
    if (!replace && fileExistsImpl(remotePath, cb)) //throw FileError, ConnectionError
        throw AlreadyExistsError(replaceCpy(L"Cannot upload to %x.", L"%x", fmtPath(remotePath)), L"The item already exists.");

    uploadImpl(localPath, remotePath, cb); //throw FileError, ConnectionError
}


void FileBackend::deleteItem(const std::string& path, StepCallback& cb) //throw FileError, ConnectionError
{
    deleteItemImpl(path, cb); //throw FileError, ConnectionError
}


bool FileBackend::fileExists(const std::string& path, StepCallback& cb) //throw FileError, ConnectionError
{
    return fileExistsImpl(path, cb); //throw FileError, ConnectionError
}


bool FileBackend::folderExists(const std::string& path, StepCallback& cb) //throw FileError, ConnectionError
{
    return folderExistsImpl(path, cb); //throw FileError, ConnectionError
}


void FileBackend::createLocalFolderLogged(const std::string& folderPath, StepCallback& cb) //throw FileError
{
    cb.logInfo(replaceCpy(L"Creating the folder %x, if it does not exist", L"%x", fmtPath(folderPath)));

    if (const std::optional<ItemType> type = getItemTypeIfExists(folderPath)) //throw FileError
    {
        if (*type == ItemType::file)
            throw FileError(replaceCpy(L"Cannot create directory %x.", L"%x", fmtPath(folderPath)), L"A file with the same name already exists.");

        cb.logInfo(L"Already existed.");
    }
    else
    {
        createDirectoryIfMissingRecursion(folderPath); //throw FileError
        cb.logInfo(L"Created!");
    }
}


void ffy::writeFileTransactional(const std::string& filePath, //throw FileError, X
                                 const std::function<void(const std::string& tmpFilePath)>& writeFile /*throw FileError, X*/)
{
    //short random tag: avoid collisions with concurrent writers of the same target
    const std::string tmpFilePath = filePath + '.' + generateShortGuidTag() + TEMP_FILE_ENDING;

    FERRY_ON_SCOPE_FAIL(try
    {
        if (itemExists(tmpFilePath)) //throw FileError
            removeFilePlain(tmpFilePath); //throw FileError
    }
    catch (const FileError& e) { logExtraError(e.toString()); });

    writeFile(tmpFilePath); //throw FileError, X

    moveAndRenameItem(tmpFilePath, filePath); //throw FileError; replaces existing file atomically
}


void FileBackend::streamToLocalFile(InputStream& streamIn, const std::string& localPath) //throw FileError
{
    FileOutputPlain fileOut(localPath, FileOutputMode::truncate); //throw FileError

    std::vector<char> buffer(std::max(streamIn.getBlockSize(), fileOut.getBlockSize())); //throw FileError
    for (;;)
    {
        const size_t bytesRead = streamIn.tryRead(buffer.data(), buffer.size()); //throw FileError
        if (bytesRead == 0)
            break;
        writeAll(fileOut, buffer.data(), bytesRead); //throw FileError
    }
    fileOut.close(); //throw FileError
}


void FileBackend::streamFromLocalFile(const std::string& localPath, OutputStream& streamOut) //throw FileError
{
    FileInputPlain fileIn(localPath); //throw FileError

    std::vector<char> buffer(std::max(fileIn.getBlockSize(), streamOut.getBlockSize())); //throw FileError
    for (;;)
    {
        const size_t bytesRead = fileIn.tryRead(buffer.data(), buffer.size()); //throw FileError
        if (bytesRead == 0)
            break;
        streamOut.write(buffer.data(), bytesRead); //throw FileError
    }
    streamOut.finalize(); //throw FileError
}

//------------------------------------------------------------------------------------------------------

std::vector<std::string> ffy::matchListedItems(const std::vector<ListedItem>& items, const std::string& namePattern, bool matchFolders, StepCallback& cb)
{
    std::vector<std::string> matches;
    for (const ListedItem& item : items)
        if (item.isFolder == matchFolders && matchesWildcard(item.itemName, namePattern))
            matches.push_back(item.itemName);

    std::wstring matchList;
    for (const std::string& itemName : matches)
        matchList += (matchList.empty() ? L"" : L", ") + fmtPath(itemName);

    cb.logInfo(L"Found the following files: [" + matchList + L']');
    return matches;
}


void ffy::checkItemName(const std::string& itemName) //throw FileError
{
    if (itemName.empty() || itemName == "." || itemName == ".." || contains(itemName, "/"))
        throw FileError(replaceCpy(L"Invalid item name %x.", L"%x", fmtPath(itemName)),
                        L"The name must not be empty, \".\" or \"..\" and must not contain a path separator.");
}


std::string ffy::appendRelPathChecked(const std::string& folderPath, const std::string& relPath) //throw FileError
{
    for (const std::string& itemName : split(relPath, "/", SplitOnEmpty::allow))
        if (itemName.empty() || itemName == "." || itemName == "..")
            throw FileError(replaceCpy(replaceCpy(L"Cannot store %x below %y.", L"%x", fmtPath(relPath)), L"%y", fmtPath(folderPath)),
                            L"The path must not contain empty, \".\" or \"..\" components.");

    return appendPath(folderPath, relPath);
}


std::pair<std::string, std::string> ffy::splitParentAndName(const std::string& itemPath)
{
    const std::string path = removeTrailingSeparators(itemPath);

    if (const std::optional<std::string> parentPath = getParentFolderPath(path))
        return {*parentPath, getItemName(path)};

    return {"", path};
}
