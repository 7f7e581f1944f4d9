// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "native.h"
#include <algorithm>
#include <ferry/file_traverser.h>
#include "abstract_impl.h"
    #include <sys/stat.h>

using namespace ferry;
using namespace ffy;


namespace
{
//follows symlinks; none if not existing (or a dangling symlink)
std::optional<ItemType> getTargetItemTypeIfExists(const std::string& itemPath) //throw FileError
{
    struct stat fileInfo = {};
    if (::stat(itemPath.c_str(), &fileInfo) != 0)
    {
        const ErrorCode ec = getLastError();
        if (ec == ENOENT || ec == ENOTDIR)
            return std::nullopt;
        throw FileError(replaceCpy(L"Cannot read file attributes of %x.", L"%x", fmtPath(itemPath)), formatSystemError("stat", ec));
    }
    return S_ISDIR(fileInfo.st_mode) ? ItemType::folder : ItemType::file;
}


void copyFileContent(const std::string& sourcePath, const std::string& targetPath) //throw FileError
{
    FileInputPlain fileIn(sourcePath); //throw FileError
    FileOutputPlain fileOut(targetPath, FileOutputMode::truncate); //throw FileError

    std::vector<char> buffer(std::max(fileIn.getBlockSize(), fileOut.getBlockSize())); //throw FileError
    for (;;)
    {
        const size_t bytesRead = fileIn.tryRead(buffer.data(), buffer.size()); //throw FileError
        if (bytesRead == 0)
            break;
        writeAll(fileOut, buffer.data(), bytesRead); //throw FileError
    }
    fileOut.close(); //throw FileError
}


void copyFolderContent(const std::string& sourcePath, const std::string& targetPath) //throw FileError
{
    std::vector<std::pair<std::string, std::string>> files;
    std::vector<std::pair<std::string, std::string>> folders;

    traverseFolder(sourcePath,
    [&](const FileInfo&   fi) { files  .emplace_back(fi.fullPath, appendPath(targetPath, fi.itemName)); },
    [&](const FolderInfo& fi) { folders.emplace_back(fi.fullPath, appendPath(targetPath, fi.itemName)); },
    [&](const SymlinkInfo& si) //copy the symlink's target, not the link
    {
        if (const std::optional<ItemType> type = getTargetItemTypeIfExists(si.fullPath)) //throw FileError
            (*type == ItemType::folder ? folders : files).emplace_back(si.fullPath, appendPath(targetPath, si.itemName));
        else
            throw FileError(replaceCpy(L"Cannot resolve symbolic link %x.", L"%x", fmtPath(si.fullPath)));
    }); //throw FileError

    for (const auto& [sourceFilePath, targetFilePath] : files)
        copyFileContent(sourceFilePath, targetFilePath); //throw FileError

    for (const auto& [sourceFolderPath, targetFolderPath] : folders)
    {
        createDirectory(targetFolderPath); //throw FileError, ErrorTargetExisting
        copyFolderContent(sourceFolderPath, targetFolderPath); //throw FileError
    }
}

//------------------------------------------------------------------------------------------------------

class LocalBackend : public FileBackend
{
public:
    explicit LocalBackend(const std::string& connectionId) : FileBackend("local", connectionId, L"local disk") {}

private:
    bool supportsAppend() const override { return true; }

    std::unique_ptr<InputStream> openInputImpl(const std::string& path, StepCallback& cb) override //throw FileError
    {
        return std::make_unique<LocalInputStream>(path); //throw FileError
    }

    std::unique_ptr<OutputStreamImpl> openOutputImpl(const std::string& path, bool append, StepCallback& cb) override //throw FileError
    {
        return std::make_unique<LocalOutputStream>(path, append ? FileOutputMode::append : FileOutputMode::truncate); //throw FileError
    }

    void downloadImpl(const std::string& remotePath, const std::string& localPath, StepCallback& cb) override //throw FileError
    {
        copyLocalFile(remotePath, localPath); //throw FileError
    }

    void downloadFolderImpl(const std::string& remotePath, const std::string& localPath, StepCallback& cb) override //throw FileError
    {
        copyLocalFolder(remotePath, localPath); //throw FileError
    }

    void uploadImpl(const std::string& localPath, const std::string& remotePath, StepCallback& cb) override //throw FileError
    {
        copyLocalFile(localPath, remotePath); //throw FileError
    }

    void deleteItemImpl(const std::string& path, StepCallback& cb) override //throw FileError
    {
        switch (getItemType(path)) //throw FileError
        {
            case ItemType::folder:
                removeDirectoryPlainRecursion(path); //throw FileError
                break;
            case ItemType::symlink:
                removeSymlinkPlain(path); //throw FileError
                break;
            case ItemType::file:
                removeFilePlain(path); //throw FileError
                break;
        }
    }

    bool fileExistsImpl(const std::string& path, StepCallback& cb) override //throw FileError
    {
        return itemExistsAs(path, false /*matchFolders*/, cb); //throw FileError
    }

    bool folderExistsImpl(const std::string& path, StepCallback& cb) override //throw FileError
    {
        return itemExistsAs(path, true /*matchFolders*/, cb); //throw FileError
    }

    //literal paths: exact stat; wildcards in the item name: match the parent folder's listing
    static bool itemExistsAs(const std::string& path, bool matchFolders, StepCallback& cb) //throw FileError
    {
        const auto& [parentPath, itemName] = splitParentAndName(path);

        if (!hasWildcard(itemName))
        {
            const std::optional<ItemType> type = getTargetItemTypeIfExists(path); //throw FileError
            return type && (*type == ItemType::folder) == matchFolders;
        }

        const std::string folderPath = parentPath.empty() ? "." : parentPath;
        if (getTargetItemTypeIfExists(folderPath) != ItemType::folder) //throw FileError
            return false;

        std::vector<ListedItem> items;
        traverseFolder(folderPath,
        [&](const FileInfo&   fi) { items.push_back({fi.itemName, false}); },
        [&](const FolderInfo& fi) { items.push_back({fi.itemName, true }); },
        [&](const SymlinkInfo& si)
        {
            if (const std::optional<ItemType> type = getTargetItemTypeIfExists(si.fullPath)) //throw FileError
                items.push_back({si.itemName, *type == ItemType::folder});
        }); //throw FileError

        return !matchListedItems(items, itemName, matchFolders, cb).empty();
    }
};
}


std::unique_ptr<FileBackend> ffy::createLocalBackend(const std::string& connectionId)
{
    return std::make_unique<LocalBackend>(connectionId);
}


void ffy::copyLocalFile(const std::string& sourcePath, const std::string& targetPath) //throw FileError
{
    writeFileTransactional(targetPath, [&](const std::string& tmpFilePath)
    {
        copyFileContent(sourcePath, tmpFilePath); //throw FileError
    }); //throw FileError
}


void ffy::copyLocalFolder(const std::string& sourcePath, const std::string& targetPath) //throw FileError
{
    if (getTargetItemTypeIfExists(sourcePath) != ItemType::folder) //throw FileError
        throw FileError(replaceCpy(L"Cannot open directory %x.", L"%x", fmtPath(sourcePath)), L"The folder does not exist.");

    if (const std::optional<std::string> parentPath = getParentFolderPath(targetPath))
        createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    createDirectory(targetPath); //throw FileError, ErrorTargetExisting

    FERRY_ON_SCOPE_FAIL(try { removeDirectoryPlainRecursion(targetPath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    copyFolderContent(sourcePath, targetPath); //throw FileError
}
