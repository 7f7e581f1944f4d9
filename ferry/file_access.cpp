// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "file_access.h"
#include <algorithm>
#include "file_traverser.h"
    #include <cstdio>    //rename, P_tmpdir
    #include <sys/stat.h>
    #include <unistd.h>

using namespace ferry;


namespace
{
struct SysErrorCode : public ferry::SysError
{
    SysErrorCode(const std::string& functionName, ErrorCode ec) : SysError(formatSystemError(functionName, ec)), errorCode(ec) {}

    const ErrorCode errorCode;
};


ItemType getItemTypeImpl(const std::string& itemPath) //throw SysErrorCode
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
        throw SysErrorCode("lstat", errno);

    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    if (S_ISDIR(itemInfo.st_mode))
        return ItemType::folder;
    return ItemType::file; //S_ISREG || S_ISCHR || S_ISBLK || S_ISFIFO || S_ISSOCK
}
}


ItemType ferry::getItemType(const std::string& itemPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysErrorCode
    }
    catch (const SysError& e) { throw FileError(replaceCpy(L"Cannot read file attributes of %x.", L"%x", fmtPath(itemPath)), e.toString()); }
}


std::optional<ItemType> ferry::getItemTypeIfExists(const std::string& itemPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysErrorCode
    }
    catch (const SysErrorCode& e)
    {
        //ENOTDIR: some parent component is a file => item cannot exist either
        if (e.errorCode == ENOENT || e.errorCode == ENOTDIR)
            return std::nullopt;

        throw FileError(replaceCpy(L"Cannot read file attributes of %x.", L"%x", fmtPath(itemPath)), e.toString());
    }
}


uint64_t ferry::getFileSize(const std::string& filePath) //throw FileError
{
    struct stat fileInfo = {};
    if (::stat(filePath.c_str(), &fileInfo) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(L"Cannot read file attributes of %x.", L"%x", fmtPath(filePath)), "stat");

    return fileInfo.st_size;
}


std::string ferry::getTempFolderPath() //throw FileError
{
    if (const std::optional<std::string> tempDirPath = getEnvironmentVar("TMPDIR"))
        if (!tempDirPath->empty())
            return removeTrailingSeparators(*tempDirPath);

    return P_tmpdir; //usually resolves to "/tmp"
}


void ferry::removeFilePlain(const std::string& filePath) //throw FileError
{
    try
    {
        if (::unlink(filePath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("unlink");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(L"Cannot delete file %x.", L"%x", fmtPath(filePath)), e.toString()); }
}


void ferry::removeDirectoryPlain(const std::string& dirPath) //throw FileError
{
    try
    {
        if (::rmdir(dirPath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("rmdir");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(L"Cannot delete directory %x.", L"%x", fmtPath(dirPath)), e.toString()); }
}


void ferry::removeSymlinkPlain(const std::string& linkPath) //throw FileError
{
    try
    {
        if (::unlink(linkPath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("unlink");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(L"Cannot delete symbolic link %x.", L"%x", fmtPath(linkPath)), e.toString()); }
}


namespace
{
void removeDirectoryImpl(const std::string& folderPath) //throw FileError
{
    std::vector<std::string> folderPaths;
    {
        std::vector<std::string> filePaths;
        std::vector<std::string> symlinkPaths;

        //get all files and directories from current directory (WITHOUT subdirectories!)
        traverseFolder(folderPath,
        [&](const    FileInfo& fi) {    filePaths.push_back(fi.fullPath); },
        [&](const  FolderInfo& fi) {  folderPaths.push_back(fi.fullPath); },
        [&](const SymlinkInfo& si) { symlinkPaths.push_back(si.fullPath); }); //throw FileError

        for (const std::string& filePath : filePaths)
            removeFilePlain(filePath); //throw FileError

        for (const std::string& symlinkPath : symlinkPaths)
            removeSymlinkPlain(symlinkPath); //throw FileError
    }

    for (const std::string& subFolderPath : folderPaths)
        removeDirectoryImpl(subFolderPath); //throw FileError

    removeDirectoryPlain(folderPath); //throw FileError
}
}


void ferry::removeDirectoryPlainRecursion(const std::string& dirPath) //throw FileError
{
    try
    {
        if (getItemTypeImpl(dirPath) == ItemType::symlink) //throw SysErrorCode
            removeSymlinkPlain(dirPath); //throw FileError
        else
            removeDirectoryImpl(dirPath); //throw FileError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(L"Cannot delete directory %x.", L"%x", fmtPath(dirPath)), e.toString()); }
}


void ferry::moveAndRenameItem(const std::string& pathFrom, const std::string& pathTo) //throw FileError
{
    if (::rename(pathFrom.c_str(), pathTo.c_str()) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(replaceCpy(L"Cannot move %x to %y.", L"%x", fmtPath(pathFrom)), L"%y", fmtPath(pathTo)), "rename");
}


void ferry::createDirectory(const std::string& dirPath) //throw FileError, ErrorTargetExisting
{
    try
    {
        const std::string dirName = getItemName(dirPath);
        if (std::all_of(dirName.begin(), dirName.end(), [](char c) { return c == '.'; }))
        /**/throw SysError(replaceCpy(L"Invalid folder name %x.", L"%x", fmtPath(dirName)));

        const mode_t mode = S_IRWXU | S_IRWXG | S_IRWXO; //0777 => consider umask!

        if (::mkdir(dirPath.c_str(), mode) != 0)
        {
            const int ec = errno; //copy before directly or indirectly making other system calls!
            if (ec == EEXIST)
                throw ErrorTargetExisting(replaceCpy(L"Cannot create directory %x.", L"%x", fmtPath(dirPath)), formatSystemError("mkdir", ec));
            THROW_LAST_SYS_ERROR("mkdir");
        }
    }
    catch (const SysError& e) { throw FileError(replaceCpy(L"Cannot create directory %x.", L"%x", fmtPath(dirPath)), e.toString()); }
}


void ferry::createDirectoryIfMissingRecursion(const std::string& dirPath) //throw FileError
{
    //find first existing parent folder (backwards iteration)
    std::string dirPathEx = removeTrailingSeparators(dirPath);
    std::vector<std::string> dirNames; //reverse order
    for (;;)
    {
        if (const std::optional<ItemType> type = getItemTypeIfExists(dirPathEx)) //throw FileError
        {
            if (*type == ItemType::file)
                throw FileError(replaceCpy(L"Cannot create directory %x.", L"%x", fmtPath(dirPath)),
                                replaceCpy(L"The name %x is already used by another item.", L"%x", fmtPath(getItemName(dirPathEx))));
            break;
        }

        const std::optional<std::string> parentPath = getParentFolderPath(dirPathEx);
        dirNames.push_back(getItemName(dirPathEx));
        if (!parentPath) //relative single-element path
        {
            dirPathEx.clear();
            break;
        }
        dirPathEx = *parentPath;
    }

    std::string dirPathNew = dirPathEx;
    for (auto it = dirNames.rbegin(); it != dirNames.rend(); ++it)
    {
        dirPathNew = appendPath(dirPathNew, *it);
        try
        {
            createDirectory(dirPathNew); //throw FileError, ErrorTargetExisting
        }
        catch (const ErrorTargetExisting&) //possible if created in parallel
        {
            if (getItemTypeIfExists(dirPathNew) != ItemType::folder) //throw FileError
                throw;
        }
    }
}
