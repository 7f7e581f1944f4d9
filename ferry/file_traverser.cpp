// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "file_traverser.h"
#include "file_path.h"
    #include <sys/stat.h>
    #include <dirent.h>

using namespace ferry;


void ferry::traverseFolder(const std::string& dirPath,
                           const std::function<void(const FileInfo&    fi)>& onFile,
                           const std::function<void(const FolderInfo&  fi)>& onFolder,
                           const std::function<void(const SymlinkInfo& si)>& onSymlink) //throw FileError
{
    DIR* folder = ::opendir(dirPath.c_str()); //directory must NOT end with path separator, except "/"
    if (!folder)
        THROW_LAST_FILE_ERROR(replaceCpy(L"Cannot open directory %x.", L"%x", fmtPath(dirPath)), "opendir");
    FERRY_ON_SCOPE_EXIT(::closedir(folder)); //never close nullptr handles! -> crash

    for (;;)
    {
        errno = 0;
        const dirent* dirEntry = ::readdir(folder);
        if (!dirEntry)
        {
            if (errno == 0) //errno left unchanged => no more items
                return;

            THROW_LAST_FILE_ERROR(replaceCpy(L"Cannot read directory %x.", L"%x", fmtPath(dirPath)), "readdir");
        }

        const std::string itemName = dirEntry->d_name;
        if (itemName == "." || itemName == "..")
            continue;

        const std::string itemPath = appendPath(dirPath, itemName);

        struct stat statData = {};
        if (::lstat(itemPath.c_str(), &statData) != 0) //lstat() does not resolve symlinks
            THROW_LAST_FILE_ERROR(replaceCpy(L"Cannot read file attributes of %x.", L"%x", fmtPath(itemPath)), "lstat");

        if (S_ISLNK(statData.st_mode))
        {
            if (onSymlink)
                onSymlink({itemName, itemPath});
        }
        else if (S_ISDIR(statData.st_mode))
        {
            if (onFolder)
                onFolder({itemName, itemPath});
        }
        else //a file or named pipe, etc.
        {
            if (onFile)
                onFile({itemName, itemPath, static_cast<uint64_t>(statData.st_size)});
        }
    }
}
