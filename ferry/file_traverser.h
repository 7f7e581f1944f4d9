// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef FILE_TRAVERSER_H_5510283746192038
#define FILE_TRAVERSER_H_5510283746192038

#include <functional>
#include "file_error.h"


namespace ferry
{
struct FileInfo
{
    std::string itemName;
    std::string fullPath;
    uint64_t fileSize = 0; //[bytes]
};

struct FolderInfo
{
    std::string itemName;
    std::string fullPath;
};

struct SymlinkInfo
{
    std::string itemName;
    std::string fullPath;
};

//- non-recursive
//- "." and ".." are skipped
void traverseFolder(const std::string& dirPath,
                    const std::function<void(const FileInfo&    fi)>& onFile,  /*optional*/
                    const std::function<void(const FolderInfo&  fi)>& onFolder,/*optional*/
                    const std::function<void(const SymlinkInfo& si)>& onSymlink/*optional*/); //throw FileError
}

#endif //FILE_TRAVERSER_H_5510283746192038
