// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef FILE_ACCESS_H_2093847561029384
#define FILE_ACCESS_H_2093847561029384

#include "file_path.h"
#include "file_error.h"


namespace ferry
{
enum class ItemType
{
    file,
    folder,
    symlink,
};
ItemType getItemType(const std::string& itemPath); //throw FileError
//no value if item (or one of its parents) is not existing
std::optional<ItemType> getItemTypeIfExists(const std::string& itemPath); //throw FileError

inline bool itemExists(const std::string& itemPath) { return static_cast<bool>(getItemTypeIfExists(itemPath)); } //throw FileError

//symlink handling: follow
uint64_t getFileSize(const std::string& filePath); //throw FileError

//get per-user directory designated for temporary files:
std::string getTempFolderPath(); //throw FileError

void removeFilePlain     (const std::string& filePath);         //throw FileError; ERROR if not existing
void removeSymlinkPlain  (const std::string& linkPath);         //throw FileError; ERROR if not existing
void removeDirectoryPlain(const std::string& dirPath );         //throw FileError; ERROR if not existing
void removeDirectoryPlainRecursion(const std::string& dirPath); //throw FileError; ERROR if not existing

//"rename" semantics: replaces existing target file atomically
void moveAndRenameItem(const std::string& pathFrom, const std::string& pathTo); //throw FileError

void createDirectory(const std::string& dirPath); //throw FileError, ErrorTargetExisting

//creates directories recursively if not existing
void createDirectoryIfMissingRecursion(const std::string& dirPath); //throw FileError
}

#endif //FILE_ACCESS_H_2093847561029384
