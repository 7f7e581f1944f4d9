// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef NATIVE_H_1192038475610293
#define NATIVE_H_1192038475610293

#include "abstract.h"


namespace ffy
{
//"local": paths are native file system paths; connection id is ignored
std::unique_ptr<FileBackend> createLocalBackend(const std::string& connectionId);

//copy a single file, following symlinks; target is overwritten transactionally
void copyLocalFile(const std::string& sourcePath, const std::string& targetPath); //throw FileError

//recursive copy: targetPath must not exist; its parent folders are created if missing
void copyLocalFolder(const std::string& sourcePath, const std::string& targetPath); //throw FileError
}

#endif //NATIVE_H_1192038475610293
