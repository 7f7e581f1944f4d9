// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef FILE_PATH_H_8830192746501928
#define FILE_PATH_H_8830192746501928

#include <optional>
#include <string>
#include "string_tools.h"


namespace ferry
{
const char FILE_NAME_SEPARATOR = '/';

//both local and remote paths use '/'
std::optional<std::string> getParentFolderPath(const std::string& itemPath); //no value for root or relative single-element path
inline std::string getItemName(const std::string& itemPath) { return afterLast(itemPath, "/", IfNotFoundReturn::all); }

std::string removeTrailingSeparators(std::string path); //keeps "/" itself

std::string appendSeparator(std::string path);

std::string appendPath(const std::string& basePath, const std::string& relPath);

//glob patterns as understood by fnmatch(3): '*', '?', "[...]"
bool hasWildcard(const std::string& pattern);
bool matchesWildcard(const std::string& name, const std::string& pattern);

std::optional<std::string> getEnvironmentVar(const std::string& name);
}

#endif //FILE_PATH_H_8830192746501928
