// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "file_path.h"
#include <cstdlib>
#include <fnmatch.h>

using namespace ferry;


std::string ferry::removeTrailingSeparators(std::string path)
{
    while (path.size() > 1 && path.back() == FILE_NAME_SEPARATOR)
        path.pop_back();
    return path;
}


std::optional<std::string> ferry::getParentFolderPath(const std::string& itemPath)
{
    const std::string path = removeTrailingSeparators(itemPath);

    const size_t pos = path.rfind(FILE_NAME_SEPARATOR);
    if (pos == std::string::npos || path == "/")
        return std::nullopt;

    if (pos == 0)
        return std::string("/");

    return path.substr(0, pos);
}


std::string ferry::appendSeparator(std::string path)
{
    if (!endsWith(path, "/"))
        path += FILE_NAME_SEPARATOR;
    return path;
}


std::string ferry::appendPath(const std::string& basePath, const std::string& relPath)
{
    if (basePath.empty())
        return relPath;
    if (relPath.empty())
        return basePath;

    if (startsWith(relPath, "/"))
        return appendPath(basePath, relPath.substr(1));

    return appendSeparator(basePath) + relPath;
}


bool ferry::hasWildcard(const std::string& pattern)
{
    return pattern.find_first_of("*?[") != std::string::npos;
}


bool ferry::matchesWildcard(const std::string& name, const std::string& pattern)
{
    return ::fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}


std::optional<std::string> ferry::getEnvironmentVar(const std::string& name)
{
    const char* buffer = ::getenv(name.c_str()); //no extended error reporting
    if (!buffer)
        return {};

    std::string value(buffer);

    //some, but not all, environment variables are enclosed in double quotes
    trim(value);
    if (value.size() >= 2 && startsWith(value, "\"") && endsWith(value, "\""))
        value = value.substr(1, value.size() - 2);

    return value;
}
