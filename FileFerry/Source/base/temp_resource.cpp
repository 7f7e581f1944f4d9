// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "temp_resource.h"
#include <ferry/file_io.h>
#include <ferry/guid.h>

using namespace ferry;
using namespace ffy;


namespace
{
template <class Function>
std::string createUniqueTempItem(const std::string& namePrefix, Function createItem /*throw FileError, ErrorTargetExisting*/) //throw TempResourceError
{
    std::string tempFolderPath;
    try
    {
        tempFolderPath = getTempFolderPath(); //throw FileError
    }
    catch (const FileError& e) { throw TempResourceError(e.toString()); }

    for (int i = 0;; ++i)
        try
        {
            const std::string itemPath = appendPath(tempFolderPath, namePrefix + generateShortGuidTag() + generateShortGuidTag());
            createItem(itemPath); //throw FileError, ErrorTargetExisting
            return itemPath;
        }
        catch (const ErrorTargetExisting& e)
        {
            if (i == 9) //64-bit names: a collision is already astronomically unlikely
                throw TempResourceError(e.toString());
        }
        catch (const FileError& e) { throw TempResourceError(e.toString()); }
        catch (const std::runtime_error& e) //generateGUID()
        {
            throw TempResourceError(L"Cannot create a unique name for a temporary item.", utfTo<std::wstring>(e.what()));
        }
}
}


TempFile TempFile::create(const std::string& namePrefix) //throw TempResourceError
{
    return TempFile(createUniqueTempItem(namePrefix, [](const std::string& filePath)
    {
        FileOutputPlain fileOut(filePath, FileOutputMode::createNew); //throw FileError, ErrorTargetExisting
        fileOut.close(); //throw FileError
    }));
}


TempFile& TempFile::operator=(TempFile&& tmp) noexcept
{
    if (this != &tmp)
    {
        discard();
        filePath_ = std::exchange(tmp.filePath_, std::string());
    }
    return *this;
}


void TempFile::discard() //nothrow!
{
    if (!filePath_.empty())
        try
        {
            if (getItemTypeIfExists(filePath_)) //throw FileError; may have been moved away by the owner
                removeFilePlain(filePath_);     //throw FileError
        }
        catch (const FileError& e) { logExtraError(e.toString()); }

    filePath_.clear();
}


TempFolder TempFolder::create(const std::string& namePrefix) //throw TempResourceError
{
    return TempFolder(createUniqueTempItem(namePrefix, [](const std::string& folderPath)
    {
        createDirectory(folderPath); //throw FileError, ErrorTargetExisting
    }));
}


TempFolder& TempFolder::operator=(TempFolder&& tmp) noexcept
{
    if (this != &tmp)
    {
        discard();
        folderPath_ = std::exchange(tmp.folderPath_, std::string());
    }
    return *this;
}


void TempFolder::discard() //nothrow!
{
    if (!folderPath_.empty())
        try
        {
            if (const std::optional<ItemType> type = getItemTypeIfExists(folderPath_)) //throw FileError
            {
                if (*type == ItemType::folder)
                    removeDirectoryPlainRecursion(folderPath_); //throw FileError
                else
                    removeFilePlain(folderPath_); //throw FileError
            }
        }
        catch (const FileError& e) { logExtraError(e.toString()); }

    folderPath_.clear();
}
