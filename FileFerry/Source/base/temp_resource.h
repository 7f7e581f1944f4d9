// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef TEMP_RESOURCE_H_8810293746510293
#define TEMP_RESOURCE_H_8810293746510293

#include <ferry/file_error.h>


namespace ffy
{
DEFINE_NEW_FILE_ERROR(TempResourceError)


//uniquely named, empty file in the system temp folder: removed on destruction unless released
class TempFile
{
public:
    TempFile() {} //no file
    static TempFile create(const std::string& namePrefix); //throw TempResourceError

    TempFile(TempFile&& tmp) noexcept : filePath_(std::exchange(tmp.filePath_, std::string())) {}
    TempFile& operator=(TempFile&& tmp) noexcept;

    ~TempFile() { discard(); }

    const std::string& getPath() const { return filePath_; }
    bool empty() const { return filePath_.empty(); }

    std::string release() { return std::exchange(filePath_, std::string()); } //caller takes ownership

    void discard(); //nothrow! remove file if still existing

private:
    TempFile           (const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    explicit TempFile(const std::string& filePath) : filePath_(filePath) {}

    std::string filePath_;
};


//uniquely named, empty folder in the system temp folder: removed recursively on destruction unless released
class TempFolder
{
public:
    TempFolder() {}
    static TempFolder create(const std::string& namePrefix); //throw TempResourceError

    TempFolder(TempFolder&& tmp) noexcept : folderPath_(std::exchange(tmp.folderPath_, std::string())) {}
    TempFolder& operator=(TempFolder&& tmp) noexcept;

    ~TempFolder() { discard(); }

    const std::string& getPath() const { return folderPath_; }
    bool empty() const { return folderPath_.empty(); }

    std::string release() { return std::exchange(folderPath_, std::string()); }

    void discard(); //nothrow!

private:
    TempFolder           (const TempFolder&) = delete;
    TempFolder& operator=(const TempFolder&) = delete;

    explicit TempFolder(const std::string& folderPath) : folderPath_(folderPath) {}

    std::string folderPath_;
};
}

#endif //TEMP_RESOURCE_H_8810293746510293
