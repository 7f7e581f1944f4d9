// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef FILE_IO_H_7721039485610293
#define FILE_IO_H_7721039485610293

#include <optional>
#include "file_access.h"
    #include <sys/stat.h>


namespace ferry
{
/*  OS-buffered file I/O:
    - sequential read/write accesses
    - better error reporting
    - follows symlinks                     */
class FileBase
{
public:
    using FileHandle = int;
    static const int invalidFileHandle = -1;

    FileHandle getHandle() { return hFile_; }

    const std::string& getFilePath() const { return filePath_; }

    size_t getBlockSize(); //throw FileError

    static constexpr size_t defaultBlockSize = 256 * 1024;

    void close(); //throw FileError -> good place to catch errors when closing stream, otherwise called in ~FileBase()!

    const struct stat& getStatBuffered(); //throw FileError

protected:
    FileBase(FileHandle handle, const std::string& filePath) : hFile_(handle), filePath_(filePath) {}
    ~FileBase();

private:
    FileBase           (const FileBase&) = delete;
    FileBase& operator=(const FileBase&) = delete;

    FileHandle hFile_ = invalidFileHandle;
    const std::string filePath_;
    size_t blockSizeBuf_ = 0;
    std::optional<struct stat> statBuf_;
};

//-----------------------------------------------------------------------------------------------

class FileInputPlain : public FileBase
{
public:
    explicit FileInputPlain(const std::string& filePath); //throw FileError

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead); //throw FileError
};


enum class FileOutputMode
{
    createNew, //fail with ErrorTargetExisting
    truncate,
    append,
};

class FileOutputPlain : public FileBase
{
public:
    FileOutputPlain(const std::string& filePath, FileOutputMode mode); //throw FileError, ErrorTargetExisting
    ~FileOutputPlain();

    //may return short! CONTRACT: bytesToWrite > 0
    size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw FileError

    //close() when done, or else file is considered incomplete and will be deleted!
    //(except for FileOutputMode::append: previous content is never thrown away)

private:
    const FileOutputMode mode_;
};

//-----------------------------------------------------------------------------------------------

//write all bytes, retrying on short writes
void writeAll(FileOutputPlain& fileOut, const void* buffer, size_t bytesToWrite); //throw FileError

[[nodiscard]] std::string getFileContent(const std::string& filePath); //throw FileError

//overwrites if existing + transactional! :)
void setFileContent(const std::string& filePath, std::string_view bytes); //throw FileError

//append to end of existing file, or create new
void appendFileContent(const std::string& filePath, std::string_view bytes); //throw FileError
}

#endif //FILE_IO_H_7721039485610293
