// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef ABSTRACT_IMPL_H_6610293847561092
#define ABSTRACT_IMPL_H_6610293847561092

#include <ferry/file_io.h>
#include "abstract.h"
#include "../base/temp_resource.h"


namespace ffy
{
class LocalInputStream : public InputStream
{
public:
    explicit LocalInputStream(const std::string& filePath) : fileIn_(filePath) {} //throw FileError

    size_t getBlockSize() override { return fileIn_.getBlockSize(); } //throw FileError
    size_t tryRead(void* buffer, size_t bytesToRead) override { return fileIn_.tryRead(buffer, bytesToRead); } //throw FileError

private:
    ferry::FileInputPlain fileIn_;
};


//~FileOutputPlain() deletes the file unless closed (except for append mode)
class LocalOutputStream : public OutputStreamImpl
{
public:
    LocalOutputStream(const std::string& filePath, ferry::FileOutputMode mode) : fileOut_(filePath, mode) {} //throw FileError, ErrorTargetExisting

    size_t getBlockSize() override { return fileOut_.getBlockSize(); } //throw FileError
    size_t tryWrite(const void* buffer, size_t bytesToWrite) override { return fileOut_.tryWrite(buffer, bytesToWrite); } //throw FileError
    void finalize() override { fileOut_.close(); } //throw FileError

private:
    ferry::FileOutputPlain fileOut_;
};

//------------------------------------------------------------------------------------------------------

//remote file was retrieved into a temp file; the temp file is removed on destruction
class SpoolInputStream : public InputStream
{
public:
    explicit SpoolInputStream(TempFile&& tmpFile) : //throw FileError
        tmpFile_(std::move(tmpFile)),
        fileIn_(tmpFile_.getPath()) {}

    size_t getBlockSize() override { return fileIn_.getBlockSize(); } //throw FileError
    size_t tryRead(void* buffer, size_t bytesToRead) override { return fileIn_.tryRead(buffer, bytesToRead); } //throw FileError

private:
    TempFile tmpFile_; //declared first: destroyed after fileIn_ was closed
    ferry::FileInputPlain fileIn_;
};


//output is collected in a temp file and published to the remote side during finalize() only
class SpoolOutputStream : public OutputStreamImpl
{
public:
    using PublishFun = std::function<void(const std::string& tmpFilePath)>; //throw FileError, ConnectionError

    SpoolOutputStream(TempFile&& tmpFile, const PublishFun& publish) : //throw FileError
        tmpFile_(std::move(tmpFile)),
        fileOut_(tmpFile_.getPath(), ferry::FileOutputMode::truncate),
        publish_(publish) {}

    size_t getBlockSize() override { return fileOut_.getBlockSize(); } //throw FileError
    size_t tryWrite(const void* buffer, size_t bytesToWrite) override { return fileOut_.tryWrite(buffer, bytesToWrite); } //throw FileError

    void finalize() override //throw FileError, ConnectionError
    {
        fileOut_.close(); //throw FileError
        publish_(tmpFile_.getPath()); //throw FileError, ConnectionError
    }

private:
    TempFile tmpFile_;
    ferry::FileOutputPlain fileOut_;
    const PublishFun publish_;
};


//retrieve into a scoped temp file, then stream from it
template <class Function> inline
std::unique_ptr<InputStream> makeSpoolInputStream(Function retrieveFile /*throw FileError, ConnectionError*/) //throw FileError, ConnectionError, TempResourceError
{
    TempFile tmpFile = TempFile::create("ffy_in_"); //throw TempResourceError
    retrieveFile(tmpFile.getPath()); //throw FileError, ConnectionError
    return std::make_unique<SpoolInputStream>(std::move(tmpFile)); //throw FileError
}


inline
std::unique_ptr<OutputStreamImpl> makeSpoolOutputStream(const SpoolOutputStream::PublishFun& publish) //throw FileError, TempResourceError
{
    return std::make_unique<SpoolOutputStream>(TempFile::create("ffy_out_") /*throw TempResourceError*/, publish); //throw FileError
}
}

#endif //ABSTRACT_IMPL_H_6610293847561092
