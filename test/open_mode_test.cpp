// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "test_tools.h"
#include <FileFerry/Source/afs/concrete.h>

using namespace ferry;
using namespace ffy;
using namespace ffy::test;


TEST(OpenMode, Parsing)
{
    EXPECT_EQ(parseOpenMode("r"),   (OpenMode{.isBinary = false, .canRead = true,  .canWrite = false, .replace = false}));
    EXPECT_EQ(parseOpenMode("rb"),  (OpenMode{.isBinary = true,  .canRead = true,  .canWrite = false, .replace = false}));
    EXPECT_EQ(parseOpenMode(""),    (OpenMode{.isBinary = false, .canRead = true,  .canWrite = false, .replace = false}));
    EXPECT_EQ(parseOpenMode("w"),   (OpenMode{.isBinary = false, .canRead = false, .canWrite = true,  .replace = true }));
    EXPECT_EQ(parseOpenMode("wb"),  (OpenMode{.isBinary = true,  .canRead = false, .canWrite = true,  .replace = true }));
    EXPECT_EQ(parseOpenMode("a"),   (OpenMode{.isBinary = false, .canRead = false, .canWrite = true,  .replace = false}));
    EXPECT_EQ(parseOpenMode("r+"),  (OpenMode{.isBinary = false, .canRead = true,  .canWrite = true,  .replace = false}));
    EXPECT_EQ(parseOpenMode("rb+"), (OpenMode{.isBinary = true,  .canRead = true,  .canWrite = false, .replace = false}));
}


class OpenModeBackendTest : public ScratchFolderTest
{
protected:
    const std::shared_ptr<const BackendRegistry> backends_ = std::make_shared<BackendRegistry>(std::make_shared<MemoryConnectionRegistry>());
    StepLogger logger_;
};


TEST_F(OpenModeBackendTest, ReadWriteIsRejectedEverywhere)
{
    for (const char* typeTag : {"local", "ftp", "sftp", "s3"})
    {
        const std::unique_ptr<FileBackend> backend = backends_->create(typeTag, "none");

        try
        {
            backend->openInput(path("f.txt"), "r+", logger_);
            ADD_FAILURE() << typeTag;
        }
        catch (const UnsupportedModeError& e)
        {
            EXPECT_TRUE(startsWith(e.toString(), L"Cannot open a read/write stream.")) << typeTag;
        }

        EXPECT_THROW(backend->openOutput(path("f.txt"), "r+", logger_), UnsupportedModeError) << typeTag;
    }
}


TEST_F(OpenModeBackendTest, AppendOnlyOnLocalDisk)
{
    const std::pair<const char*, const wchar_t*> remoteTypes[] =
    {
        {"ftp",  L"Cannot append to a file over FTP."},
        {"sftp", L"Cannot append to a file over SFTP."},
        {"s3",   L"Cannot append to a file over object storage."},
    };
    for (const auto& [typeTag, errorMsg] : remoteTypes)
        try
        {
            //no connection "none" registered: mode is checked before connecting
            backends_->create(typeTag, "none")->openOutput("folder/f.txt", "a", logger_);
            ADD_FAILURE() << typeTag;
        }
        catch (const UnsupportedModeError& e)
        {
            EXPECT_TRUE(startsWith(e.toString(), errorMsg)) << typeTag;
        }

    writeFile("f.txt", "abc");
    {
        const std::unique_ptr<OutputStream> streamOut = backends_->create("local", "")->openOutput(path("f.txt"), "a", logger_);
        streamOut->write("def", 3);
        streamOut->finalize();
    }
    EXPECT_EQ(readFile("f.txt"), "abcdef");
}


TEST_F(OpenModeBackendTest, DirectionMismatch)
{
    const std::unique_ptr<FileBackend> backend = backends_->create("local", "");
    writeFile("f.txt", "abc");

    EXPECT_THROW(backend->openInput (path("f.txt"), "w",  logger_), UnsupportedModeError);
    EXPECT_THROW(backend->openOutput(path("f.txt"), "rb", logger_), UnsupportedModeError);
    EXPECT_EQ(readFile("f.txt"), "abc");
}
