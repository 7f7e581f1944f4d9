// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "test_tools.h"
#include <FileFerry/Source/afs/native.h>

using namespace ferry;
using namespace ffy;
using namespace ffy::test;


class LocalBackendTest : public ScratchFolderTest
{
protected:
    const std::unique_ptr<FileBackend> backend_ = createLocalBackend("");
    StepLogger logger_;
};


TEST_F(LocalBackendTest, Identity)
{
    EXPECT_EQ(backend_->getTypeTag(), "local");
}


TEST_F(LocalBackendTest, ExistsAfterUpload)
{
    const std::string localPath = writeFile("in/data.csv", "a;b\n1;2\n");

    EXPECT_FALSE(backend_->fileExists(path("out/data.csv"), logger_));

    createDirectoryIfMissingRecursion(path("out"));
    backend_->upload(localPath, path("out/data.csv"), false /*replace*/, logger_);

    EXPECT_TRUE(backend_->fileExists(path("out/data.csv"), logger_));
    EXPECT_FALSE(backend_->folderExists(path("out/data.csv"), logger_));
    EXPECT_TRUE(backend_->folderExists(path("out"), logger_));
    EXPECT_FALSE(backend_->fileExists(path("out"), logger_));
    EXPECT_EQ(readFile("out/data.csv"), "a;b\n1;2\n");
}


TEST_F(LocalBackendTest, UploadWithoutReplaceFails)
{
    const std::string localPath = writeFile("new.txt", "new");
    writeFile("target.txt", "old");

    EXPECT_THROW(backend_->upload(localPath, path("target.txt"), false, logger_), AlreadyExistsError);
    EXPECT_EQ(readFile("target.txt"), "old");

    backend_->upload(localPath, path("target.txt"), true, logger_);
    EXPECT_EQ(readFile("target.txt"), "new");
}


TEST_F(LocalBackendTest, DownloadWithoutReplaceLeavesTargetUntouched)
{
    writeFile("remote.bin", "remote content");
    writeFile("local.bin", "local content");

    EXPECT_THROW(backend_->download(path("remote.bin"), path("local.bin"), false /*replace*/, logger_), AlreadyExistsError);
    EXPECT_EQ(readFile("local.bin"), "local content");

    backend_->download(path("remote.bin"), path("local.bin"), true /*replace*/, logger_);
    EXPECT_EQ(readFile("local.bin"), "remote content");
}


TEST_F(LocalBackendTest, StreamRoundTrip)
{
    for (const size_t size : {size_t(0), size_t(1), size_t(3 * 256 * 1024 + 17)})
    {
        const std::string data = makeTestData(size);
        {
            const std::unique_ptr<OutputStream> streamOut = backend_->openOutput(path("stream.bin"), "wb", logger_);
            if (!data.empty())
                streamOut->write(data.data(), data.size());
            streamOut->finalize();
            EXPECT_EQ(streamOut->getBytesWritten(), data.size());
        }

        createDirectoryIfMissingRecursion(path("copy"));
        backend_->download(path("stream.bin"), path("copy/stream.bin"), true, logger_);
        EXPECT_EQ(readFile("copy/stream.bin"), data) << size;

        const std::unique_ptr<InputStream> streamIn = backend_->openInput(path("copy/stream.bin"), "rb", logger_);
        std::string readBack;
        std::vector<char> buf(streamIn->getBlockSize());
        for (size_t bytesRead = 0; (bytesRead = streamIn->tryRead(buf.data(), buf.size())) != 0;)
            readBack.append(buf.data(), bytesRead);
        EXPECT_EQ(readBack, data) << size;
    }
}


TEST_F(LocalBackendTest, UnfinalizedOutputIsRemoved)
{
    {
        const std::unique_ptr<OutputStream> streamOut = backend_->openOutput(path("partial.txt"), "w", logger_);
        streamOut->write("half", 4);
    }
    EXPECT_FALSE(exists("partial.txt"));
}


TEST_F(LocalBackendTest, OpenMissingFile)
{
    EXPECT_THROW(backend_->openInput(path("missing.txt"), "r", logger_), FileError);
}


TEST_F(LocalBackendTest, MissingParentIsFalse)
{
    EXPECT_FALSE(backend_->fileExists  (path("no/such/dir/file.txt"), logger_));
    EXPECT_FALSE(backend_->folderExists(path("no/such/dir"),          logger_));
    EXPECT_FALSE(backend_->fileExists  (path("no/such/dir/*.csv"),    logger_));
}


TEST_F(LocalBackendTest, WildcardExistence)
{
    writeFile("reports/report_2024.csv", "x");
    writeFile("reports/report_2023.csv", "y");
    createDirectoryIfMissingRecursion(path("reports/archive_2022"));

    EXPECT_TRUE (backend_->fileExists(path("reports/report_*.csv"), logger_));
    EXPECT_FALSE(backend_->fileExists(path("reports/invoice_*.csv"), logger_));
    EXPECT_TRUE (logContains(logger_, "Found the following files: ["));

    EXPECT_TRUE (backend_->folderExists(path("reports/archive_*"), logger_));
    EXPECT_FALSE(backend_->fileExists  (path("reports/archive_*"), logger_)); //folders don't count as files
}


TEST_F(LocalBackendTest, DeleteFileAndFolder)
{
    writeFile("tree/a.txt", "a");
    writeFile("tree/sub/b.txt", "b");
    writeFile("single.txt", "s");

    backend_->deleteItem(path("single.txt"), logger_);
    backend_->deleteItem(path("tree"), logger_);

    EXPECT_FALSE(exists("single.txt"));
    EXPECT_FALSE(exists("tree"));

    EXPECT_THROW(backend_->deleteItem(path("tree"), logger_), FileError);
}


TEST_F(LocalBackendTest, DownloadFolderReplacesInsteadOfMerging)
{
    writeFile("src/a.txt", "a");
    writeFile("src/sub/b.txt", "b");
    writeFile("dst/stale.txt", "stale");

    EXPECT_THROW(backend_->downloadFolder(path("src"), path("dst"), false, logger_), AlreadyExistsError);
    EXPECT_TRUE(exists("dst/stale.txt"));

    backend_->downloadFolder(path("src"), path("dst"), true, logger_);

    EXPECT_EQ(readFile("dst/a.txt"), "a");
    EXPECT_EQ(readFile("dst/sub/b.txt"), "b");
    EXPECT_FALSE(exists("dst/stale.txt"));
}


TEST_F(LocalBackendTest, DownloadFolderCreatesParents)
{
    writeFile("src/a.txt", "a");

    backend_->downloadFolder(path("src"), path("deep/er/dst"), false, logger_);
    EXPECT_EQ(readFile("deep/er/dst/a.txt"), "a");

    EXPECT_THROW(backend_->downloadFolder(path("missing"), path("dst2"), false, logger_), FileError);
    EXPECT_FALSE(exists("dst2"));
}
