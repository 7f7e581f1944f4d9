// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "test_tools.h"
#include "fake_backend.h"
#include <FileFerry/Source/step/download.h>

using namespace ferry;
using namespace ffy;
using namespace ffy::test;


class DownloadStepTest : public ScratchFolderTest
{
protected:
    const std::shared_ptr<FakeStore> store_ = std::make_shared<FakeStore>();
    const std::shared_ptr<BackendRegistry> backends_ = makeTestRegistry(store_);
    StepLogger logger_;
};


TEST_F(DownloadStepTest, FileToGivenPath)
{
    store_->files["exports/day.csv"] = "1,2,3";
    writeFile("day.csv", "old");

    const std::string localPath = FileDownloadStep(backends_, {"mem", "ftp_conn", "exports/day.csv"}, path("day.csv")).execute(logger_);

    EXPECT_EQ(localPath, path("day.csv"));
    EXPECT_EQ(readFile("day.csv"), "1,2,3"); //replaced
    EXPECT_TRUE(logContains(logger_, "Downloading file \"exports/day.csv\" from mem source \"ftp_conn\" to local file \"" + path("day.csv") + "\"."));
    EXPECT_FALSE(logContains(logger_, "Created a temporary"));
}


TEST_F(DownloadStepTest, FileToTempPath)
{
    store_->files["exports/day.csv"] = "1,2,3";

    const std::string localPath = FileDownloadStep(backends_, {"mem", "", "exports/day.csv"}, std::nullopt).execute(logger_);

    //caller owns the temp file now
    EXPECT_EQ(getFileContent(localPath), "1,2,3");
    EXPECT_TRUE(startsWith(getItemName(localPath), "ffy_download_"));
    EXPECT_TRUE(logContains(logger_, "Created a temporary file for download at \"" + localPath + "\""));
    removeFilePlain(localPath);
}


TEST_F(DownloadStepTest, FailedDownloadRemovesTempFile)
{
    const FileDownloadStep step(backends_, {"mem", "", "missing.csv"}, std::nullopt);

    EXPECT_THROW(step.execute(logger_), FileError);

    ASSERT_EQ(logger_.getLog().size(), 2u);
    const std::string tmpPath = afterFirst(logger_.getLog()[0].message, "\"", IfNotFoundReturn::none);
    EXPECT_FALSE(itemExists(beforeLast(tmpPath, "\"", IfNotFoundReturn::none)));
}


TEST_F(DownloadStepTest, FailedTempCleanupIsLogged)
{
    std::string tmpPath;
    store_->beforeDownload = [&](const std::string& localPath)
    {
        //a folder in place of the temp file: unlink() fails
        tmpPath = localPath;
        removeFilePlain(localPath);
        createDirectory(localPath);
        setFileContent(appendPath(localPath, "blocker"), "x");
    };
    const FileDownloadStep step(backends_, {"mem", "", "missing.csv"}, std::nullopt);

    EXPECT_THROW(step.execute(logger_), FileError);

    ASSERT_FALSE(tmpPath.empty());
    EXPECT_TRUE(logContains(logger_, "Cannot delete file \"" + tmpPath + "\"."));
    EXPECT_EQ(logger_.getLog().back().type, MSG_TYPE_ERROR);
    EXPECT_TRUE(fetchExtraLog().empty()); //reported, not kept

    removeDirectoryPlainRecursion(tmpPath);
}


TEST_F(DownloadStepTest, FolderToGivenPath)
{
    store_->files["batch/a.csv"] = "a";
    store_->files["batch/sub/b.csv"] = "b";
    store_->files["other/c.csv"] = "c";
    writeFile("batch_local/stale.csv", "stale");

    const std::string localPath = FolderDownloadStep(backends_, {"mem", "", "batch"}, path("batch_local")).execute(logger_);

    EXPECT_EQ(localPath, path("batch_local"));
    EXPECT_EQ(readFile("batch_local/a.csv"), "a");
    EXPECT_EQ(readFile("batch_local/sub/b.csv"), "b");
    EXPECT_FALSE(exists("batch_local/c.csv"));
    EXPECT_FALSE(exists("batch_local/stale.csv")); //replaced, not merged

    EXPECT_TRUE(logContains(logger_, "Downloading folder \"batch\" from mem source \"\" to local folder \"" + path("batch_local") + "\"."));
    EXPECT_TRUE(logContains(logger_, "Creating the folder \"" + path("batch_local") + "\", if it does not exist"));
    EXPECT_TRUE(logContains(logger_, "Created!"));
}


TEST_F(DownloadStepTest, FolderItemOutsideTargetIsRejected)
{
    store_->files["batch/a.csv"] = "a";
    store_->files["batch/../../escaped.csv"] = "evil";

    EXPECT_THROW(FolderDownloadStep(backends_, {"mem", "", "batch"}, path("target/inner")).execute(logger_), FileError);

    EXPECT_FALSE(exists("escaped.csv"));
    EXPECT_FALSE(exists("target/escaped.csv"));
    EXPECT_FALSE(exists("target/inner/a.csv")); //nothing written
}


TEST_F(DownloadStepTest, FolderToTempPath)
{
    store_->files["batch/a.csv"] = "a";

    const std::string localPath = FolderDownloadStep(backends_, {"mem", "", "batch"}, std::nullopt).execute(logger_);

    EXPECT_TRUE(startsWith(getItemName(localPath), "ffy_download_"));
    EXPECT_EQ(getFileContent(appendPath(localPath, "a.csv")), "a");
    EXPECT_TRUE(logContains(logger_, "Created a temporary folder for download at \"" + localPath + "\""));
    removeDirectoryPlainRecursion(localPath);
}


TEST_F(DownloadStepTest, LocalSource)
{
    writeFile("src/report.csv", "r");

    const std::string localPath = FileDownloadStep(backends_, {"local", "", path("src/report.csv")}, path("report.csv")).execute(logger_);
    EXPECT_EQ(readFile("report.csv"), "r");
    EXPECT_EQ(localPath, path("report.csv"));
}


TEST_F(DownloadStepTest, UnknownType)
{
    EXPECT_THROW(FileDownloadStep  (backends_, {"nfs", "", "a"}, std::nullopt), FileError);
    EXPECT_THROW(FolderDownloadStep(backends_, {"nfs", "", "a"}, std::nullopt), FileError);
}
