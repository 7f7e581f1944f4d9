// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "test_tools.h"
#include <algorithm>
#include <ferry/file_traverser.h>
#include <FileFerry/Source/afs/abstract.h>

using namespace ferry;
using namespace ffy;
using namespace ffy::test;


class FileAccessTest : public ScratchFolderTest {};


TEST_F(FileAccessTest, ItemTypes)
{
    writeFile("dir/a.txt", "a");

    EXPECT_EQ(getItemType(path("dir")), ItemType::folder);
    EXPECT_EQ(getItemType(path("dir/a.txt")), ItemType::file);
    EXPECT_EQ(getItemTypeIfExists(path("dir/missing.txt")), std::nullopt);
    EXPECT_EQ(getItemTypeIfExists(path("missing/a.txt")), std::nullopt); //missing parent is not an error
    EXPECT_EQ(getFileSize(path("dir/a.txt")), 1u);
}


TEST_F(FileAccessTest, CreateAndRemoveFolders)
{
    createDirectoryIfMissingRecursion(path("x/y/z"));
    createDirectoryIfMissingRecursion(path("x/y/z")); //idempotent
    EXPECT_TRUE(exists("x/y/z"));

    EXPECT_THROW(createDirectory(path("x/y")), ErrorTargetExisting);

    writeFile("x/y/z/file.bin", "data");
    removeDirectoryPlainRecursion(path("x"));
    EXPECT_FALSE(exists("x"));

    EXPECT_THROW(removeFilePlain(path("x/nothing")), FileError);
}


TEST_F(FileAccessTest, MoveReplacesTarget)
{
    writeFile("from.txt", "new");
    writeFile("to.txt", "old");

    moveAndRenameItem(path("from.txt"), path("to.txt"));

    EXPECT_FALSE(exists("from.txt"));
    EXPECT_EQ(readFile("to.txt"), "new");
}


TEST_F(FileAccessTest, UnfinishedOutputIsDeleted)
{
    {
        FileOutputPlain fileOut(path("partial.txt"), FileOutputMode::truncate);
        writeAll(fileOut, "abc", 3);
        //no close()
    }
    EXPECT_FALSE(exists("partial.txt"));

    {
        FileOutputPlain fileOut(path("complete.txt"), FileOutputMode::truncate);
        writeAll(fileOut, "abc", 3);
        fileOut.close();
    }
    EXPECT_EQ(readFile("complete.txt"), "abc");
}


TEST_F(FileAccessTest, CreateNewFailsOnExistingFile)
{
    writeFile("existing.txt", "keep");
    EXPECT_THROW(FileOutputPlain(path("existing.txt"), FileOutputMode::createNew), ErrorTargetExisting);
    EXPECT_EQ(readFile("existing.txt"), "keep");
}


TEST_F(FileAccessTest, AppendKeepsContent)
{
    writeFile("log.txt", "line1\n");
    appendFileContent(path("log.txt"), "line2\n");
    EXPECT_EQ(readFile("log.txt"), "line1\nline2\n");
}


TEST_F(FileAccessTest, TraverseFolder)
{
    writeFile("root/f1.txt", "1");
    writeFile("root/f2.txt", "22");
    writeFile("root/sub/f3.txt", "333");

    std::vector<std::string> files;
    std::vector<std::string> folders;
    traverseFolder(path("root"),
    [&](const FileInfo&   fi) { files  .push_back(fi.itemName); },
    [&](const FolderInfo& fi) { folders.push_back(fi.itemName); },
    nullptr);

    std::sort(files.begin(), files.end());
    EXPECT_EQ(files,   (std::vector<std::string>{"f1.txt", "f2.txt"}));
    EXPECT_EQ(folders, (std::vector<std::string>{"sub"}));
}


TEST_F(FileAccessTest, TransactionalWriteLeavesTargetOnFailure)
{
    writeFile("target.txt", "original");

    EXPECT_THROW(writeFileTransactional(path("target.txt"), [&](const std::string& tmpFilePath)
    {
        setFileContent(tmpFilePath, "half-written");
        throw FileError(L"Simulated failure");
    }), FileError);

    EXPECT_EQ(readFile("target.txt"), "original");

    std::vector<std::string> names;
    traverseFolder(scratch_.getPath(), [&](const FileInfo& fi) { names.push_back(fi.itemName); }, nullptr, nullptr);
    EXPECT_EQ(names, std::vector<std::string>{"target.txt"}); //no temp file left behind
}


TEST(FileAccess, SplitParentAndName)
{
    EXPECT_EQ(splitParentAndName("dir/report_*.csv"), (std::pair<std::string, std::string>("dir", "report_*.csv")));
    EXPECT_EQ(splitParentAndName("/top/"), (std::pair<std::string, std::string>("/", "top")));
    EXPECT_EQ(splitParentAndName("name.txt"), (std::pair<std::string, std::string>("", "name.txt")));
}
