// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "test_tools.h"

using namespace ferry;
using namespace ffy;


TEST(TempResource, TempFileLifetime)
{
    std::string filePath;
    {
        TempFile tmp = TempFile::create("ffy_unit_");
        filePath = tmp.getPath();

        EXPECT_TRUE(startsWith(getItemName(filePath), "ffy_unit_"));
        EXPECT_EQ(getItemType(filePath), ItemType::file);
        EXPECT_EQ(getFileSize(filePath), 0u);
    }
    EXPECT_FALSE(itemExists(filePath));
}


TEST(TempResource, TempFileNamesAreUnique)
{
    const TempFile tmp1 = TempFile::create("ffy_unit_");
    const TempFile tmp2 = TempFile::create("ffy_unit_");
    EXPECT_NE(tmp1.getPath(), tmp2.getPath());
}


TEST(TempResource, ReleaseHandsOverOwnership)
{
    std::string filePath;
    {
        TempFile tmp = TempFile::create("ffy_unit_");
        filePath = tmp.release();
        EXPECT_TRUE(tmp.empty());
    }
    EXPECT_TRUE(itemExists(filePath));
    removeFilePlain(filePath);
}


TEST(TempResource, MoveTransfersOwnership)
{
    TempFile tmp1 = TempFile::create("ffy_unit_");
    const std::string filePath = tmp1.getPath();

    TempFile tmp2 = std::move(tmp1);
    EXPECT_TRUE(tmp1.empty());
    EXPECT_EQ(tmp2.getPath(), filePath);

    tmp2 = TempFile(); //discards the file
    EXPECT_FALSE(itemExists(filePath));
}


TEST(TempResource, TempFolderRemovedRecursively)
{
    std::string folderPath;
    {
        TempFolder tmp = TempFolder::create("ffy_unit_");
        folderPath = tmp.getPath();
        EXPECT_EQ(getItemType(folderPath), ItemType::folder);

        createDirectory(appendPath(folderPath, "sub"));
        setFileContent(appendPath(folderPath, "sub/file.txt"), "content");
    }
    EXPECT_FALSE(itemExists(folderPath));
}


TEST(TempResource, DiscardToleratesMissingFile)
{
    TempFile tmp = TempFile::create("ffy_unit_");
    removeFilePlain(tmp.getPath()); //e.g. moved away by the owner
    tmp.discard();
    EXPECT_TRUE(tmp.empty());
}
