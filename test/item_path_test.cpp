// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include <gtest/gtest.h>
#include <FileFerry/Source/afs/abstract.h>

using namespace ferry;
using namespace ffy;


TEST(ItemName, Check)
{
    EXPECT_NO_THROW(checkItemName("report.csv"));
    EXPECT_NO_THROW(checkItemName("..hidden"));
    EXPECT_NO_THROW(checkItemName("a..b"));
    EXPECT_NO_THROW(checkItemName("name with blanks"));

    EXPECT_THROW(checkItemName(""),         FileError);
    EXPECT_THROW(checkItemName("."),        FileError);
    EXPECT_THROW(checkItemName(".."),       FileError);
    EXPECT_THROW(checkItemName("../evil"),  FileError);
    EXPECT_THROW(checkItemName("sub/file"), FileError);
    EXPECT_THROW(checkItemName("/etc"),     FileError);
}


TEST(ItemName, RelativePathBelowFolder)
{
    EXPECT_EQ(appendRelPathChecked("/tmp/dl", "a.csv"), "/tmp/dl/a.csv");
    EXPECT_EQ(appendRelPathChecked("/tmp/dl", "sub/dir/file.csv"), "/tmp/dl/sub/dir/file.csv");

    EXPECT_THROW(appendRelPathChecked("/tmp/dl", "../../etc/cron.d/evil"), FileError);
    EXPECT_THROW(appendRelPathChecked("/tmp/dl", "sub/../../evil"), FileError);
    EXPECT_THROW(appendRelPathChecked("/tmp/dl", "a/./b"), FileError);
    EXPECT_THROW(appendRelPathChecked("/tmp/dl", "a//b"), FileError);
    EXPECT_THROW(appendRelPathChecked("/tmp/dl", "/etc/passwd"), FileError);
    EXPECT_THROW(appendRelPathChecked("/tmp/dl", ""), FileError);

    try
    {
        appendRelPathChecked("/tmp/dl", "data/../../x");
        FAIL();
    }
    catch (const FileError& e)
    {
        EXPECT_NE(e.toString().find(L"Cannot store \"data/../../x\" below \"/tmp/dl\"."), std::wstring::npos);
    }
}
