// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include <gtest/gtest.h>
#include <libcurl/curl_wrap.h>
#include <FileFerry/Source/afs/ftp.h>
#include <FileFerry/Source/base/step_logger.h>

using namespace ferry;
using namespace ffy;


namespace
{
const FtpItem* findItem(const std::vector<FtpItem>& items, const std::string& itemName)
{
    for (const FtpItem& item : items)
        if (item.itemName == itemName)
            return &item;
    return nullptr;
}


const char mlsdListing[] =
    "type=cdir;sizd=4096;modify=20240116230740; .\r\n"
    "type=pdir;sizd=4096;modify=20240116230740; ..\r\n"
    "type=file;size=10;modify=20240113063314; report_2024.csv\r\n"
    "type=file;size=12;modify=20230113063314; report_2023.csv\r\n"
    "type=dir;sizd=4096;modify=20240117144634; reports_archive\r\n"
    "type=OS.unix=slink:/data/x.csv;modify=20240117144634; report_link.csv\r\n";

const char unixListing[] =
    "total 16\r\n"
    "drwxr-xr-x 2 ftp ftp 4096 Jan 10 11:58 .\r\n"
    "drwxr-xr-x 2 ftp ftp 4096 Jan 10 11:58 ..\r\n"
    "-rw-r--r-- 1 ftp ftp   10 Jan 13 06:33 report_2024.csv\r\n"
    "-rw-r--r-- 1 ftp ftp   12 Jan 13  2023 report_2023.csv\r\n"
    "drwxr-xr-x 2 ftp ftp 4096 Jan 17 14:46 reports_archive\r\n"
    "lrwxrwxrwx 1 ftp ftp   10 Jan 17 14:46 report_link.csv -> /data/x.csv\r\n";


bool existsInListing(const std::string& listing, bool mlsd, const std::string& namePattern, bool matchFolders)
{
    StepLogger logger;
    return ftpItemExistsAs([&] { return mlsd ? parseFtpMlsdListing(listing) : parseFtpUnixListing(listing); },
                           namePattern, matchFolders, logger);
}
}


TEST(FtpListing, UnixStandard)
{
    const std::vector<FtpItem> items = parseFtpUnixListing(
        "total 4953\r\n"
        "drwxr-xr-x 1 root root    4096 Jan 10 11:58 version\r\n"
        "-rwxr-xr-x 1 root root    1084 Sep  2 01:17 Unit Test.vcxproj.user\r\n"
        "-rwxr-xr-x 1 1000  300    2217 Feb 28  2016 win32.manifest\r\n"
        "lrwxr-xr-x 1 root root      18 Apr 26 15:17 Projects -> /mnt/hgfs/Projects\r\n");

    ASSERT_EQ(items.size(), 4u);

    EXPECT_EQ(items[0].type, ItemType::folder);
    EXPECT_EQ(items[0].itemName, "version");

    EXPECT_EQ(items[1].type, ItemType::file);
    EXPECT_EQ(items[1].itemName, "Unit Test.vcxproj.user"); //blanks inside names
    EXPECT_EQ(items[1].fileSize, 1084u);

    EXPECT_EQ(items[2].fileSize, 2217u);

    EXPECT_EQ(items[3].type, ItemType::symlink);
    EXPECT_EQ(items[3].itemName, "Projects");
}


TEST(FtpListing, UnixWithoutOwnerOrGroup)
{
    //format is detected per item type
    const std::vector<FtpItem> items = parseFtpUnixListing(
        "dr-xr-xr-x   2 root                  512 Apr  8  1994 etc\n"
        "-rw-r--r--   1 ftp      ftp        12345 Mar  3 12:00 report_2024.csv\n");

    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].itemName, "etc");
    EXPECT_EQ(items[0].type, ItemType::folder);
    EXPECT_EQ(items[1].itemName, "report_2024.csv");
    EXPECT_EQ(items[1].fileSize, 12345u);

    const std::vector<FtpItem> items2 = parseFtpUnixListing("drwxrwxrwx 1              0 Jan  1 00:00 dirname/\n");
    ASSERT_EQ(items2.size(), 1u);
    EXPECT_EQ(items2[0].itemName, "dirname"); //trailing slash stripped
    EXPECT_EQ(items2[0].type, ItemType::folder);
}


TEST(FtpListing, UnixSkipsDotEntries)
{
    const std::vector<FtpItem> items = parseFtpUnixListing(
        "drwxr-xr-x 2 u g 4096 Jan 10 11:58 .\n"
        "drwxr-xr-x 2 u g 4096 Jan 10 11:58 ..\n"
        "-rw-r--r-- 1 u g    7 Jan 10 11:58 a.txt\n");

    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].itemName, "a.txt");
}


TEST(FtpListing, UnixEmptyAndInvalid)
{
    EXPECT_TRUE(parseFtpUnixListing("").empty());
    EXPECT_TRUE(parseFtpUnixListing("total 0\r\n").empty());

    EXPECT_THROW(parseFtpUnixListing("this is not a listing\n"), SysError);
    EXPECT_THROW(parseFtpUnixListing("-rw-r--r-- 1 u g 7 Foo 10 11:58 a.txt\n"), SysError); //bad month
}


TEST(FtpListing, Mlsd)
{
    const std::vector<FtpItem> items = parseFtpMlsdListing(
        "type=cdir;sizd=4096;modify=20170116230740;UNIX.mode=0755; .\r\n"
        "type=pdir;sizd=4096;modify=20170116230740;UNIX.mode=0755; ..\r\n"
        "type=file;size=4;modify=20170113063314;UNIX.mode=0600; readme.txt\r\n"
        "Type=DIR;sizd=4096;modify=20170117144634;UNIX.mode=0755; folder\r\n"
        "type=OS.unix=slink:/target;modify=20170117144634; link\r\n"
        "type=file;size=10; name with blanks.csv\r\n");

    ASSERT_EQ(items.size(), 4u);

    const FtpItem* readme = findItem(items, "readme.txt");
    ASSERT_TRUE(readme);
    EXPECT_EQ(readme->type, ItemType::file);
    EXPECT_EQ(readme->fileSize, 4u);

    const FtpItem* folder = findItem(items, "folder");
    ASSERT_TRUE(folder);
    EXPECT_EQ(folder->type, ItemType::folder);

    const FtpItem* link = findItem(items, "link");
    ASSERT_TRUE(link);
    EXPECT_EQ(link->type, ItemType::symlink);

    ASSERT_TRUE(findItem(items, "name with blanks.csv"));
}


TEST(FtpListing, MlsdMissingSize)
{
    EXPECT_THROW(parseFtpMlsdListing("type=file;modify=20170113063314; readme.txt\r\n"), SysError);
    EXPECT_THROW(parseFtpMlsdListing("type=file;size=4;\r\n"), SysError);
}


TEST(FtpExistence, WildcardsOnParsedListings)
{
    for (const bool mlsd : {true, false})
    {
        const std::string listing = mlsd ? mlsdListing : unixListing;

        EXPECT_TRUE (existsInListing(listing, mlsd, "report_*.csv",    false));
        EXPECT_TRUE (existsInListing(listing, mlsd, "report_2023.csv", false));
        EXPECT_FALSE(existsInListing(listing, mlsd, "invoice_*.csv",   false));

        //files match files only, folders match folders only
        EXPECT_FALSE(existsInListing(listing, mlsd, "reports_archive", false));
        EXPECT_TRUE (existsInListing(listing, mlsd, "reports_archive", true));
        EXPECT_TRUE (existsInListing(listing, mlsd, "reports_*",       true));
        EXPECT_FALSE(existsInListing(listing, mlsd, "report_2024.csv", true));

        //symlinks and dot entries never match
        EXPECT_FALSE(existsInListing(listing, mlsd, "report_link.csv", false));
        EXPECT_FALSE(existsInListing(listing, mlsd, "report_link.csv", true));
        EXPECT_FALSE(existsInListing(listing, mlsd, ".",  true));
        EXPECT_FALSE(existsInListing(listing, mlsd, "..", true));
        EXPECT_FALSE(existsInListing(listing, mlsd, ".*", true));
    }
}


TEST(FtpExistence, LogsMatches)
{
    StepLogger logger;
    EXPECT_TRUE(ftpItemExistsAs([] { return parseFtpMlsdListing(mlsdListing); }, "report_*.csv", false, logger));

    ASSERT_EQ(logger.getLog().size(), 1u);
    EXPECT_EQ(logger.getLog()[0].message, "Found the following files: [\"report_2024.csv\", \"report_2023.csv\"]");
}


TEST(FtpExistence, MissingParentFolder)
{
    StepLogger logger;

    //550: parent folder does not exist
    EXPECT_FALSE(ftpItemExistsAs([]() -> std::vector<FtpItem> { throw SysErrorCurlProtocol(L"550 No such file or directory", 550); },
                                 "a.csv", false, logger));

    //anything else is an error
    EXPECT_THROW(ftpItemExistsAs([]() -> std::vector<FtpItem> { throw SysErrorCurlProtocol(L"530 Not logged in", 530); },
                                 "a.csv", false, logger), SysError);
    EXPECT_THROW(ftpItemExistsAs([]() -> std::vector<FtpItem> { throw SysError(L"Connection reset"); },
                                 "a.csv", true, logger), SysError);
}


TEST(FtpListing, NamesLeavingTheFolderAreRejected)
{
    //listing entries are used as local names during folder downloads
    const std::vector<FtpItem> items = parseFtpUnixListing(
        "-rw-r--r-- 1 ftp ftp 10 Jan 13 06:33 ../../etc/cron.d/evil\r\n"
        "-rw-r--r-- 1 ftp ftp 10 Jan 13 06:33 plain.csv\r\n");

    ASSERT_EQ(items.size(), 2u);
    EXPECT_THROW(checkItemName(items[0].itemName), FileError);
    EXPECT_NO_THROW(checkItemName(items[1].itemName));
}
