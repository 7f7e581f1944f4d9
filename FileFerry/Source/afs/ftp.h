// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef FTP_H_5591028374651029
#define FTP_H_5591028374651029

#include <functional>
#include <ferry/file_access.h>
#include "abstract.h"


namespace ffy
{
//"ftp": FTP and FTPS (connection option "ssl"); paths are relative to the login folder unless starting with '/'
std::unique_ptr<FileBackend> createFtpBackend(const std::string& connectionId, const std::shared_ptr<const ConnectionRegistry>& connections);


struct FtpItem
{
    ferry::ItemType type = ferry::ItemType::file;
    std::string itemName;
    uint64_t fileSize = 0;
};

//"." and ".." are skipped
std::vector<FtpItem> parseFtpUnixListing(const std::string& buf); //throw SysError; "ls -l" format
std::vector<FtpItem> parseFtpMlsdListing(const std::string& buf); //throw SysError; RFC 3659

/*  existence check on the listing of the parent folder:
    - fnmatch() on item names: files match regular files, folders match folders
    - symbolic links never match: target type is unknown
    - FTP status 550 while listing: parent folder does not exist => false      */
bool ftpItemExistsAs(const std::function<std::vector<FtpItem>()>& listParentFolder /*throw SysError*/,
                     const std::string& namePattern, bool matchFolders, StepCallback& cb); //throw SysError
}

#endif //FTP_H_5591028374651029
