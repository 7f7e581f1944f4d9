// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef SFTP_H_8830192746501928
#define SFTP_H_8830192746501928

#include "abstract.h"


namespace ffy
{
/*  "sftp": paths are relative to the login folder unless starting with '/'

    authentication by connection options:
        "agent"          SSH agent
        "keyfile=<path>" private key file, the secret is the passphrase
        otherwise        password, keyboard-interactive if the server does not offer "password"  */
std::unique_ptr<FileBackend> createSftpBackend(const std::string& connectionId, const std::shared_ptr<const ConnectionRegistry>& connections);

void sftpInit(); //throw SysError; process-wide, not thread-safe
void sftpTearDown();
}

#endif //SFTP_H_8830192746501928
