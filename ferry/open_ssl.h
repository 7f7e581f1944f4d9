// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef OPEN_SSL_H_4420193857610293
#define OPEN_SSL_H_4420193857610293

#include <memory>
#include "sys_error.h"


namespace ferry
{
//init OpenSSL before use!
void openSslInit();
void openSslTearDown();

std::wstring formatLastOpenSSLError(const char* functionName);


//incremental SHA-256, e.g. for payload hashes of large uploads
class Sha256Hasher
{
public:
    Sha256Hasher(); //throw SysError
    ~Sha256Hasher();

    void update(const void* buffer, size_t bytes); //throw SysError
    std::string finalizeHex(); //throw SysError; lower-case hex digest

private:
    Sha256Hasher           (const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    struct Impl;
    const std::unique_ptr<Impl> pimpl_;
};

std::string getSha256HexDigest(std::string_view str); //throw SysError


std::string stringEncodeBase64(std::string_view str);
std::string stringDecodeBase64(std::string_view str); //throw SysError
}

#endif //OPEN_SSL_H_4420193857610293
