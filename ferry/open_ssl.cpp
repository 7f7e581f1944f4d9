// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "open_ssl.h"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>

using namespace ferry;


namespace
{
#ifndef OPENSSL_THREADS
    #error OpenSSL must be built with thread support
#endif

static_assert(OPENSSL_VERSION_NUMBER >= 0x30000000L, "OpenSSL version is too old!");


std::wstring formatOpenSSLError(const char* functionName, unsigned long ec)
{
    char errorBuf[256] = {}; //== buffer size used by ERR_error_string()
    ::ERR_error_string_n(ec, errorBuf, sizeof(errorBuf)); //includes null-termination

    return formatSystemError(functionName, replaceCpy(L"Error code %x", L"%x", numberTo<std::wstring>(ec)), utfTo<std::wstring>(errorBuf));
}
}


std::wstring ferry::formatLastOpenSSLError(const char* functionName)
{
    const auto ec = ::ERR_peek_last_error(); //"returns latest error code from the thread's error queue without modifying it"
    ::ERR_clear_error(); //clean up for next OpenSSL operation on this thread
    return formatOpenSSLError(functionName, ec);
}


void ferry::openSslInit()
{
    //see Curl_ossl_cleanup(): https://github.com/curl/curl/blob/master/lib/vtls/openssl.c
    if (::OPENSSL_init_ssl(OPENSSL_INIT_SSL_DEFAULT | OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) != 1)
        logExtraError(L"Error during process initialization.\n\n" + formatLastOpenSSLError("OPENSSL_init_ssl"));
}


void ferry::openSslTearDown() {}
//OpenSSL 1.1.0+ deprecates all clean up functions

//================================================================================

struct Sha256Hasher::Impl
{
    EVP_MD_CTX* mdctx = nullptr;
};


Sha256Hasher::Sha256Hasher() : pimpl_(std::make_unique<Impl>()) //throw SysError
{
    pimpl_->mdctx = ::EVP_MD_CTX_new();
    if (!pimpl_->mdctx)
        throw SysError(formatSystemError("EVP_MD_CTX_new", L"", L"No more error details."));

    if (::EVP_DigestInit_ex(pimpl_->mdctx, ::EVP_sha256(), nullptr /*ENGINE* impl*/) != 1)
    {
        const std::wstring errorMsg = formatLastOpenSSLError("EVP_DigestInit_ex");
        ::EVP_MD_CTX_free(pimpl_->mdctx);
        throw SysError(errorMsg);
    }
}


Sha256Hasher::~Sha256Hasher() { ::EVP_MD_CTX_free(pimpl_->mdctx); }


void Sha256Hasher::update(const void* buffer, size_t bytes) //throw SysError
{
    if (::EVP_DigestUpdate(pimpl_->mdctx, buffer, bytes) != 1)
        throw SysError(formatLastOpenSSLError("EVP_DigestUpdate"));
}


std::string Sha256Hasher::finalizeHex() //throw SysError
{
    std::string output(EVP_MAX_MD_SIZE, '\0');
    unsigned int bytesWritten = 0;

    if (::EVP_DigestFinal_ex(pimpl_->mdctx, reinterpret_cast<unsigned char*>(output.data()), &bytesWritten) != 1)
        throw SysError(formatLastOpenSSLError("EVP_DigestFinal_ex"));

    output.resize(bytesWritten);
    return formatAsHexString(output);
}


std::string ferry::getSha256HexDigest(std::string_view str) //throw SysError
{
    Sha256Hasher hasher; //throw SysError
    hasher.update(str.data(), str.size()); //throw SysError
    return hasher.finalizeHex(); //throw SysError
}

//================================================================================

std::string ferry::stringEncodeBase64(std::string_view str)
{
    std::string output(4 * ((str.size() + 2) / 3) + 1 /*null-termination*/, '\0');

    const int bytesWritten = ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(output.data()),
                                               reinterpret_cast<const unsigned char*>(str.data()), static_cast<int>(str.size()));
    output.resize(bytesWritten);
    return output;
}


std::string ferry::stringDecodeBase64(std::string_view str) //throw SysError
{
    const std::string input = trimCpy(str);
    if (input.empty())
        return {};
    if (input.size() % 4 != 0)
        throw SysError(formatSystemError("EVP_DecodeBlock", L"", L"Invalid base64 input length."));

    std::string output(3 * (input.size() / 4), '\0');

    const int bytesWritten = ::EVP_DecodeBlock(reinterpret_cast<unsigned char*>(output.data()),
                                               reinterpret_cast<const unsigned char*>(input.data()), static_cast<int>(input.size()));
    if (bytesWritten < 0)
        throw SysError(formatLastOpenSSLError("EVP_DecodeBlock"));

    //EVP_DecodeBlock() keeps the zero bytes produced by padding
    size_t padding = 0;
    if (endsWith(input, "=="))
        padding = 2;
    else if (endsWith(input, "="))
        padding = 1;

    output.resize(bytesWritten - padding);
    return output;
}
