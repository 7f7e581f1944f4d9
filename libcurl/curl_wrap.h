// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef CURL_WRAP_H_3301928475610293
#define CURL_WRAP_H_3301928475610293

#include <span>
#include <functional>
#include <ferry/sys_error.h>


//-------------------------------------------------
#include <curl/curl.h>
//-------------------------------------------------

#ifndef CURLINC_CURL_H
    #error curl.h header guard changed
#endif

namespace ferry
{
void libcurlInit();
void libcurlTearDown();


DEFINE_NEW_SYS_ERROR(SysErrorLogin)

//server responded with an error status, e.g. FTP 550 or HTTP 404
class SysErrorCurlProtocol : public SysError
{
public:
    SysErrorCurlProtocol(const std::wstring& msg, int sc) : SysError(msg), statusCode(sc) {}

    const int statusCode;
};


struct CurlOption
{
    template <class T>
    CurlOption(CURLoption o, T val) : option(o), value(static_cast<uint64_t>(val)) { static_assert(sizeof(val) <= sizeof(value)); }

    template <class T>
    CurlOption(CURLoption o, T* val) : option(o), value(reinterpret_cast<uint64_t>(val)) { static_assert(sizeof(val) <= sizeof(value)); }

    CURLoption option = CURLOPT_LASTENTRY;
    uint64_t value = 0;
};


/*  one easy handle, reused for all requests against the same server:
    - FTP: response codes >= 400 make perform() fail
    - HTTP: response code is returned to the caller, who decides  */
class CurlSession
{
public:
    CurlSession(const std::string& urlPrefix /*e.g. "ftp://host:21" */, const std::string& caCertFilePath /*optional*/);
    ~CurlSession();

    struct Result
    {
        int responseCode = 0;
    };
    Result perform(const std::string& urlSuffix /*already URL-escaped*/,
                   const std::vector<std::string>& extraHeaders, const std::vector<CurlOption>& extraOptions,
                   const std::function<void  (std::span<const char> buf)>& writeResponse /*throw X*/, //optional
                   const std::function<size_t(std::span<      char> buf)>& readRequest   /*throw X*/, //optional; return "bytesToRead" bytes unless end of stream!
                   const std::function<void(const std::string_view& header)>& receiveHeader /*throw X*/, //optional
                   int timeoutSec); //throw SysError, X

    std::string escapeUrlComponent(const std::string& str); //throw SysError

private:
    CurlSession           (const CurlSession&) = delete;
    CurlSession& operator=(const CurlSession&) = delete;

    CURL* getEasyHandle(); //throw SysError

    const std::string urlPrefix_;
    const std::string caCertFilePath_; //optional
    CURL* easyHandle_ = nullptr;
};


std::wstring formatCurlStatusCode(CURLcode sc);
}

#else
#error Why is this header already defined? Do not include in other headers: encapsulate the gory details!
#endif //CURL_WRAP_H_3301928475610293
