// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "curl_wrap.h"
#include <algorithm>
#include <stdexcept>
#include <ferry/open_ssl.h>
    #include <fcntl.h>

using namespace ferry;


namespace
{
int curlInitLevel = 0; //support interleaving initialization calls!
//zero-initialized POD => not subject to static initialization order fiasco
}

void ferry::libcurlInit()
{
    assert(curlInitLevel >= 0);
    if (++curlInitLevel != 1) //non-atomic => require call from main thread
        return;

    openSslInit();

    try
    {
        ASSERT_SYSERROR(::curl_global_init(CURL_GLOBAL_NOTHING /*CURL_GLOBAL_DEFAULT = CURL_GLOBAL_SSL|CURL_GLOBAL_WIN32*/) == CURLE_OK);
    }
    catch (const SysError& e) { logExtraError(L"Error during process initialization.\n\n" + e.toString()); }
}


void ferry::libcurlTearDown()
{
    assert(curlInitLevel >= 1);
    if (--curlInitLevel != 0)
        return;

    ::curl_global_cleanup();
    openSslTearDown();
}


CurlSession::CurlSession(const std::string& urlPrefix, const std::string& caCertFilePath) :
    urlPrefix_(urlPrefix),
    caCertFilePath_(caCertFilePath) {}


CurlSession::~CurlSession()
{
    if (easyHandle_)
        ::curl_easy_cleanup(easyHandle_);
}


CURL* CurlSession::getEasyHandle() //throw SysError
{
    if (!easyHandle_)
    {
        easyHandle_ = ::curl_easy_init();
        if (!easyHandle_)
            throw SysError(formatSystemError("curl_easy_init", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));
    }
    return easyHandle_;
}


std::string CurlSession::escapeUrlComponent(const std::string& str) //throw SysError
{
    char* escaped = ::curl_easy_escape(getEasyHandle(), str.c_str(), static_cast<int>(str.size()));
    if (!escaped)
        throw SysError(formatSystemError("curl_easy_escape", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));
    FERRY_ON_SCOPE_EXIT(::curl_free(escaped));
    return escaped;
}


CurlSession::Result CurlSession::perform(const std::string& urlSuffix,
                                         const std::vector<std::string>& extraHeaders, const std::vector<CurlOption>& extraOptions,
                                         const std::function<void  (std::span<const char> buf)>& writeResponse /*throw X*/,
                                         const std::function<size_t(std::span<      char> buf)>& readRequest   /*throw X*/,
                                         const std::function<void(const std::string_view& header)>& receiveHeader /*throw X*/,
                                         int timeoutSec) //throw SysError, X
{
    CURL* easyHandle = getEasyHandle(); //throw SysError
    ::curl_easy_reset(easyHandle);

    auto setCurlOption = [easyHandle](const CurlOption& curlOpt) //throw SysError
    {
        if (const CURLcode rc = ::curl_easy_setopt(easyHandle, curlOpt.option, curlOpt.value);
            rc != CURLE_OK)
            throw SysError(formatSystemError("curl_easy_setopt(" + numberTo<std::string>(static_cast<int>(curlOpt.option)) + ")",
                                             formatCurlStatusCode(rc), utfTo<std::wstring>(::curl_easy_strerror(rc))));
    };

    char curlErrorBuf[CURL_ERROR_SIZE] = {};
    setCurlOption({CURLOPT_ERRORBUFFER, curlErrorBuf}); //throw SysError

    setCurlOption({CURLOPT_USERAGENT, "FileFerry"}); //throw SysError
    //default value; may be overwritten by caller

    const std::string url = urlPrefix_ + urlSuffix;
    setCurlOption({CURLOPT_URL, url.c_str()}); //throw SysError

    setCurlOption({CURLOPT_NOSIGNAL, 1}); //throw SysError
    //thread-safety: https://curl.haxx.se/libcurl/c/threadsafe.html

    setCurlOption({CURLOPT_CONNECTTIMEOUT, timeoutSec}); //throw SysError

    //CURLOPT_TIMEOUT is a hard limit for the whole transfer => useless for large files
    setCurlOption({CURLOPT_LOW_SPEED_TIME, timeoutSec}); //throw SysError
    setCurlOption({CURLOPT_LOW_SPEED_LIMIT, 1 /*[bytes]*/}); //throw SysError
    //can't use "0" which means "inactive", so use some low number

    setCurlOption({CURLOPT_SERVER_RESPONSE_TIMEOUT, timeoutSec}); //throw SysError
    //FTP only; unrelated to CURLOPT_LOW_SPEED_TIME: waiting for server response after sending a command


    std::exception_ptr userCallbackException;

    //libcurl does *not* set FD_CLOEXEC for us! https://github.com/curl/curl/issues/2252
    //=> would leak into transformation child processes
    auto onSocketCreate = [&](curl_socket_t curlfd, curlsocktype purpose)
    {
        if (::fcntl(curlfd, F_SETFD, FD_CLOEXEC) == -1)
        {
            userCallbackException = std::make_exception_ptr(SysError(formatSystemError("fcntl(FD_CLOEXEC)", errno)));
            return CURL_SOCKOPT_ERROR;
        }
        return CURL_SOCKOPT_OK;
    };

    using SocketCbType = decltype(onSocketCreate);
    using SocketCbWrapperType = int (*)(SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose); //needed for cdecl function pointer cast
    SocketCbWrapperType onSocketCreateWrapper = [](SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose)
    {
        return (*clientp)(curlfd, purpose); //free this poor little C-API from its shackles and redirect to a proper lambda
    };

    setCurlOption({CURLOPT_SOCKOPTFUNCTION, onSocketCreateWrapper}); //throw SysError
    setCurlOption({CURLOPT_SOCKOPTDATA, &onSocketCreate}); //throw SysError

    if (!caCertFilePath_.empty())
        setCurlOption({CURLOPT_CAINFO, caCertFilePath_.c_str()}); //throw SysError
    //else: system CA store; CURLOPT_SSL_VERIFYPEER/CURLOPT_SSL_VERIFYHOST may be relaxed by caller

    //---------------------------------------------------
    auto onHeaderReceived = [&](const char* buffer, size_t len)
    {
        try
        {
            receiveHeader({buffer, len}); //throw X
            return len;
        }
        catch (...)
        {
            userCallbackException = std::current_exception();
            return len + 1; //signal error condition => CURLE_WRITE_ERROR
        }
    };
    curl_write_callback onHeaderReceivedWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
    {
        return (*static_cast<decltype(onHeaderReceived)*>(callbackData))(buffer, size * nitems);
    };
    //---------------------------------------------------
    auto onBytesReceived = [&](const char* buffer, size_t bytesToWrite)
    {
        try
        {
            writeResponse({buffer, bytesToWrite}); //throw X
            return bytesToWrite;
        }
        catch (...)
        {
            userCallbackException = std::current_exception();
            return bytesToWrite + 1; //signal error condition => CURLE_WRITE_ERROR
        }
    };
    curl_write_callback onBytesReceivedWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
    {
        return (*static_cast<decltype(onBytesReceived)*>(callbackData))(buffer, size * nitems);
    };
    //---------------------------------------------------
    auto getBytesToSend = [&](char* buffer, size_t bytesToRead) -> size_t
    {
        try
        {
            //libcurl calls back until 0 bytes are returned (Posix read() semantics), or,
            //if CURLOPT_INFILESIZE_LARGE was set, after exactly this amount of bytes
            return readRequest({buffer, bytesToRead}); //throw X; return "bytesToRead" bytes unless end of stream
        }
        catch (...)
        {
            userCallbackException = std::current_exception();
            return CURL_READFUNC_ABORT; //signal error condition => CURLE_ABORTED_BY_CALLBACK
        }
    };
    curl_read_callback getBytesToSendWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
    {
        return (*static_cast<decltype(getBytesToSend)*>(callbackData))(buffer, size * nitems);
    };
    //---------------------------------------------------
    if (receiveHeader)
    {
        setCurlOption({CURLOPT_HEADERDATA, &onHeaderReceived}); //throw SysError
        setCurlOption({CURLOPT_HEADERFUNCTION, onHeaderReceivedWrapper}); //throw SysError
    }
    if (writeResponse)
    {
        setCurlOption({CURLOPT_WRITEDATA, &onBytesReceived}); //throw SysError
        setCurlOption({CURLOPT_WRITEFUNCTION, onBytesReceivedWrapper}); //throw SysError
    }
    if (readRequest)
    {
        setCurlOption({CURLOPT_UPLOAD, 1}); //throw SysError
        //FTP: STOR, HTTP: PUT

        setCurlOption({CURLOPT_READDATA, &getBytesToSend}); //throw SysError
        setCurlOption({CURLOPT_READFUNCTION, getBytesToSendWrapper}); //throw SysError
    }

    if (std::any_of(extraOptions.begin(), extraOptions.end(), [](const CurlOption& o) { return o.option == CURLOPT_WRITEFUNCTION || o.option == CURLOPT_READFUNCTION; }))
    /**/ throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!"); //Option already used here!

    //---------------------------------------------------
    curl_slist* headers = nullptr; //"libcurl will not copy the entire list so you must keep it!"
    FERRY_ON_SCOPE_EXIT(::curl_slist_free_all(headers));

    for (const std::string& headerLine : extraHeaders)
        headers = ::curl_slist_append(headers, headerLine.c_str());

    if (startsWith(urlPrefix_, "http"))
        //1-sec delay when server doesn't support "Expect: 100-continue"
        headers = ::curl_slist_append(headers, "Expect:");

    if (headers)
        setCurlOption({CURLOPT_HTTPHEADER, headers}); //throw SysError
    //---------------------------------------------------

    for (const CurlOption& option : extraOptions)
        setCurlOption(option); //throw SysError

    //=======================================================================================================
    const CURLcode rcPerf = ::curl_easy_perform(easyHandle);
    //curl_easy_perform() considers FTP response codes 4XX, 5XX as failure, but for HTTP response codes 4XX are considered success!
    //=> let caller handle HTTP status

    if (userCallbackException)
        std::rethrow_exception(userCallbackException); //throw X
    //=======================================================================================================

    long responseCode = 0; //optional
    if (::curl_easy_getinfo(easyHandle, CURLINFO_RESPONSE_CODE, &responseCode) != CURLE_OK)
        responseCode = 0;

    if (rcPerf != CURLE_OK)
    {
        std::wstring errorMsg = trimCpy(utfTo<std::wstring>(curlErrorBuf)); //optional

        if (responseCode != 0)
        {
            errorMsg += (errorMsg.empty() ? L"" : L"\n") + replaceCpy(L"Response code %x", L"%x", numberTo<std::wstring>(responseCode));

            if (rcPerf != CURLE_OPERATION_TIMEDOUT && rcPerf != CURLE_LOGIN_DENIED && responseCode >= 400)
                throw SysErrorCurlProtocol(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg), static_cast<int>(responseCode));
        }

        if (rcPerf == CURLE_LOGIN_DENIED)
            throw SysErrorLogin(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg));

        throw SysError(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg));
    }

    return {static_cast<int>(responseCode)};
}


std::wstring ferry::formatCurlStatusCode(CURLcode sc)
{
    switch (sc)
    {
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_OK);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_UNSUPPORTED_PROTOCOL);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FAILED_INIT);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_URL_MALFORMAT);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_NOT_BUILT_IN);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_RESOLVE_PROXY);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_RESOLVE_HOST);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_CONNECT);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_WEIRD_SERVER_REPLY);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_ACCESS_DENIED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_ACCEPT_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_PASS_REPLY);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_ACCEPT_TIMEOUT);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_PASV_REPLY);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_227_FORMAT);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_CANT_GET_HOST);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_HTTP2);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_SET_TYPE);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_PARTIAL_FILE);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_RETR_FILE);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_QUOTE_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_HTTP_RETURNED_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_WRITE_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_UPLOAD_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_READ_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_OUT_OF_MEMORY);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_OPERATION_TIMEDOUT);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_PORT_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_USE_REST);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_RANGE_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CONNECT_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_BAD_DOWNLOAD_RESUME);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FILE_COULDNT_READ_FILE);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_ABORTED_BY_CALLBACK);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_BAD_FUNCTION_ARGUMENT);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_INTERFACE_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_TOO_MANY_REDIRECTS);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_UNKNOWN_OPTION);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_GOT_NOTHING);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SEND_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_RECV_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CERTPROBLEM);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CIPHER);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_PEER_FAILED_VERIFICATION);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_BAD_CONTENT_ENCODING);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FILESIZE_EXCEEDED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_USE_SSL_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SEND_FAIL_REWIND);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_LOGIN_DENIED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_DISK_FULL);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_FILE_EXISTS);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CACERT_BADFILE);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_FILE_NOT_FOUND);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSH);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_SHUTDOWN_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_AGAIN);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_PRET_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_BAD_FILE_LIST);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_NO_CONNECTION_AVAILABLE);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_AUTH_ERROR);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_PROXY);
            FERRY_CHECK_CASE_FOR_CONSTANT(CURLE_UNRECOVERABLE_POLL);
        default:
            break;
    }
    return replaceCpy(L"Curl status %x", L"%x", numberTo<std::wstring>(static_cast<int>(sc)));
}
