// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "sys_error.h"
    #include <glib.h>

using namespace ferry;


namespace
{
std::wstring formatSystemErrorCode(ErrorCode ec)
{
    switch (ec) //codes relevant for file, socket and process handling
    {
            FERRY_CHECK_CASE_FOR_CONSTANT(EPERM);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOENT);
            FERRY_CHECK_CASE_FOR_CONSTANT(ESRCH);
            FERRY_CHECK_CASE_FOR_CONSTANT(EINTR);
            FERRY_CHECK_CASE_FOR_CONSTANT(EIO);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENXIO);
            FERRY_CHECK_CASE_FOR_CONSTANT(E2BIG);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOEXEC);
            FERRY_CHECK_CASE_FOR_CONSTANT(EBADF);
            FERRY_CHECK_CASE_FOR_CONSTANT(ECHILD);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAGAIN);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOMEM);
            FERRY_CHECK_CASE_FOR_CONSTANT(EACCES);
            FERRY_CHECK_CASE_FOR_CONSTANT(EFAULT);
            FERRY_CHECK_CASE_FOR_CONSTANT(EBUSY);
            FERRY_CHECK_CASE_FOR_CONSTANT(EEXIST);
            FERRY_CHECK_CASE_FOR_CONSTANT(EXDEV);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENODEV);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOTDIR);
            FERRY_CHECK_CASE_FOR_CONSTANT(EISDIR);
            FERRY_CHECK_CASE_FOR_CONSTANT(EINVAL);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENFILE);
            FERRY_CHECK_CASE_FOR_CONSTANT(EMFILE);
            FERRY_CHECK_CASE_FOR_CONSTANT(ETXTBSY);
            FERRY_CHECK_CASE_FOR_CONSTANT(EFBIG);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOSPC);
            FERRY_CHECK_CASE_FOR_CONSTANT(ESPIPE);
            FERRY_CHECK_CASE_FOR_CONSTANT(EROFS);
            FERRY_CHECK_CASE_FOR_CONSTANT(EMLINK);
            FERRY_CHECK_CASE_FOR_CONSTANT(EPIPE);
            FERRY_CHECK_CASE_FOR_CONSTANT(ERANGE);
            FERRY_CHECK_CASE_FOR_CONSTANT(EDEADLK);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENAMETOOLONG);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOLCK);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOSYS);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOTEMPTY);
            FERRY_CHECK_CASE_FOR_CONSTANT(ELOOP);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENODATA);
            FERRY_CHECK_CASE_FOR_CONSTANT(ETIME);
            FERRY_CHECK_CASE_FOR_CONSTANT(EPROTO);
            FERRY_CHECK_CASE_FOR_CONSTANT(EOVERFLOW);
            FERRY_CHECK_CASE_FOR_CONSTANT(EILSEQ);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOTSOCK);
            FERRY_CHECK_CASE_FOR_CONSTANT(EMSGSIZE);
            FERRY_CHECK_CASE_FOR_CONSTANT(EPROTONOSUPPORT);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOTSUP);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAFNOSUPPORT);
            FERRY_CHECK_CASE_FOR_CONSTANT(EADDRINUSE);
            FERRY_CHECK_CASE_FOR_CONSTANT(EADDRNOTAVAIL);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENETDOWN);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENETUNREACH);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENETRESET);
            FERRY_CHECK_CASE_FOR_CONSTANT(ECONNABORTED);
            FERRY_CHECK_CASE_FOR_CONSTANT(ECONNRESET);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOBUFS);
            FERRY_CHECK_CASE_FOR_CONSTANT(EISCONN);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOTCONN);
            FERRY_CHECK_CASE_FOR_CONSTANT(ESHUTDOWN);
            FERRY_CHECK_CASE_FOR_CONSTANT(ETIMEDOUT);
            FERRY_CHECK_CASE_FOR_CONSTANT(ECONNREFUSED);
            FERRY_CHECK_CASE_FOR_CONSTANT(EHOSTDOWN);
            FERRY_CHECK_CASE_FOR_CONSTANT(EHOSTUNREACH);
            FERRY_CHECK_CASE_FOR_CONSTANT(EALREADY);
            FERRY_CHECK_CASE_FOR_CONSTANT(EINPROGRESS);
            FERRY_CHECK_CASE_FOR_CONSTANT(ESTALE);
            FERRY_CHECK_CASE_FOR_CONSTANT(EDQUOT);
            FERRY_CHECK_CASE_FOR_CONSTANT(ECANCELED);
            FERRY_CHECK_CASE_FOR_CONSTANT(EREMOTEIO);
        default:
            return replaceCpy(L"Error code %x", L"%x", numberTo<std::wstring>(ec));
    }
}
}


std::wstring ferry::getSystemErrorDescription(ErrorCode ec) //return empty string on error
{
    const ErrorCode ecCurrent = getLastError(); //not necessarily == ec
    FERRY_ON_SCOPE_EXIT(errno = ecCurrent);

    std::wstring errorMsg = utfTo<std::wstring>(::g_strerror(ec)); //... vs strerror(): "marginally improves thread safety, and marginally improves consistency"

    trim(errorMsg);
    return errorMsg;
}


std::wstring ferry::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    return formatSystemError(functionName, formatSystemErrorCode(ec), getSystemErrorDescription(ec));
}


std::wstring ferry::formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg)
{
    std::wstring output = trimCpy(errorCode);

    const std::wstring errorMsgFmt = trimCpy(errorMsg);
    if (!output.empty() && !errorMsgFmt.empty())
        output += L": ";

    output += errorMsgFmt;

    if (!functionName.empty())
        output += L" [" + utfTo<std::wstring>(functionName) + L']';

    return trimCpy(output);
}
