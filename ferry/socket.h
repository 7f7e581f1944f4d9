// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef SOCKET_H_9910283745610298
#define SOCKET_H_9910283745610298

#include <optional>
#include "sys_error.h"
    #include <fcntl.h>
    #include <unistd.h> //close
    #include <sys/select.h>
    #include <sys/socket.h>
    #include <netinet/in.h>
    #include <netinet/tcp.h> //TCP_NODELAY
    #include <netdb.h> //getaddrinfo


namespace ferry
{
inline
std::wstring formatGaiErrorCode(int ec)
{
    switch (ec)
    {
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_AGAIN);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_BADFLAGS);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_FAIL);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_FAMILY);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_MEMORY);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_NONAME);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_SERVICE);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_SOCKTYPE);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_SYSTEM);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_OVERFLOW);
        default:
            return replaceCpy(L"Error code %x", L"%x", numberTo<std::wstring>(ec));
    }
}

using SocketType = int;
const SocketType invalidSocket = -1;

void setNonBlocking(SocketType socket, bool value); //throw SysError


//blocking TCP connection; the time out applies to connect() only
class Socket //throw SysError
{
public:
    Socket(const std::string& server, const std::string& serviceName, int timeoutSec) //throw SysError
    {
        if (trimCpy(server).empty())
            throw SysError(L"Server name must not be empty.");

        const addrinfo hints
        {
            .ai_flags = AI_ADDRCONFIG, //save a AAAA lookup on machines that can't use the returned data anyhow
            .ai_socktype = SOCK_STREAM,
        };

        addrinfo* servinfo = nullptr;
        FERRY_ON_SCOPE_EXIT(if (servinfo) ::freeaddrinfo(servinfo));

        if (const int rcGai = ::getaddrinfo(server.c_str(), serviceName.c_str(), &hints, &servinfo);
            rcGai != 0)
        {
            if (rcGai == EAI_SYSTEM) //"check errno for details"
                THROW_LAST_SYS_ERROR("getaddrinfo");
            throw SysError(formatSystemError("getaddrinfo", formatGaiErrorCode(rcGai), utfTo<std::wstring>(::gai_strerror(rcGai))));
        }
        if (!servinfo)
            throw SysError(formatSystemError("getaddrinfo", L"", L"Empty server info."));

        //try all addresses returned, e.g. AF_INET6 + AF_INET
        std::optional<SysError> firstError;
        for (const addrinfo* si = servinfo; si; si = si->ai_next)
            try
            {
                socket_ = connectSocket(*si, timeoutSec); //throw SysError; pass ownership
                return;
            }
            catch (const SysError& e) { if (!firstError) firstError = e; }

        throw* firstError; //list was not empty, so there must have been an error!
    }

    ~Socket() { ::close(socket_); }

    SocketType get() const { return socket_; }

private:
    Socket           (const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    static SocketType connectSocket(const addrinfo& ai, int timeoutSec) //throw SysError
    {
        const SocketType testSocket = ::socket(ai.ai_family, SOCK_CLOEXEC | SOCK_NONBLOCK | ai.ai_socktype, ai.ai_protocol);
        if (testSocket == invalidSocket)
            THROW_LAST_SYS_ERROR("socket");
        FERRY_ON_SCOPE_FAIL(::close(testSocket));

        if (::connect(testSocket, ai.ai_addr, ai.ai_addrlen) != 0)
        {
            if (errno != EINPROGRESS)
                THROW_LAST_SYS_ERROR("connect");

            fd_set writefds{};
            fd_set exceptfds{};
            FD_SET(testSocket, &writefds);
            FD_SET(testSocket, &exceptfds);

            timeval tv{.tv_sec = timeoutSec};

            const int rv = ::select(testSocket + 1, nullptr, &writefds, &exceptfds, &tv);
            if (rv < 0)
                THROW_LAST_SYS_ERROR("select");

            if (rv == 0) //time-out!
                throw SysError(formatSystemError("select, " + numberTo<std::string>(timeoutSec) + " sec", ETIMEDOUT));

            int error = 0;
            socklen_t optLen = sizeof(error);
            if (::getsockopt(testSocket, SOL_SOCKET, SO_ERROR, &error, &optLen) != 0)
                THROW_LAST_SYS_ERROR("getsockopt(SO_ERROR)");

            if (error != 0)
                throw SysError(formatSystemError("connect, SO_ERROR", static_cast<ErrorCode>(error)));
        }

        setNonBlocking(testSocket, false); //throw SysError

        int noDelay = 1; //disable Nagle algorithm
        if (::setsockopt(testSocket, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay)) != 0)
            THROW_LAST_SYS_ERROR("setsockopt(TCP_NODELAY)");

        return testSocket;
    }

    SocketType socket_ = invalidSocket;
};


inline
void setNonBlocking(SocketType socket, bool nonBlocking) //throw SysError
{
    int flags = ::fcntl(socket, F_GETFL);
    if (flags == -1)
        THROW_LAST_SYS_ERROR("fcntl(F_GETFL)");

    if (nonBlocking)
        flags |= O_NONBLOCK;
    else
        flags &= ~O_NONBLOCK;

    if (::fcntl(socket, F_SETFL, flags) != 0)
        THROW_LAST_SYS_ERROR(nonBlocking ? "fcntl(F_SETFL, O_NONBLOCK)" : "fcntl(F_SETFL, ~O_NONBLOCK)");
}
}

#endif //SOCKET_H_9910283745610298
