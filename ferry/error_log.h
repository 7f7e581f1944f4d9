// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef ERROR_LOG_H_6619203847561029
#define ERROR_LOG_H_6619203847561029

#include <cassert>
#include <ctime>
#include <vector>
#include "string_tools.h"
#include "utf.h"


namespace ferry
{
enum MessageType
{
    MSG_TYPE_INFO    = 0x1,
    MSG_TYPE_WARNING = 0x2,
    MSG_TYPE_ERROR   = 0x4,
};

struct LogEntry
{
    time_t      time = 0;
    MessageType type = MSG_TYPE_ERROR;
    std::string message; //UTF-8
};

std::string formatMessage(const LogEntry& entry);

using ErrorLog = std::vector<LogEntry>;

void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time = std::time(nullptr));

struct ErrorLogStats
{
    int info    = 0;
    int warning = 0;
    int error   = 0;
};
ErrorLogStats getStats(const ErrorLog& log);

std::wstring getMessageTypeLabel(MessageType type);






//######################## implementation ##########################
inline
void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time)
{
    log.push_back({time, type, utfTo<std::string>(msg)});
}


inline
ErrorLogStats getStats(const ErrorLog& log)
{
    ErrorLogStats count;
    for (const LogEntry& entry : log)
        switch (entry.type)
        {
            case MSG_TYPE_INFO:
                ++count.info;
                break;
            case MSG_TYPE_WARNING:
                ++count.warning;
                break;
            case MSG_TYPE_ERROR:
                ++count.error;
                break;
        }
    assert(std::ssize(log) == count.info + count.warning + count.error);
    return count;
}


inline
std::wstring getMessageTypeLabel(MessageType type)
{
    switch (type)
    {
        case MSG_TYPE_INFO:
            return L"Info";
        case MSG_TYPE_WARNING:
            return L"Warning";
        case MSG_TYPE_ERROR:
            return L"Error";
    }
    assert(false);
    return std::wstring();
}


//"[12:34:56]  Info:  message", continuation lines indented below the message start
inline
std::string formatMessage(const LogEntry& entry)
{
    char timeTag[16] = {};
    std::tm tmLocal = {};
    if (::localtime_r(&entry.time, &tmLocal))
        std::strftime(timeTag, sizeof(timeTag), "%H:%M:%S", &tmLocal);

    std::string msgFmt = std::string("[") + timeTag + "]  " + utfTo<std::string>(getMessageTypeLabel(entry.type)) + ":  ";
    const size_t prefixLen = msgFmt.size(); //prefix is ASCII-only

    const std::string msg = trimCpy(entry.message);

    for (auto it = msg.begin(); it != msg.end(); )
        if (*it == '\n')
        {
            msgFmt += *it++;
            msgFmt.append(prefixLen, ' ');
            for (; it != msg.end() && *it == '\n'; ++it) //skip duplicate newlines
                ;
        }
        else
            msgFmt += *it++;

    msgFmt += '\n';
    return msgFmt;
}
}

#endif //ERROR_LOG_H_6619203847561029
