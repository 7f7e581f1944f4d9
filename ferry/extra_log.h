// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef EXTRA_LOG_H_5082736410928374
#define EXTRA_LOG_H_5082736410928374

#include <functional>
#include <mutex>
#include "error_log.h"

/*  log errors in "exceptional situations" when no other means are available, e.g.
    - while an exception is in flight
    - cleanup errors inside destructors                          */

namespace ferry
{
namespace impl
{
class ExtraLog
{
public:
    ~ExtraLog()
    {
        if (!log_.empty() && reportOutstandingLog_)
            reportOutstandingLog_(log_);
    }

    void init(const std::function<void(const ErrorLog& log)>& reportOutstandingLog)
    {
        std::lock_guard dummy(lockLog_);
        reportOutstandingLog_ = reportOutstandingLog;
    }

    ErrorLog fetchLog()
    {
        std::lock_guard dummy(lockLog_);
        return std::exchange(log_, ErrorLog());
    }

    void logError(const std::wstring& msg) //nothrow!
    {
        try
        {
            std::lock_guard dummy(lockLog_);
            logMsg(log_, msg, MSG_TYPE_ERROR);
        }
        catch (const std::bad_alloc&) { assert(false); }
    }

private:
    std::mutex lockLog_;
    ErrorLog log_;
    std::function<void(const ErrorLog& log)> reportOutstandingLog_;
};


inline
ExtraLog& getExtraLog()
{
    static ExtraLog extraLog; //thread-safe init
    return extraLog;
}
}


inline
void initExtraLog(const std::function<void(const ErrorLog& log)>& reportOutstandingLog /*nothrow! runs during global shutdown!*/)
{
    impl::getExtraLog().init(reportOutstandingLog);
}


inline
ErrorLog fetchExtraLog()
{
    return impl::getExtraLog().fetchLog();
}


inline
void logExtraError(const std::wstring& msg) //nothrow!
{
    impl::getExtraLog().logError(msg);
}
}

#endif //EXTRA_LOG_H_5082736410928374
