// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef STEP_CALLBACK_H_7710293845610293
#define STEP_CALLBACK_H_7710293845610293

#include <optional>
#include <string>
#include <type_traits>
#include <ferry/extra_log.h>
#include <ferry/utf.h>


namespace ffy
{
//receives the progress log of steps and backends
struct StepCallback
{
    virtual ~StepCallback() {}

    enum class MsgType
    {
        info,
        warning,
        error,
    };

    virtual void logMessage(const std::wstring& msg, MsgType type) = 0; //throw X

    void logInfo(const std::wstring& msg) { logMessage(msg, MsgType::info); } //throw X
};


//append errors that could not be thrown (cleanup in destructors, errors while unwinding) to the step log
inline
void reportExtraLog(StepCallback& cb) //throw X
{
    for (const ferry::LogEntry& entry : ferry::fetchExtraLog())
        cb.logMessage(ferry::utfTo<std::wstring>(entry.message),
                      entry.type == ferry::MSG_TYPE_INFO    ? StepCallback::MsgType::info :
                      entry.type == ferry::MSG_TYPE_WARNING ? StepCallback::MsgType::warning :
                      StepCallback::MsgType::error); //throw X
}


//run a step body, then report the extra log: local resources of "stepBody" are already cleaned up at this point
template <class Function> inline
auto runStep(StepCallback& cb, Function stepBody) //throw X
{
    if constexpr (std::is_void_v<decltype(stepBody())>)
    {
        try
        {
            stepBody(); //throw X
        }
        catch (...)
        {
            reportExtraLog(cb); //throw X
            throw;
        }
        reportExtraLog(cb); //throw X
    }
    else
    {
        std::optional<decltype(stepBody())> result;
        try
        {
            result = stepBody(); //throw X
        }
        catch (...)
        {
            reportExtraLog(cb); //throw X
            throw;
        }
        reportExtraLog(cb); //throw X
        return std::move(*result);
    }
}
}

#endif //STEP_CALLBACK_H_7710293845610293
