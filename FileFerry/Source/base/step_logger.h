// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef STEP_LOGGER_H_3391028475610294
#define STEP_LOGGER_H_3391028475610294

#include <ostream>
#include <ferry/error_log.h>
#include <ferry/file_error.h>
#include "step_callback.h"


namespace ffy
{
/*  default StepCallback:
    - collects all messages into a ErrorLog
    - optionally echoes each formatted message, e.g. to std::clog     */
class StepLogger : public StepCallback
{
public:
    explicit StepLogger(std::ostream* echo = nullptr) : echo_(echo) {}

    void logMessage(const std::wstring& msg, MsgType type) override;

    const ferry::ErrorLog& getLog() const { return log_; }

    //all messages formatted and separated by newline
    std::string getLogText() const;

    void saveLogFile(const std::string& filePath) const; //throw FileError

private:
    ferry::ErrorLog log_;
    std::ostream* const echo_; //optional
};


ferry::MessageType toMessageType(StepCallback::MsgType type);
}

#endif //STEP_LOGGER_H_3391028475610294
