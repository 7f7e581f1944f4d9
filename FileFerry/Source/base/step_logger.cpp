// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "step_logger.h"
#include <ferry/file_io.h>

using namespace ferry;
using namespace ffy;


MessageType ffy::toMessageType(StepCallback::MsgType type)
{
    switch (type)
    {
        case StepCallback::MsgType::info:
            return MSG_TYPE_INFO;
        case StepCallback::MsgType::warning:
            return MSG_TYPE_WARNING;
        case StepCallback::MsgType::error:
            return MSG_TYPE_ERROR;
    }
    assert(false);
    return MSG_TYPE_ERROR;
}


void StepLogger::logMessage(const std::wstring& msg, MsgType type)
{
    logMsg(log_, msg, toMessageType(type));

    if (echo_)
        *echo_ << formatMessage(log_.back()) << std::flush;
}


std::string StepLogger::getLogText() const
{
    std::string output;
    for (const LogEntry& entry : log_)
        output += formatMessage(entry);
    return output;
}


void StepLogger::saveLogFile(const std::string& filePath) const //throw FileError
{
    const ErrorLogStats stats = getStats(log_);

    std::string header = "FileFerry log: " + numberTo<std::string>(stats.error) + " errors, " +
                         numberTo<std::string>(stats.warning) + " warnings\n";
    header.append(header.size() - 1, '=');
    header += "\n\n";

    setFileContent(filePath, header + getLogText()); //throw FileError
}
