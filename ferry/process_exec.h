// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef PROCESS_EXEC_H_6650193847562019
#define PROCESS_EXEC_H_6650193847562019

#include <optional>
#include <vector>
#include "file_error.h"


namespace ferry
{
DEFINE_NEW_SYS_ERROR(SysErrorTimeOut)

struct ProcessStreams
{
    std::optional<std::string> stdinFilePath;  //none: read from /dev/null
    std::optional<std::string> stdoutFilePath; //none: capture into ProcessResult::stdOut
};

struct ProcessResult
{
    int exitCode = 0;
    std::string stdOut; //empty if redirected to file
    std::string stdErr; //always captured
};

/*  - no shell involved: argv[0] is searched in PATH if it does not contain a slash
    - timeoutMs: child runs in its own process group which is killed (SIGKILL) and reaped after expiry
    - child killed by signal or failing to launch => SysError                                       */
[[nodiscard]] ProcessResult processExecute(const std::vector<std::string>& argv, const ProcessStreams& streams,
                                           std::optional<int> timeoutMs); //throw SysError, SysErrorTimeOut
}

#endif //PROCESS_EXEC_H_6650193847562019
