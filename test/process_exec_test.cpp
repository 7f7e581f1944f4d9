// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "test_tools.h"
#include <chrono>
#include <ferry/process_exec.h>

using namespace ferry;
using namespace ffy::test;


class ProcessExecTest : public ScratchFolderTest {};


TEST_F(ProcessExecTest, CapturesStdOutAndExitCode)
{
    const ProcessResult result = processExecute({"echo", "hello"}, {}, std::nullopt);

    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.stdOut, "hello\n");
    EXPECT_TRUE(result.stdErr.empty());
}


TEST_F(ProcessExecTest, NoShellInterpretation)
{
    const ProcessResult result = processExecute({"echo", "$HOME", "*"}, {}, std::nullopt);
    EXPECT_EQ(result.stdOut, "$HOME *\n");
}


TEST_F(ProcessExecTest, RedirectsFiles)
{
    const std::string data = makeTestData(300 * 1024);
    const std::string inPath = writeFile("in.bin", data);

    const ProcessResult result = processExecute({"/bin/cat"}, ProcessStreams{inPath, path("out.bin")}, 10000);

    EXPECT_EQ(result.exitCode, 0);
    EXPECT_TRUE(result.stdOut.empty());
    EXPECT_EQ(readFile("out.bin"), data);
}


TEST_F(ProcessExecTest, NonZeroExitCodeWithStdErr)
{
    const ProcessResult result = processExecute({"/bin/sh", "-c", "echo broken input >&2; exit 3"}, {}, std::nullopt);

    EXPECT_EQ(result.exitCode, 3);
    EXPECT_EQ(result.stdErr, "broken input\n");
}


TEST_F(ProcessExecTest, MissingExecutable)
{
    try
    {
        (void)processExecute({"ffy-this-command-does-not-exist"}, {}, std::nullopt);
        FAIL() << "SysError expected";
    }
    catch (const SysError& e)
    {
        EXPECT_TRUE(contains(e.toString(), L"execvp"));
    }
}


TEST_F(ProcessExecTest, TimeoutKillsProcessGroup)
{
    const auto startTime = std::chrono::steady_clock::now();

    //the grandchild "sleep" must be killed too: else it would keep the life sign pipe open
    EXPECT_THROW((void)processExecute({"/bin/sh", "-c", "sleep 30 & sleep 30"}, {}, 500), SysErrorTimeOut);

    EXPECT_LT(std::chrono::steady_clock::now() - startTime, std::chrono::seconds(10));
}


TEST_F(ProcessExecTest, NoCommand)
{
    EXPECT_THROW((void)processExecute({}, {}, std::nullopt), SysError);
}
