// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include <sstream>
#include "test_tools.h"

using namespace ferry;
using namespace ffy;
using namespace ffy::test;


TEST(StepLogger, CollectsAndEchoes)
{
    std::ostringstream echo;
    StepLogger logger(&echo);

    logger.logInfo(L"Deleting path \"a.txt\"");
    logger.logMessage(L"Skipping symbolic link", StepCallback::MsgType::warning);
    logger.logMessage(L"Cannot delete file", StepCallback::MsgType::error);

    ASSERT_EQ(logger.getLog().size(), 3u);
    EXPECT_EQ(logger.getLog()[0].type, MSG_TYPE_INFO);
    EXPECT_EQ(logger.getLog()[1].type, MSG_TYPE_WARNING);
    EXPECT_EQ(logger.getLog()[2].type, MSG_TYPE_ERROR);

    const ErrorLogStats stats = getStats(logger.getLog());
    EXPECT_EQ(stats.info, 1);
    EXPECT_EQ(stats.warning, 1);
    EXPECT_EQ(stats.error, 1);

    EXPECT_EQ(echo.str(), logger.getLogText());
    EXPECT_TRUE(contains(echo.str(), "Info:  Deleting path \"a.txt\"\n"));
    EXPECT_TRUE(contains(echo.str(), "Error:  Cannot delete file\n"));
}


TEST(StepLogger, MultiLineMessagesAreIndented)
{
    const LogEntry entry{0, MSG_TYPE_ERROR, "first\n\nsecond"};
    const std::string text = formatMessage(entry);

    const std::string prefix = beforeFirst(text, "first", IfNotFoundReturn::none);
    EXPECT_TRUE(endsWith(prefix, "Error:  "));
    EXPECT_EQ(afterFirst(text, "first\n", IfNotFoundReturn::none), std::string(prefix.size(), ' ') + "second\n");
}


class StepLoggerFileTest : public ScratchFolderTest {};

TEST_F(StepLoggerFileTest, SaveLogFile)
{
    StepLogger logger;
    logger.logInfo(L"Transferring data from source to destination.");
    logger.logMessage(L"oops", StepCallback::MsgType::error);

    logger.saveLogFile(path("run.log"));

    const std::string content = readFile("run.log");
    EXPECT_TRUE(startsWith(content, "FileFerry log: 1 errors, 0 warnings\n"));
    EXPECT_TRUE(endsWith(content, logger.getLogText()));
}
