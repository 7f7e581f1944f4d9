// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef TEST_TOOLS_H_9901827364510293
#define TEST_TOOLS_H_9901827364510293

#include <gtest/gtest.h>
#include <ferry/extra_log.h>
#include <ferry/file_io.h>
#include <FileFerry/Source/base/step_logger.h>
#include <FileFerry/Source/base/temp_resource.h>


namespace ffy::test
{
//scratch folder per test, removed on tear down
class ScratchFolderTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ferry::fetchExtraLog(); //don't see leftovers of earlier tests
        scratch_ = TempFolder::create("ffy_test_");
    }
    void TearDown() override { scratch_.discard(); }

    std::string path(const std::string& relPath) const { return ferry::appendPath(scratch_.getPath(), relPath); }

    std::string writeFile(const std::string& relPath, std::string_view content) const
    {
        const std::string filePath = path(relPath);
        if (const std::optional<std::string> parentPath = ferry::getParentFolderPath(filePath))
            ferry::createDirectoryIfMissingRecursion(*parentPath);
        ferry::setFileContent(filePath, content);
        return filePath;
    }

    std::string readFile(const std::string& relPath) const { return ferry::getFileContent(path(relPath)); }

    bool exists(const std::string& relPath) const { return ferry::itemExists(path(relPath)); }

    TempFolder scratch_;
};


inline
bool logContains(const StepLogger& logger, const std::string& text)
{
    for (const ferry::LogEntry& entry : logger.getLog())
        if (ferry::contains(entry.message, text))
            return true;
    return false;
}


//deterministic, non-repetitive test data
inline
std::string makeTestData(size_t bytes)
{
    std::string data(bytes, '\0');
    uint32_t state = 0x12345678;
    for (char& c : data)
    {
        state = state * 1664525 + 1013904223;
        c = static_cast<char>(state >> 24);
    }
    return data;
}


inline
std::string toUtf8(const ferry::FileError& e) { return ferry::utfTo<std::string>(e.toString()); }
}

#endif //TEST_TOOLS_H_9901827364510293
