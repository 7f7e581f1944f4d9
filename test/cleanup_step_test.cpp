// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "test_tools.h"
#include "fake_backend.h"
#include <FileFerry/Source/step/cleanup.h>

using namespace ferry;
using namespace ffy;
using namespace ffy::test;


class CleanupStepTest : public ScratchFolderTest
{
protected:
    const std::shared_ptr<FakeStore> store_ = std::make_shared<FakeStore>();
    const std::shared_ptr<BackendRegistry> backends_ = makeTestRegistry(store_);
    StepLogger logger_;
};


TEST_F(CleanupStepTest, DefaultsToLocal)
{
    writeFile("tmp/download.csv", "x");
    writeFile("tmp/tree/a.txt", "a");

    CleanupStep(backends_, std::vector<std::string>{path("tmp/download.csv"), path("tmp/tree")}).execute(logger_);

    EXPECT_FALSE(exists("tmp/download.csv"));
    EXPECT_FALSE(exists("tmp/tree"));
    EXPECT_TRUE(exists("tmp"));
    EXPECT_TRUE(logContains(logger_, "Deleting path \"" + path("tmp/download.csv") + "\""));
    EXPECT_TRUE(logContains(logger_, "Deleting path \"" + path("tmp/tree") + "\""));
}


TEST_F(CleanupStepTest, SinglePath)
{
    writeFile("single.txt", "x");

    const CleanupStep step(backends_, path("single.txt"));
    EXPECT_EQ(step.getPaths(), std::vector<std::string>{path("single.txt")});

    step.execute(logger_);
    EXPECT_FALSE(exists("single.txt"));
}


TEST_F(CleanupStepTest, FailFastInOrder)
{
    store_->files["a"] = "1";
    store_->files["b"] = "2";
    store_->files["c"] = "3";
    store_->failingPaths.insert("b");

    const CleanupStep step(backends_, std::vector<std::string>{"a", "b", "c"}, "remote_conn", "mem");

    EXPECT_THROW(step.execute(logger_), FileError);

    EXPECT_EQ(store_->calls, (std::vector<std::string>{"delete:a", "delete:b"})); //"c" never attempted
    EXPECT_FALSE(store_->files.contains("a"));
    EXPECT_TRUE (store_->files.contains("b"));
    EXPECT_TRUE (store_->files.contains("c"));

    EXPECT_TRUE (logContains(logger_, "Deleting path \"b\""));
    EXPECT_FALSE(logContains(logger_, "Deleting path \"c\""));
}


TEST_F(CleanupStepTest, MissingItemFails)
{
    EXPECT_THROW(CleanupStep(backends_, path("nothing.txt")).execute(logger_), FileError);
}


TEST_F(CleanupStepTest, EmptyListIsNoOp)
{
    CleanupStep(backends_, std::vector<std::string>{}, "", "mem").execute(logger_);
    EXPECT_TRUE(store_->calls.empty());
}


TEST_F(CleanupStepTest, UnknownType)
{
    EXPECT_THROW(CleanupStep(backends_, "a", "", "hdfs"), FileError);
}
