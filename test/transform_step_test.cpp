// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "test_tools.h"
#include "fake_backend.h"
#include <ferry/file_traverser.h>
#include <FileFerry/Source/step/transfer.h>

using namespace ferry;
using namespace ffy;
using namespace ffy::test;


class TransformStepTest : public ScratchFolderTest
{
protected:
    void SetUp() override
    {
        ScratchFolderTest::SetUp();
        //temp files of the step go into our scratch folder: easy to check for leftovers
        tempDir_ = path("tmp");
        createDirectory(tempDir_);
        prevTmpDir_ = getEnvironmentVar("TMPDIR");
        ::setenv("TMPDIR", tempDir_.c_str(), 1);
    }

    void TearDown() override
    {
        if (prevTmpDir_)
            ::setenv("TMPDIR", prevTmpDir_->c_str(), 1);
        else
            ::unsetenv("TMPDIR");
        ScratchFolderTest::TearDown();
    }

    std::vector<std::string> getTempItems() const
    {
        std::vector<std::string> itemNames;
        traverseFolder(tempDir_,
        [&](const FileInfo&   fi) { itemNames.push_back(fi.itemName); },
        [&](const FolderInfo& fi) { itemNames.push_back(fi.itemName); }, nullptr);
        return itemNames;
    }

    static TransformCommand makeCommand(const std::vector<std::string>& argv, bool useStdin = true, bool useStdout = true)
    {
        TransformCommand cmd;
        cmd.argv = argv;
        cmd.useStdin = useStdin;
        cmd.useStdout = useStdout;
        return cmd;
    }

    const std::shared_ptr<FakeStore> store_ = std::make_shared<FakeStore>();
    const std::shared_ptr<BackendRegistry> backends_ = makeTestRegistry(store_);
    StepLogger logger_;
    std::string tempDir_;
    std::optional<std::string> prevTmpDir_;
};


TEST_F(TransformStepTest, EchoIsIdentity)
{
    for (const size_t size : {size_t(0), size_t(1), size_t(256 * 1024 + 1), size_t(1024 * 1024 + 3)})
    {
        const std::string data = makeTestData(size);
        store_->files["in.bin"] = data;

        TransformStep(backends_, {"mem", "", "in.bin"}, {"local", "", path("out.bin")}, makeCommand({"/bin/cat"})).execute(logger_);

        EXPECT_EQ(readFile("out.bin"), data) << size;
        EXPECT_TRUE(getTempItems().empty()) << size;
    }
}


TEST_F(TransformStepTest, LogsCommandAndOutputLocation)
{
    store_->files["in.csv"] = "a,b\n";

    TransformStep(backends_, {"mem", "src_conn", "in.csv"}, {"mem", "dst_conn", "out.csv"}, makeCommand({"tr", "a-z", "A-Z"})).execute(logger_);

    EXPECT_EQ(store_->files["out.csv"], "A,B\n");
    EXPECT_TRUE(logContains(logger_, "Opening file \"in.csv\" on mem source \"src_conn\"."));
    EXPECT_TRUE(logContains(logger_, "Dumping source data to a file: \"" + tempDir_ + "/"));
    EXPECT_TRUE(logContains(logger_, "Running the transformation script command: tr a-z A-Z"));
    EXPECT_TRUE(logContains(logger_, "Transform script successful. Output temporarily located at \"" + tempDir_ + "/"));
    EXPECT_TRUE(logContains(logger_, "Opening file \"out.csv\" on mem dest \"dst_conn\"."));
    EXPECT_TRUE(logContains(logger_, "Transferring transformed data to destination."));
}


TEST_F(TransformStepTest, PositionalArguments)
{
    store_->files["in.txt"] = "hello";

    //no stdin/stdout wiring: source and output temp paths become $0 and $1 of the script
    TransformStep(backends_, {"mem", "", "in.txt"}, {"mem", "", "out.txt"},
                  makeCommand({"/bin/sh", "-c", "tr a-z A-Z < \"$0\" > \"$1\""}, false, false)).execute(logger_);

    EXPECT_EQ(store_->files["out.txt"], "HELLO");
}


TEST_F(TransformStepTest, CommandLineLayout)
{
    const Endpoint src{"local", "", path("a")};
    const Endpoint dst{"local", "", path("b")};

    EXPECT_EQ(TransformStep(backends_, src, dst, makeCommand({"conv", "-x"}, true,  true )).getCommandLine("S", "D"), (std::vector<std::string>{"conv", "-x"}));
    EXPECT_EQ(TransformStep(backends_, src, dst, makeCommand({"conv", "-x"}, false, true )).getCommandLine("S", "D"), (std::vector<std::string>{"conv", "-x", "S"}));
    EXPECT_EQ(TransformStep(backends_, src, dst, makeCommand({"conv", "-x"}, true,  false)).getCommandLine("S", "D"), (std::vector<std::string>{"conv", "-x", "D"}));
    EXPECT_EQ(TransformStep(backends_, src, dst, makeCommand({"conv", "-x"}, false, false)).getCommandLine("S", "D"), (std::vector<std::string>{"conv", "-x", "S", "D"}));
}


TEST_F(TransformStepTest, FailureLeavesDestinationUntouched)
{
    store_->files["in.csv"] = "data";
    writeFile("out.csv", "previous result");

    const TransformStep step(backends_, {"mem", "", "in.csv"}, {"local", "", path("out.csv")},
                             makeCommand({"/bin/sh", "-c", "cat > /dev/null; echo 'column 3 is malformed' >&2; exit 2"}));
    try
    {
        step.execute(logger_);
        FAIL() << "TransformError expected";
    }
    catch (const TransformError& e)
    {
        EXPECT_TRUE(contains(e.toString(), L"column 3 is malformed"));
        EXPECT_TRUE(contains(e.toString(), L"Exit code 2"));
    }

    EXPECT_EQ(readFile("out.csv"), "previous result");
    EXPECT_FALSE(logContains(logger_, "dest"));
    EXPECT_TRUE(getTempItems().empty());
}


TEST_F(TransformStepTest, KilledBySignal)
{
    store_->files["in.csv"] = "data";

    EXPECT_THROW(TransformStep(backends_, {"mem", "", "in.csv"}, {"mem", "", "out.csv"},
                               makeCommand({"/bin/sh", "-c", "kill -9 $$"})).execute(logger_), TransformError);
    EXPECT_FALSE(store_->files.contains("out.csv"));
}


TEST_F(TransformStepTest, CommandNotFound)
{
    store_->files["in.csv"] = "data";

    EXPECT_THROW(TransformStep(backends_, {"mem", "", "in.csv"}, {"mem", "", "out.csv"},
                               makeCommand({"ffy-no-such-transform"})).execute(logger_), TransformError);
    EXPECT_FALSE(store_->files.contains("out.csv"));
    EXPECT_TRUE(getTempItems().empty());
}


TEST_F(TransformStepTest, Timeout)
{
    store_->files["in.csv"] = "data";

    TransformCommand cmd = makeCommand({"/bin/sh", "-c", "sleep 30"});
    cmd.timeoutSec = 1;

    try
    {
        TransformStep(backends_, {"mem", "", "in.csv"}, {"mem", "", "out.csv"}, cmd).execute(logger_);
        FAIL() << "TransformError expected";
    }
    catch (const TransformError& e)
    {
        EXPECT_TRUE(contains(e.toString(), L"timed out"));
    }
    EXPECT_FALSE(store_->files.contains("out.csv"));
    EXPECT_TRUE(getTempItems().empty());
}


TEST_F(TransformStepTest, SourceFailureIsTransferError)
{
    EXPECT_THROW(TransformStep(backends_, {"mem", "", "missing.csv"}, {"mem", "", "out.csv"}, makeCommand({"/bin/cat"})).execute(logger_), TransferError);
    EXPECT_FALSE(logContains(logger_, "Running the transformation script command"));
    EXPECT_TRUE(getTempItems().empty());
}


TEST_F(TransformStepTest, DestinationFailureIsTransferError)
{
    store_->files["in.csv"] = "data";
    store_->failingPaths.insert("out.csv");

    EXPECT_THROW(TransformStep(backends_, {"mem", "", "in.csv"}, {"mem", "", "out.csv"}, makeCommand({"/bin/cat"})).execute(logger_), TransferError);
    EXPECT_TRUE(getTempItems().empty());
}


TEST_F(TransformStepTest, InvalidConfiguration)
{
    EXPECT_THROW(TransformStep(backends_, {"mem", "", "a"}, {"mem", "", "b"}, makeCommand({})), FileError);

    TransformCommand cmd = makeCommand({"/bin/cat"});
    cmd.timeoutSec = 0;
    EXPECT_THROW(TransformStep(backends_, {"mem", "", "a"}, {"mem", "", "b"}, cmd), FileError);

    EXPECT_THROW(TransformStep(backends_, {"ftps", "", "a"}, {"mem", "", "b"}, makeCommand({"/bin/cat"})), FileError);
}


TEST_F(TransformStepTest, TempResourceFailure)
{
    store_->files["in.csv"] = "data";
    ::setenv("TMPDIR", path("no/such/folder").c_str(), 1);

    EXPECT_THROW(TransformStep(backends_, {"mem", "", "in.csv"}, {"mem", "", "out.csv"}, makeCommand({"/bin/cat"})).execute(logger_), TempResourceError);
    EXPECT_TRUE(store_->calls.empty()); //before any backend I/O
}
