// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "test_tools.h"
#include "fake_backend.h"

using namespace ferry;
using namespace ffy;
using namespace ffy::test;


TEST(BackendRegistry, BuiltInTypes)
{
    const BackendRegistry backends(std::make_shared<MemoryConnectionRegistry>());

    for (const char* typeTag : {"local", "ftp", "sftp", "s3"})
    {
        EXPECT_TRUE(backends.isRegistered(typeTag));

        //cheap: no connection is resolved or opened
        const std::unique_ptr<FileBackend> backend = backends.create(typeTag, "not-defined-yet");
        EXPECT_EQ(backend->getTypeTag(), typeTag);
        EXPECT_EQ(backend->getConnectionId(), "not-defined-yet");
    }
    EXPECT_FALSE(backends.isRegistered("gdrive"));
}


TEST(BackendRegistry, UnknownType)
{
    const BackendRegistry backends(std::make_shared<MemoryConnectionRegistry>());
    try
    {
        backends.create("webdav", "");
        FAIL() << "FileError expected";
    }
    catch (const FileError& e)
    {
        EXPECT_TRUE(contains(e.toString(), L"Unknown backend type \"webdav\"."));
        EXPECT_TRUE(contains(e.toString(), L"ftp, local, s3, sftp"));
    }
}


TEST(BackendRegistry, CustomType)
{
    const auto store = std::make_shared<FakeStore>();
    const std::shared_ptr<BackendRegistry> backends = makeTestRegistry(store);

    EXPECT_TRUE(backends->isRegistered("mem"));
    EXPECT_EQ(backends->create("mem", "c1")->getTypeTag(), "mem");
    EXPECT_EQ(backends->create("mem", "c2")->getConnectionId(), "c2");
    EXPECT_EQ(store->backendsCreated, 2);
}


TEST(BackendRegistry, UnknownConnectionOnFirstUse)
{
    const BackendRegistry backends(std::make_shared<MemoryConnectionRegistry>());
    StepLogger logger;

    for (const char* typeTag : {"ftp", "sftp", "s3"})
    {
        const std::unique_ptr<FileBackend> backend = backends.create(typeTag, "missing");
        EXPECT_THROW(backend->fileExists("bucket/file.txt", logger), ConnectionError) << typeTag;
    }
}


TEST(BackendRegistry, ConnectionOfWrongProtocol)
{
    auto connections = std::make_shared<MemoryConnectionRegistry>(MemoryConnectionRegistry::fromPhrases({{"my_ftp", "ftp://user@localhost"}}));
    const BackendRegistry backends(connections);
    StepLogger logger;

    EXPECT_THROW(backends.create("sftp", "my_ftp")->fileExists("a.txt", logger), ConnectionError);
    EXPECT_THROW(backends.create("s3",   "my_ftp")->fileExists("bucket/a.txt", logger), ConnectionError);
}


TEST(BackendRegistry, LibraryInitIsReferenceCounted)
{
    AfsInitializer outer;
    {
        AfsInitializer inner;
    }
    SUCCEED();
}
