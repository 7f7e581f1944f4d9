// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "test_tools.h"
#include <cstdlib>
#include <ferry/open_ssl.h>
#include <FileFerry/Source/afs/connection.h>

using namespace ferry;
using namespace ffy;
using namespace ffy::test;


TEST(ConnectionPhrase, Ftp)
{
    const ConnectionInfo info = parseConnectionPhrase("ftp://alice:pw@ftp.example.com:2121|ssl|timeout=30");

    EXPECT_EQ(info.scheme, "ftp");
    EXPECT_EQ(info.host, "ftp.example.com");
    EXPECT_EQ(info.port, 2121);
    EXPECT_EQ(info.user, "alice");
    EXPECT_EQ(info.secret, "pw");
    EXPECT_TRUE(info.hasOption("ssl"));
    EXPECT_EQ(info.getTimeoutSec(), 30);
}


TEST(ConnectionPhrase, Defaults)
{
    const ConnectionInfo info = parseConnectionPhrase("sftp://bob@example.org");

    EXPECT_EQ(info.port, 0);
    EXPECT_EQ(info.getPortOrDefault(DEFAULT_PORT_SFTP), 22);
    EXPECT_EQ(info.getTimeoutSec(), DEFAULT_CONNECTION_TIMEOUT_SEC);
    EXPECT_TRUE(info.secret.empty());
    EXPECT_FALSE(info.hasOption("agent"));
    EXPECT_EQ(info.getOption("region", DEFAULT_S3_REGION), "us-east-1");
}


TEST(ConnectionPhrase, Pass64TakesPrecedence)
{
    //"s3cr:t|x" cannot be written literally: contains both separators
    const ConnectionInfo info = parseConnectionPhrase("s3://AKIA123:ignored@minio.local:9000|pass64=" + stringEncodeBase64("s3cr:t|x") + "|region=eu-west-1|http");

    EXPECT_EQ(info.scheme, "s3");
    EXPECT_EQ(info.user, "AKIA123");
    EXPECT_EQ(info.secret, "s3cr:t|x");
    EXPECT_EQ(info.getOption("region", DEFAULT_S3_REGION), "eu-west-1");
    EXPECT_TRUE(info.hasOption("http"));
    EXPECT_FALSE(info.hasOption("pass64"));
}


TEST(ConnectionPhrase, Ipv6Host)
{
    const ConnectionInfo info = parseConnectionPhrase("ftp://user@[::1]:2121");
    EXPECT_EQ(info.host, "::1");
    EXPECT_EQ(info.port, 2121);
}


TEST(ConnectionPhrase, FormatRoundTrip)
{
    ConnectionInfo info;
    info.scheme = "sftp";
    info.host = "fe80::1";
    info.port = 2222;
    info.user = "carol";
    info.secret = "p@ss|word";
    info.options["keyfile"] = "/home/carol/.ssh/id_ed25519";
    info.options["agent"] = "";

    const std::string phrase = formatConnectionPhrase(info);
    EXPECT_FALSE(contains(phrase, "p@ss")); //secret never written in plain text
    EXPECT_EQ(parseConnectionPhrase(phrase), info);
}


TEST(ConnectionPhrase, Errors)
{
    EXPECT_THROW(parseConnectionPhrase("ftp.example.com"), ConnectionError);
    EXPECT_THROW(parseConnectionPhrase("http://example.com"), ConnectionError);
    EXPECT_THROW(parseConnectionPhrase("ftp://user@"), ConnectionError);
    EXPECT_THROW(parseConnectionPhrase("ftp://user@host:99999"), ConnectionError);
    EXPECT_THROW(parseConnectionPhrase("ftp://user@host|pass64=a"), ConnectionError);
}


TEST(ConnectionRegistry, MemoryRegistry)
{
    const MemoryConnectionRegistry registry = MemoryConnectionRegistry::fromPhrases(
    {
        {"backup_ftp", "ftp://u@backup.local"},
        {"reports_s3", "s3://key@s3.amazonaws.com|pass64=" + stringEncodeBase64("secret")},
    });

    EXPECT_EQ(registry.resolve("backup_ftp").host, "backup.local");
    EXPECT_EQ(registry.resolve("reports_s3").secret, "secret");

    try
    {
        registry.resolve("unknown");
        FAIL() << "ConnectionError expected";
    }
    catch (const ConnectionError& e)
    {
        EXPECT_TRUE(contains(e.toString(), L"\"unknown\""));
    }
}


TEST(ConnectionRegistry, ParseFile)
{
    const MemoryConnectionRegistry registry = parseConnectionsFile(
        "# connections\r\n"
        "\n"
        "ftp_in  = ftp://in@ftp.local|ssl\r\n"
        "  sftp_out=sftp://out@sftp.local:22|agent  \n", "connections.cfg");

    EXPECT_TRUE(registry.resolve("ftp_in").hasOption("ssl"));
    EXPECT_EQ(registry.resolve("sftp_out").port, 22);
}


TEST(ConnectionRegistry, ParseFileErrorNamesLine)
{
    try
    {
        parseConnectionsFile("a = ftp://x@host\nbroken line\n", "connections.cfg");
        FAIL() << "ConnectionError expected";
    }
    catch (const ConnectionError& e)
    {
        EXPECT_TRUE(contains(e.toString(), L"line 2"));
    }
}


class ConnectionFileTest : public ScratchFolderTest {};

TEST_F(ConnectionFileTest, FileRegistryAndDefaultPath)
{
    const std::string cfgPath = writeFile("FileFerry/connections.cfg", "remote = sftp://me@remote.local|keyfile=/keys/id\n");

    const FileConnectionRegistry registry(cfgPath);
    EXPECT_EQ(registry.resolve("remote").getOption("keyfile", ""), "/keys/id");
    EXPECT_THROW(registry.resolve("other"), ConnectionError);

    ::setenv("FILEFERRY_CONNECTIONS", cfgPath.c_str(), 1);
    EXPECT_EQ(getDefaultConnectionsFilePath(), cfgPath);
    EXPECT_EQ(loadDefaultConnectionRegistry()->resolve("remote").host, "remote.local");

    ::unsetenv("FILEFERRY_CONNECTIONS");
    ::setenv("XDG_CONFIG_HOME", scratch_.getPath().c_str(), 1);
    EXPECT_EQ(getDefaultConnectionsFilePath(), cfgPath);

    ::setenv("XDG_CONFIG_HOME", path("empty").c_str(), 1);
    EXPECT_THROW(loadDefaultConnectionRegistry()->resolve("remote"), ConnectionError); //no file: empty registry
    ::unsetenv("XDG_CONFIG_HOME");
}
