// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "concrete.h"
#include <iostream>
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!
#include "native.h"
#include "ftp.h"
#include "sftp.h"
#include "s3.h"

using namespace ferry;
using namespace ffy;


namespace
{
int afsInitLevel = 0; //support interleaving initialization calls!
}


void ffy::initAfs()
{
    assert(afsInitLevel >= 0);
    if (++afsInitLevel != 1) //non-atomic => require call from main thread
        return;

    //steps report the extra log as part of their step log => only leftovers end up here
    initExtraLog([](const ErrorLog& log) //don't call functions depending on global state (which might be destroyed already!)
    {
        for (const LogEntry& entry : log)
            std::cerr << formatMessage(entry);
    });

    libcurlInit(); //includes OpenSSL: libssh2 uses it, too
    try
    {
        sftpInit(); //throw SysError
    }
    catch (const SysError& e) { logExtraError(L"Error during process initialization.\n\n" + e.toString()); }
}


void ffy::teardownAfs()
{
    assert(afsInitLevel >= 1);
    if (--afsInitLevel != 0)
        return;

    sftpTearDown();
    libcurlTearDown();
}


BackendRegistry::BackendRegistry(const std::shared_ptr<const ConnectionRegistry>& connections) : connections_(connections)
{
    registerType("local", [](const std::string& connectionId, const std::shared_ptr<const ConnectionRegistry>&) { return createLocalBackend(connectionId); });
    registerType("ftp",  createFtpBackend);
    registerType("sftp", createSftpBackend);
    registerType("s3",   createS3Backend);
}


void BackendRegistry::checkRegistered(const std::string& typeTag) const //throw FileError
{
    if (!isRegistered(typeTag))
    {
        std::wstring knownTypes;
        for (const auto& [tag, factory] : factories_)
            knownTypes += (knownTypes.empty() ? L"" : L", ") + utfTo<std::wstring>(tag);

        throw FileError(replaceCpy(L"Unknown backend type %x.", L"%x", fmtPath(typeTag)), L"Supported: " + knownTypes);
    }
}


std::unique_ptr<FileBackend> BackendRegistry::create(const std::string& typeTag, const std::string& connectionId) const //throw FileError
{
    checkRegistered(typeTag); //throw FileError

    return factories_.find(typeTag)->second(connectionId, connections_);
}


std::shared_ptr<BackendRegistry> ffy::createDefaultBackendRegistry() //throw FileError, ConnectionError
{
    return std::make_shared<BackendRegistry>(loadDefaultConnectionRegistry()); //throw FileError, ConnectionError
}
