// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "connection.h"
#include <ferry/file_io.h>
#include <ferry/open_ssl.h>

using namespace ferry;
using namespace ffy;


std::string ConnectionInfo::getOption(const std::string& name, const std::string& defaultVal) const
{
    auto it = options.find(name);
    return it != options.end() ? it->second : defaultVal;
}


int ConnectionInfo::getTimeoutSec() const
{
    const int timeoutSec = stringTo<int>(getOption("timeout", ""));
    return timeoutSec > 0 ? timeoutSec : DEFAULT_CONNECTION_TIMEOUT_SEC;
}


bool ffy::operator==(const ConnectionInfo& lhs, const ConnectionInfo& rhs)
{
    return lhs.scheme  == rhs.scheme  &&
           lhs.host    == rhs.host    &&
           lhs.port    == rhs.port    &&
           lhs.user    == rhs.user    &&
           lhs.secret  == rhs.secret  &&
           lhs.options == rhs.options;
}


ConnectionInfo ffy::parseConnectionPhrase(const std::string& phrase) //throw ConnectionError
{
    const std::string phraseTrm = trimCpy(phrase);
    const std::wstring errorMsg = replaceCpy(L"Invalid connection phrase %x.", L"%x", fmtPath(phraseTrm));

    if (!contains(phraseTrm, "://"))
        throw ConnectionError(errorMsg, L"Missing protocol prefix, e.g. \"ftp://\".");

    ConnectionInfo info;
    info.scheme = asciiToLowerCpy(beforeFirst(phraseTrm, "://", IfNotFoundReturn::none));
    if (info.scheme != "ftp" && info.scheme != "sftp" && info.scheme != "s3")
        throw ConnectionError(errorMsg, replaceCpy(L"Unsupported protocol %x.", L"%x", fmtPath(info.scheme)));

    const std::string pathPhrase = afterFirst(phraseTrm, "://", IfNotFoundReturn::none);

    const std::string credentials = beforeFirst(pathPhrase, "@", IfNotFoundReturn::none);
    const std::string serverOpt   =  afterFirst(pathPhrase, "@", IfNotFoundReturn::all);

    info.user   = beforeFirst(credentials, ":", IfNotFoundReturn::all);
    info.secret =  afterFirst(credentials, ":", IfNotFoundReturn::none);

    const std::string serverPort = trimCpy(beforeFirst(serverOpt, "|", IfNotFoundReturn::all));
    const std::string options    =          afterFirst(serverOpt, "|", IfNotFoundReturn::none);

    //ignore any path component: connections describe servers only
    const std::string server = beforeFirst(serverPort, "/", IfNotFoundReturn::all);

    if (startsWith(server, "[")) //IPv6 literal: [::1]:2121
    {
        info.host = beforeFirst(afterFirst(server, "[", IfNotFoundReturn::none), "]", IfNotFoundReturn::none);
        info.port = stringTo<int>(afterFirst(afterLast(server, "]", IfNotFoundReturn::none), ":", IfNotFoundReturn::none));
    }
    else
    {
        info.host = beforeLast(server, ":", IfNotFoundReturn::all);
        info.port = stringTo<int>(afterLast(server, ":", IfNotFoundReturn::none)); //0 if empty
    }

    if (info.host.empty())
        throw ConnectionError(errorMsg, L"Server name must not be empty.");

    if (info.port < 0 || info.port > 65535)
        throw ConnectionError(errorMsg, replaceCpy(L"Invalid port number %x.", L"%x", numberTo<std::wstring>(info.port)));

    for (const std::string& optPhrase : split(options, "|", SplitOnEmpty::skip))
    {
        const std::string optTrm = trimCpy(optPhrase);
        if (optTrm.empty())
            continue;

        const std::string name  = beforeFirst(optTrm, "=", IfNotFoundReturn::all);
        const std::string value =  afterFirst(optTrm, "=", IfNotFoundReturn::none);

        if (name == "pass64")
        {
            try
            {
                info.secret = stringDecodeBase64(value); //throw SysError
            }
            catch (const SysError& e) { throw ConnectionError(errorMsg, e.toString()); }
        }
        else
            info.options[name] = value;
    }
    return info;
}


std::string ffy::formatConnectionPhrase(const ConnectionInfo& info)
{
    std::string phrase = info.scheme + "://";
    if (!info.user.empty())
        phrase += info.user + '@';

    phrase += contains(info.host, ":") ? '[' + info.host + ']' : info.host;
    if (info.port > 0)
        phrase += ':' + numberTo<std::string>(info.port);

    for (const auto& [name, value] : info.options)
        phrase += '|' + (value.empty() ? name : name + '=' + value);

    if (!info.secret.empty())
        phrase += "|pass64=" + stringEncodeBase64(info.secret);
    return phrase;
}


MemoryConnectionRegistry MemoryConnectionRegistry::fromPhrases(const std::map<std::string, std::string>& phrases) //throw ConnectionError
{
    MemoryConnectionRegistry registry;
    for (const auto& [connectionId, phrase] : phrases)
        registry.add(connectionId, parseConnectionPhrase(phrase)); //throw ConnectionError
    return registry;
}


ConnectionInfo MemoryConnectionRegistry::resolve(const std::string& connectionId) const //throw ConnectionError
{
    auto it = connections_.find(connectionId);
    if (it == connections_.end())
        throw ConnectionError(replaceCpy(L"Connection %x is not defined.", L"%x", fmtPath(connectionId)));
    return it->second;
}


MemoryConnectionRegistry ffy::parseConnectionsFile(const std::string& content, const std::string& filePathForErrors) //throw ConnectionError
{
    MemoryConnectionRegistry registry;
    int lineNo = 0;

    for (const std::string& line : split(content, "\n", SplitOnEmpty::allow))
    {
        ++lineNo;
        const std::string lineTrm = trimCpy(line); //also removes '\r'
        if (lineTrm.empty() || startsWith(lineTrm, "#"))
            continue;

        const std::string connectionId = trimCpy(beforeFirst(lineTrm, "=", IfNotFoundReturn::none));
        const std::string phrase       = trimCpy( afterFirst(lineTrm, "=", IfNotFoundReturn::none));

        if (connectionId.empty() || phrase.empty())
            throw ConnectionError(replaceCpy(replaceCpy(L"Syntax error in %x, line %y.", L"%x", fmtPath(filePathForErrors)),
                                             L"%y", numberTo<std::wstring>(lineNo)),
                                  L"Expected: <connection id> = <connection phrase>");
        try
        {
            registry.add(connectionId, parseConnectionPhrase(phrase)); //throw ConnectionError
        }
        catch (const ConnectionError& e)
        {
            throw ConnectionError(replaceCpy(replaceCpy(L"Syntax error in %x, line %y.", L"%x", fmtPath(filePathForErrors)),
                                             L"%y", numberTo<std::wstring>(lineNo)), e.toString());
        }
    }
    return registry;
}


FileConnectionRegistry::FileConnectionRegistry(const std::string& filePath) : //throw FileError, ConnectionError
    filePath_(filePath),
    connections_(parseConnectionsFile(getFileContent(filePath) /*throw FileError*/, filePath)) {}


ConnectionInfo FileConnectionRegistry::resolve(const std::string& connectionId) const //throw ConnectionError
{
    try
    {
        return connections_.resolve(connectionId); //throw ConnectionError
    }
    catch (const ConnectionError& e)
    {
        throw ConnectionError(e.toString(), replaceCpy(L"Configuration file: %x", L"%x", fmtPath(filePath_)));
    }
}


std::string ffy::getDefaultConnectionsFilePath() //throw FileError
{
    if (const std::optional<std::string> cfgPath = getEnvironmentVar("FILEFERRY_CONNECTIONS");
        cfgPath && !cfgPath->empty())
        return *cfgPath;

    if (const std::optional<std::string> xdgCfgPath = getEnvironmentVar("XDG_CONFIG_HOME");
        xdgCfgPath && !xdgCfgPath->empty())
        return appendPath(appendPath(*xdgCfgPath, "FileFerry"), "connections.cfg");

    const std::optional<std::string> homePath = getEnvironmentVar("HOME");
    if (!homePath || homePath->empty())
        throw FileError(L"Cannot determine the location of the connections file.", L"HOME environment variable is not set.");

    return appendPath(appendPath(appendPath(*homePath, ".config"), "FileFerry"), "connections.cfg");
}


std::shared_ptr<const ConnectionRegistry> ffy::loadDefaultConnectionRegistry() //throw FileError, ConnectionError
{
    const std::string cfgFilePath = getDefaultConnectionsFilePath(); //throw FileError

    if (!itemExists(cfgFilePath)) //throw FileError
        return std::make_shared<MemoryConnectionRegistry>();

    return std::make_shared<FileConnectionRegistry>(cfgFilePath); //throw FileError, ConnectionError
}
