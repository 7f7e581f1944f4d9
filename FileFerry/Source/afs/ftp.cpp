// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "ftp.h"
#include <algorithm>
#include <ferry/file_io.h>
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!
#include "abstract_impl.h"

using namespace ferry;
using namespace ffy;


namespace
{
std::vector<std::string_view> splitFtpResponse(std::string_view buf)
{
    std::vector<std::string_view> lines;
    for (;;)
    {
        const size_t pos = buf.find_first_of("\r\n");
        const std::string_view line = buf.substr(0, pos);
        if (!line.empty()) //consider <CR><LF>
            lines.push_back(line);

        if (pos == std::string_view::npos)
            return lines;
        buf.remove_prefix(pos + 1);
    }
}


class FtpLineParser
{
public:
    explicit FtpLineParser(std::string_view line) : it_(line.begin()), itEnd_(line.end()) {}

    template <class Function>
    std::string_view readRange(size_t count, Function acceptChar) //throw SysError
    {
        if (static_cast<ptrdiff_t>(count) > itEnd_ - it_)
            throw SysError(L"Unexpected end of line.");

        const auto rngEnd = it_ + count;
        if (!std::all_of(it_, rngEnd, acceptChar))
            throw SysError(L"Expected char type not found.");

        return makeView(std::exchange(it_, rngEnd), rngEnd);
    }

    template <class Function> //expects non-empty range!
    std::string_view readRange(Function acceptChar) //throw SysError
    {
        const auto rngEnd = std::find_if_not(it_, itEnd_, acceptChar);
        if (rngEnd == it_)
            throw SysError(L"Expected char range not found.");

        return makeView(std::exchange(it_, rngEnd), rngEnd);
    }

private:
    static std::string_view makeView(std::string_view::const_iterator first, std::string_view::const_iterator last)
    {
        return {&*first, static_cast<size_t>(last - first)};
    }

    std::string_view::const_iterator it_;
    const std::string_view::const_iterator itEnd_;
};


bool isNotWhiteSpace(char c) { return !isWhiteSpace(c); }


/*  "ls -l" standard listing:
        total 4953                                                  <- optional first line
        drwxr-xr-x 1 root root    4096 Jan 10 11:58 version
        -rwxr-xr-x 1 root root    1084 Sep  2 01:17 Unit Test.vcxproj.user
        -rwxr-xr-x 1 1000  300    2217 Feb 28  2016 win32.manifest
        lrwxr-xr-x 1 root root      18 Apr 26 15:17 Projects -> /mnt/hgfs/Projects

    without group:      dr-xr-xr-x   2 root                  512 Apr  8  1994 etc
    without owner+group: drwxrwxrwx 1              0 Jan  1 00:00 dirname/          */
FtpItem parseUnixLine(std::string_view rawLine, int ownerGroupCount) //throw SysError
{
    try
    {
        FtpLineParser parser(rawLine);

        const std::string_view typeTag = parser.readRange(1, [](char c) //throw SysError
        {
            return c == '-' || c == 'b' || c == 'c' || c == 'd' || c == 'l' || c == 'p' || c == 's';
        });
        parser.readRange(9, [](char c) //throw SysError
        {
            return c == '-' || c == 'r' || c == 'w' || c == 'x' || c == 's' || c == 'S' || c == 't' || c == 'T';
        });
        parser.readRange(&isWhiteSpace); //throw SysError

        //hard-link count
        parser.readRange(&isDigit);      //throw SysError
        parser.readRange(&isWhiteSpace); //throw SysError

        for (int i = 0; i < ownerGroupCount; ++i)
        {
            parser.readRange(&isNotWhiteSpace); //throw SysError
            parser.readRange(&isWhiteSpace);    //throw SysError
        }

        const uint64_t fileSize = stringTo<uint64_t>(parser.readRange(&isDigit)); //throw SysError
        parser.readRange(&isWhiteSpace);                                          //throw SysError

        const std::string_view monthStr = parser.readRange(&isNotWhiteSpace); //throw SysError
        parser.readRange(&isWhiteSpace);                                      //throw SysError

        const char* months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
        if (std::none_of(std::begin(months), std::end(months), [&](const char* name) { return equalAsciiNoCase(name, monthStr); }))
            throw SysError(L"Failed to parse month name.");

        const int day = stringTo<int>(parser.readRange(&isDigit)); //throw SysError
        parser.readRange(&isWhiteSpace);                           //throw SysError
        if (day < 1 || day > 31)
            throw SysError(L"Failed to parse day of month.");

        const std::string_view timeOrYear = parser.readRange([](char c) { return c == ':' || isDigit(c); }); //throw SysError
        parser.readRange(&isWhiteSpace);                                                                     //throw SysError
        if (!contains(timeOrYear, ":") && timeOrYear.size() != 4)
            throw SysError(L"Failed to parse modification time.");

        const std::string_view trail = parser.readRange([](char) { return true; }); //throw SysError

        FtpItem item;
        std::string_view itemName = trail;
        if (typeTag == "l")
        {
            item.type = ItemType::symlink;
            itemName = trail.substr(0, trail.find(" -> "));
        }
        else if (typeTag == "d")
            item.type = ItemType::folder;
        else
            item.fileSize = fileSize;

        item.itemName = itemName;
        if (item.type == ItemType::folder && endsWith(item.itemName, "/"))
            item.itemName.pop_back();

        if (item.itemName.empty())
            throw SysError(L"Item name not available.");
        return item;
    }
    catch (const SysError& e)
    {
        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(rawLine) + L") [ownerGroupCount: " +
                       numberTo<std::wstring>(ownerGroupCount) + L"] " + e.toString());
    }
}


/*  type=cdir;sizd=4096;modify=20170116230740;UNIX.mode=0755; .
    type=file;size=4;modify=20170113063314;UNIX.mode=0600; readme.txt
    type=dir;sizd=4096;modify=20170117144634;UNIX.mode=0755; folder        */
std::optional<FtpItem> parseMlstLine(std::string_view rawLine) //throw SysError
{
    try
    {
        std::string_view line = rawLine;
        if (startsWith(line, " ")) //leading blank is already trimmed if MLSD was processed by curl
            line.remove_prefix(1);

        const size_t posBlank = line.find(' ');
        if (posBlank == std::string_view::npos)
            throw SysError(L"Item name not available.");

        FtpItem item;
        item.itemName = line.substr(posBlank + 1);

        std::string typeFact;
        std::string fileSize;

        for (const std::string& fact : split(line.substr(0, posBlank), ";", SplitOnEmpty::skip))
            if (equalAsciiNoCase(beforeFirst(fact, "=", IfNotFoundReturn::none), "type")) //must be case-insensitive!!!
                typeFact = beforeFirst(afterFirst(fact, "=", IfNotFoundReturn::none), ":", IfNotFoundReturn::all);
            else if (equalAsciiNoCase(beforeFirst(fact, "=", IfNotFoundReturn::none), "size"))
                fileSize = afterFirst(fact, "=", IfNotFoundReturn::none);

        if (equalAsciiNoCase(typeFact, "cdir") ||
            equalAsciiNoCase(typeFact, "pdir"))
            return std::nullopt;

        if (equalAsciiNoCase(typeFact, "dir"))
            item.type = ItemType::folder;
        else if (equalAsciiNoCase(typeFact, "OS.unix=slink") ||
                 equalAsciiNoCase(typeFact, "OS.unix=symlink"))
            item.type = ItemType::symlink;

        if (item.itemName.empty())
            throw SysError(L"Item name not available.");

        if (item.type == ItemType::file)
        {
            if (fileSize.empty() || !std::all_of(fileSize.begin(), fileSize.end(), &isDigit))
                throw SysError(L"File size not available.");
            item.fileSize = stringTo<uint64_t>(fileSize);
        }
        return item;
    }
    catch (const SysError& e)
    {
        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(rawLine) + L") " + e.toString());
    }
}

//------------------------------------------------------------------------------------------------------

class FtpSession
{
public:
    explicit FtpSession(const ConnectionInfo& info) :
        info_(info),
        timeoutSec_(info.getTimeoutSec()),
        curl_("ftp://" + (contains(info.host, ":") ? '[' + info.host + ']' : info.host) + ':' +
              numberTo<std::string>(info.getPortOrDefault(DEFAULT_PORT_FTP)), "" /*caCertFilePath*/) {}

    //as long as we get *any* FTP response, the connection itself is fine
    void testConnection() //throw SysError
    {
        const std::string featBuf = runCommand("*FEAT"); //throw SysError

        for (const std::string_view line : splitFtpResponse(featBuf))
            if (startsWithAsciiNoCase(trimCpy(line), "MLST"))
                supportsMlsd_ = true;

        for (const std::string_view line : splitFtpResponse(featBuf))
            if (startsWith(line, "211 ") ||
                startsWith(line, "500 ") ||
                startsWith(line, "550 "))
                return;

        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(featBuf) + L')');
    }

    //returns server responses (header data)
    std::string perform(const std::string& itemPath, bool isFolder, const std::vector<CurlOption>& extraOptions,
                        const std::function<void  (std::span<const char> buf)>& writeResponse /*throw X*/,
                        const std::function<size_t(std::span<      char> buf)>& readRequest   /*throw X*/) //throw SysError, X
    {
        std::vector<CurlOption> options;
        if (!info_.user.empty()) //else: anonymous login
        {
            options.emplace_back(CURLOPT_USERNAME, info_.user.c_str());
            options.emplace_back(CURLOPT_PASSWORD, info_.secret.c_str());
        }
        options.emplace_back(CURLOPT_FTP_FILEMETHOD, CURLFTPMETHOD_SINGLECWD);

        if (info_.hasOption("ssl")) //https://tools.ietf.org/html/rfc4217
        {
            //require SSL for both control and data:
            options.emplace_back(CURLOPT_USE_SSL, CURLUSESSL_ALL);
            //try TLS first, then SSL:
            options.emplace_back(CURLOPT_FTPSSLAUTH, CURLFTPAUTH_TLS);
            //self-signed certificates are the norm for FTPS servers
            options.emplace_back(CURLOPT_SSL_VERIFYPEER, 0L);
            options.emplace_back(CURLOPT_SSL_VERIFYHOST, 0L);
        }
        options.insert(options.end(), extraOptions.begin(), extraOptions.end()); //may overwrite defaults

        std::string headerData;
        curl_.perform(getUrlPath(itemPath, isFolder), {} /*extraHeaders*/, options,
                      writeResponse, readRequest,
        [&](std::string_view header) { headerData += header; }, timeoutSec_); //throw SysError, X
        return headerData;
    }

    //prefix with '*' to ignore command failure
    std::string runCommand(const std::string& ftpCmd) //throw SysError
    {
        curl_slist* quote = nullptr;
        FERRY_ON_SCOPE_EXIT(::curl_slist_free_all(quote));
        quote = ::curl_slist_append(quote, ftpCmd.c_str());

        return perform("", true /*isFolder*/,
        {
            {CURLOPT_NOBODY, 1L},
            {CURLOPT_QUOTE, quote},
            {CURLOPT_FTP_FILEMETHOD, CURLFTPMETHOD_NOCWD}, //paths are relative to login folder
        }, nullptr, nullptr); //throw SysError
    }

    std::vector<FtpItem> listFolder(const std::string& folderPath) //throw SysError, SysErrorCurlProtocol
    {
        std::string rawListing;
        auto onBytesReceived = [&](std::span<const char> buf) { rawListing.append(buf.data(), buf.size()); };

        if (supportsMlsd_)
        {
            perform(folderPath, true /*isFolder*/, {{CURLOPT_CUSTOMREQUEST, "MLSD"}}, onBytesReceived, nullptr); //throw SysError
            return parseFtpMlsdListing(rawListing); //throw SysError
        }

        perform(folderPath, true /*isFolder*/, {}, onBytesReceived, nullptr); //throw SysError; LIST
        return parseFtpUnixListing(rawListing); //throw SysError
    }

private:
    FtpSession           (const FtpSession&) = delete;
    FtpSession& operator=(const FtpSession&) = delete;

    static bool startsWithAsciiNoCase(std::string_view str, std::string_view prefix)
    {
        return str.size() >= prefix.size() && equalAsciiNoCase(str.substr(0, prefix.size()), prefix);
    }

    //"/%2F" prefix: absolute path, starting at the server root instead of the login folder
    std::string getUrlPath(const std::string& itemPath, bool isFolder) //throw SysError
    {
        std::string urlPath = startsWith(itemPath, "/") ? "/%2F" : "/";

        bool first = true;
        for (const std::string& comp : split(itemPath, "/", SplitOnEmpty::skip))
        {
            if (!std::exchange(first, false))
                urlPath += '/';
            urlPath += curl_.escapeUrlComponent(comp); //throw SysError
        }

        if (isFolder && !endsWith(urlPath, "/"))
            urlPath += '/';
        return urlPath;
    }

    const ConnectionInfo info_;
    const int timeoutSec_;
    CurlSession curl_;
    bool supportsMlsd_ = false;
};

//------------------------------------------------------------------------------------------------------

class FtpBackend : public FileBackend
{
public:
    FtpBackend(const std::string& connectionId, const std::shared_ptr<const ConnectionRegistry>& connections) :
        FileBackend("ftp", connectionId, L"FTP"),
        connections_(connections) {}

private:
    FtpSession& getSession() //throw ConnectionError
    {
        if (!session_)
        {
            const ConnectionInfo info = connections_->resolve(getConnectionId()); //throw ConnectionError
            if (info.scheme != "ftp")
                throw ConnectionError(replaceCpy(L"Connection %x is not an FTP connection.", L"%x", fmtPath(getConnectionId())));

            auto session = std::make_unique<FtpSession>(info);
            try
            {
                session->testConnection(); //throw SysError
            }
            catch (const SysError& e) { throw ConnectionError(replaceCpy(L"Unable to connect to %x.", L"%x", fmtPath(info.host)), e.toString()); }

            session_ = std::move(session);
        }
        return *session_;
    }

    std::vector<FtpItem> listFolder(const std::string& folderPath) //throw FileError, ConnectionError
    {
        FtpSession& session = getSession(); //throw ConnectionError
        try
        {
            return session.listFolder(folderPath); //throw SysError
        }
        catch (const SysError& e) { throw FileError(replaceCpy(L"Cannot open directory %x.", L"%x", fmtPath(folderPath)), e.toString()); }
    }

    void retrieveFile(const std::string& remotePath, const std::string& localFilePath, StepCallback& cb) //throw FileError, ConnectionError
    {
        FtpSession& session = getSession(); //throw ConnectionError

        cb.logInfo(replaceCpy(L"Retrieving file from FTP: %x", L"%x", fmtPath(remotePath)));

        FileOutputPlain fileOut(localFilePath, FileOutputMode::truncate); //throw FileError
        try
        {
            session.perform(remotePath, false /*isFolder*/, {}, [&](std::span<const char> buf)
            {
                if (!buf.empty())
                    writeAll(fileOut, buf.data(), buf.size()); //throw FileError
            }, nullptr); //throw SysError, FileError
        }
        catch (const SysError& e) { throw FileError(replaceCpy(L"Cannot read file %x.", L"%x", fmtPath(remotePath)), e.toString()); }

        fileOut.close(); //throw FileError

        cb.logInfo(replaceCpy(L"Finished retrieving file from FTP: %x", L"%x", fmtPath(remotePath)));
    }

    void retrieveFolderRecursion(const std::string& remotePath, const std::string& localPath, StepCallback& cb) //throw FileError, ConnectionError
    {
        for (const FtpItem& item : listFolder(remotePath)) //throw FileError, ConnectionError
        {
            checkItemName(item.itemName); //throw FileError

            const std::string remoteItemPath = appendPath(remotePath, item.itemName);
            const std::string localItemPath  = appendPath(localPath,  item.itemName);

            switch (item.type)
            {
                case ItemType::file:
                    retrieveFile(remoteItemPath, localItemPath, cb); //throw FileError, ConnectionError
                    break;
                case ItemType::folder:
                    createDirectory(localItemPath); //throw FileError, ErrorTargetExisting
                    retrieveFolderRecursion(remoteItemPath, localItemPath, cb); //throw FileError, ConnectionError
                    break;
                case ItemType::symlink: //target type unknown
                    cb.logMessage(replaceCpy(L"Skipping symbolic link %x.", L"%x", fmtPath(remoteItemPath)), StepCallback::MsgType::warning);
                    break;
            }
        }
    }

    void storeFile(const std::string& localFilePath, const std::string& remotePath) //throw FileError, ConnectionError
    {
        FtpSession& session = getSession(); //throw ConnectionError

        FileInputPlain fileIn(localFilePath); //throw FileError
        const curl_off_t fileSize = fileIn.getStatBuffered().st_size; //throw FileError
        try
        {
            session.perform(remotePath, false /*isFolder*/, {{CURLOPT_INFILESIZE_LARGE, fileSize}}, nullptr, [&](std::span<char> buf)
            {
                return fileIn.tryRead(buf.data(), buf.size()); //throw FileError
            }); //throw SysError, FileError
        }
        catch (const SysError& e) { throw FileError(replaceCpy(L"Cannot write file %x.", L"%x", fmtPath(remotePath)), e.toString()); }
    }

    void runCommand(const std::string& ftpCmd, const std::wstring& errorMsg) //throw FileError, ConnectionError
    {
        FtpSession& session = getSession(); //throw ConnectionError
        try
        {
            session.runCommand(ftpCmd); //throw SysError
        }
        catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
    }

    void removeFolderRecursion(const std::string& folderPath) //throw FileError, ConnectionError
    {
        for (const FtpItem& item : listFolder(folderPath)) //throw FileError, ConnectionError
        {
            const std::string itemPath = appendPath(folderPath, item.itemName);
            if (item.type == ItemType::folder)
                removeFolderRecursion(itemPath); //throw FileError, ConnectionError
            else
                runCommand("DELE " + itemPath, replaceCpy(L"Cannot delete file %x.", L"%x", fmtPath(itemPath))); //throw FileError, ConnectionError
        }
        runCommand("RMD " + folderPath, replaceCpy(L"Cannot delete directory %x.", L"%x", fmtPath(folderPath))); //throw FileError, ConnectionError
    }

    bool itemExistsAs(const std::string& path, bool matchFolders, StepCallback& cb) //throw FileError, ConnectionError
    {
        const std::pair<std::string, std::string> parentAndName = splitParentAndName(path);
        const std::string& parentPath = parentAndName.first;

        FtpSession& session = getSession(); //throw ConnectionError
        try
        {
            return ftpItemExistsAs([&] { return session.listFolder(parentPath); /*throw SysError, SysErrorCurlProtocol*/ },
                                   parentAndName.second, matchFolders, cb); //throw SysError
        }
        catch (const SysError& e) { throw FileError(replaceCpy(L"Cannot open directory %x.", L"%x", fmtPath(parentPath)), e.toString()); }
    }

    //----------------------------------------------------------------------------------------------
    std::unique_ptr<InputStream> openInputImpl(const std::string& path, StepCallback& cb) override //throw FileError, ConnectionError
    {
        return makeSpoolInputStream([&](const std::string& tmpFilePath)
        {
            retrieveFile(path, tmpFilePath, cb); //throw FileError, ConnectionError
        }); //throw FileError, ConnectionError, TempResourceError
    }

    std::unique_ptr<OutputStreamImpl> openOutputImpl(const std::string& path, bool append, StepCallback& cb) override //throw FileError, ConnectionError
    {
        getSession(); //throw ConnectionError; fail early, before any data is spooled

        return makeSpoolOutputStream([this, path](const std::string& tmpFilePath)
        {
            storeFile(tmpFilePath, path); //throw FileError, ConnectionError
        }); //throw FileError, TempResourceError
    }

    void downloadImpl(const std::string& remotePath, const std::string& localPath, StepCallback& cb) override //throw FileError, ConnectionError
    {
        if (const std::optional<std::string> parentPath = getParentFolderPath(localPath))
            createLocalFolderLogged(*parentPath, cb); //throw FileError

        writeFileTransactional(localPath, [&](const std::string& tmpFilePath)
        {
            retrieveFile(remotePath, tmpFilePath, cb); //throw FileError, ConnectionError
        }); //throw FileError, ConnectionError
    }

    void downloadFolderImpl(const std::string& remotePath, const std::string& localPath, StepCallback& cb) override //throw FileError, ConnectionError
    {
        createLocalFolderLogged(localPath, cb); //throw FileError

        cb.logInfo(replaceCpy(L"Retrieving files in folder from FTP: %x", L"%x", fmtPath(remotePath)));
        retrieveFolderRecursion(removeTrailingSeparators(remotePath), localPath, cb); //throw FileError, ConnectionError
        cb.logInfo(replaceCpy(L"Finished retrieving folder from FTP: %x", L"%x", fmtPath(remotePath)));
    }

    void uploadImpl(const std::string& localPath, const std::string& remotePath, StepCallback& cb) override //throw FileError, ConnectionError
    {
        storeFile(localPath, remotePath); //throw FileError, ConnectionError
    }

    void deleteItemImpl(const std::string& path, StepCallback& cb) override //throw FileError, ConnectionError
    {
        const std::string itemPath = removeTrailingSeparators(path);
        const std::pair<std::string, std::string> parentAndName = splitParentAndName(itemPath);
        const std::string& itemName = parentAndName.second;

        const std::vector<FtpItem> items = listFolder(parentAndName.first); //throw FileError, ConnectionError

        auto it = std::find_if(items.begin(), items.end(), [&](const FtpItem& item) { return item.itemName == itemName; });
        if (it == items.end())
            throw FileError(replaceCpy(L"Cannot delete %x.", L"%x", fmtPath(itemPath)), L"The item does not exist.");

        if (it->type == ItemType::folder)
            removeFolderRecursion(itemPath); //throw FileError, ConnectionError
        else
            runCommand("DELE " + itemPath, replaceCpy(L"Cannot delete file %x.", L"%x", fmtPath(itemPath))); //throw FileError, ConnectionError
    }

    bool fileExistsImpl(const std::string& path, StepCallback& cb) override //throw FileError, ConnectionError
    {
        return itemExistsAs(path, false /*matchFolders*/, cb); //throw FileError, ConnectionError
    }

    bool folderExistsImpl(const std::string& path, StepCallback& cb) override //throw FileError, ConnectionError
    {
        return itemExistsAs(path, true /*matchFolders*/, cb); //throw FileError, ConnectionError
    }

    const std::shared_ptr<const ConnectionRegistry> connections_;
    std::unique_ptr<FtpSession> session_; //lazy: connect on first I/O
};
}


std::unique_ptr<FileBackend> ffy::createFtpBackend(const std::string& connectionId, const std::shared_ptr<const ConnectionRegistry>& connections)
{
    return std::make_unique<FtpBackend>(connectionId, connections);
}


std::vector<FtpItem> ffy::parseFtpUnixListing(const std::string& buf) //throw SysError
{
    const std::vector<std::string_view> lines = splitFtpResponse(buf);
    auto it = lines.begin();

    if (it != lines.end() && startsWith(*it, "total "))
        ++it;

    //listing formats differ per item type: owner/group may be missing
    std::optional<int> dirOwnerGroupCount;
    std::optional<int> fileOwnerGroupCount;
    std::optional<int> linkOwnerGroupCount;

    std::vector<FtpItem> output;

    std::for_each(it, lines.end(), [&](std::string_view line)
    {
        std::optional<int>& ownerGroupCount = line[0] == 'd' ? dirOwnerGroupCount :
                                              line[0] == 'l' ? linkOwnerGroupCount : fileOwnerGroupCount;
        if (!ownerGroupCount)
            ownerGroupCount = [&]
        {
            std::optional<SysError> firstError;

            for (int i = 3; i-- > 0;)
                try
                {
                    parseUnixLine(line, i /*ownerGroupCount*/); //throw SysError
                    return i;
                }
                catch (const SysError& e)
                {
                    if (!firstError)
                        firstError = e;
                }
            throw* firstError;
        }();

        const FtpItem item = parseUnixLine(line, *ownerGroupCount); //throw SysError
        if (item.itemName != "." &&
            item.itemName != "..")
            output.push_back(item);
    });

    return output;
}


std::vector<FtpItem> ffy::parseFtpMlsdListing(const std::string& buf) //throw SysError
{
    std::vector<FtpItem> output;
    for (const std::string_view line : splitFtpResponse(buf))
        if (const std::optional<FtpItem> item = parseMlstLine(line)) //throw SysError
            if (item->itemName != "." &&
                item->itemName != "..")
                output.push_back(*item);
    return output;
}


bool ffy::ftpItemExistsAs(const std::function<std::vector<FtpItem>()>& listParentFolder /*throw SysError*/,
                          const std::string& namePattern, bool matchFolders, StepCallback& cb) //throw SysError
{
    std::vector<FtpItem> ftpItems;
    try
    {
        ftpItems = listParentFolder(); //throw SysError, SysErrorCurlProtocol
    }
    catch (const SysErrorCurlProtocol& e)
    {
        if (e.statusCode == 550) //"Requested action not taken. File unavailable"
            return false;
        throw;
    }

    std::vector<ListedItem> items;
    for (const FtpItem& item : ftpItems)
        if (item.type != ItemType::symlink) //target type unknown
            items.push_back({item.itemName, item.type == ItemType::folder});

    return !matchListedItems(items, namePattern, matchFolders, cb).empty();
}
