// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "s3.h"
#include <ferry/file_io.h>
#include <ferry/open_ssl.h>
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!
#include <tinyxml2.h>
#include "abstract_impl.h"

using namespace ferry;
using namespace ffy;


namespace
{
const int S3_MAX_KEYS_PER_LIST = 1000; //server-side maximum


//text of a direct child element: none if the element is missing
std::optional<std::string> getChildText(const tinyxml2::XMLElement& parent, const char* name)
{
    if (const tinyxml2::XMLElement* child = parent.FirstChildElement(name))
    {
        const char* text = child->GetText(); //nullptr for "<Key/>"
        return text ? text : "";
    }
    return std::nullopt;
}


//------------------------------------------------------------------------------------------------------

class S3Session
{
public:
    explicit S3Session(const ConnectionInfo& info) :
        info_(info),
        timeoutSec_(info.getTimeoutSec()),
        sigV4Provider_("aws:amz:" + info.getOption("region", DEFAULT_S3_REGION) + ":s3"),
        curl_((info.hasOption("http") ? "http://" : "https://") + info.host +
              (info.port > 0 ? ':' + numberTo<std::string>(info.port) : std::string()), "" /*caCertFilePath*/) {}

    //false: 404
    bool headObject(const S3ObjectPath& obj) //throw SysError
    {
        try
        {
            request(getUrlPath(obj), {{CURLOPT_NOBODY, 1L}}, getSha256HexDigest(""), nullptr, nullptr); //throw SysError, SysErrorCurlProtocol
            return true;
        }
        catch (const SysErrorCurlProtocol& e)
        {
            if (e.statusCode == 404)
                return false;
            throw;
        }
    }

    void getObject(const S3ObjectPath& obj, const std::function<void(std::span<const char> buf)>& writeBody /*throw X*/) //throw SysError, X
    {
        request(getUrlPath(obj), {}, getSha256HexDigest(""), writeBody, nullptr); //throw SysError, SysErrorCurlProtocol, X
    }

    void putObject(const S3ObjectPath& obj, const std::string& localFilePath) //throw SysError, FileError
    {
        //the payload hash is part of the signature: read the file twice
        Sha256Hasher hasher; //throw SysError
        {
            FileInputPlain fileIn(localFilePath); //throw FileError
            std::vector<char> buffer(fileIn.getBlockSize()); //throw FileError
            for (;;)
            {
                const size_t bytesRead = fileIn.tryRead(buffer.data(), buffer.size()); //throw FileError
                if (bytesRead == 0)
                    break;
                hasher.update(buffer.data(), bytesRead); //throw SysError
            }
        }

        FileInputPlain fileIn(localFilePath); //throw FileError
        const curl_off_t fileSize = fileIn.getStatBuffered().st_size; //throw FileError

        request(getUrlPath(obj), {{CURLOPT_INFILESIZE_LARGE, fileSize}}, hasher.finalizeHex() /*throw SysError*/, nullptr, [&](std::span<char> buf)
        {
            return fileIn.tryRead(buf.data(), buf.size()); //throw FileError
        }); //throw SysError, SysErrorCurlProtocol, FileError
    }

    void deleteObject(const S3ObjectPath& obj) //throw SysError
    {
        request(getUrlPath(obj), {{CURLOPT_CUSTOMREQUEST, "DELETE"}}, getSha256HexDigest(""), nullptr, nullptr); //throw SysError, SysErrorCurlProtocol
    }

    //one page of ListObjectsV2
    S3ListResult listObjects(const std::string& bucket, const std::string& prefix, int maxKeys, const std::string& continuationToken) //throw SysError, SysErrorCurlProtocol
    {
        //query parameters in canonical (sorted) order: part of the signature
        std::string query;
        if (!continuationToken.empty())
            query += "continuation-token=" + curl_.escapeUrlComponent(continuationToken) + '&';
        query += "list-type=2";
        query += "&max-keys=" + numberTo<std::string>(maxKeys);
        query += "&prefix=" + curl_.escapeUrlComponent(prefix);

        std::string response;
        request('/' + curl_.escapeUrlComponent(bucket) + "?" + query, {}, getSha256HexDigest(""),
        [&](std::span<const char> buf) { response.append(buf.data(), buf.size()); }, nullptr); //throw SysError, SysErrorCurlProtocol

        return parseS3ListResponse(response); //throw SysError
    }

private:
    S3Session           (const S3Session&) = delete;
    S3Session& operator=(const S3Session&) = delete;

    //path-style: "/bucket/key/with/slashes"
    std::string getUrlPath(const S3ObjectPath& obj) //throw SysError
    {
        std::string urlPath = '/' + curl_.escapeUrlComponent(obj.bucket);
        for (const std::string& comp : split(obj.key, "/", SplitOnEmpty::allow))
            urlPath += '/' + curl_.escapeUrlComponent(comp); //throw SysError
        return urlPath;
    }

    //HTTP status other than 2XX: SysErrorCurlProtocol
    void request(const std::string& urlPath, const std::vector<CurlOption>& extraOptions, const std::string& payloadHash,
                 const std::function<void  (std::span<const char> buf)>& writeBody /*throw X*/,
                 const std::function<size_t(std::span<      char> buf)>& readBody  /*throw X*/) //throw SysError, SysErrorCurlProtocol, X
    {
        std::vector<CurlOption> options
        {
            {CURLOPT_AWS_SIGV4, sigV4Provider_.c_str()},
            {CURLOPT_USERNAME, info_.user.c_str()},
            {CURLOPT_PASSWORD, info_.secret.c_str()},
        };
        options.insert(options.end(), extraOptions.begin(), extraOptions.end());

        auto isSuccess = [](int statusCode) { return 200 <= statusCode && statusCode < 300; };

        int headerStatus = 0; //of the response currently received
        std::string errorBody;

        const int statusCode = curl_.perform(urlPath, {"x-amz-content-sha256: " + payloadHash}, options,
                                             [&](std::span<const char> buf)
        {
            if (isSuccess(headerStatus) && writeBody)
                writeBody(buf); //throw X
            else
                errorBody.append(buf.data(), buf.size());
        },
        readBody,
        [&](std::string_view header)
        {
            //"HTTP/1.1 200 OK"
            if (startsWith(header, "HTTP/"))
                headerStatus = stringTo<int>(beforeFirst(afterFirst(header, " ", IfNotFoundReturn::none), " ", IfNotFoundReturn::all));
        }, timeoutSec_).responseCode; //throw SysError, X

        if (!isSuccess(statusCode))
            throw SysErrorCurlProtocol(formatSystemError("S3 request", replaceCpy(L"HTTP status %x", L"%x", numberTo<std::wstring>(statusCode)),
                                                         formatS3ErrorResponse(errorBody)), statusCode);
    }

    const ConnectionInfo info_;
    const int timeoutSec_;
    const std::string sigV4Provider_; //"aws:amz:us-east-1:s3"
    CurlSession curl_;
};

//------------------------------------------------------------------------------------------------------

class S3Backend : public FileBackend
{
public:
    S3Backend(const std::string& connectionId, const std::shared_ptr<const ConnectionRegistry>& connections) :
        FileBackend("s3", connectionId, L"object storage"),
        connections_(connections) {}

private:
    S3Session& getSession() //throw ConnectionError
    {
        if (!session_)
        {
            const ConnectionInfo info = connections_->resolve(getConnectionId()); //throw ConnectionError
            if (info.scheme != "s3")
                throw ConnectionError(replaceCpy(L"Connection %x is not an S3 connection.", L"%x", fmtPath(getConnectionId())));

            session_ = std::make_unique<S3Session>(info); //connection is established by the first request
        }
        return *session_;
    }

    static std::string getDisplayPath(const S3ObjectPath& obj) { return obj.key.empty() ? obj.bucket : obj.bucket + '/' + obj.key; }

    template <class Function>
    auto runRequest(const std::wstring& errorMsg, Function s3Command /*throw SysError, X*/) //throw FileError, ConnectionError, X
    {
        S3Session& session = getSession(); //throw ConnectionError
        try
        {
            return s3Command(session); //throw SysError, X
        }
        catch (const SysErrorLogin& e) { throw ConnectionError(errorMsg, e.toString()); }
        catch (const SysErrorCurlProtocol& e)
        {
            if (e.statusCode == 401 || e.statusCode == 403)
                throw ConnectionError(errorMsg, e.toString());
            throw FileError(errorMsg, e.toString());
        }
        catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
    }

    bool objectExists(const S3ObjectPath& obj) //throw FileError, ConnectionError
    {
        return runRequest(replaceCpy(L"Cannot read file attributes of %x.", L"%x", fmtPath(getDisplayPath(obj))),
        [&](S3Session& session) { return session.headObject(obj); }); //throw FileError, ConnectionError
    }

    //all keys starting with prefix, following continuation tokens
    std::vector<std::string> listKeys(const std::string& bucket, const std::string& prefix) //throw FileError, ConnectionError
    {
        std::vector<std::string> keys;
        std::string continuationToken;
        do
        {
            const S3ListResult page = runRequest(replaceCpy(L"Cannot open directory %x.", L"%x", fmtPath(bucket + '/' + prefix)),
            [&](S3Session& session) { return session.listObjects(bucket, prefix, S3_MAX_KEYS_PER_LIST, continuationToken); }); //throw FileError, ConnectionError

            keys.insert(keys.end(), page.keys.begin(), page.keys.end());

            if (page.isTruncated && page.nextContinuationToken.empty())
                throw FileError(replaceCpy(L"Cannot open directory %x.", L"%x", fmtPath(bucket + '/' + prefix)), L"Continuation token missing.");
            continuationToken = page.isTruncated ? page.nextContinuationToken : std::string();
        }
        while (!continuationToken.empty());

        return keys;
    }

    static std::string getFolderPrefix(const std::string& key) { return key.empty() ? std::string() : key + '/'; }

    void retrieveObject(const S3ObjectPath& obj, const std::string& localFilePath, StepCallback& cb) //throw FileError, ConnectionError
    {
        cb.logInfo(replaceCpy(L"Retrieving file from object storage: %x", L"%x", fmtPath(getDisplayPath(obj))));

        FileOutputPlain fileOut(localFilePath, FileOutputMode::truncate); //throw FileError

        runRequest(replaceCpy(L"Cannot read file %x.", L"%x", fmtPath(getDisplayPath(obj))), [&](S3Session& session)
        {
            session.getObject(obj, [&](std::span<const char> buf)
            {
                if (!buf.empty())
                    writeAll(fileOut, buf.data(), buf.size()); //throw FileError
            }); //throw SysError, FileError
        }); //throw FileError, ConnectionError

        fileOut.close(); //throw FileError

        cb.logInfo(replaceCpy(L"Finished retrieving file from object storage: %x", L"%x", fmtPath(getDisplayPath(obj))));
    }

    void storeObject(const std::string& localFilePath, const S3ObjectPath& obj) //throw FileError, ConnectionError
    {
        if (obj.key.empty())
            throw FileError(replaceCpy(L"Cannot write file %x.", L"%x", fmtPath(getDisplayPath(obj))), L"Object key is missing.");

        runRequest(replaceCpy(L"Cannot write file %x.", L"%x", fmtPath(getDisplayPath(obj))), [&](S3Session& session)
        {
            session.putObject(obj, localFilePath); //throw SysError, FileError
        }); //throw FileError, ConnectionError
    }

    void removeObject(const S3ObjectPath& obj) //throw FileError, ConnectionError
    {
        runRequest(replaceCpy(L"Cannot delete file %x.", L"%x", fmtPath(getDisplayPath(obj))), [&](S3Session& session)
        {
            session.deleteObject(obj); //throw SysError
        }); //throw FileError, ConnectionError
    }

    //----------------------------------------------------------------------------------------------
    std::unique_ptr<InputStream> openInputImpl(const std::string& path, StepCallback& cb) override //throw FileError, ConnectionError
    {
        const S3ObjectPath obj = parseS3ObjectPath(path); //throw FileError

        return makeSpoolInputStream([&](const std::string& tmpFilePath)
        {
            retrieveObject(obj, tmpFilePath, cb); //throw FileError, ConnectionError
        }); //throw FileError, ConnectionError, TempResourceError
    }

    std::unique_ptr<OutputStreamImpl> openOutputImpl(const std::string& path, bool append, StepCallback& cb) override //throw FileError, ConnectionError
    {
        const S3ObjectPath obj = parseS3ObjectPath(path); //throw FileError
        getSession(); //throw ConnectionError

        return makeSpoolOutputStream([this, obj](const std::string& tmpFilePath)
        {
            storeObject(tmpFilePath, obj); //throw FileError, ConnectionError
        }); //throw FileError, TempResourceError
    }

    void downloadImpl(const std::string& remotePath, const std::string& localPath, StepCallback& cb) override //throw FileError, ConnectionError
    {
        const S3ObjectPath obj = parseS3ObjectPath(remotePath); //throw FileError

        if (const std::optional<std::string> parentPath = getParentFolderPath(localPath))
            createLocalFolderLogged(*parentPath, cb); //throw FileError

        writeFileTransactional(localPath, [&](const std::string& tmpFilePath)
        {
            retrieveObject(obj, tmpFilePath, cb); //throw FileError, ConnectionError
        }); //throw FileError, ConnectionError
    }

    void downloadFolderImpl(const std::string& remotePath, const std::string& localPath, StepCallback& cb) override //throw FileError, ConnectionError
    {
        const S3ObjectPath obj = parseS3ObjectPath(remotePath); //throw FileError
        const std::string prefix = getFolderPrefix(obj.key);

        const std::vector<std::string> keys = listKeys(obj.bucket, prefix); //throw FileError, ConnectionError
        if (keys.empty())
            throw FileError(replaceCpy(L"Cannot open directory %x.", L"%x", fmtPath(getDisplayPath(obj))), L"The folder does not exist.");

        //check all keys before writing anything
        std::vector<std::pair<std::string /*key*/, std::string /*local item path*/>> items;
        for (const std::string& key : keys)
        {
            const std::string relPath = key.substr(prefix.size());
            if (relPath.empty()) //folder marker object of the folder itself
                continue;

            items.emplace_back(key, appendRelPathChecked(localPath, endsWith(relPath, "/") ? relPath.substr(0, relPath.size() - 1) : relPath)); //throw FileError
        }

        createLocalFolderLogged(localPath, cb); //throw FileError

        cb.logInfo(replaceCpy(L"Retrieving files in folder from object storage: %x", L"%x", fmtPath(getDisplayPath(obj))));

        for (const auto& [key, localItemPath] : items)
            if (endsWith(key, "/")) //folder marker object
                createDirectoryIfMissingRecursion(localItemPath); //throw FileError
            else
            {
                if (const std::optional<std::string> parentPath = getParentFolderPath(localItemPath))
                    createDirectoryIfMissingRecursion(*parentPath); //throw FileError

                retrieveObject({obj.bucket, key}, localItemPath, cb); //throw FileError, ConnectionError
            }

        cb.logInfo(replaceCpy(L"Finished retrieving folder from object storage: %x", L"%x", fmtPath(getDisplayPath(obj))));
    }

    void uploadImpl(const std::string& localPath, const std::string& remotePath, StepCallback& cb) override //throw FileError, ConnectionError
    {
        storeObject(localPath, parseS3ObjectPath(remotePath) /*throw FileError*/); //throw FileError, ConnectionError
    }

    //a key is a file; otherwise a prefix with children is a folder, deleted key by key
    void deleteItemImpl(const std::string& path, StepCallback& cb) override //throw FileError, ConnectionError
    {
        const S3ObjectPath obj = parseS3ObjectPath(path); //throw FileError
        if (obj.key.empty())
            throw FileError(replaceCpy(L"Cannot delete %x.", L"%x", fmtPath(getDisplayPath(obj))), L"Buckets cannot be deleted.");

        if (objectExists(obj)) //throw FileError, ConnectionError
            return removeObject(obj); //throw FileError, ConnectionError

        const std::vector<std::string> keys = listKeys(obj.bucket, getFolderPrefix(obj.key)); //throw FileError, ConnectionError
        if (keys.empty())
            throw FileError(replaceCpy(L"Cannot delete %x.", L"%x", fmtPath(getDisplayPath(obj))), L"The item does not exist.");

        for (const std::string& key : keys)
            removeObject({obj.bucket, key}); //throw FileError, ConnectionError
    }

    bool fileExistsImpl(const std::string& path, StepCallback& cb) override //throw FileError, ConnectionError
    {
        const S3ObjectPath obj = parseS3ObjectPath(path); //throw FileError
        if (obj.key.empty())
            return false;

        return objectExists(obj); //throw FileError, ConnectionError
    }

    bool folderExistsImpl(const std::string& path, StepCallback& cb) override //throw FileError, ConnectionError
    {
        const S3ObjectPath obj = parseS3ObjectPath(path); //throw FileError

        return runRequest(replaceCpy(L"Cannot open directory %x.", L"%x", fmtPath(getDisplayPath(obj))), [&](S3Session& session)
        {
            try
            {
                const S3ListResult page = session.listObjects(obj.bucket, getFolderPrefix(obj.key), 1 /*maxKeys*/, ""); //throw SysError, SysErrorCurlProtocol
                return obj.key.empty() || !page.keys.empty(); //bucket root: existing bucket
            }
            catch (const SysErrorCurlProtocol& e)
            {
                if (e.statusCode == 404) //NoSuchBucket
                    return false;
                throw;
            }
        }); //throw FileError, ConnectionError
    }

    const std::shared_ptr<const ConnectionRegistry> connections_;
    std::unique_ptr<S3Session> session_; //lazy
};
}


std::unique_ptr<FileBackend> ffy::createS3Backend(const std::string& connectionId, const std::shared_ptr<const ConnectionRegistry>& connections)
{
    return std::make_unique<S3Backend>(connectionId, connections);
}


S3ObjectPath ffy::parseS3ObjectPath(const std::string& path) //throw FileError
{
    std::string_view tmp = path;
    if (startsWith(tmp, "s3://"))
        tmp.remove_prefix(5);

    while (startsWith(tmp, "/"))
        tmp.remove_prefix(1);

    S3ObjectPath obj;
    obj.bucket = beforeFirst(tmp, "/", IfNotFoundReturn::all);
    obj.key    = removeTrailingSeparators(afterFirst(tmp, "/", IfNotFoundReturn::none));

    if (obj.bucket.empty())
        throw FileError(replaceCpy(L"Invalid object storage path %x.", L"%x", fmtPath(path)), L"Bucket name is missing.");
    return obj;
}


S3ListResult ffy::parseS3ListResponse(const std::string& xml) //throw SysError
{
    auto throwUnexpected = [&](const std::wstring& details)
    {
        throw SysError(L"Unexpected S3 response. " + details + L" (" + utfTo<std::wstring>(xml.substr(0, 200)) + L')');
    };

    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS)
        throwUnexpected(utfTo<std::wstring>(doc.ErrorStr()));

    const tinyxml2::XMLElement* root = doc.RootElement();
    if (!root || std::string_view(root->Name()) != "ListBucketResult")
        throwUnexpected(L"Bucket listing not available.");

    S3ListResult result;

    for (const tinyxml2::XMLElement* contents = root->FirstChildElement("Contents"); contents; contents = contents->NextSiblingElement("Contents"))
    {
        const std::optional<std::string> key = getChildText(*contents, "Key");
        if (!key || key->empty())
            throwUnexpected(L"Object key not available.");

        result.keys.push_back(*key);
    }

    if (const std::optional<std::string> isTruncated = getChildText(*root, "IsTruncated"))
        result.isTruncated = *isTruncated == "true";

    if (const std::optional<std::string> token = getChildText(*root, "NextContinuationToken"))
        result.nextContinuationToken = *token;

    if (const std::optional<std::string> keyCount = getChildText(*root, "KeyCount"))
        if (stringTo<size_t>(*keyCount) != result.keys.size())
            throwUnexpected(L"Key count mismatch: " + utfTo<std::wstring>(*keyCount));

    return result;
}


std::wstring ffy::formatS3ErrorResponse(const std::string& xml)
{
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.data(), xml.size()) == tinyxml2::XML_SUCCESS)
        if (const tinyxml2::XMLElement* root = doc.RootElement();
            root && std::string_view(root->Name()) == "Error")
            if (const std::optional<std::string> code = getChildText(*root, "Code"))
            {
                std::wstring msg = utfTo<std::wstring>(*code);

                if (const std::optional<std::string> message = getChildText(*root, "Message");
                    message && !message->empty())
                    msg += L": " + utfTo<std::wstring>(*message);
                return msg;
            }

    return trimCpy(utfTo<std::wstring>(xml)); //not an S3 error document
}
