// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "sftp.h"
#include <algorithm>
#include <array>
#include <cstring>
#include <ferry/file_io.h>
#include <ferry/socket.h>
#include <libssh2/libssh2_wrap.h> //DON'T include <libssh2_sftp.h> directly!

using namespace ferry;
using namespace ffy;


namespace
{
//permissions for new files: rw- rw- rw- [0666] => server applies umask
const long SFTP_DEFAULT_PERMISSION_FILE = LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR |
                                          LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IWGRP |
                                          LIBSSH2_SFTP_S_IROTH | LIBSSH2_SFTP_S_IWOTH;

//libssh2 sends at most 30000 bytes per SFTP packet: multiples keep several requests in flight
const size_t SFTP_BLOCK_SIZE_READ  = 16 * 30000;
const size_t SFTP_BLOCK_SIZE_WRITE = 16 * 30000;


//=> most likely *not* a connection issue
struct SysErrorSftpProtocol : public SysError
{
    SysErrorSftpProtocol(const std::wstring& msg, unsigned long sftpError) : SysError(msg), sftpErrorCode(sftpError) {}

    const unsigned long sftpErrorCode;
};


std::string getLibssh2Path(const std::string& itemPath)
{
    const std::string path = removeTrailingSeparators(itemPath);
    if (path.empty())
        return itemPath.empty() ? "." : "/";
    return path;
}


//blocking SSH session with a single SFTP channel
class SftpSession
{
public:
    explicit SftpSession(const ConnectionInfo& info) : //throw SysError
        info_(info)
    {
        FERRY_ON_SCOPE_FAIL(cleanup()); //destructor is not called!

        const int timeoutSec = info_.getTimeoutSec();

        socket_.emplace(info_.host, numberTo<std::string>(info_.getPortOrDefault(DEFAULT_PORT_SFTP)), timeoutSec); //throw SysError

        sshSession_ = ::libssh2_session_init();
        if (!sshSession_) //does not set ssh last error; only memory allocation may fail
            throw SysError(formatSystemError("libssh2_session_init", formatSshStatusCode(LIBSSH2_ERROR_ALLOC), L""));

        ::libssh2_session_set_blocking(sshSession_, 1);
        ::libssh2_session_set_timeout(sshSession_, timeoutSec * 1000 /*ms*/);

        if (::libssh2_session_handshake(sshSession_, socket_->get()) != 0)
            throw SysError(formatLastSshError("libssh2_session_handshake"));

        authenticate(); //throw SysError

        sftpChannel_ = ::libssh2_sftp_init(sshSession_);
        if (!sftpChannel_)
            throw SysError(formatLastSshError("libssh2_sftp_init"));
    }

    ~SftpSession() { cleanup(); }

    //run a blocking libssh2 call: negative return values are errors
    template <class Function>
    int execute(const char* functionName, Function sftpCommand /*(LIBSSH2_SESSION*, LIBSSH2_SFTP*) noexcept*/) //throw SysError, SysErrorSftpProtocol
    {
        const int rc = sftpCommand(sshSession_, sftpChannel_);
        if (rc >= LIBSSH2_ERROR_NONE)
            return rc;

        if (::libssh2_session_last_errno(sshSession_) != rc) //libssh2 does not always set the last error
            ::libssh2_session_set_last_error(sshSession_, rc, nullptr);

        //LIBSSH2_ERROR_SFTP_PROTOCOL without an SFTP status indicates a corrupted connection
        if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && ::libssh2_sftp_last_error(sftpChannel_) != LIBSSH2_FX_OK)
            throw SysErrorSftpProtocol(formatLastSshError(functionName), ::libssh2_sftp_last_error(sftpChannel_));

        throw SysError(formatLastSshError(functionName));
    }

    //for calls returning a handle instead of a status
    static int getLastErrorCode(LIBSSH2_SESSION* sshSession)
    {
        return std::min(::libssh2_session_last_errno(sshSession), LIBSSH2_ERROR_SOCKET_NONE);
    }

    const ConnectionInfo& getConnectionInfo() const { return info_; }

private:
    SftpSession           (const SftpSession&) = delete;
    SftpSession& operator=(const SftpSession&) = delete;

    void authenticate() //throw SysError
    {
        const char* authList = ::libssh2_userauth_list(sshSession_, info_.user);
        if (!authList)
        {
            if (::libssh2_userauth_authenticated(sshSession_) != 1)
                throw SysError(formatLastSshError("libssh2_userauth_list"));
            return; //SSH_USERAUTH_NONE succeeded
        }

        bool supportAuthPassword    = false;
        bool supportAuthKeyfile     = false;
        bool supportAuthInteractive = false;
        for (const std::string& authMethod : split(authList, ",", SplitOnEmpty::skip))
        {
            const std::string method = trimCpy(authMethod);
            if (method == "password")
                supportAuthPassword = true;
            else if (method == "publickey")
                supportAuthKeyfile = true;
            else if (method == "keyboard-interactive")
                supportAuthInteractive = true;
        }

        auto throwUnsupported = [&](const wchar_t* authName)
        {
            throw SysError(replaceCpy(L"The server does not support authentication via %x.", L"%x", authName) +
                           L"\nRequired: " + utfTo<std::wstring>(authList));
        };

        if (info_.hasOption("agent"))
            authenticateAgent(); //throw SysError
        else if (info_.hasOption("keyfile"))
        {
            if (!supportAuthKeyfile)
                throwUnsupported(L"\"key file\"");

            const std::string keyFilePath = info_.getOption("keyfile", "");
            std::string pkStream;
            try
            {
                pkStream = getFileContent(keyFilePath); //throw FileError
                trim(pkStream);
            }
            catch (const FileError& e) { throw SysError(replaceCpy(e.toString(), L"\n\n", L"\n")); }

            if (::libssh2_userauth_publickey_frommemory(sshSession_, info_.user, pkStream, info_.secret /*passphrase*/) != 0)
            {
                if (contains(beforeFirst(pkStream, "\n", IfNotFoundReturn::all), "PUBLIC KEY") ||
                    startsWith(pkStream, "ssh-") ||
                    startsWith(pkStream, "ecdsa-"))
                    throw SysError(L"Authentication failed. " +
                                   replaceCpy(L"%x is not an OpenSSH private key file.", L"%x", fmtPath(keyFilePath)));

                throw SysError(formatLastSshError("libssh2_userauth_publickey_frommemory"));
            }
        }
        else if (supportAuthPassword)
        {
            if (::libssh2_userauth_password(sshSession_, info_.user, info_.secret) != 0)
                throw SysError(formatLastSshError("libssh2_userauth_password"));
        }
        else if (supportAuthInteractive) //some servers support "keyboard-interactive", but not "password"
            authenticateInteractive(); //throw SysError
        else
            throwUnsupported(L"\"username/password\"");
    }

    void authenticateInteractive() //throw SysError
    {
        struct PromptState
        {
            const std::string* password;
            int unexpectedPrompts;
        } state{&info_.secret, 0};

        //C callback without user data parameter: pass state via libssh2_session_abstract()
        auto responseCallback = [](const char* name, int nameLen, const char* instruction, int instructionLen,
                                   int numPrompts, const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts, LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses, void** abstract)
        {
            PromptState& ps = **reinterpret_cast<PromptState**>(abstract);

            //a single prompt without echo is the password request; the prompt text may be localized
            if (numPrompts == 1 && prompts[0].echo == 0)
            {
                responses[0].text = ::strdup(ps.password->c_str()); //ownership passed: libssh2 calls free()
                responses[0].length = static_cast<unsigned int>(ps.password->size());
            }
            else
                ps.unexpectedPrompts += numPrompts;
        };

        if (*::libssh2_session_abstract(sshSession_))
            throw SysError(L"libssh2_session_abstract: non-null value");

        *reinterpret_cast<PromptState**>(::libssh2_session_abstract(sshSession_)) = &state;
        FERRY_ON_SCOPE_EXIT(*::libssh2_session_abstract(sshSession_) = nullptr);

        if (::libssh2_userauth_keyboard_interactive(sshSession_, info_.user, responseCallback) != 0)
            throw SysError(formatLastSshError("libssh2_userauth_keyboard_interactive") +
                           (state.unexpectedPrompts == 0 ? L"" : L"\nUnexpected prompts: " + numberTo<std::wstring>(state.unexpectedPrompts)));
    }

    void authenticateAgent() //throw SysError
    {
        LIBSSH2_AGENT* sshAgent = ::libssh2_agent_init(sshSession_);
        if (!sshAgent)
            throw SysError(formatLastSshError("libssh2_agent_init"));
        FERRY_ON_SCOPE_EXIT(::libssh2_agent_free(sshAgent));

        if (::libssh2_agent_connect(sshAgent) != 0)
            throw SysError(formatLastSshError("libssh2_agent_connect"));
        FERRY_ON_SCOPE_EXIT(::libssh2_agent_disconnect(sshAgent));

        if (::libssh2_agent_list_identities(sshAgent) != 0)
            throw SysError(formatLastSshError("libssh2_agent_list_identities"));

        for (libssh2_agent_publickey* prev = nullptr;;)
        {
            libssh2_agent_publickey* identity = nullptr;
            const int rc = ::libssh2_agent_get_identity(sshAgent, &identity, prev);
            if (rc == 1) //no more public keys
                throw SysError(L"SSH agent contains no matching public key.");
            if (rc != 0)
                throw SysError(formatLastSshError("libssh2_agent_get_identity"));

            if (::libssh2_agent_userauth(sshAgent, info_.user.c_str(), identity) == 0)
                return;

            prev = identity; //try next public key
        }
    }

    void cleanup() //nothrow
    {
        if (sftpChannel_)
            if (::libssh2_sftp_shutdown(sftpChannel_) != LIBSSH2_ERROR_NONE)
                logExtraError(formatLastSshError("libssh2_sftp_shutdown"));

        if (sshSession_)
        {
            //server notification only
            if (::libssh2_session_disconnect(sshSession_, "FileFerry says \"bye\"!") != LIBSSH2_ERROR_NONE)
                logExtraError(formatLastSshError("libssh2_session_disconnect"));

            if (::libssh2_session_free(sshSession_) != LIBSSH2_ERROR_NONE)
                logExtraError(formatSystemError("libssh2_session_free", L"", L"Failed to free SSH session."));
        }
    }

    std::wstring formatLastSshError(const char* functionName) const
    {
        char* lastErrorMsg = nullptr; //owned by "sshSession"
        const int sshStatusCode = ::libssh2_session_last_error(sshSession_, &lastErrorMsg, nullptr, false /*want_buf*/);

        std::wstring errorMsg;
        if (lastErrorMsg)
            errorMsg = trimCpy(utfTo<std::wstring>(lastErrorMsg));

        if (sshStatusCode == LIBSSH2_ERROR_SFTP_PROTOCOL && sftpChannel_ && ::libssh2_sftp_last_error(sftpChannel_) != LIBSSH2_FX_OK)
        {
            if (errorMsg == L"SFTP Protocol Error") //trite
                errorMsg.clear();
            return formatSystemError(functionName, formatSftpStatusCode(::libssh2_sftp_last_error(sftpChannel_)), errorMsg);
        }
        return formatSystemError(functionName, formatSshStatusCode(sshStatusCode), errorMsg);
    }

    const ConnectionInfo info_;
    std::optional<Socket> socket_; //*bound* after constructor has run
    LIBSSH2_SESSION* sshSession_ = nullptr;
    LIBSSH2_SFTP* sftpChannel_ = nullptr;
};

//------------------------------------------------------------------------------------------------------

struct SftpItem
{
    std::string itemName;
    ItemType type = ItemType::file; //symlinks are not resolved
};

std::vector<SftpItem> getFolderContent(SftpSession& session, const std::string& folderPath) //throw SysError, SysErrorSftpProtocol
{
    LIBSSH2_SFTP_HANDLE* dirHandle = nullptr;
    session.execute("libssh2_sftp_opendir", [&](LIBSSH2_SESSION* sshSession, LIBSSH2_SFTP* sftpChannel)
    {
        dirHandle = ::libssh2_sftp_opendir(sftpChannel, getLibssh2Path(folderPath));
        return dirHandle ? LIBSSH2_ERROR_NONE : SftpSession::getLastErrorCode(sshSession);
    }); //throw SysError, SysErrorSftpProtocol

    FERRY_ON_SCOPE_EXIT(try
    {
        session.execute("libssh2_sftp_closedir", [&](LIBSSH2_SESSION*, LIBSSH2_SFTP*) { return ::libssh2_sftp_closedir(dirHandle); });
    }
    catch (const SysError& e) { logExtraError(replaceCpy(L"Cannot read directory %x.", L"%x", fmtPath(folderPath)) + L"\n\n" + e.toString()); });

    std::vector<SftpItem> output;
    for (;;)
    {
        std::array<char, 1024> buf; //NAME_MAX(255)+1 should suffice
        LIBSSH2_SFTP_ATTRIBUTES attribs = {};

        const int rc = session.execute("libssh2_sftp_readdir", [&](LIBSSH2_SESSION*, LIBSSH2_SFTP*)
        {
            return ::libssh2_sftp_readdir(dirHandle, buf.data(), buf.size(), &attribs);
        }); //throw SysError, SysErrorSftpProtocol

        if (rc == 0) //no more items
            return output;

        const std::string itemName(buf.data(), rc);
        if (itemName == "." || itemName == "..")
            continue;

        if ((attribs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) == 0) //server does not support these attributes
            throw SysError(replaceCpy(L"Cannot read file attributes of %x.", L"%x", fmtPath(appendPath(folderPath, itemName))) +
                           L" File attributes not available.");

        if (LIBSSH2_SFTP_S_ISLNK(attribs.permissions))
            output.push_back({itemName, ItemType::symlink});
        else if (LIBSSH2_SFTP_S_ISDIR(attribs.permissions))
            output.push_back({itemName, ItemType::folder});
        else //regular file, named pipe, etc.
            output.push_back({itemName, ItemType::file});
    }
}


//none: symlink is dangling
std::optional<ItemType> getSymlinkTargetType(SftpSession& session, const std::string& linkPath) //throw SysError
{
    LIBSSH2_SFTP_ATTRIBUTES attribsTrg = {};
    try
    {
        session.execute("libssh2_sftp_stat", [&](LIBSSH2_SESSION*, LIBSSH2_SFTP* sftpChannel)
        {
            return ::libssh2_sftp_stat(sftpChannel, getLibssh2Path(linkPath), &attribsTrg);
        }); //throw SysError, SysErrorSftpProtocol
    }
    catch (const SysErrorSftpProtocol& e)
    {
        if (e.sftpErrorCode == LIBSSH2_FX_NO_SUCH_FILE ||
            e.sftpErrorCode == LIBSSH2_FX_NO_SUCH_PATH)
            return std::nullopt;
        throw;
    }

    if ((attribsTrg.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) == 0)
        throw SysError(replaceCpy(L"Cannot read file attributes of %x.", L"%x", fmtPath(linkPath)) + L" File attributes not available.");

    return LIBSSH2_SFTP_S_ISDIR(attribsTrg.permissions) ? ItemType::folder : ItemType::file;
}

//------------------------------------------------------------------------------------------------------

class SftpInputStream : public InputStream
{
public:
    SftpInputStream(const std::shared_ptr<SftpSession>& session, const std::string& filePath) : //throw FileError
        session_(session),
        filePath_(filePath)
    {
        try
        {
            session_->execute("libssh2_sftp_open", [&](LIBSSH2_SESSION* sshSession, LIBSSH2_SFTP* sftpChannel)
            {
                fileHandle_ = ::libssh2_sftp_open(sftpChannel, getLibssh2Path(filePath), LIBSSH2_FXF_READ, 0);
                return fileHandle_ ? LIBSSH2_ERROR_NONE : SftpSession::getLastErrorCode(sshSession);
            }); //throw SysError, SysErrorSftpProtocol
        }
        catch (const SysError& e) { throw FileError(replaceCpy(L"Cannot open file %x.", L"%x", fmtPath(filePath_)), e.toString()); }
    }

    ~SftpInputStream()
    {
        try
        {
            session_->execute("libssh2_sftp_close", [&](LIBSSH2_SESSION*, LIBSSH2_SFTP*) { return ::libssh2_sftp_close(fileHandle_); });
        }
        catch (const SysError& e) { logExtraError(replaceCpy(L"Cannot read file %x.", L"%x", fmtPath(filePath_)) + L"\n\n" + e.toString()); }
    }

    size_t getBlockSize() override { return SFTP_BLOCK_SIZE_READ; } //throw FileError

    //libssh2_sftp_read has the same semantics as POSIX read()
    size_t tryRead(void* buffer, size_t bytesToRead) override //throw FileError
    {
        if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file!
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

        const size_t chunkSize = std::min(bytesToRead, SFTP_BLOCK_SIZE_READ); //keep within int range
        try
        {
            return session_->execute("libssh2_sftp_read", [&](LIBSSH2_SESSION*, LIBSSH2_SFTP*)
            {
                return static_cast<int>(::libssh2_sftp_read(fileHandle_, static_cast<char*>(buffer), chunkSize));
            }); //throw SysError, SysErrorSftpProtocol
        }
        catch (const SysError& e) { throw FileError(replaceCpy(L"Cannot read file %x.", L"%x", fmtPath(filePath_)), e.toString()); }
    }

private:
    const std::shared_ptr<SftpSession> session_;
    const std::string filePath_;
    LIBSSH2_SFTP_HANDLE* fileHandle_ = nullptr;
};


//writes directly to the target: a non-finalized file is deleted on destruction
class SftpOutputStream : public OutputStreamImpl
{
public:
    SftpOutputStream(const std::shared_ptr<SftpSession>& session, const std::string& filePath) : //throw FileError
        session_(session),
        filePath_(filePath)
    {
        try
        {
            session_->execute("libssh2_sftp_open", [&](LIBSSH2_SESSION* sshSession, LIBSSH2_SFTP* sftpChannel)
            {
                fileHandle_ = ::libssh2_sftp_open(sftpChannel, getLibssh2Path(filePath),
                                                  LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                                  SFTP_DEFAULT_PERMISSION_FILE);
                return fileHandle_ ? LIBSSH2_ERROR_NONE : SftpSession::getLastErrorCode(sshSession);
            }); //throw SysError, SysErrorSftpProtocol
        }
        catch (const SysError& e) { throw FileError(replaceCpy(L"Cannot write file %x.", L"%x", fmtPath(filePath_)), e.toString()); }
    }

    ~SftpOutputStream()
    {
        if (fileHandle_) //=> cleanup non-finalized output file
        {
            if (!closeFailed_) //calling libssh2_sftp_close() a second time is pointless
                try { close(); /*throw FileError*/ }
                catch (const FileError& e) { logExtraError(e.toString()); }

            try
            {
                session_->execute("libssh2_sftp_unlink", [&](LIBSSH2_SESSION*, LIBSSH2_SFTP* sftpChannel)
                {
                    return ::libssh2_sftp_unlink(sftpChannel, getLibssh2Path(filePath_));
                }); //throw SysError, SysErrorSftpProtocol
            }
            catch (const SysError& e) { logExtraError(replaceCpy(L"Cannot delete file %x.", L"%x", fmtPath(filePath_)) + L"\n\n" + e.toString()); }
        }
    }

    size_t getBlockSize() override { return SFTP_BLOCK_SIZE_WRITE; } //throw FileError

    size_t tryWrite(const void* buffer, size_t bytesToWrite) override //throw FileError
    {
        if (bytesToWrite == 0)
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

        const size_t chunkSize = std::min(bytesToWrite, SFTP_BLOCK_SIZE_WRITE);
        try
        {
            return session_->execute("libssh2_sftp_write", [&](LIBSSH2_SESSION*, LIBSSH2_SFTP*)
            {
                return static_cast<int>(::libssh2_sftp_write(fileHandle_, static_cast<const char*>(buffer), chunkSize));
            }); //throw SysError, SysErrorSftpProtocol
        }
        catch (const SysError& e) { throw FileError(replaceCpy(L"Cannot write file %x.", L"%x", fmtPath(filePath_)), e.toString()); }
    }

    void finalize() override { close(); } //throw FileError

private:
    void close() //throw FileError
    {
        if (!fileHandle_)
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
        try
        {
            session_->execute("libssh2_sftp_close", [&](LIBSSH2_SESSION*, LIBSSH2_SFTP*) { return ::libssh2_sftp_close(fileHandle_); });
            fileHandle_ = nullptr;
        }
        catch (const SysError& e)
        {
            closeFailed_ = true;
            throw FileError(replaceCpy(L"Cannot write file %x.", L"%x", fmtPath(filePath_)), e.toString());
        }
    }

    const std::shared_ptr<SftpSession> session_;
    const std::string filePath_;
    LIBSSH2_SFTP_HANDLE* fileHandle_ = nullptr;
    bool closeFailed_ = false;
};

//------------------------------------------------------------------------------------------------------

class SftpBackend : public FileBackend
{
public:
    SftpBackend(const std::string& connectionId, const std::shared_ptr<const ConnectionRegistry>& connections) :
        FileBackend("sftp", connectionId, L"SFTP"),
        connections_(connections) {}

private:
    //streams share ownership: they may outlive the backend
    const std::shared_ptr<SftpSession>& getSession() //throw ConnectionError
    {
        if (!session_)
        {
            const ConnectionInfo info = connections_->resolve(getConnectionId()); //throw ConnectionError
            if (info.scheme != "sftp")
                throw ConnectionError(replaceCpy(L"Connection %x is not an SFTP connection.", L"%x", fmtPath(getConnectionId())));
            try
            {
                session_ = std::make_shared<SftpSession>(info); //throw SysError
            }
            catch (const SysError& e) { throw ConnectionError(replaceCpy(L"Unable to connect to %x.", L"%x", fmtPath(info.host)), e.toString()); }
        }
        return session_;
    }

    std::vector<SftpItem> listFolder(const std::string& folderPath) //throw FileError, ConnectionError
    {
        SftpSession& session = *getSession(); //throw ConnectionError
        try
        {
            return getFolderContent(session, folderPath); //throw SysError
        }
        catch (const SysError& e) { throw FileError(replaceCpy(L"Cannot open directory %x.", L"%x", fmtPath(folderPath)), e.toString()); }
    }

    //none: folder does not exist
    std::optional<std::vector<SftpItem>> listFolderIfExists(const std::string& folderPath) //throw FileError, ConnectionError
    {
        SftpSession& session = *getSession(); //throw ConnectionError
        try
        {
            return getFolderContent(session, folderPath); //throw SysError, SysErrorSftpProtocol
        }
        catch (const SysErrorSftpProtocol& e)
        {
            if (e.sftpErrorCode == LIBSSH2_FX_NO_SUCH_FILE ||
                e.sftpErrorCode == LIBSSH2_FX_NO_SUCH_PATH)
                return std::nullopt;
            throw FileError(replaceCpy(L"Cannot open directory %x.", L"%x", fmtPath(folderPath)), e.toString());
        }
        catch (const SysError& e) { throw FileError(replaceCpy(L"Cannot open directory %x.", L"%x", fmtPath(folderPath)), e.toString()); }
    }

    std::optional<ItemType> resolveSymlink(const std::string& linkPath) //throw FileError, ConnectionError
    {
        SftpSession& session = *getSession(); //throw ConnectionError
        try
        {
            return getSymlinkTargetType(session, linkPath); //throw SysError
        }
        catch (const SysError& e) { throw FileError(replaceCpy(L"Cannot resolve symbolic link %x.", L"%x", fmtPath(linkPath)), e.toString()); }
    }

    void runCommand(const char* functionName, const std::wstring& errorMsg, //throw FileError, ConnectionError
                    const std::function<int(LIBSSH2_SFTP* sftpChannel)>& sftpCommand)
    {
        SftpSession& session = *getSession(); //throw ConnectionError
        try
        {
            session.execute(functionName, [&](LIBSSH2_SESSION*, LIBSSH2_SFTP* sftpChannel) { return sftpCommand(sftpChannel); }); //throw SysError
        }
        catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
    }

    void retrieveFile(const std::string& remotePath, const std::string& localFilePath, StepCallback& cb) //throw FileError, ConnectionError
    {
        cb.logInfo(replaceCpy(L"Retrieving file from SFTP: %x", L"%x", fmtPath(remotePath)));

        SftpInputStream streamIn(getSession() /*throw ConnectionError*/, remotePath); //throw FileError
        streamToLocalFile(streamIn, localFilePath); //throw FileError

        cb.logInfo(replaceCpy(L"Finished retrieving file from SFTP: %x", L"%x", fmtPath(remotePath)));
    }

    void retrieveFolderRecursion(const std::string& remotePath, const std::string& localPath, StepCallback& cb) //throw FileError, ConnectionError
    {
        for (const SftpItem& item : listFolder(remotePath)) //throw FileError, ConnectionError
        {
            checkItemName(item.itemName); //throw FileError

            const std::string remoteItemPath = appendPath(remotePath, item.itemName);
            const std::string localItemPath  = appendPath(localPath,  item.itemName);

            std::optional<ItemType> type = item.type;
            if (item.type == ItemType::symlink)
                type = resolveSymlink(remoteItemPath); //throw FileError, ConnectionError

            if (!type)
                cb.logMessage(replaceCpy(L"Skipping broken symbolic link %x.", L"%x", fmtPath(remoteItemPath)), StepCallback::MsgType::warning);
            else if (*type == ItemType::folder)
            {
                createDirectory(localItemPath); //throw FileError, ErrorTargetExisting
                retrieveFolderRecursion(remoteItemPath, localItemPath, cb); //throw FileError, ConnectionError
            }
            else
                retrieveFile(remoteItemPath, localItemPath, cb); //throw FileError, ConnectionError
        }
    }

    void removeFile(const std::string& filePath) //throw FileError, ConnectionError
    {
        runCommand("libssh2_sftp_unlink", replaceCpy(L"Cannot delete file %x.", L"%x", fmtPath(filePath)),
        [&](LIBSSH2_SFTP* sftpChannel) { return ::libssh2_sftp_unlink(sftpChannel, getLibssh2Path(filePath)); }); //throw FileError, ConnectionError
    }

    void removeFolderRecursion(const std::string& folderPath) //throw FileError, ConnectionError
    {
        for (const SftpItem& item : listFolder(folderPath)) //throw FileError, ConnectionError
        {
            const std::string itemPath = appendPath(folderPath, item.itemName);
            if (item.type == ItemType::folder)
                removeFolderRecursion(itemPath); //throw FileError, ConnectionError
            else //symlinks are removed, never followed
                removeFile(itemPath); //throw FileError, ConnectionError
        }

        runCommand("libssh2_sftp_rmdir", replaceCpy(L"Cannot delete directory %x.", L"%x", fmtPath(folderPath)),
        [&](LIBSSH2_SFTP* sftpChannel) { return ::libssh2_sftp_rmdir(sftpChannel, getLibssh2Path(folderPath)); }); //throw FileError, ConnectionError
    }

    bool itemExistsAs(const std::string& path, bool matchFolders, StepCallback& cb) //throw FileError, ConnectionError
    {
        const auto& [parentPath, namePattern] = splitParentAndName(path);

        const std::optional<std::vector<SftpItem>> sftpItems = listFolderIfExists(parentPath); //throw FileError, ConnectionError
        if (!sftpItems)
            return false;

        std::vector<ListedItem> items;
        for (const SftpItem& item : *sftpItems)
            if (item.type != ItemType::symlink)
                items.push_back({item.itemName, item.type == ItemType::folder});
            else if (const std::optional<ItemType> targetType = resolveSymlink(appendPath(parentPath, item.itemName))) //throw FileError, ConnectionError
                items.push_back({item.itemName, *targetType == ItemType::folder});

        return !matchListedItems(items, namePattern, matchFolders, cb).empty();
    }

    //----------------------------------------------------------------------------------------------
    std::unique_ptr<InputStream> openInputImpl(const std::string& path, StepCallback& cb) override //throw FileError, ConnectionError
    {
        return std::make_unique<SftpInputStream>(getSession() /*throw ConnectionError*/, path); //throw FileError
    }

    std::unique_ptr<OutputStreamImpl> openOutputImpl(const std::string& path, bool append, StepCallback& cb) override //throw FileError, ConnectionError
    {
        return std::make_unique<SftpOutputStream>(getSession() /*throw ConnectionError*/, path); //throw FileError
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

        cb.logInfo(replaceCpy(L"Retrieving files in folder from SFTP: %x", L"%x", fmtPath(remotePath)));
        retrieveFolderRecursion(removeTrailingSeparators(remotePath), localPath, cb); //throw FileError, ConnectionError
        cb.logInfo(replaceCpy(L"Finished retrieving folder from SFTP: %x", L"%x", fmtPath(remotePath)));
    }

    void uploadImpl(const std::string& localPath, const std::string& remotePath, StepCallback& cb) override //throw FileError, ConnectionError
    {
        OutputStream streamOut(std::make_unique<SftpOutputStream>(getSession() /*throw ConnectionError*/, remotePath) /*throw FileError*/, remotePath);
        streamFromLocalFile(localPath, streamOut); //throw FileError
    }

    void deleteItemImpl(const std::string& path, StepCallback& cb) override //throw FileError, ConnectionError
    {
        const std::string itemPath = removeTrailingSeparators(path);
        const std::pair<std::string, std::string> parentAndName = splitParentAndName(itemPath);
        const std::string& itemName = parentAndName.second;

        const std::vector<SftpItem> items = listFolder(parentAndName.first); //throw FileError, ConnectionError

        auto it = std::find_if(items.begin(), items.end(), [&](const SftpItem& item) { return item.itemName == itemName; });
        if (it == items.end())
            throw FileError(replaceCpy(L"Cannot delete %x.", L"%x", fmtPath(itemPath)), L"The item does not exist.");

        if (it->type == ItemType::folder)
            removeFolderRecursion(itemPath); //throw FileError, ConnectionError
        else
            removeFile(itemPath); //throw FileError, ConnectionError
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
    std::shared_ptr<SftpSession> session_; //lazy: connect on first I/O
};
}


std::unique_ptr<FileBackend> ffy::createSftpBackend(const std::string& connectionId, const std::shared_ptr<const ConnectionRegistry>& connections)
{
    return std::make_unique<SftpBackend>(connectionId, connections);
}


void ffy::sftpInit() //throw SysError
{
    if (const int rc = ::libssh2_init(0); //not thread-safe!
        rc != 0)
        throw SysError(formatSystemError("libssh2_init", formatSshStatusCode(rc), L""));
}


void ffy::sftpTearDown()
{
    ::libssh2_exit();
}
