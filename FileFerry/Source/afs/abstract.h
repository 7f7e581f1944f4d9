// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef ABSTRACT_H_4410293847561029
#define ABSTRACT_H_4410293847561029

#include <functional>
#include <memory>
#include <vector>
#include <ferry/file_error.h>
#include <ferry/file_path.h>
#include "connection.h"
#include "../base/step_callback.h"


namespace ffy
{
DEFINE_NEW_FILE_ERROR(UnsupportedModeError)
DEFINE_NEW_FILE_ERROR(AlreadyExistsError)


//parsed from "r", "rb", "w", "wb", "r+", "a", ...
struct OpenMode
{
    bool isBinary = false; //contains 'b'
    bool canRead  = false; //empty or starts with 'r'
    bool canWrite = false; //starts with 'w', "r+" or 'a'
    bool replace  = false; //starts with 'w'
};
OpenMode parseOpenMode(std::string_view mode);

inline bool operator==(const OpenMode& lhs, const OpenMode& rhs)
{
    return lhs.isBinary == rhs.isBinary && lhs.canRead == rhs.canRead && lhs.canWrite == rhs.canWrite && lhs.replace == rhs.replace;
}


struct InputStream
{
    virtual ~InputStream() {}

    virtual size_t getBlockSize() = 0; //throw FileError

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    virtual size_t tryRead(void* buffer, size_t bytesToRead) = 0; //throw FileError
};


//destruction without finalize(): partial output must not become visible as the target file
struct OutputStreamImpl
{
    virtual ~OutputStreamImpl() {}

    virtual size_t getBlockSize() = 0; //throw FileError

    //may return short! CONTRACT: bytesToWrite > 0
    virtual size_t tryWrite(const void* buffer, size_t bytesToWrite) = 0; //throw FileError

    virtual void finalize() = 0; //throw FileError
};


//destruction without finalize() discards the output
class OutputStream
{
public:
    OutputStream(std::unique_ptr<OutputStreamImpl>&& outStream, const std::string& displayPath);

    size_t getBlockSize() { return outStream_->getBlockSize(); } //throw FileError

    void write(const void* buffer, size_t bytesToWrite); //throw FileError

    void finalize(); //throw FileError

    uint64_t getBytesWritten() const { return bytesWritten_; }

private:
    OutputStream           (const OutputStream&) = delete;
    OutputStream& operator=(const OutputStream&) = delete;

    std::unique_ptr<OutputStreamImpl> outStream_;
    const std::string displayPath_;
    uint64_t bytesWritten_ = 0;
    bool finalizeSucceeded_ = false;
};


//returns number of bytes copied
uint64_t copyStream(InputStream& streamIn, OutputStream& streamOut); //throw FileError


/*  THREAD-SAFETY: none; an instance is connection-scoped and used by a single step execution

    - paths are backend-relative and may contain wildcards where the backend supports existence checks by listing
    - the connection is resolved and established lazily on first I/O, then kept for the backend's lifetime
    - public functions check preconditions and log, then delegate to the backend implementation     */
class FileBackend
{
public:
    virtual ~FileBackend() {}

    const std::string& getTypeTag     () const { return typeTag_; }
    const std::string& getConnectionId() const { return connectionId_; }

    std::unique_ptr<InputStream>  openInput (const std::string& path, const std::string& mode, StepCallback& cb); //throw FileError, UnsupportedModeError, ConnectionError
    std::unique_ptr<OutputStream> openOutput(const std::string& path, const std::string& mode, StepCallback& cb); //throw FileError, UnsupportedModeError, ConnectionError

    //replace == false && localPath existing: AlreadyExistsError
    void download      (const std::string& remotePath, const std::string& localPath, bool replace, StepCallback& cb); //throw FileError, AlreadyExistsError, ConnectionError
    void downloadFolder(const std::string& remotePath, const std::string& localPath, bool replace, StepCallback& cb); //throw FileError, AlreadyExistsError, ConnectionError

    //replace == false: best-effort existence check on the remote side, not atomic!
    void upload(const std::string& localPath, const std::string& remotePath, bool replace, StepCallback& cb); //throw FileError, AlreadyExistsError, ConnectionError

    //file or (recursively) folder
    void deleteItem(const std::string& path, StepCallback& cb); //throw FileError, ConnectionError

    //missing parent folder => false
    bool fileExists  (const std::string& path, StepCallback& cb); //throw FileError, ConnectionError
    bool folderExists(const std::string& path, StepCallback& cb); //throw FileError, ConnectionError

protected:
    FileBackend(const std::string& typeTag, const std::string& connectionId, const std::wstring& protocolName) :
        typeTag_(typeTag), connectionId_(connectionId), protocolName_(protocolName) {}

    //"Creating the folder %x, if it does not exist" + "Created!"/"Already existed."
    static void createLocalFolderLogged(const std::string& folderPath, StepCallback& cb); //throw FileError

    //copy whole file to/from a local path
    static void streamToLocalFile  (InputStream& streamIn, const std::string& localPath); //throw FileError
    static void streamFromLocalFile(const std::string& localPath, OutputStream& streamOut); //throw FileError

private:
    FileBackend           (const FileBackend&) = delete;
    FileBackend& operator=(const FileBackend&) = delete;

    virtual bool supportsAppend() const { return false; }

    virtual std::unique_ptr<InputStream>      openInputImpl (const std::string& path, StepCallback& cb) = 0; //throw FileError, ConnectionError
    virtual std::unique_ptr<OutputStreamImpl> openOutputImpl(const std::string& path, bool append, StepCallback& cb) = 0; //throw FileError, ConnectionError

    //localPath: existing items were already handled; parent folder may be missing
    virtual void downloadImpl      (const std::string& remotePath, const std::string& localPath, StepCallback& cb) = 0; //throw FileError, ConnectionError
    virtual void downloadFolderImpl(const std::string& remotePath, const std::string& localPath, StepCallback& cb) = 0; //throw FileError, ConnectionError
    virtual void uploadImpl        (const std::string& localPath, const std::string& remotePath, StepCallback& cb) = 0; //throw FileError, ConnectionError

    virtual void deleteItemImpl(const std::string& path, StepCallback& cb) = 0; //throw FileError, ConnectionError

    virtual bool fileExistsImpl  (const std::string& path, StepCallback& cb) = 0; //throw FileError, ConnectionError
    virtual bool folderExistsImpl(const std::string& path, StepCallback& cb) = 0; //throw FileError, ConnectionError

    const std::string typeTag_;
    const std::string connectionId_;
    const std::wstring protocolName_; //e.g. "FTP"
};

//------------------------------------------------------------------------------------------------------

struct ListedItem
{
    std::string itemName;
    bool isFolder = false;
};

//fnmatch() semantics on item names of one folder listing; also logs "Found the following files: ..."
std::vector<std::string> matchListedItems(const std::vector<ListedItem>& items, const std::string& namePattern, bool matchFolders, StepCallback& cb);

//"dir/name*.csv" => {"dir", "name*.csv"}; trailing separators are ignored; no parent => ""
std::pair<std::string, std::string> splitParentAndName(const std::string& itemPath);

//names received from a server must not address anything outside the folder being downloaded:
//reject empty names, "." and ".." and names containing a path separator
void checkItemName(const std::string& itemName); //throw FileError

//"sub/dir/file" below folderPath; every component is checked by checkItemName()
std::string appendRelPathChecked(const std::string& folderPath, const std::string& relPath); //throw FileError

//write to a temporary sibling of filePath, then rename: the target is either complete or untouched
void writeFileTransactional(const std::string& filePath, //throw FileError, X
                            const std::function<void(const std::string& tmpFilePath)>& writeFile /*throw FileError, X*/);
}

#endif //ABSTRACT_H_4410293847561029
