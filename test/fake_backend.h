// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef FAKE_BACKEND_H_7720193846510297
#define FAKE_BACKEND_H_7720193846510297

#include <algorithm>
#include <cstring>
#include <functional>
#include <optional>
#include <set>
#include <ferry/file_io.h>
#include <FileFerry/Source/afs/concrete.h>
#include <FileFerry/Source/afs/native.h>


namespace ffy::test
{
//in-memory files shared by all "mem" backend instances of one test
struct FakeStore
{
    std::map<std::string, std::string> files;

    std::vector<std::string> calls; //"delete:a", "open:b", ...
    std::set<std::string> failingPaths; //any operation on these throws FileError
    std::function<void(const std::string& localPath)> beforeDownload; //optional
    std::optional<size_t> readFailsAfter; //bytes; simulate a connection lost mid-transfer
    int backendsCreated = 0;
};


class FakeBackend : public FileBackend
{
public:
    FakeBackend(const std::string& connectionId, const std::shared_ptr<FakeStore>& store) :
        FileBackend("mem", connectionId, L"memory"), store_(store) { ++store_->backendsCreated; }

private:
    class MemInputStream : public InputStream
    {
    public:
        MemInputStream(const std::string& data, std::optional<size_t> failAfter) : data_(data), failAfter_(failAfter) {}

        size_t getBlockSize() override { return 7; } //force many chunks

        size_t tryRead(void* buffer, size_t bytesToRead) override
        {
            if (failAfter_ && pos_ >= *failAfter_)
                throw ferry::FileError(L"Simulated read failure.", L"Connection reset");

            const size_t bytes = std::min(bytesToRead, data_.size() - pos_);
            std::memcpy(buffer, data_.data() + pos_, bytes);
            pos_ += bytes;
            return bytes;
        }

    private:
        const std::string data_;
        const std::optional<size_t> failAfter_;
        size_t pos_ = 0;
    };

    class MemOutputStream : public OutputStreamImpl
    {
    public:
        MemOutputStream(const std::string& path, const std::shared_ptr<FakeStore>& store) : path_(path), store_(store) {}

        size_t getBlockSize() override { return 5; }

        size_t tryWrite(const void* buffer, size_t bytesToWrite) override
        {
            buf_.append(static_cast<const char*>(buffer), bytesToWrite);
            return bytesToWrite;
        }

        void finalize() override { store_->files[path_] = buf_; } //publish on success only

    private:
        const std::string path_;
        const std::shared_ptr<FakeStore> store_;
        std::string buf_;
    };

    void record(const std::string& operation, const std::string& path)
    {
        store_->calls.push_back(operation + ':' + path);
        if (store_->failingPaths.contains(path))
            throw ferry::FileError(ferry::replaceCpy(L"Simulated failure for %x.", L"%x", ferry::fmtPath(path)));
    }

    std::unique_ptr<InputStream> openInputImpl(const std::string& path, StepCallback& cb) override
    {
        record("open", path);
        auto it = store_->files.find(path);
        if (it == store_->files.end())
            throw ferry::FileError(ferry::replaceCpy(L"Cannot open file %x.", L"%x", ferry::fmtPath(path)), L"Not found");
        return std::make_unique<MemInputStream>(it->second, store_->readFailsAfter);
    }

    std::unique_ptr<OutputStreamImpl> openOutputImpl(const std::string& path, bool append, StepCallback& cb) override
    {
        record("write", path);
        return std::make_unique<MemOutputStream>(path, store_);
    }

    void downloadImpl(const std::string& remotePath, const std::string& localPath, StepCallback& cb) override
    {
        record("download", remotePath);
        if (store_->beforeDownload)
            store_->beforeDownload(localPath);
        auto it = store_->files.find(remotePath);
        if (it == store_->files.end())
            throw ferry::FileError(ferry::replaceCpy(L"Cannot read file %x.", L"%x", ferry::fmtPath(remotePath)), L"Not found");
        ferry::setFileContent(localPath, it->second);
    }

    void downloadFolderImpl(const std::string& remotePath, const std::string& localPath, StepCallback& cb) override
    {
        record("downloadFolder", remotePath);

        const std::string prefix = remotePath + '/';
        std::vector<std::pair<std::string, std::string>> items; //local file path, data
        for (const auto& [path, data] : store_->files)
            if (ferry::startsWith(path, prefix))
                items.emplace_back(appendRelPathChecked(localPath, path.substr(prefix.size())), data); //throw FileError

        createLocalFolderLogged(localPath, cb);

        for (const auto& [localFilePath, data] : items)
        {
            ferry::createDirectoryIfMissingRecursion(*ferry::getParentFolderPath(localFilePath));
            ferry::setFileContent(localFilePath, data);
        }
    }

    void uploadImpl(const std::string& localPath, const std::string& remotePath, StepCallback& cb) override
    {
        record("upload", remotePath);
        store_->files[remotePath] = ferry::getFileContent(localPath);
    }

    void deleteItemImpl(const std::string& path, StepCallback& cb) override
    {
        record("delete", path);
        if (store_->files.erase(path) == 0)
            throw ferry::FileError(ferry::replaceCpy(L"Cannot delete %x.", L"%x", ferry::fmtPath(path)), L"Not found");
    }

    bool fileExistsImpl(const std::string& path, StepCallback& cb) override
    {
        record("fileExists", path);
        return store_->files.contains(path);
    }

    bool folderExistsImpl(const std::string& path, StepCallback& cb) override
    {
        record("folderExists", path);
        const std::string prefix = path + '/';
        return std::any_of(store_->files.begin(), store_->files.end(), [&](const auto& item) { return ferry::startsWith(item.first, prefix); });
    }

    const std::shared_ptr<FakeStore> store_;
};


//built-in backends plus "mem"
inline
std::shared_ptr<BackendRegistry> makeTestRegistry(const std::shared_ptr<FakeStore>& store)
{
    auto backends = std::make_shared<BackendRegistry>(std::make_shared<MemoryConnectionRegistry>());
    backends->registerType("mem", [store](const std::string& connectionId, const std::shared_ptr<const ConnectionRegistry>&)
    {
        return std::make_unique<FakeBackend>(connectionId, store);
    });
    return backends;
}
}

#endif //FAKE_BACKEND_H_7720193846510297
