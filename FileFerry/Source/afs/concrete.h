// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef CONCRETE_H_3348787329573243
#define CONCRETE_H_3348787329573243

#include "abstract.h"


namespace ffy
{
//process-wide libcurl, OpenSSL and libssh2 initialization; reference counted: call from main thread only!
void initAfs();
void teardownAfs();

class AfsInitializer
{
public:
    AfsInitializer() { initAfs(); }
    ~AfsInitializer() { teardownAfs(); }

private:
    AfsInitializer           (const AfsInitializer&) = delete;
    AfsInitializer& operator=(const AfsInitializer&) = delete;
};


/*  type tag => backend constructor: "local", "ftp", "sftp", "s3" are built in
    creating a backend is cheap: no connection is opened before the first I/O  */
class BackendRegistry
{
public:
    using Factory = std::function<std::unique_ptr<FileBackend>(const std::string& connectionId,
                                                               const std::shared_ptr<const ConnectionRegistry>& connections)>;

    explicit BackendRegistry(const std::shared_ptr<const ConnectionRegistry>& connections);

    void registerType(const std::string& typeTag, const Factory& factory) { factories_[typeTag] = factory; } //setup only: not thread-safe!

    bool isRegistered(const std::string& typeTag) const { return factories_.contains(typeTag); }

    void checkRegistered(const std::string& typeTag) const; //throw FileError

    std::unique_ptr<FileBackend> create(const std::string& typeTag, const std::string& connectionId) const; //throw FileError

    const std::shared_ptr<const ConnectionRegistry>& getConnections() const { return connections_; }

private:
    const std::shared_ptr<const ConnectionRegistry> connections_;
    std::map<std::string, Factory> factories_;
};

//built-in backends, connections from the default connections file
std::shared_ptr<BackendRegistry> createDefaultBackendRegistry(); //throw FileError, ConnectionError
}

#endif //CONCRETE_H_3348787329573243
