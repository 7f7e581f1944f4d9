// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "sensor.h"

using namespace ferry;
using namespace ffy;


FileAvailabilitySensor::FileAvailabilitySensor(const std::shared_ptr<const BackendRegistry>& backends, const Endpoint& target) : //throw FileError
    backends_(backends),
    target_(target)
{
    checkEndpointType(backends_.get(), target_); //throw FileError
}


bool FileAvailabilitySensor::check(StepCallback& cb) const //throw FileError, ConnectionError
{
    return runStep(cb, [&]
    {
        const std::unique_ptr<FileBackend> backend = backends_->create(target_.typeTag, target_.connectionId); //throw FileError

        cb.logInfo(formatEndpointMsg(L"Checking existence of file %x on %y source %z.", target_));

        const bool exists = backend->fileExists(target_.path, cb); //throw FileError, ConnectionError

        cb.logInfo(exists ? L"File exists." : L"File does not exist.");
        return exists;
    }); //throw FileError, ConnectionError
}


FolderAvailabilitySensor::FolderAvailabilitySensor(const std::shared_ptr<const BackendRegistry>& backends, const Endpoint& target) : //throw FileError
    backends_(backends),
    target_(target)
{
    checkEndpointType(backends_.get(), target_); //throw FileError
}


bool FolderAvailabilitySensor::check(StepCallback& cb) const //throw FileError, ConnectionError
{
    return runStep(cb, [&]
    {
        const std::unique_ptr<FileBackend> backend = backends_->create(target_.typeTag, target_.connectionId); //throw FileError

        cb.logInfo(formatEndpointMsg(L"Checking existence of folder %x on %y source %z.", target_));

        const bool exists = backend->folderExists(target_.path, cb); //throw FileError, ConnectionError

        cb.logInfo(exists ? L"Folder exists." : L"Folder does not exist.");
        return exists;
    }); //throw FileError, ConnectionError
}
