// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#include "cleanup.h"

using namespace ferry;
using namespace ffy;


CleanupStep::CleanupStep(const std::shared_ptr<const BackendRegistry>& backends, const std::vector<std::string>& paths, //throw FileError
                         const std::string& connectionId, const std::string& typeTag) :
    backends_(backends),
    paths_(paths),
    connectionId_(connectionId),
    typeTag_(typeTag)
{
    if (!backends_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    backends_->checkRegistered(typeTag_); //throw FileError
}


void CleanupStep::execute(StepCallback& cb) const //throw FileError, ConnectionError
{
    runStep(cb, [&]
    {
        const std::unique_ptr<FileBackend> backend = backends_->create(typeTag_, connectionId_); //throw FileError

        for (const std::string& path : paths_)
        {
            cb.logInfo(replaceCpy(L"Deleting path %x", L"%x", fmtPath(path)));
            backend->deleteItem(path, cb); //throw FileError, ConnectionError
        }
    }); //throw FileError, ConnectionError
}
