// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef CLEANUP_H_4471029384756102
#define CLEANUP_H_4471029384756102

#include "endpoint.h"


namespace ffy
{
//delete files or folder trees in the given order; the first failure aborts the remaining deletions
class CleanupStep
{
public:
    CleanupStep(const std::shared_ptr<const BackendRegistry>& backends, const std::vector<std::string>& paths,
                const std::string& connectionId = {}, const std::string& typeTag = "local"); //throw FileError

    CleanupStep(const std::shared_ptr<const BackendRegistry>& backends, const std::string& path,
                const std::string& connectionId = {}, const std::string& typeTag = "local") : //throw FileError
        CleanupStep(backends, std::vector<std::string>{path}, connectionId, typeTag) {}

    void execute(StepCallback& cb) const; //throw FileError, ConnectionError

    const std::vector<std::string>& getPaths() const { return paths_; }

private:
    const std::shared_ptr<const BackendRegistry> backends_;
    const std::vector<std::string> paths_;
    const std::string connectionId_;
    const std::string typeTag_;
};
}

#endif //CLEANUP_H_4471029384756102
