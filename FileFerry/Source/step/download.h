// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef DOWNLOAD_H_2290183746501928
#define DOWNLOAD_H_2290183746501928

#include <optional>
#include "endpoint.h"
#include "../base/temp_resource.h"


namespace ffy
{
/*  copy a remote file to local disk, replacing an existing target
    no destination: a fresh temp file is created first and handed over to the caller on success  */
class FileDownloadStep
{
public:
    FileDownloadStep(const std::shared_ptr<const BackendRegistry>& backends, const Endpoint& source, const std::optional<std::string>& destPath); //throw FileError

    //returns the local file path
    std::string execute(StepCallback& cb) const; //throw FileError, ConnectionError, TempResourceError

private:
    const std::shared_ptr<const BackendRegistry> backends_;
    const Endpoint source_;
    const std::optional<std::string> destPath_;
};


//same for a folder tree: an existing local folder is replaced, not merged
class FolderDownloadStep
{
public:
    FolderDownloadStep(const std::shared_ptr<const BackendRegistry>& backends, const Endpoint& source, const std::optional<std::string>& destPath); //throw FileError

    std::string execute(StepCallback& cb) const; //throw FileError, ConnectionError, TempResourceError

private:
    const std::shared_ptr<const BackendRegistry> backends_;
    const Endpoint source_;
    const std::optional<std::string> destPath_;
};
}

#endif //DOWNLOAD_H_2290183746501928
