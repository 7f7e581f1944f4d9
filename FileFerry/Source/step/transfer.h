// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef TRANSFER_H_1103928475610298
#define TRANSFER_H_1103928475610298

#include <optional>
#include "endpoint.h"


namespace ffy
{
DEFINE_NEW_FILE_ERROR(TransferError)
DEFINE_NEW_FILE_ERROR(TransformError)


/*  stream a file from source to destination:
    1. open source for reading
    2. open destination write-truncate
    3. copy block-wise, then finalize the destination

    any failure: TransferError with the backend error as details
    a failed copy leaves no partial destination: local and SFTP output deletes the unfinished file,
    FTP and object storage output is uploaded by finalize() only. An existing local or SFTP destination
    is truncated when opened, so its previous content is lost nevertheless.   */
class TransferStep
{
public:
    TransferStep(const std::shared_ptr<const BackendRegistry>& backends, const Endpoint& source, const Endpoint& dest); //throw FileError

    void execute(StepCallback& cb) const; //throw TransferError

    const Endpoint& getSource() const { return source_; }
    const Endpoint& getDest  () const { return dest_; }

private:
    const std::shared_ptr<const BackendRegistry> backends_;
    const Endpoint source_;
    const Endpoint dest_;
};


struct TransformCommand
{
    std::vector<std::string> argv; //argv[0] is searched in PATH if it does not contain a slash

    bool useStdin  = true; //false: source temp file path is appended to argv
    bool useStdout = true; //false: output temp file path is appended to argv

    std::optional<int> timeoutSec; //none: wait forever
};


/*  transfer with an external command in between:
    1. source => local temp file
    2. run command: temp file => second temp file
    3. second temp file => destination

    the destination is not touched unless the command succeeded; temp files are removed on all paths  */
class TransformStep
{
public:
    TransformStep(const std::shared_ptr<const BackendRegistry>& backends, const Endpoint& source, const Endpoint& dest, const TransformCommand& command); //throw FileError

    void execute(StepCallback& cb) const; //throw TransformError, TransferError, TempResourceError

    //argv as it would be run for the given temp files
    std::vector<std::string> getCommandLine(const std::string& sourceTmpPath, const std::string& outputTmpPath) const;

private:
    const std::shared_ptr<const BackendRegistry> backends_;
    const Endpoint source_;
    const Endpoint dest_;
    const TransformCommand command_;
};
}

#endif //TRANSFER_H_1103928475610298
