// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef S3_H_7730291846502918
#define S3_H_7730291846502918

#include "abstract.h"


namespace ffy
{
/*  "s3": S3-compatible object storage with path-style addressing: "bucket/key"
    - requests are signed with AWS signature V4 (connection user = access key id, secret = secret access key)
    - a "folder" is a key prefix with at least one object below it  */
std::unique_ptr<FileBackend> createS3Backend(const std::string& connectionId, const std::shared_ptr<const ConnectionRegistry>& connections);


struct S3ObjectPath
{
    std::string bucket;
    std::string key; //may be empty: bucket root
};
//leading "s3://" and '/' are ignored
S3ObjectPath parseS3ObjectPath(const std::string& path); //throw FileError


struct S3ListResult
{
    std::vector<std::string> keys;
    bool isTruncated = false;
    std::string nextContinuationToken;
};
//ListObjectsV2 response body
S3ListResult parseS3ListResponse(const std::string& xml); //throw SysError

//"<Error><Code>NoSuchKey</Code><Message>...</Message></Error>" => "NoSuchKey: ..."
std::wstring formatS3ErrorResponse(const std::string& xml);
}

#endif //S3_H_7730291846502918
