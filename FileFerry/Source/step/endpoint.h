// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef ENDPOINT_H_5520193847561203
#define ENDPOINT_H_5520193847561203

#include "../afs/concrete.h"


namespace ffy
{
//one side of a step: which backend, which connection, which path
struct Endpoint
{
    std::string typeTag = "local";
    std::string connectionId; //ignored by "local"
    std::string path;
};


//"Opening file %x on %y source %z." => replace %x, %y and %z
inline
std::wstring formatEndpointMsg(const std::wstring& msgTemplate, const Endpoint& ep)
{
    using namespace ferry;
    std::wstring msg = replaceCpy(msgTemplate, L"%x", fmtPath(ep.path));
    replace(msg, L"%y", utfTo<std::wstring>(ep.typeTag));
    replace(msg, L"%z", fmtPath(ep.connectionId));
    return msg;
}


//steps validate their backend types up front: fail at pipeline definition, not at run time
inline
void checkEndpointType(const BackendRegistry* backends, const Endpoint& ep) //throw FileError
{
    if (!backends)
        throw std::logic_error(std::string(__FILE__) + '[' + ferry::numberTo<std::string>(__LINE__) + "] Contract violation!");

    backends->checkRegistered(ep.typeTag); //throw FileError
}
}

#endif //ENDPOINT_H_5520193847561203
