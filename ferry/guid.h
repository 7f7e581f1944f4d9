// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef GUID_H_1038475610293847
#define GUID_H_1038475610293847

#include <stdexcept>
    #include <unistd.h> //getentropy
    #include "sys_error.h"


namespace ferry
{
inline
std::string generateGUID() //creates a 16-byte GUID
{
    std::string guid(16, '\0');

    if (::getentropy(guid.data(), guid.size()) != 0)  //"The maximum permitted value for the length argument is 256"
        throw std::runtime_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Failed to generate GUID." + "\n\n" +
                                 utfTo<std::string>(formatSystemError("getentropy", errno)));
    return guid;
}


//short hex tag for unique file names, e.g. "3fa94c0e"
inline
std::string generateShortGuidTag()
{
    return formatAsHexString(generateGUID().substr(0, 4));
}
}

#endif //GUID_H_1038475610293847
