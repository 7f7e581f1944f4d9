// *****************************************************************************
// * This file is part of the FileFerry project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) FileFerry contributors - All Rights Reserved                *
// *****************************************************************************

#ifndef SENSOR_H_8830192746510283
#define SENSOR_H_8830192746510283

#include "endpoint.h"


namespace ffy
{
/*  poll once: no retry, no state between calls
    a missing item (or a missing parent folder) is "false", never an error     */
class FileAvailabilitySensor
{
public:
    FileAvailabilitySensor(const std::shared_ptr<const BackendRegistry>& backends, const Endpoint& target); //throw FileError

    bool check(StepCallback& cb) const; //throw FileError, ConnectionError

private:
    const std::shared_ptr<const BackendRegistry> backends_;
    const Endpoint target_;
};


class FolderAvailabilitySensor
{
public:
    FolderAvailabilitySensor(const std::shared_ptr<const BackendRegistry>& backends, const Endpoint& target); //throw FileError

    bool check(StepCallback& cb) const; //throw FileError, ConnectionError

private:
    const std::shared_ptr<const BackendRegistry> backends_;
    const Endpoint target_;
};
}

#endif //SENSOR_H_8830192746510283
