/*
    Copyright 2023 The rpi-controls Authors

    This file is part of rpi-controls.

    rpi-controls is free software: you can redistribute it and/or modify it
    under the terms of the GNU General Public License as published by the Free
    Software Foundation, either version 3 of the License, or (at your option)
    any later version.

    rpi-controls is distributed in the hope that it will be useful, but
    WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY
    or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU General Public License for
    more details.

    You should have received a copy of the GNU General Public License along with
    rpi-controls.  If not, see <https://www.gnu.org/licenses/>.
*/

#ifndef rpicontrols_errors_h
#define rpicontrols_errors_h

#include <stdexcept>
#include <string>

/*---------------------------------------------------------------------------*/

namespace rpicontrols {

/**
 * Base of every exception thrown by this library.
 */
class Error : public std::runtime_error
{
public:
    explicit Error(const std::string& what) : std::runtime_error(what) { }
};

// The pin id does not name a pin the driver can use.
class InvalidPinError : public Error
{
public:
    explicit InvalidPinError(const std::string& what) : Error(what) { }
};

// Reading or configuring the hardware failed.
class GpioError : public Error
{
public:
    explicit GpioError(const std::string& what) : Error(what) { }
};

class ConfigurationError : public Error
{
public:
    explicit ConfigurationError(const std::string& what) : Error(what) { }
};

// The controller is not in a status that allows the requested operation.
class StateError : public Error
{
public:
    explicit StateError(const std::string& what) : Error(what) { }
};

} // namespace rpicontrols

/*---------------------------------------------------------------------------*/

#endif
