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

#ifndef rpicontrols_h
#define rpicontrols_h

#include "AsyncCall.h"
#include "Button.h"
#include "Controller.h"
#include "Errors.h"
#include "GpioDriver.h"
#include "Log.h"

#include <memory>

/*---------------------------------------------------------------------------*/

namespace rpicontrols {

/**
 * Creates a new controller. One controller handles any number of buttons.
 *
 * The driver abstracts access to the GPIO; a driver other than GpiodDriver
 * (see GpiodDriver.h for the overloads that create one) is mostly useful to
 * test code without the hardware. Throws ConfigurationError if driver is
 * null.
 */
std::unique_ptr<Controller> make_controller(std::unique_ptr<GpioDriver> driver);

} // namespace rpicontrols

/*---------------------------------------------------------------------------*/

#endif
