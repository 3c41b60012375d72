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

#ifndef rpicontrols_gpio_driver_h
#define rpicontrols_gpio_driver_h

#include <cstdint>

/*---------------------------------------------------------------------------*/

namespace rpicontrols {

/**
 * Built-in resistor biasing a pin when nothing drives it.
 */
enum PullType {
    PULL_NONE,
    PULL_UP,
    PULL_DOWN,
};

const char* describe_pull(PullType pull);

/**
 * Access to the digital input pins buttons are wired to.
 *
 * Implementations throw InvalidPinError for pins they cannot use, GpioError
 * when the hardware cannot be accessed and ConfigurationError for options
 * they do not support.
 */
class GpioDriver
{
public:
    virtual ~GpioDriver() { }

    /**
     * Returns the current level of a configured pin, true for high.
     */
    virtual bool input(int pin_id) = 0;

    /**
     * Configures pin_id as an input with the given pull. A non-zero
     * bounce_ms asks the hardware to ignore edges closer than that.
     */
    virtual void configure_button(int pin_id, PullType pull, uint32_t bounce_ms) = 0;

    virtual void unconfigure_button(int pin_id) = 0;

    /**
     * Releases every resource held by the driver. Called once, when the
     * controller that owns the driver stops.
     */
    virtual void release() = 0;
};

} // namespace rpicontrols

/*---------------------------------------------------------------------------*/

#endif
