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

#ifndef rpicontrols_gpiod_driver_h
#define rpicontrols_gpiod_driver_h

#include "Controller.h"
#include "GpioDriver.h"

#include <gpiod.hpp>

#include <map>
#include <memory>
#include <string>

/*---------------------------------------------------------------------------*/

namespace rpicontrols {

/**
 * Driver for the Linux GPIO character device, through libgpiod. Pin ids are
 * line offsets on the chip.
 */
class GpiodDriver : public GpioDriver
{
    gpiod::chip _chip;
    std::string _consumer;
    std::map<int, gpiod::line> _lines;

    gpiod::line& line(int pin_id);

public:
    static const char* const DEFAULT_CHIP;

    /**
     * Opens chip, by name ("gpiochip0"), path or number. Throws GpioError
     * if it cannot be opened.
     */
    explicit GpiodDriver(const std::string& chip = DEFAULT_CHIP, const std::string& consumer = "rpi-controls");

    bool input(int pin_id) override;

    /**
     * Requests the line as an input. libgpiod cannot debounce in hardware,
     * so a non-zero bounce_ms is a ConfigurationError.
     */
    void configure_button(int pin_id, PullType pull, uint32_t bounce_ms) override;

    void unconfigure_button(int pin_id) override;
    void release() override;
};

/**
 * Creates a controller reading the GPIO of chip through libgpiod.
 */
std::unique_ptr<Controller> make_controller(const std::string& chip);

/**
 * Creates a controller reading the GPIO of the Raspberry Pi header, on
 * GpiodDriver::DEFAULT_CHIP.
 */
std::unique_ptr<Controller> make_controller();

} // namespace rpicontrols

/*---------------------------------------------------------------------------*/

#endif
