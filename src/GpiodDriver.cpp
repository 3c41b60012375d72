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

#include "GpiodDriver.h"

#include "Errors.h"
#include "Log.h"
#include "RpiControls.h"

#include <stdexcept>
#include <system_error>

namespace rpicontrols {

static const char* TAG = "gpiod";

/*-------------------------------------------------------------------------*/

const char* const GpiodDriver::DEFAULT_CHIP = "gpiochip0";

GpiodDriver::GpiodDriver(const std::string& chip, const std::string& consumer)
    : _consumer(consumer)
{
    try {
        _chip.open(chip);
    } catch (const std::system_error& e) {
        throw GpioError("Cannot open GPIO chip " + chip + ": " + e.what());
    }
    RPICONTROLS_LOGD(TAG, "Opened %s (%s) with %u lines.", _chip.name().c_str(), _chip.label().c_str(), _chip.num_lines());
}

gpiod::line&
GpiodDriver::line(int pin_id)
{
    auto it = _lines.find(pin_id);
    if (it == _lines.end())
        throw InvalidPinError("Pin " + std::to_string(pin_id) + " is not configured.");
    return it->second;
}

bool
GpiodDriver::input(int pin_id)
{
    auto& l = line(pin_id);
    int value;
    try {
        value = l.get_value();
    } catch (const std::system_error& e) {
        throw GpioError("Cannot read pin " + std::to_string(pin_id) + ": " + e.what());
    }
    return value != 0;
}

void
GpiodDriver::configure_button(int pin_id, PullType pull, uint32_t bounce_ms)
{
    if (bounce_ms != 0)
        throw ConfigurationError("The gpiod driver cannot debounce in hardware; set the button's debounce time instead.");
    if (pin_id < 0 || static_cast<unsigned int>(pin_id) >= _chip.num_lines())
        throw InvalidPinError("Pin " + std::to_string(pin_id) + " is not a line of " + _chip.name() + ".");
    if (_lines.count(pin_id))
        throw ConfigurationError("Pin " + std::to_string(pin_id) + " is already configured.");

    gpiod::line_request request;
    request.consumer = _consumer;
    request.request_type = gpiod::line_request::DIRECTION_INPUT;
    switch (pull) {
        case PULL_NONE: request.flags = gpiod::line_request::FLAG_BIAS_DISABLE;   break;
        case PULL_UP:   request.flags = gpiod::line_request::FLAG_BIAS_PULL_UP;   break;
        case PULL_DOWN: request.flags = gpiod::line_request::FLAG_BIAS_PULL_DOWN; break;
        default:
            throw ConfigurationError("Unsupported pull type " + std::to_string(pull) + ".");
    }

    try {
        gpiod::line l = _chip.get_line(pin_id);
        l.request(request);
        _lines[pin_id] = l;
    } catch (const std::system_error& e) {
        throw GpioError("Cannot configure pin " + std::to_string(pin_id) + ": " + e.what());
    }

    RPICONTROLS_LOGD(TAG, "Configured pin %d on %s with pull %s.", pin_id, _chip.name().c_str(), describe_pull(pull));
}

void
GpiodDriver::unconfigure_button(int pin_id)
{
    line(pin_id).release();
    _lines.erase(pin_id);
    RPICONTROLS_LOGD(TAG, "Released pin %d.", pin_id);
}

void
GpiodDriver::release()
{
    for (auto& entry : _lines)
        entry.second.release();
    _lines.clear();
    _chip.reset();
    RPICONTROLS_LOGD(TAG, "GPIO chip closed.");
}

/*-------------------------------------------------------------------------*/

std::unique_ptr<Controller>
make_controller(const std::string& chip)
{
    return make_controller(std::make_unique<GpiodDriver>(chip));
}

std::unique_ptr<Controller>
make_controller()
{
    return make_controller(GpiodDriver::DEFAULT_CHIP);
}

} // namespace rpicontrols
