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

#include "Button.h"

#include "Errors.h"
#include "Log.h"

#include <algorithm>

namespace rpicontrols {

static const char* TAG = "button";

/*-------------------------------------------------------------------------*/

Button::Button(int pin_id, InputType input_type, PullType pull, const std::string& name)
    : _pin_id(pin_id)
    , _input_type(input_type)
    , _pull(pull)
    , _name(name.empty() ? "button for pin " + std::to_string(pin_id) : name)
    , _detector(input_type == PRESSED_WHEN_ON)
    , _pressed(false)
    , _long_pressed(false)
{ }

Button::HandlerId
Button::add(Event event, SyncHandler sync, AsyncHandler async)
{
    if (!sync && !async)
        throw ConfigurationError("Empty handler for " + _name + ".");

    std::lock_guard<std::mutex> lock(_mutex);
    Handler handler;
    handler._id = _next_handler_id++;
    handler._event = event;
    handler._sync = std::move(sync);
    handler._async = std::move(async);
    _handlers.push_back(std::move(handler));
    return _handlers.back()._id;
}

Button::HandlerId
Button::add_handler(Event event, SyncHandler handler)
{
    return add(event, std::move(handler), AsyncHandler());
}

Button::HandlerId
Button::add_async_handler(Event event, AsyncHandler handler)
{
    return add(event, SyncHandler(), std::move(handler));
}

bool
Button::remove_handler(HandlerId id)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = std::find_if(_handlers.begin(), _handlers.end(),
                           [id](const Handler& h) { return h._id == id; });
    if (it == _handlers.end())
        return false;
    _handlers.erase(it);
    return true;
}

std::vector<Button::Handler>
Button::handlers(Event event) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<Handler> result;
    for (const auto& h : _handlers) {
        if (h._event == event)
            result.push_back(h);
    }
    return result;
}

uint32_t
Button::debounce_ms() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _detector.debounce_ms();
}

void
Button::set_debounce_ms(uint32_t ms)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _detector.set_debounce_ms(ms);
}

uint32_t
Button::long_press_ms() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _detector.long_press_ms();
}

void
Button::set_long_press_ms(uint32_t ms)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _detector.set_long_press_ms(ms);
}

uint32_t
Button::double_click_ms() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _detector.double_click_ms();
}

void
Button::set_double_click_ms(uint32_t ms)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _detector.set_double_click_ms(ms);
}

GestureDetector::Gestures
Button::update(bool level, uint32_t tm)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto gestures = _detector.update(level, tm);

    _pressed = _detector.state();
    _long_pressed = _detector.long_pressed();

    for (auto g : gestures)
        RPICONTROLS_LOGD(TAG, "Button %s [%d]: %s.", _name.c_str(), _pin_id, GestureDetector::describe_gesture(g));

    return gestures;
}

void
Button::reset(bool level, uint32_t tm)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _detector.reset(level, tm);
    _pressed = _detector.state();
    _long_pressed = false;
}

const char*
Button::describe_input_type(InputType input_type)
{
    switch (input_type) {
        case PRESSED_WHEN_ON:  return "pressed when on";
        case PRESSED_WHEN_OFF: return "pressed when off";
        default:               return "unknown";
    }
}

/*-------------------------------------------------------------------------*/

} // namespace rpicontrols
