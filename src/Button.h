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

#ifndef rpicontrols_button_h
#define rpicontrols_button_h

#include "AsyncCall.h"
#include "GestureDetector.h"
#include "GpioDriver.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

/*---------------------------------------------------------------------------*/

namespace rpicontrols {

/**
 * A button wired to one GPIO input pin, and the handlers to call when it
 * produces events.
 *
 * Buttons are created by Controller::make_button() and live as long as
 * their controller. Handlers may be added and removed from any thread.
 */
class Button
{
public:
    /**
     * How the button's wiring maps the pin level to pressed.
     */
    enum InputType {
        PRESSED_WHEN_ON,
        PRESSED_WHEN_OFF,
    };

    using Event = GestureDetector::Gesture;
    using SyncHandler = std::function<void(Button&)>;
    using AsyncHandler = std::function<void(Button&, AsyncCall)>;
    using HandlerId = uint32_t;

    // Exactly one of _sync and _async is set.
    struct Handler
    {
        HandlerId _id;
        Event _event;
        SyncHandler _sync;
        AsyncHandler _async;
    };

private:
    const int _pin_id;
    const InputType _input_type;
    const PullType _pull;
    const std::string _name;

    mutable std::mutex _mutex;
    GestureDetector _detector;
    std::vector<Handler> _handlers;
    HandlerId _next_handler_id = 1;

    std::atomic<bool> _pressed;
    std::atomic<bool> _long_pressed;

    HandlerId add(Event event, SyncHandler sync, AsyncHandler async);

public:
    Button(int pin_id, InputType input_type, PullType pull, const std::string& name = "");

    Button(const Button&) = delete;
    Button& operator=(const Button&) = delete;

    int pin_id() const { return _pin_id; }
    InputType input_type() const { return _input_type; }
    PullType pull() const { return _pull; }

    /**
     * Informational name, "button for pin <id>" unless one was given.
     */
    const std::string& name() const { return _name; }

    bool pressed() const { return _pressed.load(); }

    /**
     * Returns true while the button is pressed and has been for at least
     * long_press_ms().
     */
    bool long_pressed() const { return _long_pressed.load(); }

    HandlerId add_on_press(SyncHandler handler) { return add_handler(GestureDetector::PRESS, std::move(handler)); }
    HandlerId add_on_release(SyncHandler handler) { return add_handler(GestureDetector::RELEASE, std::move(handler)); }
    HandlerId add_on_long_press(SyncHandler handler) { return add_handler(GestureDetector::LONG_PRESS, std::move(handler)); }

    /**
     * The click handler is called once the button was pressed and released
     * and no second click can make it a double click anymore.
     */
    HandlerId add_on_click(SyncHandler handler) { return add_handler(GestureDetector::CLICK, std::move(handler)); }

    HandlerId add_on_double_click(SyncHandler handler) { return add_handler(GestureDetector::DOUBLE_CLICK, std::move(handler)); }

    HandlerId add_handler(Event event, SyncHandler handler);
    HandlerId add_async_handler(Event event, AsyncHandler handler);

    /**
     * Removes a handler added to this button. Returns false if id is unknown.
     */
    bool remove_handler(HandlerId id);

    /**
     * Returns the handlers of event in the order they were added.
     */
    std::vector<Handler> handlers(Event event) const;

    uint32_t debounce_ms() const;
    void set_debounce_ms(uint32_t ms);
    uint32_t long_press_ms() const;
    void set_long_press_ms(uint32_t ms);
    uint32_t double_click_ms() const;
    void set_double_click_ms(uint32_t ms);

    /**
     * Feeds the pin level read at tm and returns the events it completes.
     */
    GestureDetector::Gestures update(bool level, uint32_t tm);

    /**
     * Takes level as the settled state of the pin without raising events.
     */
    void reset(bool level, uint32_t tm);

    static const char* describe_input_type(InputType input_type);
};

} // namespace rpicontrols

/*---------------------------------------------------------------------------*/

#endif
