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

#include "GestureDetector.h"

namespace rpicontrols {

/*-------------------------------------------------------------------------*/

const uint32_t GestureDetector::DEFAULT_DEBOUNCE_MS;
const uint32_t GestureDetector::DEFAULT_LONG_PRESS_MS;
const uint32_t GestureDetector::DEFAULT_DOUBLE_CLICK_MS;

GestureDetector::GestureDetector(bool pressed_state)
    : _pressed_state(pressed_state)
{ }

GestureDetector::Gestures
GestureDetector::update(bool reading, uint32_t tm)
{
    if (!_pressed_state)
        reading = !reading;

    if (_prev_reading != reading) {
        // If the reading has changed, begin a new debounce period.
        _last_reading_change_tm = tm;
        _prev_reading = reading;
    }

    Gestures gestures;

    // Deadlines that passed before this reading come first.
    check_timeouts(tm, gestures);

    if (_debounced_reading != reading && tm - _last_reading_change_tm >= _debounce_ms) {
        // The new reading has passed the debounce period.
        _debounced_reading = reading;
        _last_change_tm = tm;

        if (reading)
            on_press(tm, gestures);
        else
            on_release(tm, gestures);
    }

    return gestures;
}

void
GestureDetector::check_timeouts(uint32_t tm, Gestures& gestures)
{
    if (_state == CLICKED_PENDING) {
        if (tm - _first_press_tm >= _double_click_ms) {
            gestures.push_back(CLICK);
            _state = IDLE;
        }
    } else if (_state == CLICKED_PRESSED_PENDING) {
        uint32_t window_left = _double_click_ms - (_second_press_tm - _first_press_tm);
        if (_long_press_ms < window_left && tm - _second_press_tm >= _long_press_ms) {
            // Held long enough before the window closed: the first click
            // stands alone and the held press is a long press.
            gestures.push_back(CLICK);
            gestures.push_back(LONG_PRESS);
            _first_press_tm = _second_press_tm;
            _state = LONG_PRESSED;
        } else if (tm - _first_press_tm >= _double_click_ms) {
            // Too late for a double click; the held press starts over.
            gestures.push_back(CLICK);
            _first_press_tm = _second_press_tm;
            _state = PRESSED_PENDING;
        }
    }

    if (_state == PRESSED_PENDING) {
        if (tm - _first_press_tm >= _long_press_ms) {
            gestures.push_back(LONG_PRESS);
            _state = LONG_PRESSED;
        }
    }
}

void
GestureDetector::on_press(uint32_t tm, Gestures& gestures)
{
    gestures.push_back(PRESS);

    if (_state == CLICKED_PENDING) {
        _second_press_tm = tm;
        _state = CLICKED_PRESSED_PENDING;
    } else {
        _first_press_tm = tm;
        _state = PRESSED_PENDING;
    }
}

void
GestureDetector::on_release(uint32_t tm, Gestures& gestures)
{
    gestures.push_back(RELEASE);

    if (_state == PRESSED_PENDING) {
        if (tm - _first_press_tm >= _double_click_ms) {
            gestures.push_back(CLICK);
            _state = IDLE;
        } else {
            _state = CLICKED_PENDING;
        }
    } else if (_state == CLICKED_PRESSED_PENDING) {
        gestures.push_back(DOUBLE_CLICK);
        _state = IDLE;
    } else {
        // Long presses and held buttons are not clicks.
        _state = IDLE;
    }
}

void
GestureDetector::reset(bool reading, uint32_t tm)
{
    if (!_pressed_state)
        reading = !reading;

    _prev_reading = _debounced_reading = reading;
    _last_reading_change_tm = _last_change_tm = tm;
    _state = reading ? HELD : IDLE;
}

const char*
GestureDetector::describe_gesture(Gesture gesture)
{
    switch (gesture) {
        case PRESS:        return "press";
        case RELEASE:      return "release";
        case LONG_PRESS:   return "long press";
        case CLICK:        return "click";
        case DOUBLE_CLICK: return "double click";
        default:           return "unknown";
    }
    // Unreachable
}

/*-------------------------------------------------------------------------*/

} // namespace rpicontrols
