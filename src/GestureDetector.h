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

#ifndef rpicontrols_gesture_detector_h
#define rpicontrols_gesture_detector_h

#include <cstdint>
#include <vector>

/*---------------------------------------------------------------------------*/

namespace rpicontrols {

/**
 * Turns the readings of a two-state (digital) button into debounced
 * gestures. Readings are fed with the time they were taken, so the detector
 * has no clock of its own.
 */
class GestureDetector
{
public:
    enum Gesture {
        PRESS,
        RELEASE,
        LONG_PRESS,
        CLICK,
        DOUBLE_CLICK,
    };

    using Gestures = std::vector<Gesture>;

    // The button's state must be different for at least this long to cause
    // the debounced state to change.
    static const uint32_t DEFAULT_DEBOUNCE_MS = 20;

    // A press held this long is a long press rather than a click.
    static const uint32_t DEFAULT_LONG_PRESS_MS = 500;

    // Two clicks make a double click when the second release comes less than
    // this long after the first press.
    static const uint32_t DEFAULT_DOUBLE_CLICK_MS = 500;

private:
    /**
     * The state values that end in _PENDING indicate ones for which the
     * click or double click decision has not been delivered yet.
     */
    enum State {
        IDLE,
        HELD,
        PRESSED_PENDING,
        LONG_PRESSED,
        CLICKED_PENDING,
        CLICKED_PRESSED_PENDING,
    };

    bool _pressed_state;
    uint32_t _debounce_ms = DEFAULT_DEBOUNCE_MS;
    uint32_t _long_press_ms = DEFAULT_LONG_PRESS_MS;
    uint32_t _double_click_ms = DEFAULT_DOUBLE_CLICK_MS;

    State _state = IDLE;
    bool _prev_reading = false;
    bool _debounced_reading = false;
    uint32_t _last_reading_change_tm = 0;
    uint32_t _last_change_tm = 0;
    uint32_t _first_press_tm = 0;
    uint32_t _second_press_tm = 0;

    void check_timeouts(uint32_t tm, Gestures& gestures);
    void on_press(uint32_t tm, Gestures& gestures);
    void on_release(uint32_t tm, Gestures& gestures);

public:
    /**
     * Creates a new instance with the specified polarity: pressed_state is
     * the reading that means the button is pushed.
     */
    explicit GestureDetector(bool pressed_state = true);

    /**
     * Adds a reading to the button, and returns the gestures it completes,
     * oldest first.
     */
    Gestures update(bool reading, uint32_t tm);

    /**
     * Forgets any gesture in progress and takes reading as the debounced
     * state at tm without reporting anything. A button found pressed is
     * held: its release is reported, but not as a click.
     */
    void reset(bool reading, uint32_t tm);

    static const char* describe_gesture(Gesture gesture);

    /**
     * Returns the debounced state of the button, true for pressed and
     * false otherwise.
     */
    bool state() const { return _debounced_reading; }

    bool long_pressed() const { return _state == LONG_PRESSED; }

    /**
     * Returns the number of milliseconds between tm and the last change in
     * the debounced state.
     */
    uint32_t duration(uint32_t tm) const { return tm - _last_change_tm; }

    uint32_t debounce_ms() const { return _debounce_ms; }
    void set_debounce_ms(uint32_t ms) { _debounce_ms = ms; }

    uint32_t long_press_ms() const { return _long_press_ms; }
    void set_long_press_ms(uint32_t ms) { _long_press_ms = ms; }

    uint32_t double_click_ms() const { return _double_click_ms; }
    void set_double_click_ms(uint32_t ms) { _double_click_ms = ms; }
};

} // namespace rpicontrols

/*---------------------------------------------------------------------------*/

#endif
