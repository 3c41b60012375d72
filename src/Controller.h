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

#ifndef rpicontrols_controller_h
#define rpicontrols_controller_h

#include "Button.h"
#include "EventLoop.h"
#include "GpioDriver.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/*---------------------------------------------------------------------------*/

namespace rpicontrols {

/**
 * Monitors the GPIO pins of its buttons and calls their event handlers.
 *
 * Polling and every handler run on a single thread: the one calling run(),
 * or the worker thread started by start_in_thread().
 */
class Controller
{
public:
    /**
     * Steps of the controller lifecycle. A stopped controller cannot be
     * started again.
     */
    enum Status {
        // Waiting for run() or start_in_thread().
        READY,
        // Monitoring the GPIO and raising events.
        RUNNING,
        // No longer monitoring the GPIO, handlers still finishing.
        STOPPING,
        // Every handler has returned and the driver is released.
        STOPPED,
    };

    static const uint32_t DEFAULT_POLL_INTERVAL_MS = 10;

private:
    using Clock = std::chrono::steady_clock;

    std::unique_ptr<GpioDriver> _driver;
    EventLoop _loop;
    const Clock::time_point _start_tm;

    mutable std::mutex _buttons_mutex;
    std::vector<std::shared_ptr<Button>> _buttons;

    mutable std::mutex _status_mutex;
    std::condition_variable _status_cv;
    Status _status = READY;
    bool _driver_released = false;
    std::thread::id _loop_thread_id;

    std::thread _thread;
    std::atomic<uint32_t> _poll_interval_ms;
    std::atomic<int> _running_handlers;
    std::atomic<bool> _stop_on_signals;

    uint32_t now_ms() const;
    void poll(uint32_t tm);
    void dispatch(const std::shared_ptr<Button>& button, GestureDetector::Gesture gesture);
    void call_handler(const std::shared_ptr<Button>& button, const Button::Handler& handler);
    void release_driver();
    void set_status(Status status);
    bool drained() const;

    friend class StopGuard;

public:
    /**
     * Creates a controller reading the GPIO through driver, which it owns.
     */
    explicit Controller(std::unique_ptr<GpioDriver> driver);

    /**
     * Stops the controller if it is running, waits for it to reach
     * STOPPED and joins the thread started by start_in_thread().
     */
    ~Controller();

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    Status status() const;

    static const char* describe_status(Status status);

    GpioDriver& driver() { return *_driver; }

    /**
     * Returns the buttons created with make_button(), in creation order.
     */
    std::vector<Button*> buttons() const;

    /**
     * Creates a button for input_pin_id and configures the pin on the
     * driver. The button starts from the current level of the pin, without
     * raising events.
     *
     * Throws InvalidPinError for a negative pin id and ConfigurationError
     * when another button already uses the pin.
     */
    Button& make_button(int input_pin_id, Button::InputType input_type, PullType pull,
                        const std::string& name = "", uint32_t bounce_ms = 0);

    /**
     * Stops monitoring button and returns its pin to the driver. Handlers
     * already queued for it still run.
     */
    void delete_button(Button& button);

    uint32_t poll_interval_ms() const { return _poll_interval_ms.load(); }
    void set_poll_interval_ms(uint32_t ms) { _poll_interval_ms = ms; }

    /**
     * Monitors the GPIO until the controller is stopped. Throws StateError
     * unless the controller is READY, and rethrows the driver's error if
     * reading a pin fails.
     */
    void run();

    /**
     * Runs the controller on its own thread and returns once it has started.
     */
    void start_in_thread();

    /**
     * Stops monitoring the GPIO. The controller reaches STOPPED once every
     * queued and running handler is done. Stopping a stopped controller does
     * nothing, and so does stopping one that is already stopping. Stopping
     * one that never started throws StateError.
     *
     * With wait, blocks until STOPPED, unless called from a handler.
     */
    void stop(bool wait = false);

    /**
     * Stops this controller when one of signals is received.
     */
    void stop_on_signals(const std::vector<int>& signals = {SIGINT, SIGTERM});
};

} // namespace rpicontrols

/*---------------------------------------------------------------------------*/

#endif
