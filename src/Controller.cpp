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

#include "Controller.h"

#include "Errors.h"
#include "Log.h"

#include <algorithm>

namespace rpicontrols {

static const char* TAG = "controller";

namespace {

// Number of the last signal received by on_stop_signal(), or 0.
volatile std::sig_atomic_t s_stop_signal = 0;

void
on_stop_signal(int signo)
{
    s_stop_signal = signo;
}

} // anonymous namespace

/**
 * Releases the driver and marks the controller stopped when run() exits,
 * however it exits.
 */
class StopGuard
{
    Controller& _controller;

public:
    explicit StopGuard(Controller& controller) : _controller(controller) { }

    ~StopGuard()
    {
        _controller.release_driver();
        _controller.set_status(Controller::STOPPED);
        RPICONTROLS_LOGI(TAG, "Controller is now stopped.");
    }
};

/*-------------------------------------------------------------------------*/

const uint32_t Controller::DEFAULT_POLL_INTERVAL_MS;

Controller::Controller(std::unique_ptr<GpioDriver> driver)
    : _driver(std::move(driver))
    , _start_tm(Clock::now())
    , _poll_interval_ms(DEFAULT_POLL_INTERVAL_MS)
    , _running_handlers(0)
    , _stop_on_signals(false)
{
    if (!_driver)
        throw ConfigurationError("A controller needs a GPIO driver.");
}

Controller::~Controller()
{
    Status current = status();
    if (current == RUNNING || current == STOPPING) {
        try {
            stop(true);
        } catch (const std::exception& e) {
            RPICONTROLS_LOGE(TAG, "Stopping the controller on destruction failed: %s", e.what());
        }
    }

    if (_thread.joinable())
        _thread.join();

    // A controller that never ran still owns a configured driver.
    if (current == READY)
        release_driver();
}

Controller::Status
Controller::status() const
{
    std::lock_guard<std::mutex> lock(_status_mutex);
    return _status;
}

void
Controller::set_status(Status status)
{
    {
        std::lock_guard<std::mutex> lock(_status_mutex);
        _status = status;
    }
    _status_cv.notify_all();
}

const char*
Controller::describe_status(Status status)
{
    switch (status) {
        case READY:    return "ready";
        case RUNNING:  return "running";
        case STOPPING: return "stopping";
        case STOPPED:  return "stopped";
        default:       return "unknown";
    }
}

uint32_t
Controller::now_ms() const
{
    return static_cast<uint32_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - _start_tm).count());
}

std::vector<Button*>
Controller::buttons() const
{
    std::lock_guard<std::mutex> lock(_buttons_mutex);
    std::vector<Button*> result;
    for (const auto& b : _buttons)
        result.push_back(b.get());
    return result;
}

Button&
Controller::make_button(int input_pin_id, Button::InputType input_type, PullType pull,
                        const std::string& name, uint32_t bounce_ms)
{
    if (input_pin_id < 0)
        throw InvalidPinError("Invalid pin id " + std::to_string(input_pin_id) + ".");

    std::lock_guard<std::mutex> lock(_buttons_mutex);

    Status current = status();
    if (current == STOPPING || current == STOPPED)
        throw StateError(std::string("Cannot add a button to a controller that is ") + describe_status(current) + ".");

    for (const auto& b : _buttons) {
        if (b->pin_id() == input_pin_id)
            throw ConfigurationError("Pin " + std::to_string(input_pin_id) + " is already used by " + b->name() + ".");
    }

    auto button = std::make_shared<Button>(input_pin_id, input_type, pull, name);

    _driver->configure_button(input_pin_id, pull, bounce_ms);
    try {
        // Start from the current level so that a button held at startup
        // raises nothing.
        button->reset(_driver->input(input_pin_id), now_ms());
    } catch (...) {
        _driver->unconfigure_button(input_pin_id);
        throw;
    }

    RPICONTROLS_LOGD(TAG, "New button configured for pin %d (%s, pull %s).", input_pin_id,
                     Button::describe_input_type(input_type), describe_pull(pull));

    _buttons.push_back(button);
    return *button;
}

void
Controller::delete_button(Button& button)
{
    std::lock_guard<std::mutex> lock(_buttons_mutex);

    auto it = std::find_if(_buttons.begin(), _buttons.end(),
                           [&button](const std::shared_ptr<Button>& b) { return b.get() == &button; });
    if (it == _buttons.end())
        throw ConfigurationError("Button " + button.name() + " is not registered in this controller.");

    bool released;
    {
        std::lock_guard<std::mutex> status_lock(_status_mutex);
        released = _driver_released;
    }
    if (!released)
        _driver->unconfigure_button(button.pin_id());

    RPICONTROLS_LOGD(TAG, "Button %s deleted.", button.name().c_str());
    _buttons.erase(it);
}

void
Controller::poll(uint32_t tm)
{
    // Holding the lock keeps delete_button() from unconfiguring a pin
    // between its read and its update.
    std::lock_guard<std::mutex> lock(_buttons_mutex);
    for (const auto& button : _buttons) {
        bool level = _driver->input(button->pin_id());
        for (auto gesture : button->update(level, tm))
            dispatch(button, gesture);
    }
}

void
Controller::dispatch(const std::shared_ptr<Button>& button, GestureDetector::Gesture gesture)
{
    for (const auto& handler : button->handlers(gesture)) {
        std::shared_ptr<Button> target = button;
        _loop.post([this, target, handler]() { call_handler(target, handler); });
    }
}

void
Controller::call_handler(const std::shared_ptr<Button>& button, const Button::Handler& handler)
{
    const char* event_name = GestureDetector::describe_gesture(handler._event);

    if (handler._sync) {
        RPICONTROLS_LOGD(TAG, "Calling event handler synchronously for \"%s\" on %s.", event_name, button->name().c_str());
        try {
            handler._sync(*button);
        } catch (const std::exception& e) {
            RPICONTROLS_LOGE(TAG, "Handler for \"%s\" on %s failed: %s", event_name, button->name().c_str(), e.what());
        } catch (...) {
            RPICONTROLS_LOGE(TAG, "Handler for \"%s\" on %s failed: unknown exception", event_name, button->name().c_str());
        }
        return;
    }

    RPICONTROLS_LOGD(TAG, "Calling event handler asynchronously for \"%s\" on %s.", event_name, button->name().c_str());
    ++_running_handlers;
    AsyncCall call(_loop,
                   [this]() {
                       // The loop may finish as soon as the count drops, so
                       // nothing of this controller is touched after it.
                       _loop.wake();
                       --_running_handlers;
                   },
                   std::string("\"") + event_name + "\" handler of " + button->name());
    try {
        handler._async(*button, call);
    } catch (const std::exception& e) {
        RPICONTROLS_LOGE(TAG, "Handler for \"%s\" on %s failed: %s", event_name, button->name().c_str(), e.what());
        call.done();
    } catch (...) {
        RPICONTROLS_LOGE(TAG, "Handler for \"%s\" on %s failed: unknown exception", event_name, button->name().c_str());
        call.done();
    }
}

bool
Controller::drained() const
{
    return _running_handlers.load() == 0 && _loop.empty();
}

void
Controller::release_driver()
{
    std::lock_guard<std::mutex> lock(_buttons_mutex);
    {
        std::lock_guard<std::mutex> status_lock(_status_mutex);
        if (_driver_released)
            return;
        _driver_released = true;
    }

    try {
        _driver->release();
        RPICONTROLS_LOGD(TAG, "GPIO driver released.");
    } catch (const std::exception& e) {
        RPICONTROLS_LOGE(TAG, "Releasing the GPIO driver failed: %s", e.what());
    }
}

void
Controller::run()
{
    RPICONTROLS_LOGI(TAG, "Starting the controller...");
    {
        std::lock_guard<std::mutex> lock(_status_mutex);
        if (_status != READY) {
            std::string message = std::string("Controller is currently \"") + describe_status(_status)
                                + "\" and cannot be started.";
            RPICONTROLS_LOGE(TAG, "%s", message.c_str());
            throw StateError(message);
        }
        _status = RUNNING;
        _loop_thread_id = std::this_thread::get_id();
    }
    _status_cv.notify_all();

    std::exception_ptr failure;
    {
        StopGuard guard(*this);

        while (true) {
            Status current = status();

            if (current == RUNNING && _stop_on_signals && s_stop_signal != 0) {
                RPICONTROLS_LOGI(TAG, "Signal %d caught.", static_cast<int>(s_stop_signal));
                stop(false);
                current = STOPPING;
            }

            if (current == RUNNING) {
                try {
                    poll(now_ms());
                } catch (const std::exception& e) {
                    RPICONTROLS_LOGE(TAG, "Reading the GPIO failed: %s", e.what());
                    failure = std::current_exception();
                    stop(false);
                }
            } else if (drained()) {
                RPICONTROLS_LOGD(TAG, "All event handlers are now complete.");
                break;
            }

            _loop.run_for(_poll_interval_ms);
        }
    }

    if (failure)
        std::rethrow_exception(failure);
}

void
Controller::start_in_thread()
{
    {
        std::lock_guard<std::mutex> lock(_status_mutex);
        if (_status != READY || _thread.joinable())
            throw StateError(std::string("Controller is currently \"") + describe_status(_status)
                             + "\" and cannot be started.");
    }

    _thread = std::thread([this]() {
        try {
            run();
        } catch (const std::exception& e) {
            RPICONTROLS_LOGE(TAG, "Controller thread ended with an error: %s", e.what());
        } catch (...) {
            RPICONTROLS_LOGE(TAG, "Controller thread ended with an unknown error.");
        }
    });

    std::unique_lock<std::mutex> lock(_status_mutex);
    _status_cv.wait(lock, [this]() { return _status != READY; });
}

void
Controller::stop(bool wait)
{
    RPICONTROLS_LOGI(TAG, "Stopping controller...");
    {
        std::lock_guard<std::mutex> lock(_status_mutex);
        if (_status == STOPPED) {
            RPICONTROLS_LOGI(TAG, "Controller is already stopped.");
            return;
        }
        if (_status == READY) {
            std::string message = std::string("Controller status is \"") + describe_status(_status)
                                + "\" and cannot be stopped.";
            RPICONTROLS_LOGE(TAG, "%s", message.c_str());
            throw StateError(message);
        }
        _status = STOPPING;
    }
    _status_cv.notify_all();
    _loop.wake();

    if (!wait)
        return;

    std::unique_lock<std::mutex> lock(_status_mutex);
    if (std::this_thread::get_id() == _loop_thread_id) {
        // The loop cannot finish while one of its handlers waits for it.
        RPICONTROLS_LOGD(TAG, "Not waiting for the stop from the controller thread.");
        return;
    }
    _status_cv.wait(lock, [this]() { return _status == STOPPED; });
}

void
Controller::stop_on_signals(const std::vector<int>& signals)
{
    s_stop_signal = 0;
    for (int sig : signals) {
        if (std::signal(sig, on_stop_signal) == SIG_ERR)
            throw ConfigurationError("Cannot handle signal " + std::to_string(sig) + ".");
        RPICONTROLS_LOGD(TAG, "Controller will stop on signal %d.", sig);
    }
    _stop_on_signals = true;
}

/*-------------------------------------------------------------------------*/

} // namespace rpicontrols
