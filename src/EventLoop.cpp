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

#include "EventLoop.h"

#include "Log.h"

#include <exception>

namespace rpicontrols {

static const char* TAG = "loop";

/*-------------------------------------------------------------------------*/

void
EventLoop::post(Task task)
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _ready.push_back(std::move(task));
    }
    _cv.notify_all();
}

void
EventLoop::post_after(uint32_t delay_ms, Task task)
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        Timer timer;
        timer._due = Clock::now() + std::chrono::milliseconds(delay_ms);
        timer._seq = _next_seq++;
        timer._task = std::move(task);
        _timers.push(std::move(timer));
    }
    _cv.notify_all();
}

void
EventLoop::wake()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _woken = true;
    }
    _cv.notify_all();
}

bool
EventLoop::empty() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _ready.empty() && _timers.empty();
}

void
EventLoop::collect_due_timers(Clock::time_point now)
{
    while (!_timers.empty() && _timers.top()._due <= now) {
        _ready.push_back(_timers.top()._task);
        _timers.pop();
    }
}

size_t
EventLoop::run_for(uint32_t timeout_ms)
{
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    size_t count = 0;

    std::unique_lock<std::mutex> lock(_mutex);
    while (true) {
        collect_due_timers(Clock::now());

        if (!_ready.empty()) {
            Task task = std::move(_ready.front());
            _ready.pop_front();

            lock.unlock();
            try {
                task();
            } catch (const std::exception& e) {
                RPICONTROLS_LOGE(TAG, "Task failed: %s", e.what());
            } catch (...) {
                RPICONTROLS_LOGE(TAG, "Task failed: unknown exception");
            }
            ++count;
            lock.lock();
            continue;
        }

        if (_woken || Clock::now() >= deadline)
            break;

        auto wake_tm = deadline;
        if (!_timers.empty() && _timers.top()._due < wake_tm)
            wake_tm = _timers.top()._due;
        _cv.wait_until(lock, wake_tm);
    }
    _woken = false;

    return count;
}

/*-------------------------------------------------------------------------*/

} // namespace rpicontrols
