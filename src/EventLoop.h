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

#ifndef rpicontrols_event_loop_h
#define rpicontrols_event_loop_h

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <queue>
#include <vector>

/*---------------------------------------------------------------------------*/

namespace rpicontrols {

/**
 * Queue of tasks executed one at a time by whichever thread runs the loop.
 * Tasks can be posted from any thread.
 */
class EventLoop
{
public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;

private:
    struct Timer
    {
        Clock::time_point _due;
        uint64_t _seq;
        Task _task;

        // Earliest due first, then first posted.
        bool operator<(const Timer& other) const
        {
            if (_due != other._due)
                return _due > other._due;
            return _seq > other._seq;
        }
    };

    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<Task> _ready;
    std::priority_queue<Timer> _timers;
    uint64_t _next_seq = 0;
    bool _woken = false;

    void collect_due_timers(Clock::time_point now);

public:
    /**
     * Queues task to run after the tasks already queued.
     */
    void post(Task task);

    /**
     * Queues task to run once delay_ms has elapsed.
     */
    void post_after(uint32_t delay_ms, Task task);

    /**
     * Runs queued tasks, and tasks that become due, for up to timeout_ms.
     * Returns early when wake() is called. Tasks that throw are logged and
     * do not stop the loop. Returns the number of tasks run.
     */
    size_t run_for(uint32_t timeout_ms);

    /**
     * Runs the tasks that are due now without waiting.
     */
    size_t run_ready() { return run_for(0); }

    /**
     * Makes a run_for() in progress, or the next one, return as soon as no
     * task is due.
     */
    void wake();

    /**
     * Returns true when no task is queued or scheduled.
     */
    bool empty() const;
};

} // namespace rpicontrols

/*---------------------------------------------------------------------------*/

#endif
