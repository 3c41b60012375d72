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

#ifndef rpicontrols_async_call_h
#define rpicontrols_async_call_h

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

/*---------------------------------------------------------------------------*/

namespace rpicontrols {

class EventLoop;

/**
 * Handle given to an asynchronous event handler. The handler continues its
 * work in continuations posted through the handle, which run on the same
 * loop as every other handler, and calls done() when it has finished.
 * Copies share the same invocation.
 *
 * The controller does not stop before every AsyncCall it created is done.
 */
class AsyncCall
{
    struct State
    {
        EventLoop* _loop;
        std::function<void()> _on_done;
        std::string _description;
        std::atomic<bool> _done;

        State(EventLoop* loop, std::function<void()> on_done, std::string description)
            : _loop(loop)
            , _on_done(std::move(on_done))
            , _description(std::move(description))
            , _done(false)
        { }
    };

    std::shared_ptr<State> _state;

    std::function<void()> guard(std::function<void()> continuation) const;

public:
    AsyncCall(EventLoop& loop, std::function<void()> on_done, std::string description);

    /**
     * Queues continuation on the loop. A continuation that throws finishes
     * the call.
     */
    void post(std::function<void()> continuation);

    /**
     * Queues continuation on the loop once delay_ms has elapsed.
     */
    void post_after(uint32_t delay_ms, std::function<void()> continuation);

    /**
     * Marks the invocation finished. Only the first call has an effect, and
     * it may come from any thread.
     */
    void done();

    bool is_done() const { return _state->_done.load(); }

    const std::string& description() const { return _state->_description; }
};

} // namespace rpicontrols

/*---------------------------------------------------------------------------*/

#endif
