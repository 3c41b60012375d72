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

#include "AsyncCall.h"

#include "Errors.h"
#include "EventLoop.h"
#include "Log.h"

namespace rpicontrols {

static const char* TAG = "async";

/*-------------------------------------------------------------------------*/

AsyncCall::AsyncCall(EventLoop& loop, std::function<void()> on_done, std::string description)
    : _state(std::make_shared<State>(&loop, std::move(on_done), std::move(description)))
{ }

std::function<void()>
AsyncCall::guard(std::function<void()> continuation) const
{
    if (is_done())
        throw StateError("Cannot continue " + _state->_description + " after it is done.");

    AsyncCall self = *this;
    return [self, continuation]() mutable {
        try {
            continuation();
        } catch (const std::exception& e) {
            RPICONTROLS_LOGE(TAG, "Continuation of %s failed: %s", self.description().c_str(), e.what());
            self.done();
        } catch (...) {
            RPICONTROLS_LOGE(TAG, "Continuation of %s failed: unknown exception", self.description().c_str());
            self.done();
        }
    };
}

void
AsyncCall::post(std::function<void()> continuation)
{
    _state->_loop->post(guard(std::move(continuation)));
}

void
AsyncCall::post_after(uint32_t delay_ms, std::function<void()> continuation)
{
    _state->_loop->post_after(delay_ms, guard(std::move(continuation)));
}

void
AsyncCall::done()
{
    if (_state->_done.exchange(true))
        return;

    RPICONTROLS_LOGD(TAG, "Finished %s.", _state->_description.c_str());
    if (_state->_on_done)
        _state->_on_done();
}

/*-------------------------------------------------------------------------*/

} // namespace rpicontrols
