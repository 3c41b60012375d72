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

#include "GpioDriver.h"

namespace rpicontrols {

const char*
describe_pull(PullType pull)
{
    switch (pull) {
        case PULL_NONE: return "none";
        case PULL_UP:   return "up";
        case PULL_DOWN: return "down";
        default:        return "unknown";
    }
}

} // namespace rpicontrols
