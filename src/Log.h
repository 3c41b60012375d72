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

#ifndef rpicontrols_log_h
#define rpicontrols_log_h

#include <functional>
#include <string>

/*---------------------------------------------------------------------------*/

namespace rpicontrols {

enum LogLevel {
    LOG_NONE,
    LOG_ERROR,
    LOG_WARN,
    LOG_INFO,
    LOG_DEBUG,
};

using LogSink = std::function<void(LogLevel level, const char* tag, const std::string& message)>;

/**
 * Sets the most verbose level that is written. Until this is called the
 * level comes from the RPICONTROLS_LOG_LEVEL environment variable, or
 * LOG_INFO when it is unset.
 */
void log_set_level(LogLevel level);

LogLevel log_level();

/**
 * Routes messages to sink instead of stderr. An empty sink restores stderr.
 */
void log_set_sink(LogSink sink);

/**
 * Parses none, error, warn, info or debug. Returns fallback for anything else.
 */
LogLevel log_parse_level(const char* text, LogLevel fallback);

void log_write(LogLevel level, const char* tag, const char* format, ...)
    __attribute__((format(printf, 3, 4)));

} // namespace rpicontrols

#define RPICONTROLS_LOG_AT(LEVEL, TAG, ...)                          \
    do {                                                             \
        if (::rpicontrols::log_level() >= (LEVEL))                   \
            ::rpicontrols::log_write((LEVEL), (TAG), __VA_ARGS__);   \
    } while (0)

#define RPICONTROLS_LOGE(TAG, ...) RPICONTROLS_LOG_AT(::rpicontrols::LOG_ERROR, TAG, __VA_ARGS__)
#define RPICONTROLS_LOGW(TAG, ...) RPICONTROLS_LOG_AT(::rpicontrols::LOG_WARN, TAG, __VA_ARGS__)
#define RPICONTROLS_LOGI(TAG, ...) RPICONTROLS_LOG_AT(::rpicontrols::LOG_INFO, TAG, __VA_ARGS__)
#define RPICONTROLS_LOGD(TAG, ...) RPICONTROLS_LOG_AT(::rpicontrols::LOG_DEBUG, TAG, __VA_ARGS__)

/*---------------------------------------------------------------------------*/

#endif
