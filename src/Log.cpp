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

#include "Log.h"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <vector>

namespace rpicontrols {

namespace {

// -1 until the level has been read from the environment or set explicitly.
std::atomic<int> s_level(-1);

std::mutex s_sink_mutex;
LogSink s_sink;

const std::chrono::steady_clock::time_point s_start = std::chrono::steady_clock::now();

char
level_letter(LogLevel level)
{
    switch (level) {
        case LOG_ERROR: return 'E';
        case LOG_WARN:  return 'W';
        case LOG_INFO:  return 'I';
        case LOG_DEBUG: return 'D';
        default:        return '?';
    }
}

} // anonymous namespace

/*-------------------------------------------------------------------------*/

LogLevel
log_parse_level(const char* text, LogLevel fallback)
{
    if (!text)
        return fallback;
    if (!strcmp(text, "none"))  return LOG_NONE;
    if (!strcmp(text, "error")) return LOG_ERROR;
    if (!strcmp(text, "warn"))  return LOG_WARN;
    if (!strcmp(text, "info"))  return LOG_INFO;
    if (!strcmp(text, "debug")) return LOG_DEBUG;
    return fallback;
}

void
log_set_level(LogLevel level)
{
    s_level = level;
}

LogLevel
log_level()
{
    int level = s_level.load();
    if (level < 0) {
        level = log_parse_level(getenv("RPICONTROLS_LOG_LEVEL"), LOG_INFO);
        int expected = -1;
        // A concurrent log_set_level() wins over the environment.
        if (!s_level.compare_exchange_strong(expected, level))
            level = expected;
    }
    return static_cast<LogLevel>(level);
}

void
log_set_sink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_sink = std::move(sink);
}

void
log_write(LogLevel level, const char* tag, const char* format, ...)
{
    va_list args;
    va_start(args, format);
    va_list args_copy;
    va_copy(args_copy, args);
    int len = vsnprintf(nullptr, 0, format, args);
    va_end(args);

    std::string message;
    if (len > 0) {
        std::vector<char> buf(len + 1);
        vsnprintf(buf.data(), buf.size(), format, args_copy);
        message.assign(buf.data(), len);
    }
    va_end(args_copy);

    std::lock_guard<std::mutex> lock(s_sink_mutex);
    if (s_sink) {
        s_sink(level, tag, message);
        return;
    }

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - s_start).count();
    fprintf(stderr, "%c (%lld) %s: %s\n", level_letter(level), static_cast<long long>(ms), tag, message.c_str());
}

} // namespace rpicontrols
