/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace bastion
{
    // Duration strings of the form "1h2m3.5s", "500ms", "1.5us" and "0s".
    // This is the text used by the retryafter trailer and by configuration files.
    //
    // format_duration always emits the shortest exact rendering, using the
    // largest unit below one second ("ns", "us", "ms") for sub-second values
    // and an "h", "m", "s" breakdown otherwise. The output is always printable
    // ASCII so it can travel as a metadata value.
    std::string format_duration(std::chrono::nanoseconds d);

    // accepts an optional sign followed by one or more number/unit pairs, numbers
    // may carry a fraction; valid units are ns, us, µs, ms, s, m and h. The bare
    // string "0" is also accepted. Returns false and leaves out untouched on error.
    bool parse_duration(std::string_view text, std::chrono::nanoseconds& out);
}
