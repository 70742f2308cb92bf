/**
 * Copyright (c) 2024, Timothy Stack
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice, this
 * list of conditions and the following disclaimer.
 * * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * * Neither the name of Timothy Stack nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE REGENTS AND CONTRIBUTORS ''AS IS'' AND ANY
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE REGENTS OR CONTRIBUTORS BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 * @file time_util.hh
 */

#ifndef lsift_time_util_hh
#define lsift_time_util_hh

#include <chrono>
#include <optional>
#include <string>

#include <sys/time.h>
#include <time.h>

#include "base/string_fragment.hh"
#include "date/date.h"

namespace lsift {
namespace time {

/**
 * A point in time along with the UTC offset it was written in.
 */
struct zoned_point {
    date::sys_time<std::chrono::milliseconds> zp_time;
    std::chrono::minutes zp_offset{0};
    bool zp_has_zone{false};
};

/**
 * Parse a timestamp in one of the common log formats: RFC 3339, the
 * Apache/nginx access log format, "YYYY-MM-DD HH:MM:SS" and syslog's
 * "Mon DD HH:MM:SS".  Syslog times are assigned the given year.
 */
std::optional<zoned_point> parse_timestamp(string_fragment in, int syslog_year);

std::optional<zoned_point> parse_timestamp(string_fragment in);

/**
 * Format as "YYYY-MM-DDTHH:MM:SS[.mmm]+HH:MM" using the point's own offset.
 * The millisecond part is only included when it is non-zero.
 */
std::string to_rfc3339_string(const zoned_point& zp);

}  // namespace time
}  // namespace lsift

inline int64_t
getmstime()
{
    struct timeval tv;

    gettimeofday(&tv, nullptr);

    return int64_t(tv.tv_sec) * 1000ULL + int64_t(tv.tv_usec) / 1000ULL;
}

#endif
