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
 * @file time_util.cc
 */

#include <sstream>

#include "time_util.hh"

#include <ctype.h>

#include "config.h"
#include "fmt/format.h"

namespace lsift {
namespace time {

namespace {

struct time_format {
    const char* tf_format;
    bool tf_has_zone;
};

const time_format TIME_FORMATS[] = {
    {"%Y-%m-%dT%H:%M:%S%Ez", true},
    {"%Y-%m-%dT%H:%M:%S%z", true},
    {"%Y-%m-%d %H:%M:%S%Ez", true},
    {"%Y-%m-%d %H:%M:%S %z", true},
    {"%d/%b/%Y:%H:%M:%S %z", true},
    {"%Y-%m-%dT%H:%M:%S", false},
    {"%Y-%m-%d %H:%M:%S", false},
    {"%Y/%m/%d %H:%M:%S", false},
    {"%d/%b/%Y:%H:%M:%S", false},
};

bool
consumed_all(std::istringstream& in)
{
    if (in.fail()) {
        return false;
    }
    in >> std::ws;
    return in.eof();
}

std::optional<zoned_point>
parse_with(const std::string& str, const time_format& tf)
{
    std::istringstream in{str};
    zoned_point retval;

    // %S reads as many fraction digits as the duration can hold.
    if (tf.tf_has_zone) {
        date::sys_time<std::chrono::nanoseconds> stime;

        in >> date::parse(tf.tf_format, stime, retval.zp_offset);
        if (!consumed_all(in)) {
            return std::nullopt;
        }
        retval.zp_time = date::floor<std::chrono::milliseconds>(stime);
        retval.zp_has_zone = true;
    } else {
        date::local_time<std::chrono::nanoseconds> ltime;

        in >> date::parse(tf.tf_format, ltime);
        if (!consumed_all(in)) {
            return std::nullopt;
        }
        retval.zp_time = date::sys_time<std::chrono::milliseconds>{
            date::floor<std::chrono::milliseconds>(ltime.time_since_epoch())};
    }

    return retval;
}

}  // namespace

std::optional<zoned_point>
parse_timestamp(string_fragment in, int syslog_year)
{
    auto trimmed = in.trim();
    if (trimmed.empty()) {
        return std::nullopt;
    }

    auto str = trimmed.to_string();
    if (str.back() == 'Z' || str.back() == 'z') {
        str.pop_back();
        str.append("+00:00");
    }

    for (const auto& tf : TIME_FORMATS) {
        auto parse_res = parse_with(str, tf);

        if (parse_res) {
            return parse_res;
        }
    }

    if (isalpha((unsigned char) str.front())) {
        auto with_year = fmt::format(FMT_STRING("{} {}"), syslog_year, str);
        auto parse_res = parse_with(with_year, {"%Y %b %d %H:%M:%S", false});

        if (parse_res) {
            return parse_res;
        }
    }

    return std::nullopt;
}

std::optional<zoned_point>
parse_timestamp(string_fragment in)
{
    auto now = date::floor<date::days>(std::chrono::system_clock::now());
    auto ymd = date::year_month_day{now};

    return parse_timestamp(in, (int) ymd.year());
}

std::string
to_rfc3339_string(const zoned_point& zp)
{
    auto local = zp.zp_time + zp.zp_offset;
    auto day_point = date::floor<date::days>(local);
    auto ymd = date::year_month_day{day_point};
    auto tod = date::make_time(local - day_point);
    auto millis = tod.subseconds().count();
    auto offset_mins = zp.zp_offset.count();
    auto sign = offset_mins < 0 ? '-' : '+';

    if (offset_mins < 0) {
        offset_mins = -offset_mins;
    }

    auto retval = fmt::format(FMT_STRING("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}"),
                              (int) ymd.year(),
                              (unsigned) ymd.month(),
                              (unsigned) ymd.day(),
                              tod.hours().count(),
                              tod.minutes().count(),
                              tod.seconds().count());
    if (millis != 0) {
        retval.append(fmt::format(FMT_STRING(".{:03}"), millis));
    }
    retval.append(fmt::format(
        FMT_STRING("{}{:02}:{:02}"), sign, offset_mins / 60, offset_mins % 60));

    return retval;
}

}  // namespace time
}  // namespace lsift
