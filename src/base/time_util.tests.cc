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
 * @file time_util.tests.cc
 */

#include "base/time_util.hh"

#include "config.h"
#include "doctest/doctest.h"

using namespace lsift;

static std::string
normalize(const char* in)
{
    auto zp = time::parse_timestamp(string_fragment::from_c_str(in), 2023);

    if (!zp) {
        return "<invalid>";
    }
    return time::to_rfc3339_string(zp.value());
}

TEST_CASE("parse_timestamp rfc3339")
{
    CHECK(normalize("2023-10-10T13:55:36Z") == "2023-10-10T13:55:36+00:00");
    CHECK(normalize("2023-10-10T13:55:36+02:00")
          == "2023-10-10T13:55:36+02:00");
    CHECK(normalize("2023-10-10T13:55:36.250-0700")
          == "2023-10-10T13:55:36.250-07:00");
}

TEST_CASE("parse_timestamp long fractions")
{
    CHECK(normalize("2023-10-10T13:55:36.123456Z")
          == "2023-10-10T13:55:36.123+00:00");
    CHECK(normalize("2023-10-10T13:55:36.987654321+01:00")
          == "2023-10-10T13:55:36.987+01:00");
    CHECK(normalize("2023-10-10 13:55:36.000999")
          == "2023-10-10T13:55:36+00:00");
}

TEST_CASE("parse_timestamp access log")
{
    CHECK(normalize("10/Oct/2023:13:55:36 -0700")
          == "2023-10-10T13:55:36-07:00");
}

TEST_CASE("parse_timestamp without zone")
{
    CHECK(normalize("2023-10-10 13:55:36") == "2023-10-10T13:55:36+00:00");
    CHECK(normalize("2023-10-10T13:55:36") == "2023-10-10T13:55:36+00:00");
    CHECK(normalize("2023-10-10 13:55:36.5") == "2023-10-10T13:55:36.500+00:00");
}

TEST_CASE("parse_timestamp syslog")
{
    CHECK(normalize("Oct 10 13:55:36") == "2023-10-10T13:55:36+00:00");
    CHECK(normalize("Jan  2 03:04:05") == "2023-01-02T03:04:05+00:00");
}

TEST_CASE("parse_timestamp invalid")
{
    CHECK(normalize("") == "<invalid>");
    CHECK(normalize("yesterday") == "<invalid>");
    CHECK(normalize("2023-13-45 99:00:00") == "<invalid>");
    // leading bytes outside of ASCII
    CHECK(normalize("\xc3\x89t\xc3\xa9 10 13:55:36") == "<invalid>");
    CHECK(normalize("\xff") == "<invalid>");
}
