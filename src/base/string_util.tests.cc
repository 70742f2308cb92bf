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
 * @file string_util.tests.cc
 */

#include "base/string_util.hh"

#include "config.h"
#include "doctest/doctest.h"

TEST_CASE("scrub_to_utf8")
{
    {
        std::string valid = "hello, w\xc3\xb6rld";

        CHECK(scrub_to_utf8(valid) == 0);
        CHECK(valid == "hello, w\xc3\xb6rld");
    }
    {
        std::string invalid = "abc\xff"
                              "def";

        CHECK(scrub_to_utf8(invalid) == 1);
        CHECK(invalid == "abc\xef\xbf\xbd"
                         "def");
    }
    {
        // truncated multi-byte sequence at the end
        std::string truncated = "abc\xe2\x82";

        CHECK(scrub_to_utf8(truncated) == 1);
        CHECK(truncated == "abc\xef\xbf\xbd");
    }
}

TEST_CASE("parse_number")
{
    CHECK(parse_number("404"_frag).value() == 404.0);
    CHECK(parse_number("-1.5"_frag).value() == -1.5);
    CHECK(parse_number(".25"_frag).value() == 0.25);
    CHECK_FALSE(parse_number(""_frag).has_value());
    CHECK_FALSE(parse_number("ERROR"_frag).has_value());
    CHECK_FALSE(parse_number("12abc"_frag).has_value());
    CHECK_FALSE(parse_number("inf"_frag).has_value());
}
