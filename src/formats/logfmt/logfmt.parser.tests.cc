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
 * @file logfmt.parser.tests.cc
 */

#include "config.h"

#include "doctest/doctest.h"
#include "logfmt.parser.hh"

using lsift::logfmt::parser;

TEST_CASE("logfmt basic")
{
    static const char* line
        = "abc=def ghi=\"1 2 3 4\" time=333 empty1= esc=\"a \\\"b\\\"\"";

    auto p = parser{string_fragment{line}};

    auto pair1 = p.step();

    CHECK(pair1.is<parser::kvpair>());
    CHECK(pair1.get<parser::kvpair>().first == "abc");
    CHECK(pair1.get<parser::kvpair>().second.get<parser::unquoted_value>().uv_value
          == "def");

    auto pair2 = p.step();

    CHECK(pair2.is<parser::kvpair>());
    CHECK(pair2.get<parser::kvpair>().first == "ghi");
    CHECK(pair2.get<parser::kvpair>().second.get<parser::quoted_value>().qv_value
          == "\"1 2 3 4\"");
    CHECK(parser::to_string(pair2.get<parser::kvpair>().second) == "1 2 3 4");

    auto pair3 = p.step();

    CHECK(pair3.is<parser::kvpair>());
    CHECK(parser::to_string(pair3.get<parser::kvpair>().second) == "333");

    auto pair4 = p.step();

    CHECK(pair4.is<parser::kvpair>());
    CHECK(pair4.get<parser::kvpair>().first == "empty1");
    CHECK(parser::to_string(pair4.get<parser::kvpair>().second).empty());

    auto pair5 = p.step();

    CHECK(pair5.is<parser::kvpair>());
    CHECK(pair5.get<parser::kvpair>().first == "esc");
    CHECK(parser::to_string(pair5.get<parser::kvpair>().second) == "a \"b\"");

    auto eoi = p.step();
    CHECK(eoi.is<parser::end_of_input>());
}

TEST_CASE("logfmt bare words are reported")
{
    static const char* line = "INFO started level=info =x done";

    auto p = parser{string_fragment{line}};

    auto bw1 = p.step();
    CHECK(bw1.is<parser::bare_word>());
    CHECK(bw1.get<parser::bare_word>().bw_value == "INFO");

    auto bw2 = p.step();
    CHECK(bw2.is<parser::bare_word>());
    CHECK(bw2.get<parser::bare_word>().bw_value == "started");

    auto kv = p.step();
    CHECK(kv.is<parser::kvpair>());
    CHECK(kv.get<parser::kvpair>().first == "level");

    auto bw3 = p.step();
    CHECK(bw3.is<parser::bare_word>());
    CHECK(bw3.get<parser::bare_word>().bw_value == "=x");

    auto bw4 = p.step();
    CHECK(bw4.is<parser::bare_word>());
    CHECK(bw4.get<parser::bare_word>().bw_value == "done");

    CHECK(p.step().is<parser::end_of_input>());
}

TEST_CASE("logfmt non-terminated string")
{
    static const char* line = "abc=\"12 2 def=3";

    auto p = parser{string_fragment{line}};
    auto pair1 = p.step();

    REQUIRE(pair1.is<parser::kvpair>());
    auto kv1 = pair1.get<parser::kvpair>();
    CHECK(kv1.first == "abc");
    CHECK(kv1.second.is<parser::unquoted_value>());
    CHECK(parser::to_string(kv1.second) == "\"12");

    auto bw = p.step();
    REQUIRE(bw.is<parser::bare_word>());
    CHECK(bw.get<parser::bare_word>().bw_value == "2");

    auto pair2 = p.step();
    REQUIRE(pair2.is<parser::kvpair>());
    CHECK(pair2.get<parser::kvpair>().first == "def");
    CHECK(p.step().is<parser::end_of_input>());
}

TEST_CASE("logfmt empty")
{
    static const char* line = "";

    auto p = parser{string_fragment{line}};

    CHECK(p.step().is<parser::end_of_input>());
}
