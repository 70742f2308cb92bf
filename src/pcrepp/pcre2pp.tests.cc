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
 * @file pcre2pp.tests.cc
 */

#include "config.h"

#include "doctest/doctest.h"
#include "pcre2pp.hh"

using namespace lsift;

TEST_CASE("pcre2pp named captures")
{
    auto code = pcre2pp::code::from(
                    R"((?<user>\w+)@(?<host>[\w.]+)(?:/(?<path>\S+))?)"_frag)
                    .unwrap();
    const auto& ncs = code.get_named_captures();

    REQUIRE(ncs.size() == 3);
    CHECK(ncs[0].nc_name == "host");
    CHECK(ncs[0].nc_index == 2);
    CHECK(ncs[1].nc_name == "path");
    CHECK(ncs[1].nc_index == 3);
    CHECK(ncs[2].nc_name == "user");
    CHECK(ncs[2].nc_index == 1);

    pcre2pp::match_data md;

    REQUIRE(code.match("login joe@example.com ok"_frag, md));
    CHECK(md.get_count() == 3);
    CHECK(md[0].value() == "joe@example.com");
    CHECK(md[1].value() == "joe");
    CHECK(md[2].value() == "example.com");
    CHECK_FALSE(md[3].has_value());

    CHECK_FALSE(code.match("no address here"_frag, md));
    CHECK(md.get_count() == 0);
    CHECK_FALSE(md[0].has_value());
}

TEST_CASE("pcre2pp match data grows for larger patterns")
{
    auto small = pcre2pp::code::from_const(R"(\d+)");
    auto large = pcre2pp::code::from_const(R"((a)(b)(c)(d)(e))");
    pcre2pp::match_data md;

    REQUIRE(small.match("id 42"_frag, md));
    CHECK(md[0].value() == "42");

    REQUIRE(large.match("xabcdey"_frag, md));
    CHECK(md.get_count() == 6);
    CHECK(md[5].value() == "e");
}

TEST_CASE("pcre2pp find_in")
{
    auto code = pcre2pp::code::from_const(R"(\.log$)");

    CHECK(code.find_in("/var/log/app.log"_frag));
    CHECK_FALSE(code.find_in("/var/log/app.log.1"_frag));
    CHECK(code.get_pattern() == R"(\.log$)");
}

TEST_CASE("pcre2pp compile error")
{
    auto compile_res = pcre2pp::code::from("abc("_frag);

    REQUIRE(compile_res.isErr());
    auto ce = compile_res.unwrapErr();
    CHECK(ce.ce_pattern == "abc(");
    CHECK(ce.ce_offset == 4);
    CHECK(ce.get_message().find("parenthesis") != std::string::npos);
}
