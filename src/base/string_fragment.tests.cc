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
 * @file string_fragment.tests.cc
 */

#include "base/string_fragment.hh"

#include "config.h"
#include "doctest/doctest.h"

TEST_CASE("string_fragment sub_range clamps")
{
    auto sf = "hello world"_frag;

    CHECK(sf.sub_range(0, 5) == "hello");
    CHECK(sf.sub_range(6, 100) == "world");
    CHECK(sf.sub_range(-3, 2) == "he");
    CHECK(sf.sub_range(8, 4).empty());
    CHECK(sf.substr(20).empty());
}

TEST_CASE("string_fragment split_pair")
{
    auto is_eq = [](char ch) { return ch == '='; };

    auto split_res = "key=val=ue"_frag.split_pair(is_eq);
    REQUIRE(split_res.has_value());
    CHECK(split_res->first == "key");
    CHECK(split_res->second == "val=ue");

    CHECK_FALSE("novalue"_frag.split_pair(is_eq).has_value());

    auto trailing = "key="_frag.split_pair(is_eq);
    REQUIRE(trailing.has_value());
    CHECK(trailing->second.empty());
}

TEST_CASE("string_fragment quoted body")
{
    auto body = R"(say \"hi\" now" rest)"_frag;
    auto split_res
        = body.split_while(string_fragment::quoted_string_body{});

    REQUIRE(split_res.has_value());
    CHECK(split_res->first == R"(say \"hi\" now)");
    CHECK(split_res->second.startswith("\" rest"));
    CHECK(split_res->first.to_unquoted_string() == "say \"hi\" now");
    CHECK(R"(a\tb\)"_frag.to_unquoted_string() == "a\tb\\");
}

TEST_CASE("string_fragment find and trim")
{
    auto sf = "  GET /index.html  "_frag;

    CHECK(sf.trim() == "GET /index.html");
    CHECK(" \t "_frag.trim().empty());
    CHECK(sf.find('/') == 6);
    CHECK_FALSE(sf.find('?').has_value());
    CHECK(sf.find("index"_frag) == 7);
    CHECK_FALSE(sf.find("missing"_frag).has_value());
    CHECK(sf.trim().endswith(".html"_frag));
    CHECK("warn"_frag.is_one_of("info", "warn"));
}
