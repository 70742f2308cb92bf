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
 * @file json.flatten.tests.cc
 */

#include "config.h"

#include "doctest/doctest.h"
#include "json.flatten.hh"

using namespace lsift;

TEST_CASE("json::flatten_object nested")
{
    std::vector<json::flat_pair> pairs;

    auto line = R"({"level":"info","req":{"id":7,"ok":true,"tags":["a","b"]},"err":null,"msg":"a \"quoted\" word"})";
    REQUIRE(json::flatten_object(string_fragment::from_c_str(line), pairs));

    std::vector<json::flat_pair> expected = {
        {"level", "info"},
        {"req.id", "7"},
        {"req.ok", "true"},
        {"req.tags.0", "a"},
        {"req.tags.1", "b"},
        {"err", "null"},
        {"msg", "a \"quoted\" word"},
    };
    CHECK(pairs == expected);
}

TEST_CASE("json::flatten_object number text")
{
    std::vector<json::flat_pair> pairs;

    REQUIRE(json::flatten_object(R"({"latency": 1.50})"_frag, pairs));
    REQUIRE(pairs.size() == 1);
    CHECK(pairs[0].second == "1.50");
}

TEST_CASE("json::flatten_object rejects")
{
    std::vector<json::flat_pair> pairs;

    CHECK_FALSE(json::flatten_object("not json"_frag, pairs));
    CHECK_FALSE(json::flatten_object(R"({"a": )"_frag, pairs));
    CHECK_FALSE(json::flatten_object("[1, 2]"_frag, pairs));
    CHECK(pairs.empty());
}
