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
 * @file line_pattern.tests.cc
 */

#include "line_pattern.hh"

#include "config.h"
#include "doctest/doctest.h"

using namespace lsift;

static std::vector<std::pair<std::string, std::string>>
to_pairs(const std::vector<line_pattern::capture>& caps)
{
    std::vector<std::pair<std::string, std::string>> retval;

    for (const auto& cap : caps) {
        retval.emplace_back(cap.first.to_string(), cap.second.to_string());
    }
    return retval;
}

TEST_CASE("line_pattern two slots")
{
    auto lp = line_pattern::compile("<a> <b>"_frag).unwrap();
    std::vector<line_pattern::capture> caps;

    REQUIRE(lp.match("1 2"_frag, caps));
    std::vector<std::pair<std::string, std::string>> expected = {
        {"a", "1"},
        {"b", "2"},
    };
    CHECK(to_pairs(caps) == expected);
}

TEST_CASE("line_pattern literals")
{
    auto lp = line_pattern::compile("[<level>] <_>: <msg>"_frag).unwrap();
    std::vector<line_pattern::capture> caps;

    REQUIRE(lp.match("[WARN] worker-3: queue is full"_frag, caps));
    std::vector<std::pair<std::string, std::string>> expected = {
        {"level", "WARN"},
        {"msg", "queue is full"},
    };
    CHECK(to_pairs(caps) == expected);
}

TEST_CASE("line_pattern anchored trailing literal")
{
    auto lp = line_pattern::compile("took <ms>ms"_frag).unwrap();
    std::vector<line_pattern::capture> caps;

    REQUIRE(lp.match("took 12ms"_frag, caps));
    CHECK(to_pairs(caps)[0].second == "12");

    caps.clear();
    CHECK_FALSE(lp.match("took 12ms!"_frag, caps));
    CHECK_FALSE(lp.match("it took 12ms"_frag, caps));
    CHECK(caps.empty());
}

TEST_CASE("line_pattern mismatch leaves captures alone")
{
    auto lp = line_pattern::compile("<a>=<b>;"_frag).unwrap();
    std::vector<line_pattern::capture> caps;

    CHECK_FALSE(lp.match("no equals here;"_frag, caps));
    CHECK(caps.empty());
}

TEST_CASE("line_pattern compile errors")
{
    CHECK(line_pattern::compile(""_frag).isErr());
    CHECK(line_pattern::compile("<a"_frag).isErr());
    CHECK(line_pattern::compile("<> x"_frag).isErr());
    CHECK(line_pattern::compile("<a<b>"_frag).isErr());

    auto adjacent = line_pattern::compile("<a><b>"_frag);
    REQUIRE(adjacent.isErr());
    CHECK(adjacent.unwrapErr().find("immediately follows")
          != std::string::npos);
}
