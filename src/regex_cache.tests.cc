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
 * @file regex_cache.tests.cc
 */

#include "regex_cache.hh"

#include "config.h"
#include "doctest/doctest.h"

using namespace lsift;

TEST_CASE("regex_cache shares compiled regexes")
{
    regex_cache cache;

    auto first = cache.get_regex("^GET "_frag).unwrap();
    auto second = cache.get_regex("^GET "_frag).unwrap();

    CHECK(first.get() == second.get());

    auto stats = cache.get_stats();
    CHECK(stats.s_hits == 1);
    CHECK(stats.s_misses == 1);
    CHECK(stats.s_size == 1);
}

TEST_CASE("regex_cache evicts the oldest entry")
{
    regex_cache cache(2);

    auto a = cache.get_regex("a"_frag).unwrap();
    cache.get_regex("b"_frag).unwrap();
    cache.get_regex("c"_frag).unwrap();

    CHECK(cache.get_stats().s_size == 2);

    auto a2 = cache.get_regex("a"_frag).unwrap();
    CHECK(a.get() != a2.get());
}

TEST_CASE("regex_cache keeps recently used entries")
{
    regex_cache cache(2);

    auto a = cache.get_regex("a"_frag).unwrap();
    auto b = cache.get_regex("b"_frag).unwrap();

    CHECK(cache.get_regex("a"_frag).unwrap().get() == a.get());
    cache.get_regex("c"_frag).unwrap();

    CHECK(cache.get_regex("a"_frag).unwrap().get() == a.get());
    CHECK(cache.get_regex("b"_frag).unwrap().get() != b.get());

    auto st = cache.get_stats();
    CHECK(st.s_hits == 2);
    CHECK(st.s_misses == 4);
    CHECK(st.s_size == 2);
}

TEST_CASE("regex_cache compile error")
{
    regex_cache cache;

    auto res = cache.get_regex("("_frag);

    REQUIRE(res.isErr());
    CHECK_FALSE(res.unwrapErr().get_message().empty());
    CHECK(cache.get_stats().s_size == 0);
}

TEST_CASE("regex_cache patterns")
{
    regex_cache cache;

    auto first = cache.get_pattern("<a> <b>"_frag).unwrap();
    auto second = cache.get_pattern("<a> <b>"_frag).unwrap();

    CHECK(first.get() == second.get());
    CHECK(cache.get_pattern("<a><b>"_frag).isErr());
}
