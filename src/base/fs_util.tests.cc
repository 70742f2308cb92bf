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
 * @file fs_util.tests.cc
 */

#include <filesystem>

#include "base/fs_util.hh"

#include "config.h"
#include "doctest/doctest.h"

using namespace lsift;

TEST_CASE("fs_util::write_file and read_file")
{
    auto temp_res = filesystem::open_temp_file("/tmp/lsift.fs_util.XXXXXX");
    REQUIRE(temp_res.isOk());

    auto temp_pair = temp_res.unwrap();
    auto write_res = filesystem::write_file(temp_pair.first,
                                            "line one\nline two\n"_frag);
    CHECK(write_res.isOk());

    auto read_res = filesystem::read_file(temp_pair.first);
    REQUIRE(read_res.isOk());
    CHECK(read_res.unwrap() == "line one\nline two\n");

    auto st_res = filesystem::stat_file(temp_pair.first);
    REQUIRE(st_res.isOk());
    CHECK(st_res.unwrap().st_size == 18);

    std::filesystem::remove(temp_pair.first);
}

TEST_CASE("fs_util::open_file error")
{
    auto open_res
        = filesystem::open_file("/tmp/lsift.does-not-exist/file", O_RDONLY);

    REQUIRE(open_res.isErr());
    CHECK(open_res.unwrapErr().find("/tmp/lsift.does-not-exist/file")
          != std::string::npos);
}
