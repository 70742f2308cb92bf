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
 * @file journal.parser.tests.cc
 */

#include "config.h"

#include "doctest/doctest.h"
#include "journal.parser.hh"

using namespace lsift;

TEST_CASE("journal::parse_line")
{
    auto ent = journal::parse_line(
        "2024-03-01T10:15:30+0000 web01 sshd[1234]: Accepted publickey for bob"_frag);

    REQUIRE(ent.has_value());
    CHECK(ent->e_timestamp == "2024-03-01T10:15:30+0000");
    CHECK(ent->e_hostname == "web01");
    CHECK(ent->e_service == "sshd");
    REQUIRE(ent->e_pid.has_value());
    CHECK(ent->e_pid.value() == "1234");
    CHECK(ent->e_message == "Accepted publickey for bob");
}

TEST_CASE("journal::parse_line without pid")
{
    auto ent = journal::parse_line(
        "2024-03-01T10:15:30+0000 web01 kernel: usb 1-1: new device"_frag);

    REQUIRE(ent.has_value());
    CHECK(ent->e_service == "kernel");
    CHECK_FALSE(ent->e_pid.has_value());
    CHECK(ent->e_message == "usb 1-1: new device");
}

TEST_CASE("journal::parse_line rejects")
{
    CHECK_FALSE(journal::parse_line(
                    "-- Boot 0123456789abcdef --"_frag)
                    .has_value());
    CHECK_FALSE(journal::parse_line("hello world"_frag).has_value());
    CHECK_FALSE(journal::parse_line("2024-03-01T10:15:30+0000"_frag).has_value());
}
