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
 * @file csv.parser.tests.cc
 */

#include "config.h"

#include "csv.parser.hh"
#include "doctest/doctest.h"

using namespace lsift;

TEST_CASE("csv::guess_separator")
{
    CHECK(csv::guess_separator("a,b,c"_frag) == ',');
    CHECK(csv::guess_separator("a;b;c"_frag) == ';');
    CHECK(csv::guess_separator("a;b,c"_frag) == ';');
    CHECK(csv::guess_separator("single"_frag) == ',');
}

TEST_CASE("csv::split_row")
{
    {
        auto cells = csv::split_row("1,\"two, three\",4"_frag, ',');

        REQUIRE(cells.size() == 3);
        CHECK(cells[0] == "1");
        CHECK(cells[1] == "two, three");
        CHECK(cells[2] == "4");
    }
    {
        auto cells = csv::split_row("\"say \"\"hi\"\"\";x"_frag, ';');

        REQUIRE(cells.size() == 2);
        CHECK(cells[0] == "say \"hi\"");
        CHECK(cells[1] == "x");
    }
    {
        auto cells = csv::split_row("a\\,b,c"_frag, ',');

        REQUIRE(cells.size() == 2);
        CHECK(cells[0] == "a,b");
        CHECK(cells[1] == "c");
    }
    {
        auto cells = csv::split_row(",,"_frag, ',');

        CHECK(cells.size() == 3);
    }
}
