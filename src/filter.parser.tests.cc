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
 * @file filter.parser.tests.cc
 */

#include "filter.parser.hh"

#include "config.h"
#include "doctest/doctest.h"

using namespace lsift;

static std::string
parse_to_string(const char* expr)
{
    regex_cache cache;
    auto parse_res = filter::parse(string_fragment::from_c_str(expr), cache);

    if (parse_res.isErr()) {
        auto ce = parse_res.unwrapErr();

        return "error@" + std::to_string(ce.ce_offset) + ": " + ce.ce_message;
    }
    return filter::ast::to_string(parse_res.unwrap());
}

TEST_CASE("parser free text")
{
    CHECK(parse_to_string("ERROR") == "\"ERROR\"");
    CHECK(parse_to_string("\"ERROR\"") == "\"ERROR\"");
    CHECK(parse_to_string("404") == "404");
}

TEST_CASE("parser comparisons")
{
    CHECK(parse_to_string("status >= 400") == "(>= status 400)");
    CHECK(parse_to_string("level == ERROR") == "(== level \"ERROR\")");
    CHECK(parse_to_string("level = \"ERROR\"") == "(== level \"ERROR\")");
    CHECK(parse_to_string("\"a\" != b") == "(!= \"a\" \"b\")");
}

TEST_CASE("parser regex")
{
    CHECK(parse_to_string("~ \"^GET\"") == "/^GET/");
    CHECK(parse_to_string("~^POST") == "/^POST/");
    CHECK(parse_to_string("path ~ \"\\.php$\"") == "(~ path /\\.php$/)");
}

TEST_CASE("parser precedence")
{
    CHECK(parse_to_string("a || b && c") == "(|| \"a\" (&& \"b\" \"c\"))");
    CHECK(parse_to_string("a && b || c") == "(|| (&& \"a\" \"b\") \"c\")");
    CHECK(parse_to_string("!a && !!b") == "(&& (! \"a\") (! (! \"b\")))");
    CHECK(parse_to_string("a && b && c") == "(&& (&& \"a\" \"b\") \"c\")");
}

TEST_CASE("parser errors")
{
    CHECK(parse_to_string("") == "error@0: empty expression");
    CHECK(parse_to_string("  ") == "error@0: empty expression");
    CHECK(parse_to_string("status >=")
          == "error@9: expecting an operand after '>='");
    CHECK(parse_to_string("a &&") == "error@4: expecting an operand to match "
                                      "against");
    CHECK(parse_to_string("a && || b")
          == "error@5: expecting an operand to match against, found '||'");
    CHECK(parse_to_string("a b") == "error@2: unexpected 'b'");
    CHECK(parse_to_string("~") == "error@1: expecting an operand after '~'");

    auto bad_regex = parse_to_string("~ \"(\"");
    CHECK(bad_regex.find("error@2: invalid regular expression: ") == 0);
}
