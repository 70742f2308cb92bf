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
 * @file filter.lexer.tests.cc
 */

#include "filter.lexer.hh"

#include "config.h"
#include "doctest/doctest.h"

using namespace lsift;
using namespace lsift::filter;

static std::vector<token_kind>
kinds_of(const std::vector<token>& tokens)
{
    std::vector<token_kind> retval;

    for (const auto& tok : tokens) {
        retval.emplace_back(tok.t_kind);
    }
    return retval;
}

TEST_CASE("lexer operators")
{
    auto tokens
        = tokenize("a==b&&c!=d||!e>1 f>=2 g<3 h<=4 ~x i=j"_frag).unwrap();

    std::vector<token_kind> expected = {
        token_kind::bare_word, token_kind::eq,      token_kind::bare_word,
        token_kind::and_op,    token_kind::bare_word, token_kind::ne,
        token_kind::bare_word, token_kind::or_op,   token_kind::not_op,
        token_kind::bare_word, token_kind::gt,      token_kind::bare_word,
        token_kind::bare_word, token_kind::ge,      token_kind::bare_word,
        token_kind::bare_word, token_kind::lt,      token_kind::bare_word,
        token_kind::bare_word, token_kind::le,      token_kind::bare_word,
        token_kind::tilde,     token_kind::bare_word, token_kind::bare_word,
        token_kind::eq,        token_kind::bare_word,
    };
    CHECK(kinds_of(tokens) == expected);
}

TEST_CASE("lexer quoted strings")
{
    auto tokens = tokenize(R"(msg == "say \"hi\" \\ \d")"_frag).unwrap();

    REQUIRE(tokens.size() == 3);
    CHECK(tokens[2].t_kind == token_kind::quoted_string);
    CHECK(tokens[2].t_value == R"(say "hi" \ \d)");
    CHECK(tokens[2].t_offset == 7);
}

TEST_CASE("lexer unterminated quote")
{
    auto tokens = tokenize(R"("ERROR in)"_frag).unwrap();

    REQUIRE(tokens.size() == 1);
    CHECK(tokens[0].t_kind == token_kind::quoted_string);
    CHECK(tokens[0].t_value == "ERROR in");
}

TEST_CASE("lexer offsets")
{
    auto tokens = tokenize("  status >= 500"_frag).unwrap();

    REQUIRE(tokens.size() == 3);
    CHECK(tokens[0].t_offset == 2);
    CHECK(tokens[0].t_source == "status");
    CHECK(tokens[1].t_offset == 9);
    CHECK(tokens[2].t_offset == 12);
    CHECK(tokens[2].t_value == "500");
}

TEST_CASE("lexer errors")
{
    auto single_amp = tokenize("a & b"_frag);
    REQUIRE(single_amp.isErr());
    CHECK(single_amp.unwrapErr().ce_offset == 2);

    auto single_pipe = tokenize("a | b"_frag);
    REQUIRE(single_pipe.isErr());
    CHECK(single_pipe.unwrapErr().ce_message == "expecting '||'");
}

TEST_CASE("lexer empty")
{
    CHECK(tokenize(""_frag).unwrap().empty());
    CHECK(tokenize("   "_frag).unwrap().empty());
}
