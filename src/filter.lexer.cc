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
 * @file filter.lexer.cc
 */

#include "filter.lexer.hh"

#include <ctype.h>

#include "config.h"
#include "fmt/format.h"

namespace lsift::filter {

const char*
token_kind_name(token_kind tk)
{
    switch (tk) {
        case token_kind::and_op:
            return "&&";
        case token_kind::or_op:
            return "||";
        case token_kind::not_op:
            return "!";
        case token_kind::eq:
            return "==";
        case token_kind::ne:
            return "!=";
        case token_kind::gt:
            return ">";
        case token_kind::ge:
            return ">=";
        case token_kind::lt:
            return "<";
        case token_kind::le:
            return "<=";
        case token_kind::tilde:
            return "~";
        case token_kind::quoted_string:
            return "string";
        case token_kind::bare_word:
            return "word";
    }

    return "unknown";
}

static bool
is_operator_char(char ch)
{
    switch (ch) {
        case '=':
        case '!':
        case '<':
        case '>':
        case '~':
        case '&':
        case '|':
            return true;
        default:
            return false;
    }
}

token
lexer::make_token(token_kind kind, int start, int end, std::string value)
{
    this->l_offset = end;

    return token{
        kind,
        this->l_input.sub_range(start, end),
        std::move(value),
        start,
    };
}

Result<std::optional<token>, compile_error>
lexer::next()
{
    const auto len = this->l_input.length();

    while (this->l_offset < len
           && isspace((unsigned char) this->l_input[this->l_offset]))
    {
        this->l_offset += 1;
    }

    if (this->l_offset >= len) {
        return Ok(std::optional<token>{});
    }

    const auto start = this->l_offset;
    const auto ch = this->l_input[start];
    const auto next_ch = start + 1 < len ? this->l_input[start + 1] : '\0';

    switch (ch) {
        case '&':
            if (next_ch != '&') {
                return Err(compile_error{"expecting '&&'", start});
            }
            return Ok(std::make_optional(
                this->make_token(token_kind::and_op, start, start + 2, "")));
        case '|':
            if (next_ch != '|') {
                return Err(compile_error{"expecting '||'", start});
            }
            return Ok(std::make_optional(
                this->make_token(token_kind::or_op, start, start + 2, "")));
        case '!':
            if (next_ch == '=') {
                return Ok(std::make_optional(
                    this->make_token(token_kind::ne, start, start + 2, "")));
            }
            return Ok(std::make_optional(
                this->make_token(token_kind::not_op, start, start + 1, "")));
        case '=':
            if (next_ch == '=') {
                return Ok(std::make_optional(
                    this->make_token(token_kind::eq, start, start + 2, "")));
            }
            return Ok(std::make_optional(
                this->make_token(token_kind::eq, start, start + 1, "")));
        case '>':
            if (next_ch == '=') {
                return Ok(std::make_optional(
                    this->make_token(token_kind::ge, start, start + 2, "")));
            }
            return Ok(std::make_optional(
                this->make_token(token_kind::gt, start, start + 1, "")));
        case '<':
            if (next_ch == '=') {
                return Ok(std::make_optional(
                    this->make_token(token_kind::le, start, start + 2, "")));
            }
            return Ok(std::make_optional(
                this->make_token(token_kind::lt, start, start + 1, "")));
        case '~':
            return Ok(std::make_optional(
                this->make_token(token_kind::tilde, start, start + 1, "")));
        case '"': {
            std::string value;
            auto lpc = start + 1;

            while (lpc < len) {
                auto sch = this->l_input[lpc];

                if (sch == '"') {
                    lpc += 1;
                    break;
                }
                if (sch == '\\' && lpc + 1 < len) {
                    auto esc = this->l_input[lpc + 1];

                    if (esc == '"' || esc == '\\') {
                        value.push_back(esc);
                        lpc += 2;
                        continue;
                    }
                }
                value.push_back(sch);
                lpc += 1;
            }
            return Ok(std::make_optional(this->make_token(
                token_kind::quoted_string, start, lpc, std::move(value))));
        }
        default:
            break;
    }

    auto lpc = start;
    while (lpc < len) {
        auto wch = this->l_input[lpc];

        if (isspace((unsigned char) wch) || wch == '"' || is_operator_char(wch))
        {
            break;
        }
        lpc += 1;
    }

    auto word = this->l_input.sub_range(start, lpc);
    return Ok(std::make_optional(
        this->make_token(token_kind::bare_word, start, lpc, word.to_string())));
}

Result<std::vector<token>, compile_error>
tokenize(string_fragment input)
{
    std::vector<token> retval;
    lexer lex(input);

    while (true) {
        auto tok = TRY(lex.next());

        if (!tok) {
            break;
        }
        retval.emplace_back(std::move(tok.value()));
    }

    return Ok(std::move(retval));
}

}  // namespace lsift::filter
