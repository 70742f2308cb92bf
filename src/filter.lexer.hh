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
 * @file filter.lexer.hh
 */

#ifndef lsift_filter_lexer_hh
#define lsift_filter_lexer_hh

#include <optional>
#include <string>
#include <vector>

#include "base/string_fragment.hh"
#include "result.h"

namespace lsift::filter {

struct compile_error {
    std::string ce_message;
    /** Byte offset into the expression where the problem was found. */
    int ce_offset{0};
};

enum class token_kind {
    and_op,
    or_op,
    not_op,
    eq,
    ne,
    gt,
    ge,
    lt,
    le,
    tilde,
    quoted_string,
    bare_word,
};

const char* token_kind_name(token_kind tk);

struct token {
    token_kind t_kind;
    /** The span of the expression that produced this token. */
    string_fragment t_source;
    /** For strings and words, the text with any escapes decoded. */
    std::string t_value;
    int t_offset{0};

    bool is_operand() const
    {
        return this->t_kind == token_kind::quoted_string
            || this->t_kind == token_kind::bare_word;
    }

    bool is_comparison() const
    {
        switch (this->t_kind) {
            case token_kind::eq:
            case token_kind::ne:
            case token_kind::gt:
            case token_kind::ge:
            case token_kind::lt:
            case token_kind::le:
            case token_kind::tilde:
                return true;
            default:
                return false;
        }
    }
};

/**
 * Splits a filter expression into tokens.  A double-quoted string that is
 * not closed runs to the end of the input.
 */
class lexer {
public:
    explicit lexer(string_fragment input) : l_input(input) {}

    /**
     * @return The next token or nullopt at the end of the input.
     */
    Result<std::optional<token>, compile_error> next();

    int offset() const { return this->l_offset; }

private:
    token make_token(token_kind kind, int start, int end, std::string value);

    string_fragment l_input;
    int l_offset{0};
};

Result<std::vector<token>, compile_error> tokenize(string_fragment input);

}  // namespace lsift::filter

#endif
