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
 * @file filter.parser.hh
 */

#ifndef lsift_filter_parser_hh
#define lsift_filter_parser_hh

#include <vector>

#include "base/string_fragment.hh"
#include "filter.ast.hh"
#include "filter.lexer.hh"
#include "regex_cache.hh"
#include "result.h"

namespace lsift::filter {

/**
 * Recursive-descent parser for filter expressions:
 *
 *   expr       := or_expr
 *   or_expr    := and_expr ("||" and_expr)*
 *   and_expr   := unary ("&&" unary)*
 *   unary      := "!" unary | comparison
 *   comparison := operand (op operand)? | "~" operand
 *
 * Regular expressions are compiled through the given cache while parsing
 * so that a bad pattern is reported as a compile error.
 */
class parser {
public:
    parser(string_fragment input, regex_cache& cache)
        : p_input(input), p_cache(cache)
    {
    }

    Result<ast::node, compile_error> parse();

private:
    const token* peek() const
    {
        if (this->p_pos < this->p_tokens.size()) {
            return &this->p_tokens[this->p_pos];
        }
        return nullptr;
    }

    bool accept(token_kind kind)
    {
        const auto* tok = this->peek();

        if (tok != nullptr && tok->t_kind == kind) {
            this->p_pos += 1;
            return true;
        }
        return false;
    }

    int current_offset() const
    {
        const auto* tok = this->peek();

        return tok != nullptr ? tok->t_offset : this->p_input.length();
    }

    Result<const token*, compile_error> expect_operand(const char* context);
    Result<ast::node, compile_error> compile_regex(const token& tok);

    Result<ast::node, compile_error> parse_or();
    Result<ast::node, compile_error> parse_and();
    Result<ast::node, compile_error> parse_unary();
    Result<ast::node, compile_error> parse_comparison();

    string_fragment p_input;
    regex_cache& p_cache;
    std::vector<token> p_tokens;
    size_t p_pos{0};
};

Result<ast::node, compile_error> parse(string_fragment input,
                                       regex_cache& cache);

}  // namespace lsift::filter

#endif
