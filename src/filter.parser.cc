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
 * @file filter.parser.cc
 */

#include "filter.parser.hh"

#include "base/lsift_log.hh"
#include "base/string_util.hh"
#include "config.h"
#include "fmt/format.h"

namespace lsift::filter {

static ast::comparison_op
to_comparison_op(token_kind kind)
{
    switch (kind) {
        case token_kind::ne:
            return ast::comparison_op::ne;
        case token_kind::gt:
            return ast::comparison_op::gt;
        case token_kind::ge:
            return ast::comparison_op::ge;
        case token_kind::lt:
            return ast::comparison_op::lt;
        case token_kind::le:
            return ast::comparison_op::le;
        case token_kind::tilde:
            return ast::comparison_op::regex;
        default:
            return ast::comparison_op::eq;
    }
}

/**
 * A value-side operand: quoted text is always a string and a bare word is
 * a number if it looks like one.
 */
static ast::node
to_literal(const token& tok)
{
    if (tok.t_kind == token_kind::bare_word) {
        auto num = parse_number(string_fragment::from_str(tok.t_value));

        if (num) {
            return ast::number_literal{num.value(), tok.t_value};
        }
    }

    return ast::string_literal{tok.t_value};
}

Result<const token*, compile_error>
parser::expect_operand(const char* context)
{
    const auto* tok = this->peek();

    if (tok == nullptr) {
        return Err(compile_error{
            fmt::format(FMT_STRING("expecting an operand {}"), context),
            this->p_input.length(),
        });
    }
    if (!tok->is_operand()) {
        return Err(compile_error{
            fmt::format(FMT_STRING("expecting an operand {}, found '{}'"),
                        context,
                        token_kind_name(tok->t_kind)),
            tok->t_offset,
        });
    }

    this->p_pos += 1;
    return Ok(tok);
}

Result<ast::node, compile_error>
parser::compile_regex(const token& tok)
{
    auto re_res
        = this->p_cache.get_regex(string_fragment::from_str(tok.t_value));

    if (re_res.isErr()) {
        auto ce = re_res.unwrapErr();

        return Err(compile_error{
            fmt::format(FMT_STRING("invalid regular expression: {}"),
                        ce.get_message()),
            tok.t_offset,
        });
    }

    return Ok(ast::node{ast::regex_literal{re_res.unwrap()}});
}

Result<ast::node, compile_error>
parser::parse_or()
{
    auto retval = TRY(this->parse_and());

    while (this->accept(token_kind::or_op)) {
        auto rhs = TRY(this->parse_and());

        retval = ast::or_expr{std::move(retval), std::move(rhs)};
    }

    return Ok(std::move(retval));
}

Result<ast::node, compile_error>
parser::parse_and()
{
    auto retval = TRY(this->parse_unary());

    while (this->accept(token_kind::and_op)) {
        auto rhs = TRY(this->parse_unary());

        retval = ast::and_expr{std::move(retval), std::move(rhs)};
    }

    return Ok(std::move(retval));
}

Result<ast::node, compile_error>
parser::parse_unary()
{
    if (this->accept(token_kind::not_op)) {
        auto expr = TRY(this->parse_unary());

        return Ok(ast::node{ast::not_expr{std::move(expr)}});
    }

    if (this->accept(token_kind::tilde)) {
        const auto* tok = TRY(this->expect_operand("after '~'"));

        return this->compile_regex(*tok);
    }

    return this->parse_comparison();
}

Result<ast::node, compile_error>
parser::parse_comparison()
{
    const auto* lhs_tok = TRY(this->expect_operand("to match against"));
    const auto* op_tok = this->peek();

    if (op_tok == nullptr || !op_tok->is_comparison()) {
        return Ok(to_literal(*lhs_tok));
    }
    this->p_pos += 1;

    ast::node lhs = lhs_tok->t_kind == token_kind::bare_word
        ? ast::node{ast::identifier{lhs_tok->t_value}}
        : ast::node{ast::string_literal{lhs_tok->t_value}};
    auto context = fmt::format(FMT_STRING("after '{}'"),
                               token_kind_name(op_tok->t_kind));
    const auto* rhs_tok = TRY(this->expect_operand(context.c_str()));
    auto op = to_comparison_op(op_tok->t_kind);
    ast::node rhs;

    if (op == ast::comparison_op::regex) {
        rhs = TRY(this->compile_regex(*rhs_tok));
    } else {
        rhs = to_literal(*rhs_tok);
    }

    return Ok(ast::node{ast::comparison{op, std::move(lhs), std::move(rhs)}});
}

Result<ast::node, compile_error>
parser::parse()
{
    this->p_tokens = TRY(tokenize(this->p_input));
    this->p_pos = 0;

    if (this->p_tokens.empty()) {
        return Err(compile_error{"empty expression", 0});
    }

    auto retval = TRY(this->parse_or());

    const auto* trailing = this->peek();
    if (trailing != nullptr) {
        return Err(compile_error{
            fmt::format(FMT_STRING("unexpected '{}'"), trailing->t_source),
            trailing->t_offset,
        });
    }

    log_debug("compiled filter: %s", ast::to_string(retval).c_str());

    return Ok(std::move(retval));
}

Result<ast::node, compile_error>
parse(string_fragment input, regex_cache& cache)
{
    parser p(input, cache);

    return p.parse();
}

}  // namespace lsift::filter
