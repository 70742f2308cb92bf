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
 * @file filter.eval.cc
 */

#include "filter.eval.hh"

#include <optional>

#include "base/string_util.hh"
#include "config.h"
#include "filter.parser.hh"

namespace lsift::filter {

namespace {

struct operand_value {
    std::string ov_text;
    std::optional<double> ov_number;
};

bool
contains_text(const record& rec, string_fragment needle)
{
    if (rec.to_string_fragment().find(needle)) {
        return true;
    }

    for (const auto& field : rec.get_fields()) {
        if (string_fragment::from_str(field.second).find(needle)) {
            return true;
        }
    }

    return false;
}

bool
regex_matches(const pcre2pp::code& code, string_fragment sf)
{
    return code.find_in(sf);
}

/**
 * Resolve one side of a comparison.  Identifiers that do not name a field
 * on the record resolve to nullopt.
 */
std::optional<operand_value>
resolve(const ast::node& n, const record& rec)
{
    return n.match(
        [](const ast::string_literal& sl) -> std::optional<operand_value> {
            return operand_value{
                sl.sl_value,
                parse_number(string_fragment::from_str(sl.sl_value)),
            };
        },
        [](const ast::number_literal& nl) -> std::optional<operand_value> {
            return operand_value{nl.nl_text, nl.nl_value};
        },
        [&rec](const ast::identifier& id) -> std::optional<operand_value> {
            const auto* value = rec.get_fields().find(id.i_name);

            if (value == nullptr) {
                return std::nullopt;
            }
            return operand_value{
                *value,
                parse_number(string_fragment::from_str(*value)),
            };
        },
        [](const auto&) -> std::optional<operand_value> {
            return std::nullopt;
        });
}

template<typename T>
bool
apply_op(ast::comparison_op op, const T& lhs, const T& rhs)
{
    switch (op) {
        case ast::comparison_op::eq:
            return lhs == rhs;
        case ast::comparison_op::ne:
            return lhs != rhs;
        case ast::comparison_op::gt:
            return lhs > rhs;
        case ast::comparison_op::ge:
            return lhs >= rhs;
        case ast::comparison_op::lt:
            return lhs < rhs;
        case ast::comparison_op::le:
            return lhs <= rhs;
        case ast::comparison_op::regex:
            break;
    }

    return false;
}

bool
evaluate_comparison(const ast::comparison& comp, const record& rec)
{
    auto lhs = resolve(comp.c_left, rec);
    if (!lhs) {
        return false;
    }

    if (comp.c_op == ast::comparison_op::regex) {
        if (!comp.c_right.is<ast::regex_literal>()) {
            return false;
        }

        const auto& rl = comp.c_right.get<ast::regex_literal>();
        return regex_matches(*rl.rl_code,
                             string_fragment::from_str(lhs->ov_text));
    }

    auto rhs = resolve(comp.c_right, rec);
    if (!rhs) {
        return false;
    }

    if (lhs->ov_number && rhs->ov_number) {
        return apply_op(
            comp.c_op, lhs->ov_number.value(), rhs->ov_number.value());
    }

    return apply_op(comp.c_op, lhs->ov_text, rhs->ov_text);
}

}  // namespace

bool
evaluate(const ast::node& expr, const record& rec)
{
    return expr.match(
        [&rec](const ast::string_literal& sl) {
            return contains_text(rec, string_fragment::from_str(sl.sl_value));
        },
        [&rec](const ast::number_literal& nl) {
            return contains_text(rec, string_fragment::from_str(nl.nl_text));
        },
        [&rec](const ast::identifier& id) {
            return rec.get_fields().contains(id.i_name);
        },
        [&rec](const ast::regex_literal& rl) {
            return regex_matches(*rl.rl_code, rec.to_string_fragment());
        },
        [&rec](const ast::comparison& comp) {
            return evaluate_comparison(comp, rec);
        },
        [&rec](const ast::and_expr& ae) {
            return evaluate(ae.ae_left, rec) && evaluate(ae.ae_right, rec);
        },
        [&rec](const ast::or_expr& oe) {
            return evaluate(oe.oe_left, rec) || evaluate(oe.oe_right, rec);
        },
        [&rec](const ast::not_expr& ne) {
            return !evaluate(ne.ne_expr, rec);
        });
}

Result<std::shared_ptr<const compiled_filter>, compile_error>
compiled_filter::compile(string_fragment text, regex_cache& cache)
{
    auto root = TRY(parse(text, cache));

    return Ok(std::shared_ptr<const compiled_filter>(
        std::make_shared<compiled_filter>(text.to_string(), std::move(root))));
}

}  // namespace lsift::filter
