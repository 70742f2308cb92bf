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
 * @file filter.ast.cc
 */

#include "filter.ast.hh"

#include "config.h"
#include "fmt/format.h"

namespace lsift::filter::ast {

const char*
comparison_op_name(comparison_op op)
{
    switch (op) {
        case comparison_op::eq:
            return "==";
        case comparison_op::ne:
            return "!=";
        case comparison_op::gt:
            return ">";
        case comparison_op::ge:
            return ">=";
        case comparison_op::lt:
            return "<";
        case comparison_op::le:
            return "<=";
        case comparison_op::regex:
            return "~";
    }

    return "?";
}

std::string
to_string(const node& n)
{
    return n.match(
        [](const string_literal& sl) {
            return fmt::format(FMT_STRING("\"{}\""), sl.sl_value);
        },
        [](const number_literal& nl) { return nl.nl_text; },
        [](const identifier& id) { return id.i_name; },
        [](const regex_literal& rl) {
            return fmt::format(FMT_STRING("/{}/"), rl.rl_code->get_pattern());
        },
        [](const comparison& comp) {
            return fmt::format(FMT_STRING("({} {} {})"),
                               comparison_op_name(comp.c_op),
                               to_string(comp.c_left),
                               to_string(comp.c_right));
        },
        [](const and_expr& ae) {
            return fmt::format(FMT_STRING("(&& {} {})"),
                               to_string(ae.ae_left),
                               to_string(ae.ae_right));
        },
        [](const or_expr& oe) {
            return fmt::format(FMT_STRING("(|| {} {})"),
                               to_string(oe.oe_left),
                               to_string(oe.oe_right));
        },
        [](const not_expr& ne) {
            return fmt::format(FMT_STRING("(! {})"), to_string(ne.ne_expr));
        });
}

}  // namespace lsift::filter::ast
