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
 * @file filter.ast.hh
 */

#ifndef lsift_filter_ast_hh
#define lsift_filter_ast_hh

#include <memory>
#include <string>

#include "mapbox/variant.hpp"
#include "pcrepp/pcre2pp.hh"

namespace lsift::filter::ast {

/**
 * Literal text.  When it stands alone in an expression, it matches any
 * record that contains it.
 */
struct string_literal {
    std::string sl_value;
};

struct number_literal {
    double nl_value{0.0};
    std::string nl_text;
};

/** The name of a field on the record being evaluated. */
struct identifier {
    std::string i_name;
};

struct regex_literal {
    std::shared_ptr<const pcre2pp::code> rl_code;
};

enum class comparison_op {
    eq,
    ne,
    gt,
    ge,
    lt,
    le,
    regex,
};

const char* comparison_op_name(comparison_op op);

struct comparison;
struct and_expr;
struct or_expr;
struct not_expr;

using node
    = mapbox::util::variant<string_literal,
                            number_literal,
                            identifier,
                            regex_literal,
                            mapbox::util::recursive_wrapper<comparison>,
                            mapbox::util::recursive_wrapper<and_expr>,
                            mapbox::util::recursive_wrapper<or_expr>,
                            mapbox::util::recursive_wrapper<not_expr>>;

struct comparison {
    comparison_op c_op;
    node c_left;
    node c_right;
};

struct and_expr {
    node ae_left;
    node ae_right;
};

struct or_expr {
    node oe_left;
    node oe_right;
};

struct not_expr {
    node ne_expr;
};

/**
 * Render the tree in a prefix form, like "(&& (== level \"ERROR\") ...)",
 * for logging and tests.
 */
std::string to_string(const node& n);

}  // namespace lsift::filter::ast

#endif
