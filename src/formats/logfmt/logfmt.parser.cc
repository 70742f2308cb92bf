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
 * @file logfmt.parser.cc
 */

#include <ctype.h>

#include "logfmt.parser.hh"

#include "config.h"

namespace lsift::logfmt {

parser::parser(string_fragment sf) : p_next_input(sf) {}

static bool
is_key_char(char ch)
{
    return ch != '=' && !isspace((unsigned char) ch);
}

static bool
is_space(char ch)
{
    return isspace((unsigned char) ch);
}

static bool
is_not_space(char ch)
{
    return !isspace((unsigned char) ch);
}

parser::step_result
parser::step()
{
    auto remaining = this->p_next_input.skip(is_space);

    if (remaining.empty()) {
        return end_of_input{};
    }

    auto key_pair = remaining.split_while(is_key_char);
    if (!key_pair) {
        // a token starting with '=' has no key, skip over it
        auto bare_pair = remaining.split_while(is_not_space);

        this->p_next_input = bare_pair->second;
        return bare_word{bare_pair->first};
    }

    auto key_frag = key_pair->first;
    if (!key_pair->second.startswith("=")) {
        this->p_next_input = key_pair->second;
        return bare_word{key_frag};
    }

    auto value_start = key_pair->second.substr(1);

    if (value_start.startswith("\"")) {
        string_fragment::quoted_string_body qsb;
        auto body = value_start.substr(1);
        auto quoted_pair = body.split_while(qsb);
        auto body_end = quoted_pair ? quoted_pair->second : body;
        if (body_end.startswith("\"")) {
            auto after_quote = body_end.substr(1);

            this->p_next_input = after_quote;
            return std::make_pair(
                key_frag,
                quoted_value{value_start.sub_range(
                    0, after_quote.sf_begin - value_start.sf_begin)});
        }
    }

    auto value_pair = value_start.split_while(is_not_space);
    if (value_pair) {
        this->p_next_input = value_pair->second;
        return std::make_pair(key_frag, unquoted_value{value_pair->first});
    }

    this->p_next_input = value_start;
    return std::make_pair(key_frag,
                          unquoted_value{value_start.sub_range(0, 0)});
}

std::string
parser::to_string(const value_type& val)
{
    return val.match(
        [](const unquoted_value& uv) { return uv.uv_value.to_string(); },
        [](const quoted_value& qv) {
            return qv.qv_value.sub_range(1, qv.qv_value.length() - 1)
                .to_unquoted_string();
        });
}

}  // namespace lsift::logfmt
