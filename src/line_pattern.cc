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
 * @file line_pattern.cc
 */

#include "line_pattern.hh"

#include "config.h"
#include "fmt/format.h"

namespace lsift {

Result<line_pattern, std::string>
line_pattern::compile(string_fragment tmpl)
{
    line_pattern retval;
    std::string literal;

    if (tmpl.empty()) {
        return Err(std::string("empty template"));
    }

    retval.lp_template = tmpl.to_string();
    for (int lpc = 0; lpc < tmpl.length(); lpc++) {
        auto ch = tmpl[lpc];

        if (ch != '<') {
            literal.push_back(ch);
            continue;
        }

        auto name_start = lpc + 1;
        auto close = tmpl.substr(name_start).find('>');
        if (!close) {
            return Err(fmt::format(
                FMT_STRING("unterminated slot starting at offset {}"), lpc));
        }

        auto name = tmpl.sub_range(name_start, name_start + close.value());
        if (name.empty()) {
            return Err(
                fmt::format(FMT_STRING("empty slot name at offset {}"), lpc));
        }
        if (name.find('<')) {
            return Err(fmt::format(
                FMT_STRING("unterminated slot starting at offset {}"), lpc));
        }
        if (literal.empty() && !retval.lp_segments.empty()
            && retval.lp_segments.back().s_is_slot)
        {
            return Err(fmt::format(
                FMT_STRING("slot <{}> at offset {} immediately follows "
                           "another slot"),
                name,
                lpc));
        }
        if (!literal.empty()) {
            retval.lp_segments.emplace_back(segment{false, std::move(literal)});
            literal.clear();
        }
        retval.lp_segments.emplace_back(segment{true, name.to_string()});
        lpc = name_start + close.value();
    }
    if (!literal.empty()) {
        retval.lp_segments.emplace_back(segment{false, std::move(literal)});
    }

    return Ok(std::move(retval));
}

bool
line_pattern::match(string_fragment line,
                    std::vector<capture>& caps_out) const
{
    auto orig_size = caps_out.size();
    int pos = 0;

    for (size_t lpc = 0; lpc < this->lp_segments.size(); lpc++) {
        const auto& seg = this->lp_segments[lpc];
        auto is_last = (lpc + 1) == this->lp_segments.size();
        auto rest = line.substr(pos);

        if (!seg.s_is_slot) {
            auto lit = string_fragment::from_str(seg.s_text);

            if (is_last ? rest != lit : !rest.startswith(seg.s_text.c_str())) {
                caps_out.resize(orig_size);
                return false;
            }
            pos += lit.length();
            continue;
        }

        int value_end;
        if (is_last) {
            value_end = line.length();
        } else {
            const auto& next_lit = this->lp_segments[lpc + 1].s_text;
            auto lit = string_fragment::from_str(next_lit);

            if (lpc + 2 == this->lp_segments.size()) {
                // the trailing literal is anchored to the end of the line
                if (!rest.endswith(lit) || rest.length() < lit.length()) {
                    caps_out.resize(orig_size);
                    return false;
                }
                value_end = line.length() - lit.length();
            } else {
                auto hit = rest.find(lit);

                if (!hit) {
                    caps_out.resize(orig_size);
                    return false;
                }
                value_end = pos + hit.value();
            }
        }

        if (seg.s_text != "_") {
            caps_out.emplace_back(string_fragment::from_str(seg.s_text),
                                  line.sub_range(pos, value_end));
        }
        pos = value_end;
    }

    if (pos != line.length()) {
        caps_out.resize(orig_size);
        return false;
    }

    return true;
}

}  // namespace lsift
