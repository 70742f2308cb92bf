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
 * @file line_pattern.hh
 */

#ifndef lsift_line_pattern_hh
#define lsift_line_pattern_hh

#include <string>
#include <utility>
#include <vector>

#include "base/string_fragment.hh"
#include "result.h"

namespace lsift {

/**
 * A line template like `<ip> - <user> [<time>] "<request>"`, compiled into
 * an alternating sequence of literal separators and named slots.  A slot
 * named `_` is matched but not captured.
 */
class line_pattern {
public:
    struct segment {
        bool s_is_slot{false};
        std::string s_text;
    };

    using capture = std::pair<string_fragment, string_fragment>;

    static Result<line_pattern, std::string> compile(string_fragment tmpl);

    /**
     * Match the whole line against the template.  On success, the slot
     * values are appended to the given vector as (name, value) pairs.
     * Nothing is appended when the line does not match.
     */
    bool match(string_fragment line, std::vector<capture>& caps_out) const;

    const std::string& get_template() const { return this->lp_template; }

    const std::vector<segment>& get_segments() const
    {
        return this->lp_segments;
    }

private:
    std::string lp_template;
    std::vector<segment> lp_segments;
};

}  // namespace lsift

#endif
