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
 * @file pcre2pp.hh
 */

#ifndef lsift_pcre2pp_hh
#define lsift_pcre2pp_hh

#define PCRE2_CODE_UNIT_WIDTH 8

#include <optional>
#include <string>
#include <vector>

#include <pcre2.h>
#include <stdio.h>

#include "base/auto_mem.hh"
#include "base/string_fragment.hh"
#include "result.h"

namespace lsift::pcre2pp {

struct compile_error {
    std::string ce_pattern;
    int ce_code{0};
    size_t ce_offset{0};

    std::string get_message() const;
};

struct named_capture {
    std::string nc_name;
    uint32_t nc_index{0};
};

class code;

/**
 * The captures from the last successful match.  A match_data can be reused
 * with any pattern, it is reallocated when the pattern has more captures
 * than it can hold.
 */
class match_data {
public:
    match_data() = default;

    /**
     * @return The text of the capture or nullopt if the group did not
     * participate in the match.
     */
    std::optional<string_fragment> operator[](size_t index) const;

    /** @return One more than the highest capture group that was set. */
    size_t get_count() const { return this->md_count; }

private:
    friend class code;

    auto_mem<pcre2_match_data> md_data{pcre2_match_data_free};
    uint32_t md_capacity{0};
    string_fragment md_input;
    size_t md_count{0};
};

/**
 * A compiled PCRE2 pattern.  Patterns are compiled in UTF mode and JIT
 * compiled where the platform supports it.
 */
class code {
public:
    static Result<code, compile_error> from(string_fragment sf,
                                            int options = 0);

    /**
     * Compile a pattern that is part of the program.  A failure is a bug, so
     * the error is printed before unwrap() gives up.
     */
    template<std::size_t N>
    static code from_const(const char (&str)[N], int options = 0)
    {
        auto res = from(string_fragment::from_const(str), options);

        if (res.isErr()) {
            fprintf(stderr,
                    "invalid built-in regex: %s -- %s\n",
                    str,
                    res.unwrapErr().get_message().c_str());
        }

        return res.unwrap();
    }

    const std::string& get_pattern() const { return this->c_pattern; }

    /**
     * @return The named groups in the order PCRE2 keeps them, which is
     * sorted by name.
     */
    const std::vector<named_capture>& get_named_captures() const
    {
        return this->c_named_captures;
    }

    /**
     * Search the input and store the captures in the given match data.
     * Errors from the matcher, like hitting the match limit, are logged
     * and reported as no match.
     */
    bool match(string_fragment in, match_data& md) const;

    /**
     * @return True if the pattern occurs anywhere in the input.
     */
    bool find_in(string_fragment in) const;

private:
    code(auto_mem<pcre2_code> co, std::string pattern);

    auto_mem<pcre2_code> c_code;
    std::string c_pattern;
    uint32_t c_capture_count{0};
    std::vector<named_capture> c_named_captures;
};

}  // namespace lsift::pcre2pp

#endif
