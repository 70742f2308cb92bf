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
 * @file regex_cache.cc
 */

#include "regex_cache.hh"

#include "base/lsift_log.hh"
#include "config.h"

namespace lsift {

Result<std::shared_ptr<const pcre2pp::code>, pcre2pp::compile_error>
regex_cache::get_regex(string_fragment pattern)
{
    auto key = pattern.to_string();

    {
        safe::WriteAccess<safe_state> st(this->rc_state);
        auto existing = st->s_regexes.find(key);

        if (existing) {
            st->s_stats.s_hits += 1;
            return Ok(existing);
        }
        st->s_stats.s_misses += 1;
    }

    // compiled outside of the lock, a concurrent insert of the same key wins
    auto compile_res = pcre2pp::code::from(pattern);
    if (compile_res.isErr()) {
        auto ce = compile_res.unwrapErr();

        log_warning("regex compile failed at %zu: %s -- %s",
                    ce.ce_offset,
                    key.c_str(),
                    ce.get_message().c_str());
        return Err(ce);
    }

    auto retval = std::make_shared<const pcre2pp::code>(compile_res.unwrap());
    {
        safe::WriteAccess<safe_state> st(this->rc_state);

        st->s_regexes.insert(key, retval, this->rc_capacity);
    }

    return Ok(retval);
}

Result<std::shared_ptr<const line_pattern>, std::string>
regex_cache::get_pattern(string_fragment tmpl)
{
    auto key = tmpl.to_string();

    {
        safe::WriteAccess<safe_state> st(this->rc_state);
        auto existing = st->s_patterns.find(key);

        if (existing) {
            st->s_stats.s_hits += 1;
            return Ok(existing);
        }
        st->s_stats.s_misses += 1;
    }

    auto compile_res = line_pattern::compile(tmpl);
    if (compile_res.isErr()) {
        return Err(compile_res.unwrapErr());
    }

    auto retval
        = std::make_shared<const line_pattern>(compile_res.unwrap());
    {
        safe::WriteAccess<safe_state> st(this->rc_state);

        st->s_patterns.insert(key, retval, this->rc_capacity);
    }

    return Ok(std::shared_ptr<const line_pattern>(retval));
}

regex_cache::stats
regex_cache::get_stats()
{
    safe::WriteAccess<safe_state> st(this->rc_state);
    auto retval = st->s_stats;

    retval.s_size = st->s_regexes.size() + st->s_patterns.size();

    return retval;
}

}  // namespace lsift
