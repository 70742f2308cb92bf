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
 * @file pcre2pp.cc
 */

#include "pcre2pp.hh"

#include "base/lsift_log.hh"
#include "config.h"

namespace lsift::pcre2pp {

static std::string
error_message(int error_code)
{
    PCRE2_UCHAR buffer[256];

    if (pcre2_get_error_message(error_code, buffer, sizeof(buffer)) < 0) {
        return "unknown PCRE2 error " + std::to_string(error_code);
    }

    return {(const char*) buffer};
}

std::string
compile_error::get_message() const
{
    return error_message(this->ce_code);
}

std::optional<string_fragment>
match_data::operator[](size_t index) const
{
    if (index >= this->md_count) {
        return std::nullopt;
    }

    const auto* ovector = pcre2_get_ovector_pointer(this->md_data.in());
    auto start = ovector[index * 2];
    auto stop = ovector[index * 2 + 1];
    if (start == PCRE2_UNSET || stop == PCRE2_UNSET) {
        return std::nullopt;
    }

    return this->md_input.sub_range((int) start, (int) stop);
}

code::code(auto_mem<pcre2_code> co, std::string pattern)
    : c_code(std::move(co)), c_pattern(std::move(pattern))
{
    uint32_t name_count = 0;
    uint32_t entry_size = 0;
    PCRE2_SPTR name_table = nullptr;

    pcre2_pattern_info(
        this->c_code.in(), PCRE2_INFO_CAPTURECOUNT, &this->c_capture_count);
    pcre2_pattern_info(this->c_code.in(), PCRE2_INFO_NAMECOUNT, &name_count);
    pcre2_pattern_info(
        this->c_code.in(), PCRE2_INFO_NAMEENTRYSIZE, &entry_size);
    pcre2_pattern_info(this->c_code.in(), PCRE2_INFO_NAMETABLE, &name_table);

    // each entry is a big-endian group number followed by the
    // NUL-terminated name
    for (uint32_t lpc = 0; lpc < name_count; lpc++) {
        const auto* entry = name_table + (lpc * entry_size);

        this->c_named_captures.emplace_back(named_capture{
            std::string((const char*) &entry[2]),
            ((uint32_t) entry[0] << 8) | entry[1],
        });
    }
}

Result<code, compile_error>
code::from(string_fragment sf, int options)
{
    compile_error ce;
    auto_mem<pcre2_code> co(pcre2_code_free,
                            pcre2_compile(sf.udata(),
                                          sf.length(),
                                          options | PCRE2_UTF,
                                          &ce.ce_code,
                                          &ce.ce_offset,
                                          nullptr));

    if (co.empty()) {
        ce.ce_pattern = sf.to_string();
        return Err(ce);
    }

    auto jit_rc = pcre2_jit_compile(co.in(), PCRE2_JIT_COMPLETE);
    if (jit_rc < 0) {
        log_debug("unable to JIT compile pattern (%d): %.*s",
                  jit_rc,
                  sf.length(),
                  sf.data());
    }

    return Ok(code{std::move(co), sf.to_string()});
}

bool
code::match(string_fragment in, match_data& md) const
{
    auto needed = this->c_capture_count + 1;

    if (md.md_capacity < needed) {
        md.md_data.reset(pcre2_match_data_create(needed, nullptr));
        md.md_capacity = needed;
    }

    md.md_input = in;
    md.md_count = 0;

    auto rc = pcre2_match(this->c_code.in(),
                          in.udata(),
                          in.length(),
                          0,
                          0,
                          md.md_data.in(),
                          nullptr);
    if (rc == PCRE2_ERROR_NOMATCH) {
        return false;
    }
    if (rc < 0) {
        log_error("pcre2_match failed for %s: %s",
                  this->c_pattern.c_str(),
                  error_message(rc).c_str());
        return false;
    }

    md.md_count = rc;
    return true;
}

bool
code::find_in(string_fragment in) const
{
    thread_local match_data md;

    return this->match(in, md);
}

}  // namespace lsift::pcre2pp
