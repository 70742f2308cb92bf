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
 * @file string_util.cc
 */

#include "string_util.hh"

#include <ctype.h>

#include "config.h"
#include "scn/scan.h"

namespace {

/**
 * @return The length of the valid UTF-8 sequence at the start of the given
 * bytes or zero if the sequence is invalid.
 */
size_t
valid_utf8_length(const unsigned char* bytes, size_t avail)
{
    auto lead = bytes[0];
    size_t expected;
    uint32_t min_cp;
    uint32_t cp;

    if (lead < 0x80) {
        return 1;
    }
    if ((lead & 0xe0) == 0xc0) {
        expected = 2;
        min_cp = 0x80;
        cp = lead & 0x1f;
    } else if ((lead & 0xf0) == 0xe0) {
        expected = 3;
        min_cp = 0x800;
        cp = lead & 0x0f;
    } else if ((lead & 0xf8) == 0xf0) {
        expected = 4;
        min_cp = 0x10000;
        cp = lead & 0x07;
    } else {
        return 0;
    }

    if (expected > avail) {
        return 0;
    }
    for (size_t lpc = 1; lpc < expected; lpc++) {
        if ((bytes[lpc] & 0xc0) != 0x80) {
            return 0;
        }
        cp = (cp << 6) | (bytes[lpc] & 0x3f);
    }
    if (cp < min_cp || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) {
        return 0;
    }

    return expected;
}

}  // namespace

size_t
scrub_to_utf8(std::string& str)
{
    static constexpr char REPLACEMENT[] = "\xef\xbf\xbd";

    const auto* bytes = (const unsigned char*) str.data();
    size_t retval = 0;
    size_t index = 0;

    while (index < str.size()) {
        auto valid_len = valid_utf8_length(&bytes[index], str.size() - index);

        if (valid_len == 0) {
            break;
        }
        index += valid_len;
    }
    if (index == str.size()) {
        return 0;
    }

    std::string scrubbed;

    scrubbed.reserve(str.size() + 8);
    scrubbed.append(str, 0, index);
    while (index < str.size()) {
        auto valid_len = valid_utf8_length(&bytes[index], str.size() - index);

        if (valid_len == 0) {
            scrubbed.append(REPLACEMENT);
            retval += 1;
            index += 1;
            // swallow the rest of a broken sequence
            while (index < str.size() && (bytes[index] & 0xc0) == 0x80) {
                index += 1;
            }
        } else {
            scrubbed.append(str, index, valid_len);
            index += valid_len;
        }
    }
    str = std::move(scrubbed);

    return retval;
}

std::optional<double>
parse_number(string_fragment sf)
{
    if (sf.empty()) {
        return std::nullopt;
    }

    auto lead = sf.front();
    if (!isdigit((unsigned char) lead) && lead != '-' && lead != '+'
        && lead != '.')
    {
        return std::nullopt;
    }

    auto scan_res = scn::scan_value<double>(sf.to_string_view());
    if (scan_res && scan_res->range().empty()) {
        return scan_res->value();
    }

    return std::nullopt;
}
