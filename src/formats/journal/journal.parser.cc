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
 * @file journal.parser.cc
 */

#include <algorithm>

#include <ctype.h>

#include "journal.parser.hh"

#include "config.h"

namespace lsift::journal {

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

std::optional<entry>
parse_line(string_fragment line)
{
    entry retval;

    if (line.startswith("-- ")) {
        return std::nullopt;
    }

    auto ts_pair = line.split_while(is_not_space);
    if (!ts_pair || !isdigit((unsigned char) ts_pair->first.front())) {
        return std::nullopt;
    }
    retval.e_timestamp = ts_pair->first;

    auto host_pair = ts_pair->second.skip(is_space).split_while(is_not_space);
    if (!host_pair) {
        return std::nullopt;
    }
    retval.e_hostname = host_pair->first;

    auto rest = host_pair->second.skip(is_space);
    auto colon = rest.find(": "_frag);
    if (!colon) {
        // a trailing colon without a message
        if (rest.empty() || rest.back() != ':') {
            return std::nullopt;
        }
        colon = rest.length() - 1;
    }

    auto ident = rest.sub_range(0, colon.value());
    retval.e_message = rest.substr(std::min(colon.value() + 2, rest.length()));

    if (!ident.empty() && ident.back() == ']') {
        auto open = ident.find('[');

        if (open) {
            retval.e_pid = ident.sub_range(open.value() + 1, ident.length() - 1);
            ident = ident.sub_range(0, open.value());
        }
    }
    if (ident.empty()) {
        return std::nullopt;
    }
    retval.e_service = ident;

    return retval;
}

}  // namespace lsift::journal
