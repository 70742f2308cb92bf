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
 * @file string_fragment.cc
 */

#include "string_fragment.hh"

#include <algorithm>

#include <ctype.h>
#include <string.h>

#include "config.h"

bool
string_fragment::startswith(const char* prefix) const
{
    auto prefix_len = (int) strlen(prefix);

    return prefix_len <= this->length()
        && memcmp(this->data(), prefix, prefix_len) == 0;
}

bool
string_fragment::endswith(const string_fragment& suffix) const
{
    return suffix.length() <= this->length()
        && memcmp(this->end() - suffix.length(), suffix.data(), suffix.length())
        == 0;
}

string_fragment
string_fragment::sub_range(int begin, int end) const
{
    auto len = this->length();

    begin = std::min(std::max(begin, 0), len);
    end = std::min(std::max(end, begin), len);

    return string_fragment{
        this->sf_string, this->sf_begin + begin, this->sf_begin + end};
}

std::optional<int>
string_fragment::find(const string_fragment& needle) const
{
    if (needle.empty()) {
        return 0;
    }

    const auto* hit
        = memmem(this->data(), this->length(), needle.data(), needle.length());
    if (hit == nullptr) {
        return std::nullopt;
    }

    return (int) ((const char*) hit - this->data());
}

string_fragment
string_fragment::trim() const
{
    auto is_ws = [](char ch) { return isspace((unsigned char) ch) != 0; };
    auto retval = this->skip(is_ws);

    while (!retval.empty() && is_ws(retval.back())) {
        retval.sf_end -= 1;
    }

    return retval;
}

std::string
string_fragment::to_unquoted_string() const
{
    std::string retval;
    bool in_escape = false;

    retval.reserve(this->length());
    for (auto ch : *this) {
        if (!in_escape) {
            if (ch == '\\') {
                in_escape = true;
            } else {
                retval.push_back(ch);
            }
            continue;
        }

        in_escape = false;
        switch (ch) {
            case 'n':
                retval.push_back('\n');
                break;
            case 't':
                retval.push_back('\t');
                break;
            case 'r':
                retval.push_back('\r');
                break;
            default:
                retval.push_back(ch);
                break;
        }
    }
    if (in_escape) {
        retval.push_back('\\');
    }

    return retval;
}
