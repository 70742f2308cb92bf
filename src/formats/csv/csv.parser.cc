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
 * @file csv.parser.cc
 */

#include "csv.parser.hh"

#include "config.h"

namespace lsift::csv {

char
guess_separator(string_fragment header_line)
{
    for (auto ch : header_line) {
        if (ch == ',' || ch == ';') {
            return ch;
        }
    }

    return ',';
}

std::vector<std::string>
split_row(string_fragment line, char separator)
{
    std::vector<std::string> retval;
    std::string current;
    bool in_quotes = false;
    bool in_escape = false;

    for (int lpc = 0; lpc < line.length(); lpc++) {
        auto ch = line[lpc];

        if (in_escape) {
            current.push_back(ch);
            in_escape = false;
        } else if (ch == '"') {
            if (in_quotes && lpc + 1 < line.length() && line[lpc + 1] == '"') {
                current.push_back('"');
                lpc += 1;
            } else {
                in_quotes = !in_quotes;
            }
        } else if (in_quotes) {
            current.push_back(ch);
        } else if (ch == separator) {
            retval.emplace_back(std::move(current));
            current.clear();
        } else if (ch == '\\') {
            in_escape = true;
        } else {
            current.push_back(ch);
        }
    }
    retval.emplace_back(std::move(current));

    return retval;
}

}  // namespace lsift::csv
