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
 * @file record.cc
 */

#include <algorithm>

#include "record.hh"

#include "config.h"

namespace lsift {

const std::string*
field_map::find(string_fragment key) const
{
    for (const auto& pair : this->fm_values) {
        if (key == pair.first) {
            return &pair.second;
        }
    }

    return nullptr;
}

bool
field_map::insert(std::string key, std::string value)
{
    if (this->contains(key)) {
        return false;
    }

    this->fm_values.emplace_back(std::move(key), std::move(value));
    return true;
}

void
field_map::set(std::string key, std::string value)
{
    for (auto& pair : this->fm_values) {
        if (pair.first == key) {
            pair.second = std::move(value);
            return;
        }
    }

    this->fm_values.emplace_back(std::move(key), std::move(value));
}

bool
field_map::erase(string_fragment key)
{
    auto iter = std::find_if(
        this->fm_values.begin(),
        this->fm_values.end(),
        [&key](const value_type& pair) { return key == pair.first; });

    if (iter == this->fm_values.end()) {
        return false;
    }

    this->fm_values.erase(iter);
    return true;
}

bool
record::toggle_mark(const std::string& color)
{
    auto iter = this->r_marks.find(color);

    if (iter != this->r_marks.end()) {
        this->r_marks.erase(iter);
        return false;
    }

    this->r_marks.insert(color);
    return true;
}

}  // namespace lsift
