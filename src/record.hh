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
 * @file record.hh
 */

#ifndef lsift_record_hh
#define lsift_record_hh

#include <cstdint>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "base/string_fragment.hh"

namespace lsift {

using source_id_t = uint32_t;
using record_index_t = size_t;

constexpr record_index_t INVALID_RECORD_INDEX
    = std::numeric_limits<record_index_t>::max();

/**
 * An ordered mapping of field names to values.  Keys are unique and keep
 * the order in which they were first added.
 */
class field_map {
public:
    using value_type = std::pair<std::string, std::string>;
    using const_iterator = std::vector<value_type>::const_iterator;

    const std::string* find(string_fragment key) const;

    bool contains(string_fragment key) const
    {
        return this->find(key) != nullptr;
    }

    /**
     * Add the pair if the key is not already present.
     *
     * @return True if the pair was added.
     */
    bool insert(std::string key, std::string value);

    /**
     * Replace the value for an existing key in place or append a new pair.
     */
    void set(std::string key, std::string value);

    bool erase(string_fragment key);

    size_t size() const { return this->fm_values.size(); }

    bool empty() const { return this->fm_values.empty(); }

    const_iterator begin() const { return this->fm_values.cbegin(); }

    const_iterator end() const { return this->fm_values.cend(); }

    void clear() { this->fm_values.clear(); }

private:
    std::vector<value_type> fm_values;
};

/**
 * One line of input along with the fields extracted from it.
 */
class record {
public:
    record() = default;

    explicit record(std::string original, source_id_t sid = 0)
        : r_original(std::move(original)), r_source_id(sid)
    {
    }

    const std::string& get_original() const { return this->r_original; }

    string_fragment to_string_fragment() const
    {
        return string_fragment::from_str(this->r_original);
    }

    record_index_t get_index() const { return this->r_index; }

    source_id_t get_source_id() const { return this->r_source_id; }

    field_map& get_fields() { return this->r_fields; }

    const field_map& get_fields() const { return this->r_fields; }

    const std::set<std::string>& get_marks() const { return this->r_marks; }

    bool is_marked() const { return !this->r_marks.empty(); }

    bool has_mark(const std::string& color) const
    {
        return this->r_marks.count(color) > 0;
    }

    /**
     * Add the color to the record's marks or remove it if it is already
     * there.
     *
     * @return True if the mark is now set.
     */
    bool toggle_mark(const std::string& color);

private:
    friend class record_store;

    std::string r_original;
    field_map r_fields;
    record_index_t r_index{INVALID_RECORD_INDEX};
    source_id_t r_source_id{0};
    std::set<std::string> r_marks;
};

}  // namespace lsift

#endif
