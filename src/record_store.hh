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
 * @file record_store.hh
 */

#ifndef lsift_record_store_hh
#define lsift_record_store_hh

#include <cstdint>
#include <deque>
#include <optional>
#include <string>

#include "bookmarks.hh"
#include "record.hh"

namespace lsift {

/**
 * Append-only sequence of records.  Indexes are assigned on append, start
 * at zero and are never reused until the store is cleared.  The store is
 * only touched from the consuming thread, producers hand their records over
 * through an ingest_queue.
 */
class record_store {
public:
    record_store() = default;

    record_store(const record_store&) = delete;
    record_store& operator=(const record_store&) = delete;

    /**
     * @return The index assigned to the record.
     */
    record_index_t append(record rec);

    const record& get(record_index_t index) const
    {
        require_lt(index, this->rs_records.size());

        return this->rs_records[index];
    }

    /**
     * @return The record at the given index or nullptr if it is out of range.
     */
    const record* find(record_index_t index) const
    {
        if (index >= this->rs_records.size()) {
            return nullptr;
        }
        return &this->rs_records[index];
    }

    size_t size() const { return this->rs_records.size(); }

    bool empty() const { return this->rs_records.empty(); }

    /**
     * Drop all records and restart indexing at zero.  Views built on the
     * previous generation must be rebuilt.
     */
    void clear();

    /**
     * Bumped on every clear() so views can tell their indexes are stale.
     */
    uint64_t generation() const { return this->rs_generation; }

    /**
     * Set or, when the value is nullopt, remove a field.
     *
     * @return False if the index is out of range or a removed key did not
     * exist.
     */
    bool update_field(record_index_t index,
                      const std::string& key,
                      std::optional<std::string> value);

    /**
     * @return The new state of the mark or nullopt if the index is out of
     * range.
     */
    std::optional<bool> toggle_mark(record_index_t index,
                                    const std::string& color);

    std::optional<record_index_t> next_mark(record_index_t from) const
    {
        return this->rs_marked.next_wrapped(from);
    }

    std::optional<record_index_t> prev_mark(record_index_t from) const
    {
        return this->rs_marked.prev_wrapped(from);
    }

    const bookmark_vector<record_index_t>& marked_indices() const
    {
        return this->rs_marked;
    }

private:
    std::deque<record> rs_records;
    bookmark_vector<record_index_t> rs_marked;
    uint64_t rs_generation{0};
};

}  // namespace lsift

#endif
