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
 * @file filtered_view.hh
 */

#ifndef lsift_filtered_view_hh
#define lsift_filtered_view_hh

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "filter.eval.hh"
#include "record.hh"
#include "record_store.hh"

namespace lsift {

/**
 * The store indexes of the records that satisfy the active filter, in store
 * order.  With no filter, every record is included.  The view remembers how
 * far into the store it has looked so that refresh() only needs to check
 * records that were appended since the last call.
 */
class filtered_view {
public:
    using filter_ptr = std::shared_ptr<const filter::compiled_filter>;

    /**
     * Replace the filter and rebuild the view from the whole store.
     */
    void set_filter(filter_ptr filt, const record_store& store);

    void clear_filter(const record_store& store)
    {
        this->set_filter(nullptr, store);
    }

    const filter_ptr& get_filter() const { return this->fv_filter; }

    /**
     * Check the records appended to the store since the last refresh.  If
     * the store was cleared, the view is rebuilt.
     *
     * @return The number of indexes added to the view.
     */
    size_t refresh(const record_store& store);

    size_t size() const { return this->fv_indexes.size(); }

    bool empty() const { return this->fv_indexes.empty(); }

    std::optional<record_index_t> at(size_t row) const
    {
        if (row >= this->fv_indexes.size()) {
            return std::nullopt;
        }
        return this->fv_indexes[row];
    }

    const std::vector<record_index_t>& get_indexes() const
    {
        return this->fv_indexes;
    }

    /**
     * @return The number of store records that have been checked.
     */
    size_t get_evaluated_count() const { return this->fv_evaluated; }

private:
    void reset();

    filter_ptr fv_filter;
    std::vector<record_index_t> fv_indexes;
    size_t fv_evaluated{0};
    uint64_t fv_generation{0};
};

}  // namespace lsift

#endif
