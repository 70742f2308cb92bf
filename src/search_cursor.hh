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
 * @file search_cursor.hh
 */

#ifndef lsift_search_cursor_hh
#define lsift_search_cursor_hh

#include <memory>
#include <optional>

#include "bookmarks.hh"
#include "filter.eval.hh"
#include "filtered_view.hh"
#include "record.hh"
#include "record_store.hh"

namespace lsift {

/**
 * Tracks the records in a view that match a search expression and a
 * current position among them.
 */
class search_cursor {
public:
    using filter_ptr = std::shared_ptr<const filter::compiled_filter>;

    /**
     * Start a new search over the rows currently in the view.
     */
    void set_predicate(filter_ptr pred,
                       const record_store& store,
                       const filtered_view& view);

    void clear();

    const filter_ptr& get_predicate() const { return this->sc_predicate; }

    /**
     * Check the rows added to the view since the last refresh.  A view that
     * shrank, because its filter changed or the store was cleared, causes
     * the matches to be recomputed.
     *
     * @return The number of new matches.
     */
    size_t refresh(const record_store& store, const filtered_view& view);

    /**
     * Move to the first match after the given store index, wrapping around
     * to the first match.
     *
     * @return The index of the match or nullopt if there are no matches, in
     * which case the cursor does not move.
     */
    std::optional<record_index_t> next(std::optional<record_index_t> from);

    std::optional<record_index_t> previous(std::optional<record_index_t> from);

    std::optional<record_index_t> next()
    {
        return this->next(this->sc_current);
    }

    std::optional<record_index_t> previous()
    {
        return this->previous(this->sc_current);
    }

    std::optional<record_index_t> get_current() const
    {
        return this->sc_current;
    }

    const bookmark_vector<record_index_t>& get_matches() const
    {
        return this->sc_matches;
    }

private:
    filter_ptr sc_predicate;
    bookmark_vector<record_index_t> sc_matches;
    std::optional<record_index_t> sc_current;
    size_t sc_rows_checked{0};
    filtered_view::filter_ptr sc_last_view_filter;
    uint64_t sc_generation{0};
};

}  // namespace lsift

#endif
