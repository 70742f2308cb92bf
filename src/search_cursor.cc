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
 * @file search_cursor.cc
 */

#include "search_cursor.hh"

#include "base/lsift_log.hh"
#include "config.h"

namespace lsift {

void
search_cursor::set_predicate(filter_ptr pred,
                             const record_store& store,
                             const filtered_view& view)
{
    this->clear();
    this->sc_predicate = std::move(pred);
    this->refresh(store, view);

    if (this->sc_predicate) {
        log_info("search %s: %zu matches",
                 this->sc_predicate->get_text().c_str(),
                 this->sc_matches.size());
    }
}

void
search_cursor::clear()
{
    this->sc_predicate.reset();
    this->sc_matches.clear();
    this->sc_current = std::nullopt;
    this->sc_rows_checked = 0;
    this->sc_last_view_filter.reset();
}

size_t
search_cursor::refresh(const record_store& store, const filtered_view& view)
{
    if (!this->sc_predicate) {
        return 0;
    }

    if (this->sc_generation != store.generation()
        || this->sc_last_view_filter != view.get_filter()
        || view.size() < this->sc_rows_checked)
    {
        this->sc_matches.clear();
        this->sc_rows_checked = 0;
        this->sc_generation = store.generation();
        this->sc_last_view_filter = view.get_filter();
        if (this->sc_current && !store.find(this->sc_current.value())) {
            this->sc_current = std::nullopt;
        }
    }

    auto before = this->sc_matches.size();
    const auto& rows = view.get_indexes();
    for (; this->sc_rows_checked < rows.size(); this->sc_rows_checked++) {
        auto index = rows[this->sc_rows_checked];

        if (this->sc_predicate->matches(store.get(index))) {
            this->sc_matches.insert_once(index);
        }
    }

    return this->sc_matches.size() - before;
}

std::optional<record_index_t>
search_cursor::next(std::optional<record_index_t> from)
{
    if (this->sc_matches.empty()) {
        return std::nullopt;
    }

    std::optional<record_index_t> retval;
    if (from) {
        retval = this->sc_matches.next_wrapped(from.value());
    } else {
        retval = this->sc_matches.front();
    }
    this->sc_current = retval;

    return retval;
}

std::optional<record_index_t>
search_cursor::previous(std::optional<record_index_t> from)
{
    if (this->sc_matches.empty()) {
        return std::nullopt;
    }

    std::optional<record_index_t> retval;
    if (from) {
        retval = this->sc_matches.prev_wrapped(from.value());
    } else {
        retval = this->sc_matches.back();
    }
    this->sc_current = retval;

    return retval;
}

}  // namespace lsift
