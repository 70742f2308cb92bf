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
 * @file filtered_view.cc
 */

#include "filtered_view.hh"

#include "base/lsift_log.hh"
#include "config.h"

namespace lsift {

void
filtered_view::reset()
{
    this->fv_indexes.clear();
    this->fv_evaluated = 0;
}

void
filtered_view::set_filter(filter_ptr filt, const record_store& store)
{
    this->fv_filter = std::move(filt);
    this->reset();
    this->fv_generation = store.generation();
    this->refresh(store);

    log_info("filter %s: %zu of %zu records",
             this->fv_filter ? this->fv_filter->get_text().c_str() : "<none>",
             this->fv_indexes.size(),
             store.size());
}

size_t
filtered_view::refresh(const record_store& store)
{
    if (this->fv_generation != store.generation()) {
        log_debug("store generation changed, rebuilding view");
        this->reset();
        this->fv_generation = store.generation();
    }

    auto before = this->fv_indexes.size();
    for (; this->fv_evaluated < store.size(); this->fv_evaluated++) {
        auto index = this->fv_evaluated;

        if (!this->fv_filter || this->fv_filter->matches(store.get(index))) {
            this->fv_indexes.emplace_back(index);
        }
    }

    return this->fv_indexes.size() - before;
}

}  // namespace lsift
