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
 * @file record_store.cc
 */

#include <cinttypes>

#include "record_store.hh"

#include "base/lsift_log.hh"
#include "config.h"

namespace lsift {

record_index_t
record_store::append(record rec)
{
    auto retval = this->rs_records.size();

    rec.r_index = retval;
    if (rec.is_marked()) {
        this->rs_marked.insert_once(retval);
    }
    this->rs_records.emplace_back(std::move(rec));

    return retval;
}

void
record_store::clear()
{
    log_info("clearing %zu records from generation %" PRIu64,
             this->rs_records.size(),
             this->rs_generation);
    this->rs_records.clear();
    this->rs_marked.clear();
    this->rs_generation += 1;
}

bool
record_store::update_field(record_index_t index,
                           const std::string& key,
                           std::optional<std::string> value)
{
    if (index >= this->rs_records.size()) {
        log_warning("update_field: index %zu is out of range", index);
        return false;
    }

    auto& fields = this->rs_records[index].get_fields();
    if (!value) {
        return fields.erase(key);
    }

    fields.set(key, std::move(value.value()));
    return true;
}

std::optional<bool>
record_store::toggle_mark(record_index_t index, const std::string& color)
{
    if (index >= this->rs_records.size()) {
        return std::nullopt;
    }

    auto& rec = this->rs_records[index];
    auto retval = rec.toggle_mark(color);

    if (rec.is_marked()) {
        this->rs_marked.insert_once(index);
    } else {
        this->rs_marked.erase_once(index);
    }

    return retval;
}

}  // namespace lsift
