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
 * @file ingest_queue.cc
 */

#include "ingest_queue.hh"

#include "config.h"

namespace lsift {

const char*
source_state_name(source_state state)
{
    switch (state) {
        case source_state::running:
            return "running";
        case source_state::finished:
            return "finished";
        case source_state::truncated:
            return "truncated";
        case source_state::error:
            return "error";
    }

    return "unknown";
}

void
ingest_queue::push_records(source_id_t sid,
                           std::vector<record> records,
                           size_t encoding_errors)
{
    if (records.empty()) {
        return;
    }

    safe::WriteAccess<safe_events> events(this->iq_events);

    events->emplace_back(ingest_event{
        sid,
        record_batch{std::move(records), encoding_errors},
    });
}

void
ingest_queue::push_state(source_id_t sid,
                         source_state state,
                         std::string message)
{
    safe::WriteAccess<safe_events> events(this->iq_events);

    events->emplace_back(ingest_event{
        sid,
        state_change{state, std::move(message)},
    });
}

std::deque<ingest_event>
ingest_queue::drain()
{
    std::deque<ingest_event> retval;
    safe::WriteAccess<safe_events> events(this->iq_events);

    retval.swap(*events);

    return retval;
}

bool
ingest_queue::empty() const
{
    safe::ReadAccess<safe_events> events(this->iq_events);

    return events->empty();
}

}  // namespace lsift
