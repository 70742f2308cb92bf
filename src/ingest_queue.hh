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
 * @file ingest_queue.hh
 */

#ifndef lsift_ingest_queue_hh
#define lsift_ingest_queue_hh

#include <deque>
#include <string>
#include <vector>

#include "mapbox/variant.hpp"
#include "record.hh"
#include "safe/safe.h"

namespace lsift {

enum class source_state {
    running,
    finished,
    truncated,
    error,
};

const char* source_state_name(source_state state);

/**
 * Records extracted by a producer, in the order the lines were read.
 */
struct record_batch {
    std::vector<record> rb_records;
    /** The running total of invalid UTF-8 sequences seen by the source. */
    size_t rb_encoding_errors{0};
};

struct state_change {
    source_state sc_state;
    std::string sc_message;
};

struct ingest_event {
    source_id_t ie_source;
    mapbox::util::variant<record_batch, state_change> ie_payload;
};

/**
 * The hand-off point between the producers and the thread that owns the
 * record store.  Producers may push from any thread.  Events from a single
 * producer are drained in the order they were pushed.
 */
class ingest_queue {
public:
    void push_records(source_id_t sid,
                      std::vector<record> records,
                      size_t encoding_errors);

    void push_state(source_id_t sid,
                    source_state state,
                    std::string message = "");

    /**
     * Take all of the pending events without blocking.
     */
    std::deque<ingest_event> drain();

    bool empty() const;

private:
    using safe_events = safe::Safe<std::deque<ingest_event>>;

    safe_events iq_events;
};

}  // namespace lsift

#endif
