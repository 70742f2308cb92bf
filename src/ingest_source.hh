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
 * @file ingest_source.hh
 */

#ifndef lsift_ingest_source_hh
#define lsift_ingest_source_hh

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <vector>

#include <poll.h>

#include "base/auto_fd.hh"
#include "field_extractor.hh"
#include "ingest_queue.hh"
#include "record.hh"
#include "result.h"
#include "rule.hh"

namespace lsift {

/**
 * A producer of records that runs on its own thread and hands its output
 * to an ingest_queue.  Subclasses implement run() and should check
 * is_looping() between reads.  stop() can be called from any thread and
 * waits for run() to return.
 */
class ingest_source {
public:
    ingest_source(source_id_t sid,
                  std::string name,
                  const rule& r,
                  ingest_queue& queue);

    ingest_source(const ingest_source&) = delete;
    ingest_source& operator=(const ingest_source&) = delete;

    virtual ~ingest_source();

    Result<void, std::string> start();

    /**
     * Ask the thread to finish and wait for it.  Safe to call more than
     * once.
     */
    void stop();

    source_id_t get_id() const { return this->is_id; }

    const std::string& get_name() const { return this->is_name; }

    const rule& get_rule() const { return this->is_rule; }

    bool is_looping() const { return this->is_looping_flag.load(); }

protected:
    virtual void run() = 0;

    /**
     * Wait until one of the given descriptors is readable, the timeout
     * expires or stop() is called.  The revents of the descriptors are
     * updated.
     *
     * @return False if the source is being stopped.
     */
    bool wait_for(std::vector<pollfd>& pollfds,
                  std::chrono::milliseconds timeout);

    bool wait_for(std::chrono::milliseconds timeout)
    {
        std::vector<pollfd> none;

        return this->wait_for(none, timeout);
    }

    void post_records(std::vector<record> records, size_t encoding_errors)
    {
        this->is_queue.push_records(
            this->is_id, std::move(records), encoding_errors);
    }

    void post_state(source_state state, std::string message = "");

    const std::atomic<bool>& looping_flag() const
    {
        return this->is_looping_flag;
    }

    extract_context is_context;

private:
    source_id_t is_id;
    std::string is_name;
    const rule& is_rule;
    ingest_queue& is_queue;
    std::atomic<bool> is_looping_flag{false};
    auto_fd is_wakeup[2];
    std::future<void> is_future;
};

}  // namespace lsift

#endif
