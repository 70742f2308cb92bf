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
 * @file ingest_source.cc
 */

#include "ingest_source.hh"

#include <errno.h>
#include <string.h>
#include <unistd.h>

#include "base/lsift_log.hh"
#include "config.h"
#include "fmt/format.h"

namespace lsift {

ingest_source::ingest_source(source_id_t sid,
                             std::string name,
                             const rule& r,
                             ingest_queue& queue)
    : is_id(sid), is_name(std::move(name)), is_rule(r), is_queue(queue)
{
    this->is_context.ec_source_name = this->is_name;
}

ingest_source::~ingest_source()
{
    this->stop();
}

Result<void, std::string>
ingest_source::start()
{
    if (this->is_future.valid()) {
        return Err(fmt::format(FMT_STRING("source {} is already running"),
                               this->is_name));
    }

    if (auto_fd::pipe(this->is_wakeup) == -1) {
        return Err(fmt::format(FMT_STRING("unable to create wakeup pipe -- {}"),
                               strerror(errno)));
    }
    this->is_wakeup[0].non_blocking();
    this->is_wakeup[0].close_on_exec();
    this->is_wakeup[1].close_on_exec();

    log_info("starting source %u: %s (rule %s)",
             this->is_id,
             this->is_name.c_str(),
             this->is_rule.get_name().c_str());
    this->is_looping_flag = true;
    this->is_future = std::async(std::launch::async, [this]() {
        this->run();
        log_info("source %u has stopped", this->is_id);
    });

    return Ok();
}

void
ingest_source::stop()
{
    if (!this->is_future.valid()) {
        return;
    }

    this->is_looping_flag = false;
    if (this->is_wakeup[1].has_value()) {
        static const char WAKEUP = '\0';

        log_perror(write(this->is_wakeup[1].get(), &WAKEUP, 1));
    }
    this->is_future.get();
    this->is_wakeup[0].reset();
    this->is_wakeup[1].reset();
}

bool
ingest_source::wait_for(std::vector<pollfd>& pollfds,
                        std::chrono::milliseconds timeout)
{
    pollfds.push_back(pollfd{this->is_wakeup[0].get(), POLLIN, 0});

    int rc;
    do {
        rc = poll(pollfds.data(), pollfds.size(), timeout.count());
    } while (rc == -1 && errno == EINTR);

    auto wakeup = pollfds.back();
    pollfds.pop_back();

    if (rc == -1) {
        log_error("%s: poll failed -- %s",
                  this->is_name.c_str(),
                  strerror(errno));
    }
    if (wakeup.revents & POLLIN) {
        char buffer[32];

        while (read(wakeup.fd, buffer, sizeof(buffer)) > 0) {
        }
    }

    return this->is_looping();
}

void
ingest_source::post_state(source_state state, std::string message)
{
    if (state == source_state::error) {
        log_error("%s: %s", this->is_name.c_str(), message.c_str());
    } else {
        log_info("%s: %s %s",
                 this->is_name.c_str(),
                 source_state_name(state),
                 message.c_str());
    }
    this->is_queue.push_state(this->is_id, state, std::move(message));
}

}  // namespace lsift
