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
 * @file stream_looper.cc
 */

#include <chrono>

#include "stream_looper.hh"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

#include "base/lsift_log.hh"
#include "bulk_loader.hh"
#include "config.h"
#include "fmt/format.h"

using namespace std::chrono_literals;

namespace lsift {

static const auto STREAM_FIELD = std::string("stream");

stream_looper::stream_looper(source_id_t sid,
                             std::string name,
                             const rule& r,
                             ingest_queue& queue)
    : ingest_source(sid, std::move(name), r, queue)
{
}

stream_looper::~stream_looper()
{
    this->stop();
}

std::unique_ptr<stream_looper>
stream_looper::for_fd(source_id_t sid,
                      std::string name,
                      auto_fd fd,
                      const rule& r,
                      ingest_queue& queue)
{
    std::unique_ptr<stream_looper> retval(
        new stream_looper(sid, std::move(name), r, queue));

    retval->sl_streams.emplace_back(stream{line_buffer(std::move(fd))});

    return retval;
}

Result<std::unique_ptr<stream_looper>, std::string>
stream_looper::for_command(source_id_t sid,
                           std::string name,
                           const std::vector<std::string>& argv,
                           const rule& r,
                           ingest_queue& queue)
{
    if (argv.empty()) {
        return Err(std::string("no command given"));
    }

    std::vector<char*> args;
    for (const auto& arg : argv) {
        args.emplace_back(const_cast<char*>(arg.c_str()));
    }
    args.emplace_back(nullptr);

    auto out_pipe = TRY(auto_pipe::for_child_output(STDOUT_FILENO));
    auto err_pipe = TRY(auto_pipe::for_child_output(STDERR_FILENO));
    auto child = TRY(lsift::pid::from_fork());

    out_pipe.after_fork(child.in());
    err_pipe.after_fork(child.in());

    if (child.in_child()) {
        auto dev_null = open("/dev/null", O_RDONLY);

        if (dev_null != -1) {
            dup2(dev_null, STDIN_FILENO);
        }

        execvp(args[0], args.data());
        fprintf(stderr,
                "unable to execute %s -- %s\n",
                args[0],
                strerror(errno));
        _exit(127);
    }

    std::unique_ptr<stream_looper> retval(
        new stream_looper(sid, std::move(name), r, queue));

    retval->sl_streams.emplace_back(
        stream{line_buffer(std::move(out_pipe.read_end())), false});
    retval->sl_streams.emplace_back(
        stream{line_buffer(std::move(err_pipe.read_end())), true});
    retval->sl_child = std::move(child);

    return Ok(std::move(retval));
}

record
stream_looper::make_record(std::string line, bool is_stderr)
{
    auto retval = extract_record(
        this->get_rule(), this->is_context, std::move(line), this->get_id());

    if (is_stderr) {
        retval.get_fields().insert(STREAM_FIELD, "stderr");
    }

    return retval;
}

size_t
stream_looper::get_encoding_errors() const
{
    size_t retval = 0;

    for (const auto& st : this->sl_streams) {
        retval += st.s_buffer.get_encoding_errors();
    }

    return retval;
}

void
stream_looper::wait_for_exit()
{
    while (this->sl_child) {
        auto poll_res = std::move(this->sl_child.value()).poll();

        if (poll_res.is<auto_pid<process_state::finished>>()) {
            auto& finished = poll_res.get<auto_pid<process_state::finished>>();
            auto status = finished.exit_description();
            record exit_rec(fmt::format(FMT_STRING("EXIT: {}"), status),
                            this->get_id());
            auto& fields = exit_rec.get_fields();

            fields.insert("filename", this->get_name());
            fields.insert(STREAM_FIELD, "stderr");
            exit_rec.toggle_mark("red");

            std::vector<record> records;
            records.emplace_back(std::move(exit_rec));
            this->post_records(std::move(records), this->get_encoding_errors());
            this->post_state(source_state::finished, status);
            this->sl_child = std::nullopt;
            return;
        }

        this->sl_child = std::move(
            poll_res.get<auto_pid<process_state::running>>());
        if (!this->wait_for(50ms)) {
            return;
        }
    }
}

void
stream_looper::run()
{
    std::vector<pollfd> pollfds;

    while (this->is_looping()) {
        pollfds.clear();
        for (const auto& st : this->sl_streams) {
            if (st.s_open) {
                pollfds.push_back(pollfd{st.s_buffer.get_fd(), POLLIN, 0});
            }
        }
        if (pollfds.empty()) {
            break;
        }

        if (!this->wait_for(pollfds, -1ms)) {
            return;
        }

        std::vector<record> records;
        for (auto& st : this->sl_streams) {
            if (!st.s_open) {
                continue;
            }

            auto ready = false;
            for (const auto& pfd : pollfds) {
                if (pfd.fd == st.s_buffer.get_fd()
                    && (pfd.revents & (POLLIN | POLLHUP | POLLERR)))
                {
                    ready = true;
                }
            }
            if (!ready) {
                continue;
            }

            auto fill_res = st.s_buffer.fill();
            if (fill_res.isErr()) {
                this->post_records(std::move(records),
                                   this->get_encoding_errors());
                this->post_state(source_state::error, fill_res.unwrapErr());
                return;
            }

            while (true) {
                auto line = st.s_buffer.pop_line();

                if (!line) {
                    break;
                }
                records.emplace_back(
                    this->make_record(std::move(line.value()), st.s_is_stderr));
            }
            if (fill_res.unwrap() == 0) {
                auto partial = st.s_buffer.pop_partial();

                if (partial) {
                    records.emplace_back(this->make_record(
                        std::move(partial.value()), st.s_is_stderr));
                }
                st.s_open = false;
            }
        }
        this->post_records(std::move(records), this->get_encoding_errors());
    }

    if (this->sl_child) {
        this->wait_for_exit();
    } else if (this->is_looping()) {
        this->post_state(source_state::finished);
    }
}

}  // namespace lsift
