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
 * @file stream_looper.hh
 */

#ifndef lsift_stream_looper_hh
#define lsift_stream_looper_hh

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "base/auto_fd.hh"
#include "base/auto_pid.hh"
#include "ingest_source.hh"
#include "line_buffer.hh"
#include "result.h"

namespace lsift {

/**
 * Reads lines from a pipe, standard input or the output of a child process
 * and extracts them one at a time as they arrive.
 */
class stream_looper final : public ingest_source {
public:
    static std::unique_ptr<stream_looper> for_fd(source_id_t sid,
                                                 std::string name,
                                                 auto_fd fd,
                                                 const rule& r,
                                                 ingest_queue& queue);

    /**
     * Start the command in its own process group with its standard output
     * and error connected to this looper.  Lines from the error stream are
     * given a "stream" field with the value "stderr".  When the command
     * exits, a record with the exit status is added.
     */
    static Result<std::unique_ptr<stream_looper>, std::string> for_command(
        source_id_t sid,
        std::string name,
        const std::vector<std::string>& argv,
        const rule& r,
        ingest_queue& queue);

    ~stream_looper() override;

    std::optional<pid_t> get_child_pid() const
    {
        if (this->sl_child) {
            return this->sl_child->in();
        }
        return std::nullopt;
    }

protected:
    void run() override;

private:
    struct stream {
        line_buffer s_buffer;
        bool s_is_stderr{false};
        bool s_open{true};
    };

    stream_looper(source_id_t sid,
                  std::string name,
                  const rule& r,
                  ingest_queue& queue);

    record make_record(std::string line, bool is_stderr);
    size_t get_encoding_errors() const;
    void wait_for_exit();

    std::vector<stream> sl_streams;
    std::optional<auto_pid<process_state::running>> sl_child;
};

}  // namespace lsift

#endif
