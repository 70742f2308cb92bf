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
 * @file file_tailer.hh
 */

#ifndef lsift_file_tailer_hh
#define lsift_file_tailer_hh

#include <chrono>
#include <filesystem>
#include <optional>

#include <sys/types.h>

#include "ingest_source.hh"
#include "line_buffer.hh"

namespace lsift {

struct tail_options {
    /**
     * When the file shrinks or is replaced, read it again from the start
     * instead of stopping.
     */
    bool to_reload_on_truncate{false};
    std::chrono::milliseconds to_poll_interval{250};
};

/**
 * Loads the existing content of a file in bulk and then follows it as it
 * grows.
 */
class file_tailer final : public ingest_source {
public:
    file_tailer(source_id_t sid,
                std::filesystem::path path,
                const rule& r,
                ingest_queue& queue,
                tail_options opts);

    ~file_tailer() override;

    const std::filesystem::path& get_path() const { return this->ft_path; }

protected:
    void run() override;

private:
    enum class change_t {
        none,
        grew,
        truncated,
        replaced,
    };

    Result<void, std::string> open_file();
    Result<void, std::string> load_existing();
    Result<void, std::string> read_new_lines();
    Result<change_t, std::string> check_file();

    std::filesystem::path ft_path;
    tail_options ft_options;
    std::optional<line_buffer> ft_buffer;
    ino_t ft_inode{0};
    dev_t ft_dev{0};
};

}  // namespace lsift

#endif
