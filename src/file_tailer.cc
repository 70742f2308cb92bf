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
 * @file file_tailer.cc
 */

#include "file_tailer.hh"

#include <errno.h>
#include <string.h>
#include <sys/stat.h>

#include "base/fs_util.hh"
#include "base/lsift_log.hh"
#include "bulk_loader.hh"
#include "config.h"
#include "fmt/format.h"

namespace lsift {

file_tailer::file_tailer(source_id_t sid,
                         std::filesystem::path path,
                         const rule& r,
                         ingest_queue& queue,
                         tail_options opts)
    : ingest_source(sid, path.string(), r, queue), ft_path(std::move(path)),
      ft_options(opts)
{
}

file_tailer::~file_tailer()
{
    this->stop();
}

Result<void, std::string>
file_tailer::open_file()
{
    auto fd = TRY(filesystem::open_file(this->ft_path, O_RDONLY));
    struct stat st;

    if (fstat(fd.get(), &st) == -1) {
        return Err(fmt::format(FMT_STRING("unable to stat {} -- {}"),
                               this->ft_path.string(),
                               strerror(errno)));
    }
    if (!S_ISREG(st.st_mode)) {
        return Err(fmt::format(FMT_STRING("not a regular file: {}"),
                               this->ft_path.string()));
    }

    this->ft_inode = st.st_ino;
    this->ft_dev = st.st_dev;
    if (this->ft_buffer) {
        this->ft_buffer->reset(std::move(fd));
    } else {
        this->ft_buffer.emplace(std::move(fd));
    }
    this->is_context.ec_line_number = 0;
    this->is_context.ec_csv_header = std::nullopt;

    return Ok();
}

Result<void, std::string>
file_tailer::load_existing()
{
    auto lines = TRY(this->ft_buffer->read_available_lines());
    auto records = bulk_loader(this->get_rule(), this->get_id())
                       .with_looping(&this->looping_flag())
                       .load(std::move(lines), this->is_context);

    this->post_records(std::move(records),
                       this->ft_buffer->get_encoding_errors());

    return Ok();
}

Result<void, std::string>
file_tailer::read_new_lines()
{
    std::vector<record> records;

    while (this->is_looping()) {
        auto bytes_read = TRY(this->ft_buffer->fill());

        while (true) {
            auto line = this->ft_buffer->pop_line();

            if (!line) {
                break;
            }
            records.emplace_back(extract_record(this->get_rule(),
                                                this->is_context,
                                                std::move(line.value()),
                                                this->get_id()));
        }
        if (!records.empty()) {
            this->post_records(std::move(records),
                               this->ft_buffer->get_encoding_errors());
            records.clear();
        }
        if (bytes_read == 0) {
            break;
        }
    }

    return Ok();
}

Result<file_tailer::change_t, std::string>
file_tailer::check_file()
{
    struct stat fd_st;

    if (fstat(this->ft_buffer->get_fd(), &fd_st) == -1) {
        return Err(fmt::format(FMT_STRING("unable to stat {} -- {}"),
                               this->ft_path.string(),
                               strerror(errno)));
    }

    if (fd_st.st_size < this->ft_buffer->get_read_offset()) {
        return Ok(change_t::truncated);
    }

    struct stat path_st;
    if (filesystem::statp(this->ft_path, &path_st) == 0
        && (path_st.st_ino != this->ft_inode || path_st.st_dev != this->ft_dev))
    {
        return Ok(change_t::replaced);
    }

    if (fd_st.st_size > this->ft_buffer->get_read_offset()) {
        return Ok(change_t::grew);
    }

    return Ok(change_t::none);
}

void
file_tailer::run()
{
    auto open_res = this->open_file();
    if (open_res.isErr()) {
        this->post_state(source_state::error, open_res.unwrapErr());
        return;
    }

    auto load_res = this->load_existing();
    if (load_res.isErr()) {
        this->post_state(source_state::error, load_res.unwrapErr());
        return;
    }

    while (this->wait_for(this->ft_options.to_poll_interval)) {
        auto check_res = this->check_file();
        if (check_res.isErr()) {
            this->post_state(source_state::error, check_res.unwrapErr());
            return;
        }

        switch (check_res.unwrap()) {
            case change_t::none:
                break;
            case change_t::grew: {
                auto read_res = this->read_new_lines();
                if (read_res.isErr()) {
                    this->post_state(source_state::error,
                                     read_res.unwrapErr());
                    return;
                }
                break;
            }
            case change_t::truncated:
            case change_t::replaced: {
                if (!this->ft_options.to_reload_on_truncate) {
                    this->post_state(
                        source_state::truncated,
                        "file was truncated or replaced, stopping");
                    return;
                }

                log_info("%s: file was truncated or replaced, reloading",
                         this->get_name().c_str());
                auto reopen_res = this->open_file();
                if (reopen_res.isErr()) {
                    this->post_state(source_state::error,
                                     reopen_res.unwrapErr());
                    return;
                }
                auto read_res = this->read_new_lines();
                if (read_res.isErr()) {
                    this->post_state(source_state::error,
                                     read_res.unwrapErr());
                    return;
                }
                break;
            }
        }
    }
}

}  // namespace lsift
