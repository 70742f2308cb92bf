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
 * @file line_buffer.cc
 */

#include "line_buffer.hh"

#include <errno.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include "base/lsift_log.hh"
#include "base/string_util.hh"
#include "config.h"
#include "fmt/format.h"

namespace lsift {

static bool
is_regular_file(int fd)
{
    struct stat st;

    return fstat(fd, &st) == 0 && S_ISREG(st.st_mode);
}

line_buffer::line_buffer(auto_fd fd)
    : lb_fd(std::move(fd)), lb_seekable(is_regular_file(this->lb_fd.get()))
{
}

void
line_buffer::reset(auto_fd fd)
{
    this->lb_fd = std::move(fd);
    this->lb_seekable = is_regular_file(this->lb_fd.get());
    this->lb_eof = false;
    this->lb_read_offset = 0;
    this->lb_buffer.clear();
}

Result<size_t, std::string>
line_buffer::fill(size_t read_size)
{
    auto old_size = this->lb_buffer.size();
    ssize_t rc;

    this->lb_buffer.resize(old_size + read_size);
    do {
        if (this->lb_seekable) {
            rc = pread(this->lb_fd.get(),
                       &this->lb_buffer[old_size],
                       read_size,
                       this->lb_read_offset);
        } else {
            rc = read(this->lb_fd.get(), &this->lb_buffer[old_size], read_size);
        }
    } while (rc == -1 && errno == EINTR);

    if (rc == -1) {
        this->lb_buffer.resize(old_size);
        return Err(fmt::format(FMT_STRING("unable to read from fd {} -- {}"),
                               this->lb_fd.get(),
                               strerror(errno)));
    }

    this->lb_buffer.resize(old_size + rc);
    this->lb_read_offset += rc;
    this->lb_eof = rc == 0;

    return Ok((size_t) rc);
}

std::string
line_buffer::finish_line(size_t len, size_t consume)
{
    auto retval = this->lb_buffer.substr(0, len);

    this->lb_buffer.erase(0, consume);
    if (!retval.empty() && retval.back() == '\r') {
        retval.pop_back();
    }
    this->lb_encoding_errors += scrub_to_utf8(retval);

    return retval;
}

std::optional<std::string>
line_buffer::pop_line()
{
    auto nl = this->lb_buffer.find('\n');

    if (nl == std::string::npos) {
        return std::nullopt;
    }

    return this->finish_line(nl, nl + 1);
}

std::optional<std::string>
line_buffer::pop_partial()
{
    if (this->lb_buffer.empty()) {
        return std::nullopt;
    }

    auto len = this->lb_buffer.size();
    return this->finish_line(len, len);
}

Result<std::vector<std::string>, std::string>
line_buffer::read_available_lines()
{
    std::vector<std::string> retval;

    while (true) {
        auto bytes_read = TRY(this->fill());

        while (true) {
            auto line = this->pop_line();

            if (!line) {
                break;
            }
            retval.emplace_back(std::move(line.value()));
        }
        if (bytes_read == 0) {
            break;
        }
    }

    if (!this->lb_seekable) {
        auto partial = this->pop_partial();

        if (partial) {
            retval.emplace_back(std::move(partial.value()));
        }
    }

    log_debug("read %zu lines from fd %d, offset %lld",
              retval.size(),
              this->lb_fd.get(),
              (long long) this->lb_read_offset);

    return Ok(std::move(retval));
}

}  // namespace lsift
