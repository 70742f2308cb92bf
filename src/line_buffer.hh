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
 * @file line_buffer.hh
 */

#ifndef lsift_line_buffer_hh
#define lsift_line_buffer_hh

#include <optional>
#include <string>
#include <vector>

#include "base/auto_fd.hh"
#include "base/file_range.hh"
#include "result.h"

namespace lsift {

/**
 * Buffer for reading lines from a file descriptor.  Regular files are read
 * with pread(2) at a tracked offset so that the caller can compare the
 * offset against the size of the file.  Other descriptors are read
 * sequentially.
 */
class line_buffer {
public:
    static constexpr size_t DEFAULT_READ_SIZE = 64 * 1024;

    explicit line_buffer(auto_fd fd);

    line_buffer(line_buffer&&) = default;
    line_buffer& operator=(line_buffer&&) = default;

    /**
     * Read the next block of data from the descriptor.
     *
     * @return The number of bytes read, zero at the end of the input.
     */
    Result<size_t, std::string> fill(size_t read_size = DEFAULT_READ_SIZE);

    /**
     * Pop the next complete line off the front of the buffer.  The line
     * ending is removed and invalid UTF-8 is replaced.
     */
    std::optional<std::string> pop_line();

    /**
     * Pop any data that is not terminated by a newline.  Used at the end of
     * a stream.
     */
    std::optional<std::string> pop_partial();

    /**
     * Read until the end of the input and return all of the lines.  A
     * trailing line without a newline is only included when the descriptor
     * is not a regular file.
     */
    Result<std::vector<std::string>, std::string> read_available_lines();

    /**
     * Switch to a new descriptor and start reading from the beginning.
     */
    void reset(auto_fd fd);

    int get_fd() const { return this->lb_fd.get(); }

    bool is_seekable() const { return this->lb_seekable; }

    /**
     * @return The offset of the next byte to read from the file.
     */
    file_off_t get_read_offset() const { return this->lb_read_offset; }

    size_t get_encoding_errors() const { return this->lb_encoding_errors; }

    bool is_eof() const { return this->lb_eof; }

private:
    std::string finish_line(size_t len, size_t consume);

    auto_fd lb_fd;
    bool lb_seekable{false};
    bool lb_eof{false};
    file_off_t lb_read_offset{0};
    std::string lb_buffer;
    size_t lb_encoding_errors{0};
};

}  // namespace lsift

#endif
