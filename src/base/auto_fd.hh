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
 * @file auto_fd.hh
 */

#ifndef lsift_auto_fd_hh
#define lsift_auto_fd_hh

#include <string>

#include <sys/types.h>

#include "result.h"
#include "base/string_fragment.hh"

/**
 * Resource management class for file descriptors.  The standard descriptors
 * are never closed by this class.
 */
class auto_fd {
public:
    /**
     * Wrapper for pipe(2) that stores the reader end in af[0] and the writer
     * end in af[1].
     */
    static int pipe(auto_fd* af);

    /**
     * dup(2) the given file descriptor and wrap it in an auto_fd.
     */
    static Result<auto_fd, std::string> dup_of(int fd);

    explicit auto_fd(int fd = -1);

    auto_fd(auto_fd&& af) noexcept;

    auto_fd(const auto_fd& af) = delete;

    ~auto_fd();

    operator int() const { return this->af_fd; }

    auto_fd& operator=(int fd);

    auto_fd& operator=(auto_fd&& af) noexcept
    {
        this->reset(af.release());
        return *this;
    }

    int release()
    {
        int retval = this->af_fd;

        this->af_fd = -1;
        return retval;
    }

    int get() const { return this->af_fd; }

    bool has_value() const { return this->af_fd != -1; }

    /**
     * Closes the current file descriptor and replaces its value with the given
     * one.
     */
    void reset(int fd = -1);

    Result<void, std::string> write_fully(string_fragment sf);

    void close_on_exec() const;

    void non_blocking() const;

private:
    int af_fd;
};

/**
 * A pipe that carries a child's output descriptor back to the parent.  The
 * child writes to the pipe in place of the descriptor and the parent reads
 * from read_end().
 */
class auto_pipe {
public:
    static Result<auto_pipe, std::string> for_child_output(int child_fd);

    auto_fd& read_end() { return this->ap_fd[0]; }

    /**
     * Close the end that is not used on this side of the fork.  In the child,
     * the write end is also moved onto the output descriptor.
     */
    void after_fork(pid_t child_pid);

private:
    explicit auto_pipe(int child_fd) : ap_child_fd(child_fd) {}

    int ap_child_fd;
    auto_fd ap_fd[2];
};

#endif
