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
 * @file auto_fd.cc
 */

#include "auto_fd.hh"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

#include "config.h"
#include "fmt/format.h"
#include "lsift_log.hh"

int
auto_fd::pipe(auto_fd* af)
{
    int retval, fd[2];

    require(af != nullptr);

    if ((retval = ::pipe(fd)) == 0) {
        af[0] = fd[0];
        af[1] = fd[1];
    }

    return retval;
}

Result<auto_fd, std::string>
auto_fd::dup_of(int fd)
{
    auto new_fd = ::dup(fd);

    if (new_fd == -1) {
        return Err(fmt::format(
            FMT_STRING("unable to dup fd {}: {}"), fd, strerror(errno)));
    }

    return Ok(auto_fd(new_fd));
}

auto_fd::auto_fd(int fd) : af_fd(fd)
{
    require(fd >= -1);
}

auto_fd::auto_fd(auto_fd&& af) noexcept : af_fd(af.release()) {}

auto_fd::~auto_fd()
{
    this->reset();
}

void
auto_fd::reset(int fd)
{
    require(fd >= -1);

    if (this->af_fd != fd) {
        if (this->af_fd != -1) {
            switch (this->af_fd) {
                case STDIN_FILENO:
                case STDOUT_FILENO:
                case STDERR_FILENO:
                    break;
                default:
                    close(this->af_fd);
                    break;
            }
        }
        this->af_fd = fd;
    }
}

void
auto_fd::close_on_exec() const
{
    if (this->af_fd == -1) {
        return;
    }
    log_perror(fcntl(this->af_fd, F_SETFD, FD_CLOEXEC));
}

void
auto_fd::non_blocking() const
{
    auto fl = fcntl(this->af_fd, F_GETFL, 0);
    if (fl < 0) {
        return;
    }

    log_perror(fcntl(this->af_fd, F_SETFL, fl | O_NONBLOCK));
}

auto_fd&
auto_fd::operator=(int fd)
{
    require(fd >= -1);

    this->reset(fd);
    return *this;
}

Result<void, std::string>
auto_fd::write_fully(string_fragment sf)
{
    while (!sf.empty()) {
        auto rc = write(this->af_fd, sf.data(), sf.length());

        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Err(
                fmt::format(FMT_STRING("failed to write {} bytes to FD {}"),
                            sf.length(),
                            this->af_fd));
        }

        sf = sf.substr(rc);
    }

    return Ok();
}

Result<auto_pipe, std::string>
auto_pipe::for_child_output(int child_fd)
{
    auto_pipe retval(child_fd);

    if (auto_fd::pipe(retval.ap_fd) == -1) {
        return Err(fmt::format(FMT_STRING("unable to create pipe for fd {}: {}"),
                               child_fd,
                               strerror(errno)));
    }
    retval.ap_fd[0].close_on_exec();
    retval.ap_fd[1].close_on_exec();

    return Ok(std::move(retval));
}

void
auto_pipe::after_fork(pid_t child_pid)
{
    switch (child_pid) {
        case -1:
            this->ap_fd[0].reset();
            this->ap_fd[1].reset();
            break;
        case 0:
            this->ap_fd[0].reset();
            if (this->ap_fd[1].get() != this->ap_child_fd) {
                dup2(this->ap_fd[1].get(), this->ap_child_fd);
                this->ap_fd[1].reset();
            }
            break;
        default:
            this->ap_fd[1].reset();
            break;
    }
}
