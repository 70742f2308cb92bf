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
 * @file auto_pid.hh
 */

#ifndef lsift_auto_pid_hh
#define lsift_auto_pid_hh

#include <csignal>
#include <string>
#include <utility>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "base/lsift_log.hh"
#include "fmt/format.h"
#include "mapbox/variant.hpp"
#include "result.h"

enum class process_state {
    running,
    finished,
};

/**
 * Handle for a forked child process.  A handle in the running state
 * terminates the child's process group when it is destroyed without having
 * been reaped.
 */
template<process_state ProcState>
class auto_pid {
public:
    explicit auto_pid(pid_t child, int status = 0)
        : ap_status(status), ap_child(child)
    {
    }

    auto_pid(const auto_pid& other) = delete;

    auto_pid(auto_pid&& other) noexcept
        : ap_status(other.ap_status),
          ap_child(std::exchange(other.ap_child, -1))
    {
    }

    ~auto_pid() noexcept { this->terminate(); }

    auto_pid& operator=(auto_pid&& other) noexcept
    {
        this->terminate();
        this->ap_status = other.ap_status;
        this->ap_child = std::exchange(other.ap_child, -1);
        return *this;
    }

    auto_pid& operator=(const auto_pid& other) = delete;

    pid_t in() const { return this->ap_child; }

    bool in_child() const
    {
        static_assert(ProcState == process_state::running,
                      "this method is only available in the RUNNING state");
        return this->ap_child == 0;
    }

    /**
     * @return "exit status: N" for a normal exit or "signal: N" when the
     * child was killed.
     */
    std::string exit_description() const
    {
        static_assert(ProcState == process_state::finished,
                      "poll() must report the child as finished first");
        if (WIFEXITED(this->ap_status)) {
            return fmt::format(FMT_STRING("exit status: {}"),
                               WEXITSTATUS(this->ap_status));
        }
        return fmt::format(FMT_STRING("signal: {}"),
                           WTERMSIG(this->ap_status));
    }

    using poll_result
        = mapbox::util::variant<auto_pid<process_state::running>,
                                auto_pid<process_state::finished>>;

    /**
     * Reap the child without blocking.
     */
    poll_result poll() &&
    {
        if (this->ap_child != -1) {
            auto rc = waitpid(this->ap_child, &this->ap_status, WNOHANG);

            if (rc <= 0) {
                return std::move(*this);
            }
        }

        return auto_pid<process_state::finished>(
            std::exchange(this->ap_child, -1), this->ap_status);
    }

private:
    void terminate() noexcept
    {
        if (ProcState == process_state::running && this->ap_child > 0) {
            log_debug("sending SIGTERM to child: %d", this->ap_child);
            if (getpgid(this->ap_child) == this->ap_child) {
                kill(-this->ap_child, SIGTERM);
            } else {
                kill(this->ap_child, SIGTERM);
            }
        }
        this->ap_child = -1;
    }

    int ap_status{0};
    pid_t ap_child;
};

namespace lsift {
namespace pid {

/**
 * fork(2) the current process.  The child is moved into its own process
 * group so that it and its descendants can be terminated together.
 */
Result<auto_pid<process_state::running>, std::string> from_fork();

}  // namespace pid
}  // namespace lsift

#endif
