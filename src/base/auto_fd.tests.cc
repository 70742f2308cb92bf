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
 * @file auto_fd.tests.cc
 */

#include <sys/wait.h>
#include <unistd.h>

#include "base/auto_fd.hh"

#include "config.h"
#include "doctest/doctest.h"

TEST_CASE("auto_pipe carries child output")
{
    auto pipe_res = auto_pipe::for_child_output(STDOUT_FILENO);
    REQUIRE(pipe_res.isOk());
    auto out_pipe = pipe_res.unwrap();

    auto child = fork();
    REQUIRE(child != -1);
    out_pipe.after_fork(child);
    if (child == 0) {
        auto_fd out(STDOUT_FILENO);

        auto rc = out.write_fully("from child\n"_frag).isOk() ? 0 : 1;
        _exit(rc);
    }

    std::string output;
    char buffer[64];
    ssize_t rc;

    while ((rc = read(out_pipe.read_end().get(), buffer, sizeof(buffer))) > 0)
    {
        output.append(buffer, rc);
    }

    int status = 0;
    REQUIRE(waitpid(child, &status, 0) == child);
    CHECK(WIFEXITED(status));
    CHECK(WEXITSTATUS(status) == 0);
    CHECK(output == "from child\n");
}

TEST_CASE("auto_fd dup_of")
{
    auto_fd fds[2];

    REQUIRE(auto_fd::pipe(fds) == 0);
    auto dup_res = auto_fd::dup_of(fds[1].get());
    REQUIRE(dup_res.isOk());
    auto copy = dup_res.unwrap();
    CHECK(copy.get() != fds[1].get());

    fds[1].reset();
    REQUIRE(copy.write_fully("x"_frag).isOk());
    copy.reset();

    char ch = 0;
    CHECK(read(fds[0].get(), &ch, 1) == 1);
    CHECK(ch == 'x');
    CHECK(read(fds[0].get(), &ch, 1) == 0);

    CHECK(auto_fd::dup_of(-1).isErr());
}
