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
 * @file bulk_loader.cc
 */

#include <future>
#include <thread>

#include "bulk_loader.hh"

#include "base/future_util.hh"
#include "base/lsift_log.hh"
#include "base/time_util.hh"
#include "config.h"

namespace lsift {

record
extract_record(const rule& r,
               extract_context& ctx,
               std::string line,
               source_id_t sid)
{
    record retval(std::move(line), sid);
    auto& fields = retval.get_fields();

    r.extract(retval.to_string_fragment(), ctx, fields);
    fields.insert("filename", ctx.ec_source_name);
    fields.insert("line_number", std::to_string(ctx.ec_line_number + 1));
    ctx.ec_line_number += 1;

    return retval;
}

bulk_loader::bulk_loader(const rule& r, source_id_t sid)
    : bl_rule(r), bl_source_id(sid),
      bl_max_tasks(std::max(1U, std::thread::hardware_concurrency()))
{
}

std::vector<record>
bulk_loader::load(std::vector<std::string> lines, extract_context& ctx) const
{
    std::vector<record> retval(lines.size());

    if (lines.empty()) {
        return retval;
    }

    auto start_time = getmstime();
    auto base_line = ctx.ec_line_number;

    // The first line may carry state for the rest, like a CSV header, so
    // it is done before the context is copied into the tasks.
    retval[0] = extract_record(
        this->bl_rule, ctx, std::move(lines[0]), this->bl_source_id);

    auto interrupted = false;
    size_t finished = 1;
    {
        futures::future_queue<size_t> tasks(
            [this, &interrupted, &finished](std::future<size_t>& fut) {
                finished += fut.get();
                if (this->bl_looping != nullptr && !this->bl_looping->load()) {
                    interrupted = true;
                    return futures::progress_result_t::interrupt;
                }
                return futures::progress_result_t::ok;
            },
            this->bl_max_tasks);

        for (size_t start = 1; start < lines.size() && !interrupted;
             start += this->bl_chunk_size)
        {
            auto end = std::min(start + this->bl_chunk_size, lines.size());
            auto chunk_ctx = ctx;

            chunk_ctx.ec_line_number = base_line + start;
            tasks.push_back(std::async(
                std::launch::async,
                [this, &lines, &retval, start, end, chunk_ctx]() mutable {
                    for (auto lpc = start; lpc < end; lpc++) {
                        retval[lpc] = extract_record(this->bl_rule,
                                                     chunk_ctx,
                                                     std::move(lines[lpc]),
                                                     this->bl_source_id);
                    }
                    return end - start;
                }));
        }
    }

    if (interrupted) {
        log_info("bulk load interrupted after %zu of %zu lines",
                 finished,
                 lines.size());
        retval.resize(finished);
    }
    ctx.ec_line_number = base_line + retval.size();

    log_info("bulk loaded %zu lines in %lld ms",
             retval.size(),
             (long long) (getmstime() - start_time));

    return retval;
}

}  // namespace lsift
