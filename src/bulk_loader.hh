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
 * @file bulk_loader.hh
 */

#ifndef lsift_bulk_loader_hh
#define lsift_bulk_loader_hh

#include <atomic>
#include <string>
#include <vector>

#include "field_extractor.hh"
#include "record.hh"
#include "rule.hh"

namespace lsift {

/**
 * Build a record for a single line.  The rule's extractors are run and then
 * the "filename" and "line_number" fields are added if the extractors did
 * not provide them.  The context's line number is advanced.
 */
record extract_record(const rule& r,
                      extract_context& ctx,
                      std::string line,
                      source_id_t sid);

/**
 * Extracts the fields for a block of lines that are all available up
 * front.  The work is split into chunks that run concurrently and write
 * into their own slots of the output so the records come back in the same
 * order as the lines.
 */
class bulk_loader {
public:
    static constexpr size_t DEFAULT_CHUNK_SIZE = 4096;

    bulk_loader(const rule& r, source_id_t sid);

    bulk_loader& with_max_tasks(size_t max_tasks)
    {
        this->bl_max_tasks = max_tasks == 0 ? 1 : max_tasks;
        return *this;
    }

    bulk_loader& with_chunk_size(size_t chunk_size)
    {
        this->bl_chunk_size = chunk_size == 0 ? 1 : chunk_size;
        return *this;
    }

    /**
     * Checked between chunks.  When the flag is cleared, the remaining
     * chunks are skipped and only the records that were finished are
     * returned.
     */
    bulk_loader& with_looping(const std::atomic<bool>* looping)
    {
        this->bl_looping = looping;
        return *this;
    }

    std::vector<record> load(std::vector<std::string> lines,
                             extract_context& ctx) const;

private:
    const rule& bl_rule;
    source_id_t bl_source_id;
    size_t bl_max_tasks;
    size_t bl_chunk_size{DEFAULT_CHUNK_SIZE};
    const std::atomic<bool>* bl_looping{nullptr};
};

}  // namespace lsift

#endif
