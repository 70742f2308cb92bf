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
 * @file filter_editor.cc
 */

#include "filter_editor.hh"

#include "base/lsift_log.hh"
#include "config.h"

namespace lsift {

void
filter_editor::begin_edit()
{
    this->fe_state = state_t::editing;
    this->fe_draft = this->fe_active ? this->fe_active->get_text() : "";
    this->fe_error = std::nullopt;
}

void
filter_editor::set_draft(std::string draft)
{
    if (!this->is_editing()) {
        this->begin_edit();
    }
    this->fe_draft = std::move(draft);
}

Result<void, filter::compile_error>
filter_editor::commit()
{
    if (!this->is_editing()) {
        return Ok();
    }

    auto trimmed = string_fragment::from_str(this->fe_draft).trim();
    if (trimmed.empty()) {
        log_info("clearing expression");
        this->fe_active.reset();
        this->fe_error = std::nullopt;
        this->fe_state = state_t::idle;
        this->fe_draft.clear();
        return Ok();
    }

    auto compile_res = filter::compiled_filter::compile(
        string_fragment::from_str(this->fe_draft), this->fe_cache);
    if (compile_res.isErr()) {
        auto err = compile_res.unwrapErr();

        log_info("expression failed to compile at %d: %s",
                 err.ce_offset,
                 err.ce_message.c_str());
        this->fe_error = err;
        return Err(err);
    }

    this->fe_active = compile_res.unwrap();
    this->fe_error = std::nullopt;
    this->fe_state = state_t::idle;
    this->fe_draft.clear();

    return Ok();
}

void
filter_editor::cancel()
{
    this->fe_state = state_t::idle;
    this->fe_draft.clear();
    this->fe_error = std::nullopt;
}

}  // namespace lsift
