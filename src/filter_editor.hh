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
 * @file filter_editor.hh
 */

#ifndef lsift_filter_editor_hh
#define lsift_filter_editor_hh

#include <memory>
#include <optional>
#include <string>

#include "filter.eval.hh"
#include "filter.lexer.hh"
#include "regex_cache.hh"
#include "result.h"

namespace lsift {

/**
 * The edit cycle for a filter or search expression.  While editing, the
 * previously active expression stays in effect.  A commit that fails to
 * compile leaves the editor in the editing state with the error attached.
 */
class filter_editor {
public:
    using filter_ptr = std::shared_ptr<const filter::compiled_filter>;

    enum class state_t {
        idle,
        editing,
    };

    explicit filter_editor(regex_cache& cache) : fe_cache(cache) {}

    /**
     * Start editing with the text of the active expression as the draft.
     */
    void begin_edit();

    void set_draft(std::string draft);

    /**
     * Compile the draft.  On success, the result becomes the active
     * expression and the editor returns to idle.  An empty draft clears the
     * active expression.
     */
    Result<void, filter::compile_error> commit();

    /**
     * Discard the draft and return to idle.
     */
    void cancel();

    state_t get_state() const { return this->fe_state; }

    bool is_editing() const { return this->fe_state == state_t::editing; }

    const std::string& get_draft() const { return this->fe_draft; }

    const filter_ptr& get_active() const { return this->fe_active; }

    const std::optional<filter::compile_error>& get_error() const
    {
        return this->fe_error;
    }

private:
    regex_cache& fe_cache;
    state_t fe_state{state_t::idle};
    std::string fe_draft;
    filter_ptr fe_active;
    std::optional<filter::compile_error> fe_error;
};

}  // namespace lsift

#endif
