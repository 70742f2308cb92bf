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
 * @file filter.eval.hh
 */

#ifndef lsift_filter_eval_hh
#define lsift_filter_eval_hh

#include <memory>
#include <string>

#include "base/string_fragment.hh"
#include "filter.ast.hh"
#include "filter.lexer.hh"
#include "record.hh"
#include "regex_cache.hh"
#include "result.h"

namespace lsift::filter {

/**
 * Evaluate an expression tree against a record.
 */
bool evaluate(const ast::node& expr, const record& rec);

/**
 * A filter expression that has been parsed and had its regular expressions
 * compiled.  Instances are immutable and can be evaluated from any thread.
 */
class compiled_filter {
public:
    static Result<std::shared_ptr<const compiled_filter>, compile_error>
    compile(string_fragment text, regex_cache& cache);

    bool matches(const record& rec) const
    {
        return evaluate(this->cf_root, rec);
    }

    const std::string& get_text() const { return this->cf_text; }

    const ast::node& get_ast() const { return this->cf_root; }

    compiled_filter(std::string text, ast::node root)
        : cf_text(std::move(text)), cf_root(std::move(root))
    {
    }

private:
    std::string cf_text;
    ast::node cf_root;
};

}  // namespace lsift::filter

#endif
