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
 * @file rule.hh
 */

#ifndef lsift_rule_hh
#define lsift_rule_hh

#include <memory>
#include <string>
#include <vector>

#include "base/string_fragment.hh"
#include "config_error.hh"
#include "field_extractor.hh"
#include "filter.eval.hh"
#include "pcrepp/pcre2pp.hh"
#include "record.hh"
#include "regex_cache.hh"
#include "result.h"

namespace lsift {

struct filter_def {
    std::string fd_name;
    std::string fd_expression;
    std::string fd_highlight;
    std::string fd_gutter;
};

enum class column_align {
    left,
    right,
};

struct column_def {
    std::string cd_name;
    size_t cd_width{0};
    column_align cd_align{column_align::left};
};

/**
 * A rule as it was written in the configuration, before any of its
 * patterns have been compiled.
 */
struct rule_def {
    std::string rd_name;
    std::vector<std::string> rd_file_patterns;
    std::vector<std::string> rd_extractors;
    merge_policy rd_merge_policy{merge_policy::first_wins};
    std::vector<filter_def> rd_filters;
    std::vector<column_def> rd_columns;
};

struct global_options {
    bool go_reload_on_truncate{false};
};

/**
 * A compiled rule.  Rules are immutable once compiled and are shared by
 * every source they apply to.
 */
class rule {
public:
    struct named_filter {
        filter_def nf_def;
        std::shared_ptr<const filter::compiled_filter> nf_filter;
    };

    static Result<std::shared_ptr<const rule>, config_error> compile(
        const rule_def& def, regex_cache& cache, const std::string& path);

    const std::string& get_name() const { return this->r_name; }

    merge_policy get_merge_policy() const { return this->r_merge_policy; }

    const std::vector<field_extractor>& get_extractors() const
    {
        return this->r_extractors;
    }

    const std::vector<named_filter>& get_filters() const
    {
        return this->r_filters;
    }

    const named_filter* find_filter(string_fragment name) const;

    const std::vector<column_def>& get_columns() const
    {
        return this->r_columns;
    }

    bool matches_source(string_fragment source_name) const;

    /**
     * Run this rule's extractors over a line.
     */
    void extract(string_fragment line,
                 extract_context& ctx,
                 field_map& fields) const
    {
        run_extractors(
            this->r_extractors, this->r_merge_policy, line, ctx, fields);
    }

private:
    std::string r_name;
    std::vector<std::shared_ptr<const pcre2pp::code>> r_file_patterns;
    std::vector<field_extractor> r_extractors;
    merge_policy r_merge_policy{merge_policy::first_wins};
    std::vector<named_filter> r_filters;
    std::vector<column_def> r_columns;
};

class rule_set {
public:
    static constexpr const char* DEFAULT_RULE_NAME = "default";

    static Result<rule_set, config_error> compile(
        const std::vector<rule_def>& defs,
        const global_options& global,
        regex_cache& cache);

    /**
     * Find the rule for a source.  The first rule with a file pattern that
     * matches the name wins.  If none match, the rule named "default" is
     * used and, failing that, a rule that extracts nothing.
     */
    const rule& find_rule(string_fragment source_name) const;

    const rule* find_rule_by_name(string_fragment name) const;

    const std::vector<std::shared_ptr<const rule>>& get_rules() const
    {
        return this->rs_rules;
    }

    const global_options& get_global() const { return this->rs_global; }

private:
    std::vector<std::shared_ptr<const rule>> rs_rules;
    std::shared_ptr<const rule> rs_fallback;
    global_options rs_global;
};

/**
 * The rules that are available without a rules file.
 */
std::vector<rule_def> builtin_rule_defs();

}  // namespace lsift

#endif
