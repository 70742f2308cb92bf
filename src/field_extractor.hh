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
 * @file field_extractor.hh
 */

#ifndef lsift_field_extractor_hh
#define lsift_field_extractor_hh

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "base/string_fragment.hh"
#include "config_error.hh"
#include "line_pattern.hh"
#include "mapbox/variant.hpp"
#include "pcrepp/pcre2pp.hh"
#include "record.hh"
#include "regex_cache.hh"
#include "result.h"

namespace lsift {

enum class merge_policy {
    first_wins,
    last_wins,
};

std::optional<merge_policy> merge_policy_from_name(string_fragment name);

const char* merge_policy_name(merge_policy mp);

/**
 * Mutable state that follows a single source through extraction.  Rules
 * are shared between sources and are never modified, so anything learned
 * from the input itself lives here.
 */
struct extract_context {
    std::string ec_source_name;
    /** Zero-based number of the line being extracted. */
    size_t ec_line_number{0};
    std::optional<std::vector<std::string>> ec_csv_header;
    char ec_csv_separator{','};
};

/**
 * One entry from a rule's "extractors" list, like "logfmt" or
 * "pattern <ip> - <user>", compiled into a ready-to-run form.
 */
class field_extractor {
public:
    struct logfmt_kind {};

    struct pattern_kind {
        std::shared_ptr<const line_pattern> pk_pattern;
    };

    struct regex_kind {
        std::shared_ptr<const pcre2pp::code> rk_code;
    };

    struct csv_kind {
        std::optional<char> ck_separator;
    };

    struct json_kind {};

    struct journal_kind {};

    struct transform_kind {
        std::string tk_field;
    };

    struct autodatetime_kind {};

    using kind_type = mapbox::util::variant<logfmt_kind,
                                            pattern_kind,
                                            regex_kind,
                                            csv_kind,
                                            json_kind,
                                            journal_kind,
                                            transform_kind,
                                            autodatetime_kind>;

    static Result<field_extractor, config_error> from_spec(
        string_fragment spec, regex_cache& cache);

    /**
     * Add the fields found in the line to the given map.  A line that does
     * not match contributes nothing.
     */
    void extract(string_fragment line,
                 extract_context& ctx,
                 field_map& fields,
                 merge_policy policy) const;

    const std::string& get_spec() const { return this->fe_spec; }

    const kind_type& get_kind() const { return this->fe_kind; }

private:
    field_extractor(std::string spec, kind_type kind)
        : fe_spec(std::move(spec)), fe_kind(std::move(kind))
    {
    }

    std::string fe_spec;
    kind_type fe_kind;
};

/**
 * Run the extractors in order against the same field map.
 */
void run_extractors(const std::vector<field_extractor>& extractors,
                    merge_policy policy,
                    string_fragment line,
                    extract_context& ctx,
                    field_map& fields);

}  // namespace lsift

#endif
