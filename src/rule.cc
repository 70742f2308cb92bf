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
 * @file rule.cc
 */

#include "rule.hh"

#include "base/lsift_log.hh"
#include "config.h"
#include "fmt/format.h"

namespace lsift {

Result<std::shared_ptr<const rule>, config_error>
rule::compile(const rule_def& def, regex_cache& cache, const std::string& path)
{
    auto retval = std::make_shared<rule>();

    if (def.rd_name.empty()) {
        return Err(config_error{path + "/name", "rule name is empty"});
    }

    retval->r_name = def.rd_name;
    retval->r_merge_policy = def.rd_merge_policy;
    retval->r_columns = def.rd_columns;

    for (size_t lpc = 0; lpc < def.rd_file_patterns.size(); lpc++) {
        const auto& pat = def.rd_file_patterns[lpc];
        auto re_res = cache.get_regex(string_fragment::from_str(pat));

        if (re_res.isErr()) {
            return Err(config_error{
                fmt::format(FMT_STRING("{}/file-patterns/{}"), path, lpc),
                fmt::format(FMT_STRING("invalid file pattern \"{}\": {}"),
                            pat,
                            re_res.unwrapErr().get_message()),
            });
        }
        retval->r_file_patterns.emplace_back(re_res.unwrap());
    }

    for (size_t lpc = 0; lpc < def.rd_extractors.size(); lpc++) {
        auto fe_res = field_extractor::from_spec(
            string_fragment::from_str(def.rd_extractors[lpc]), cache);

        if (fe_res.isErr()) {
            auto err = fe_res.unwrapErr();

            err.ce_path = fmt::format(FMT_STRING("{}/extractors/{}"), path, lpc);
            return Err(err);
        }
        retval->r_extractors.emplace_back(fe_res.unwrap());
    }

    for (size_t lpc = 0; lpc < def.rd_filters.size(); lpc++) {
        const auto& fd = def.rd_filters[lpc];
        auto filter_res = filter::compiled_filter::compile(
            string_fragment::from_str(fd.fd_expression), cache);

        if (filter_res.isErr()) {
            auto ce = filter_res.unwrapErr();

            return Err(config_error{
                fmt::format(FMT_STRING("{}/filters/{}/expression"), path, lpc),
                fmt::format(FMT_STRING("invalid filter \"{}\" at offset {}: {}"),
                            fd.fd_name,
                            ce.ce_offset,
                            ce.ce_message),
            });
        }
        retval->r_filters.emplace_back(named_filter{fd, filter_res.unwrap()});
    }

    log_debug("compiled rule %s: %zu patterns, %zu extractors, %s",
              retval->r_name.c_str(),
              retval->r_file_patterns.size(),
              retval->r_extractors.size(),
              merge_policy_name(retval->r_merge_policy));

    return Ok(std::shared_ptr<const rule>(std::move(retval)));
}

const rule::named_filter*
rule::find_filter(string_fragment name) const
{
    for (const auto& nf : this->r_filters) {
        if (name == nf.nf_def.fd_name) {
            return &nf;
        }
    }

    return nullptr;
}

bool
rule::matches_source(string_fragment source_name) const
{
    for (const auto& pat : this->r_file_patterns) {
        if (pat->find_in(source_name)) {
            return true;
        }
    }

    return false;
}

Result<rule_set, config_error>
rule_set::compile(const std::vector<rule_def>& defs,
                  const global_options& global,
                  regex_cache& cache)
{
    rule_set retval;

    retval.rs_global = global;
    for (size_t lpc = 0; lpc < defs.size(); lpc++) {
        auto path = fmt::format(FMT_STRING("/rules/{}"), lpc);
        auto rule_res = rule::compile(defs[lpc], cache, path);

        if (rule_res.isErr()) {
            return Err(rule_res.unwrapErr());
        }
        retval.rs_rules.emplace_back(rule_res.unwrap());
    }

    retval.rs_fallback = std::make_shared<rule>();
    for (const auto& r : retval.rs_rules) {
        if (r->get_name() == DEFAULT_RULE_NAME) {
            retval.rs_fallback = r;
            break;
        }
    }

    log_info("compiled %zu rules", retval.rs_rules.size());

    return Ok(std::move(retval));
}

const rule&
rule_set::find_rule(string_fragment source_name) const
{
    for (const auto& r : this->rs_rules) {
        if (r->matches_source(source_name)) {
            return *r;
        }
    }

    return *this->rs_fallback;
}

const rule*
rule_set::find_rule_by_name(string_fragment name) const
{
    for (const auto& r : this->rs_rules) {
        if (name == r->get_name()) {
            return r.get();
        }
    }

    return nullptr;
}

std::vector<rule_def>
builtin_rule_defs()
{
    std::vector<rule_def> retval;

    {
        rule_def rd;

        rd.rd_name = "json";
        rd.rd_file_patterns = {R"(\.jsonl?$)"};
        rd.rd_extractors = {"json", "transform timestamp iso8601"};
        retval.emplace_back(std::move(rd));
    }
    {
        rule_def rd;

        rd.rd_name = "csv";
        rd.rd_file_patterns = {R"(\.csv$)"};
        rd.rd_extractors = {"csv"};
        retval.emplace_back(std::move(rd));
    }
    {
        rule_def rd;

        rd.rd_name = "access_log";
        rd.rd_file_patterns = {R"(access(_log|\.log))"};
        rd.rd_extractors = {
            R"(regex ^(?<ip>\S+) \S+ (?<user>\S+) \[(?<timestamp>[^\]]+)\] )"
            R"("(?<method>\S+) (?<url>\S+) (?<protocol>[^"]+)" )"
            R"((?<status>\d{3}) (?<bytes>\S+))"
            R"((?: "(?<referer>[^"]*)" "(?<user_agent>[^"]*)")?)",
            "transform timestamp iso8601",
        };
        rd.rd_filters = {
            {"errors", "status >= 500", "red", "red"},
            {"not-found", "status == 404", "yellow", ""},
        };
        rd.rd_columns = {
            {"ip", 15, column_align::left},
            {"status", 3, column_align::right},
            {"url", 0, column_align::left},
        };
        retval.emplace_back(std::move(rd));
    }
    {
        rule_def rd;

        rd.rd_name = "journal";
        rd.rd_file_patterns = {R"(^journalctl\b)"};
        rd.rd_extractors = {"journal", "transform timestamp iso8601"};
        retval.emplace_back(std::move(rd));
    }
    {
        rule_def rd;

        rd.rd_name = "syslog";
        rd.rd_file_patterns = {R"((^|/)(syslog|messages)(\.\d+)?$)"};
        rd.rd_extractors = {
            R"(regex ^(?<timestamp>[A-Z][a-z]{2} [ \d]\d \d{2}:\d{2}:\d{2}) )"
            R"((?<hostname>\S+) (?<service>[^\[:\s]+)(?:\[(?<pid>\d+)\])?: )"
            R"((?<message>.*)$)",
            "transform timestamp iso8601",
        };
        retval.emplace_back(std::move(rd));
    }
    {
        rule_def rd;

        rd.rd_name = rule_set::DEFAULT_RULE_NAME;
        rd.rd_extractors = {"logfmt", "autodatetime"};
        rd.rd_filters = {
            {"errors", "level == error || level == ERROR", "red", "red"},
        };
        retval.emplace_back(std::move(rd));
    }

    return retval;
}

}  // namespace lsift
