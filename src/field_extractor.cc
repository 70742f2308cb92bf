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
 * @file field_extractor.cc
 */

#include "field_extractor.hh"

#include <ctype.h>

#include "base/lsift_log.hh"
#include "base/time_util.hh"
#include "config.h"
#include "fmt/format.h"
#include "formats/csv/csv.parser.hh"
#include "formats/journal/journal.parser.hh"
#include "formats/json/json.flatten.hh"
#include "formats/logfmt/logfmt.parser.hh"

namespace lsift {

static const auto TIMESTAMP_FIELD = std::string("timestamp");

std::optional<merge_policy>
merge_policy_from_name(string_fragment name)
{
    if (name == "first-wins") {
        return merge_policy::first_wins;
    }
    if (name == "last-wins") {
        return merge_policy::last_wins;
    }

    return std::nullopt;
}

const char*
merge_policy_name(merge_policy mp)
{
    switch (mp) {
        case merge_policy::first_wins:
            return "first-wins";
        case merge_policy::last_wins:
            return "last-wins";
    }

    return "unknown";
}

static void
add_field(field_map& fields,
          merge_policy policy,
          std::string key,
          std::string value)
{
    switch (policy) {
        case merge_policy::first_wins:
            fields.insert(std::move(key), std::move(value));
            break;
        case merge_policy::last_wins:
            fields.set(std::move(key), std::move(value));
            break;
    }
}

static bool
is_space(char ch)
{
    return isspace((unsigned char) ch);
}

static Result<std::optional<char>, std::string>
separator_from_arg(string_fragment arg)
{
    if (arg.empty()) {
        return Ok(std::optional<char>{});
    }
    if (arg == "tab" || arg == "\\t") {
        return Ok(std::make_optional('\t'));
    }
    if (arg.length() == 1) {
        return Ok(std::make_optional(arg.front()));
    }

    return Err(fmt::format(FMT_STRING("invalid CSV separator: {}"), arg));
}

Result<field_extractor, config_error>
field_extractor::from_spec(string_fragment spec, regex_cache& cache)
{
    auto trimmed = spec.trim();
    auto kind = trimmed;
    auto arg = string_fragment::from_const("");

    auto split_res = trimmed.split_pair(is_space);
    if (split_res) {
        kind = split_res->first;
        arg = split_res->second.trim();
    }

    if (trimmed.empty()) {
        return Err(config_error{"", "empty extractor"});
    }

    auto spec_str = trimmed.to_string();
    auto no_args = [&]() -> Result<void, config_error> {
        if (!arg.empty()) {
            return Err(config_error{
                "",
                fmt::format(FMT_STRING("\"{}\" does not take arguments: {}"),
                            kind,
                            arg),
            });
        }
        return Ok();
    };

    if (kind == "logfmt") {
        TRY(no_args());
        return Ok(field_extractor{spec_str, logfmt_kind{}});
    }
    if (kind == "json") {
        TRY(no_args());
        return Ok(field_extractor{spec_str, json_kind{}});
    }
    if (kind == "journal") {
        TRY(no_args());
        return Ok(field_extractor{spec_str, journal_kind{}});
    }
    if (kind == "autodatetime") {
        TRY(no_args());
        return Ok(field_extractor{spec_str, autodatetime_kind{}});
    }
    if (kind == "csv") {
        auto sep_res = separator_from_arg(arg);
        if (sep_res.isErr()) {
            return Err(config_error{"", sep_res.unwrapErr()});
        }
        return Ok(field_extractor{spec_str, csv_kind{sep_res.unwrap()}});
    }
    if (kind == "pattern") {
        auto pat_res = cache.get_pattern(arg);
        if (pat_res.isErr()) {
            return Err(config_error{
                "",
                fmt::format(FMT_STRING("invalid pattern \"{}\": {}"),
                            arg,
                            pat_res.unwrapErr()),
            });
        }
        return Ok(field_extractor{spec_str, pattern_kind{pat_res.unwrap()}});
    }
    if (kind == "regex") {
        if (arg.empty()) {
            return Err(config_error{"", "regex extractor requires a pattern"});
        }
        auto re_res = cache.get_regex(arg);
        if (re_res.isErr()) {
            return Err(config_error{
                "",
                fmt::format(FMT_STRING("invalid regex \"{}\": {}"),
                            arg,
                            re_res.unwrapErr().get_message()),
            });
        }
        auto code = re_res.unwrap();
        if (code->get_named_captures().empty()) {
            log_warning("regex extractor has no named captures: %s",
                        code->get_pattern().c_str());
        }
        return Ok(field_extractor{spec_str, regex_kind{code}});
    }
    if (kind == "transform") {
        auto targets = arg;
        auto field = TIMESTAMP_FIELD;
        auto target_split = targets.split_pair(is_space);
        if (target_split) {
            field = target_split->first.to_string();
            targets = target_split->second.trim();
        }
        if (!targets.is_one_of("iso8601", "rfc3339")) {
            return Err(config_error{
                "",
                fmt::format(FMT_STRING("unsupported transform: {}"), arg),
            });
        }
        return Ok(field_extractor{spec_str, transform_kind{field}});
    }

    return Err(config_error{
        "",
        fmt::format(FMT_STRING("unknown extractor kind: {}"), kind),
    });
}

static void
extract_logfmt(string_fragment line, field_map& fields, merge_policy policy)
{
    logfmt::parser p(line);
    bool done = false;

    while (!done) {
        auto step = p.step();

        done = step.match(
            [](const logfmt::parser::end_of_input&) { return true; },
            [&](const logfmt::parser::kvpair& kv) {
                add_field(fields,
                          policy,
                          kv.first.to_string(),
                          logfmt::parser::to_string(kv.second));
                return false;
            },
            [](const logfmt::parser::bare_word&) { return false; });
    }
}

static void
extract_regex(const pcre2pp::code& code,
              string_fragment line,
              field_map& fields,
              merge_policy policy)
{
    thread_local pcre2pp::match_data md;

    if (!code.match(line, md)) {
        return;
    }

    for (const auto& nc : code.get_named_captures()) {
        if (nc.nc_name.front() == '_') {
            continue;
        }

        auto cap = md[nc.nc_index];
        if (!cap) {
            continue;
        }
        add_field(fields, policy, nc.nc_name, cap->to_string());
    }
}

static void
extract_csv(const field_extractor::csv_kind& ck,
            string_fragment line,
            extract_context& ctx,
            field_map& fields,
            merge_policy policy)
{
    if (!ctx.ec_csv_header) {
        ctx.ec_csv_separator = ck.ck_separator.value_or(
            csv::guess_separator(line));
        ctx.ec_csv_header = csv::split_row(line, ctx.ec_csv_separator);
        log_debug("%s: CSV header has %zu columns, separator '%c'",
                  ctx.ec_source_name.c_str(),
                  ctx.ec_csv_header->size(),
                  ctx.ec_csv_separator);
        return;
    }

    const auto& header = ctx.ec_csv_header.value();
    auto cells = csv::split_row(line, ctx.ec_csv_separator);
    for (size_t lpc = 0; lpc < cells.size(); lpc++) {
        auto name = lpc < header.size() && !header[lpc].empty()
            ? header[lpc]
            : fmt::format(FMT_STRING("header_{}"), lpc);

        add_field(fields, policy, std::move(name), std::move(cells[lpc]));
    }
}

static void
extract_json(string_fragment line, field_map& fields, merge_policy policy)
{
    std::vector<json::flat_pair> pairs;

    if (!json::flatten_object(line, pairs)) {
        return;
    }

    for (auto& pair : pairs) {
        add_field(
            fields, policy, std::move(pair.first), std::move(pair.second));
    }
}

static void
extract_journal(string_fragment line, field_map& fields, merge_policy policy)
{
    auto entry_opt = journal::parse_line(line);
    if (!entry_opt) {
        return;
    }

    const auto& ent = entry_opt.value();
    add_field(fields, policy, TIMESTAMP_FIELD, ent.e_timestamp.to_string());
    add_field(fields, policy, "hostname", ent.e_hostname.to_string());
    add_field(fields, policy, "service", ent.e_service.to_string());
    if (ent.e_pid) {
        add_field(fields, policy, "pid", ent.e_pid->to_string());
    }
    add_field(fields, policy, "message", ent.e_message.to_string());
}

static void
transform_timestamp(const std::string& field_name, field_map& fields)
{
    const auto* value = fields.find(field_name);
    if (value == nullptr) {
        return;
    }

    auto zp = time::parse_timestamp(string_fragment::from_str(*value));
    if (!zp) {
        log_trace("cannot normalize %s: %s",
                  field_name.c_str(),
                  value->c_str());
        return;
    }

    fields.set(field_name, time::to_rfc3339_string(zp.value()));
}

static void
extract_autodatetime(string_fragment line,
                     field_map& fields,
                     merge_policy policy)
{
    static const auto TIME_RE = pcre2pp::code::from_const(
        R"((\d{4}-\d{2}-\d{2}[T ]\d{2}:\d{2}:\d{2}(?:[.,]\d+)?(?:Z|[+-]\d{2}:?\d{2})?))"
        R"(|\[(\d{2}/[A-Z][a-z]{2}/\d{4}:\d{2}:\d{2}:\d{2}(?: [+-]\d{4})?)\])"
        R"(|\b([A-Z][a-z]{2} [ \d]\d \d{2}:\d{2}:\d{2})\b)");
    thread_local pcre2pp::match_data md;

    if (fields.contains(TIMESTAMP_FIELD)) {
        return;
    }

    if (!TIME_RE.match(line, md)) {
        return;
    }

    for (size_t lpc = 1; lpc < md.get_count(); lpc++) {
        auto cap = md[lpc];

        if (cap) {
            add_field(fields, policy, TIMESTAMP_FIELD, cap->to_string());
            return;
        }
    }
}

void
field_extractor::extract(string_fragment line,
                         extract_context& ctx,
                         field_map& fields,
                         merge_policy policy) const
{
    this->fe_kind.match(
        [&](const logfmt_kind&) { extract_logfmt(line, fields, policy); },
        [&](const pattern_kind& pk) {
            std::vector<line_pattern::capture> caps;

            if (pk.pk_pattern->match(line, caps)) {
                for (const auto& cap : caps) {
                    add_field(fields,
                              policy,
                              cap.first.to_string(),
                              cap.second.to_string());
                }
            }
        },
        [&](const regex_kind& rk) {
            extract_regex(*rk.rk_code, line, fields, policy);
        },
        [&](const csv_kind& ck) {
            extract_csv(ck, line, ctx, fields, policy);
        },
        [&](const json_kind&) { extract_json(line, fields, policy); },
        [&](const journal_kind&) { extract_journal(line, fields, policy); },
        [&](const transform_kind& tk) {
            transform_timestamp(tk.tk_field, fields);
        },
        [&](const autodatetime_kind&) {
            extract_autodatetime(line, fields, policy);
        });
}

void
run_extractors(const std::vector<field_extractor>& extractors,
               merge_policy policy,
               string_fragment line,
               extract_context& ctx,
               field_map& fields)
{
    for (const auto& fe : extractors) {
        fe.extract(line, ctx, fields, policy);
    }
}

}  // namespace lsift
