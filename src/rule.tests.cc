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
 * @file rule.tests.cc
 */

#include "rule.hh"

#include "config.h"
#include "doctest/doctest.h"
#include "rules_loader.hh"

using namespace lsift;

TEST_CASE("rule selection by file pattern")
{
    regex_cache cache;
    auto rules
        = rule_set::compile(builtin_rule_defs(), global_options{}, cache)
              .unwrap();

    CHECK(rules.find_rule("/var/log/app.jsonl"_frag).get_name() == "json");
    CHECK(rules.find_rule("events.json"_frag).get_name() == "json");
    CHECK(rules.find_rule("export.csv"_frag).get_name() == "csv");
    CHECK(rules.find_rule("/var/log/nginx/access.log"_frag).get_name()
          == "access_log");
    CHECK(rules.find_rule("journalctl -f -o short-iso"_frag).get_name()
          == "journal");
    CHECK(rules.find_rule("/var/log/syslog.1"_frag).get_name() == "syslog");
    CHECK(rules.find_rule("app.log"_frag).get_name() == "default");
    CHECK(rules.find_rule_by_name("csv"_frag) != nullptr);
    CHECK(rules.find_rule_by_name("nope"_frag) == nullptr);
}

TEST_CASE("rule selection prefers the first match")
{
    regex_cache cache;
    rule_def custom;

    custom.rd_name = "app";
    custom.rd_file_patterns = {R"(^app.*\.json$)"};
    custom.rd_extractors = {"json"};

    auto defs = builtin_rule_defs();
    defs.insert(defs.begin(), custom);
    auto rules = rule_set::compile(defs, global_options{}, cache).unwrap();

    CHECK(rules.find_rule("app-2024.json"_frag).get_name() == "app");
    CHECK(rules.find_rule("other.json"_frag).get_name() == "json");
}

TEST_CASE("rule set without a default")
{
    regex_cache cache;
    rule_def only;

    only.rd_name = "only";
    only.rd_file_patterns = {"only"};
    auto rules = rule_set::compile({only}, global_options{}, cache).unwrap();

    const auto& fallback = rules.find_rule("something.log"_frag);
    CHECK(fallback.get_name().empty());
    CHECK(fallback.get_extractors().empty());
}

TEST_CASE("builtin access_log rule")
{
    regex_cache cache;
    auto rules
        = rule_set::compile(builtin_rule_defs(), global_options{}, cache)
              .unwrap();
    const auto& access = rules.find_rule("access.log"_frag);
    extract_context ctx;
    field_map fields;

    access.extract(
        R"(10.0.0.1 - frank [10/Oct/2023:13:55:36 -0700] "GET /apache_pb.gif HTTP/1.0" 404 2326 "http://example.com/" "Mozilla/4.08")"_frag,
        ctx,
        fields);

    CHECK(*fields.find("ip"_frag) == "10.0.0.1");
    CHECK(*fields.find("user"_frag) == "frank");
    CHECK(*fields.find("timestamp"_frag) == "2023-10-10T13:55:36-07:00");
    CHECK(*fields.find("method"_frag) == "GET");
    CHECK(*fields.find("url"_frag) == "/apache_pb.gif");
    CHECK(*fields.find("status"_frag) == "404");
    CHECK(*fields.find("user_agent"_frag) == "Mozilla/4.08");

    const auto* not_found = access.find_filter("not-found"_frag);
    REQUIRE(not_found != nullptr);
    CHECK(not_found->nf_def.fd_highlight == "yellow");

    record rec{"line"};
    rec.get_fields() = fields;
    CHECK(not_found->nf_filter->matches(rec));
    CHECK_FALSE(access.find_filter("errors"_frag)->nf_filter->matches(rec));
    CHECK(access.get_columns().size() == 3);
}

TEST_CASE("rule compile errors name the location")
{
    regex_cache cache;

    auto check_error = [&cache](rule_def rd, const char* path) {
        auto res = rule_set::compile({rd}, global_options{}, cache);

        REQUIRE(res.isErr());
        CHECK(res.unwrapErr().ce_path == path);
    };

    rule_def bad_extractor;
    bad_extractor.rd_name = "x";
    bad_extractor.rd_extractors = {"logfmt", "xml"};
    check_error(bad_extractor, "/rules/0/extractors/1");

    rule_def bad_pattern;
    bad_pattern.rd_name = "x";
    bad_pattern.rd_file_patterns = {"(oops"};
    check_error(bad_pattern, "/rules/0/file-patterns/0");

    rule_def bad_filter;
    bad_filter.rd_name = "x";
    bad_filter.rd_filters = {{"broken", "status >=", "", ""}};
    check_error(bad_filter, "/rules/0/filters/0/expression");

    check_error(rule_def{}, "/rules/0/name");
}

TEST_CASE("parse_rules")
{
    static const char* RULES = R"({
  "global": {"reload-on-truncate": true, "colour": "blue"},
  "rules": [
    {
      "name": "apache",
      "file-patterns": ["access\\.log$"],
      "merge-policy": "last-wins",
      "extractors": ["pattern <ip> <_> <_> [<timestamp>] <rest>",
                     "transform timestamp iso8601"],
      "filters": [{"name": "errors", "expression": "status >= 500",
                   "highlight": "red", "gutter": "red"}],
      "columns": [{"name": "status", "width": 3, "align": "right"}],
      "comment": "unknown keys are ignored"
    }
  ]
})";

    auto config = parse_rules(string_fragment::from_c_str(RULES), "test.json")
                      .unwrap();

    CHECK(config.rc_global.go_reload_on_truncate);
    REQUIRE(config.rc_rules.size() == 1);

    const auto& rd = config.rc_rules[0];
    CHECK(rd.rd_name == "apache");
    CHECK(rd.rd_file_patterns == std::vector<std::string>{"access\\.log$"});
    CHECK(rd.rd_extractors.size() == 2);
    CHECK(rd.rd_merge_policy == merge_policy::last_wins);
    REQUIRE(rd.rd_filters.size() == 1);
    CHECK(rd.rd_filters[0].fd_expression == "status >= 500");
    CHECK(rd.rd_filters[0].fd_gutter == "red");
    REQUIRE(rd.rd_columns.size() == 1);
    CHECK(rd.rd_columns[0].cd_width == 3);
    CHECK(rd.rd_columns[0].cd_align == column_align::right);

    regex_cache cache;
    CHECK(rule_set::compile(config.rc_rules, config.rc_global, cache).isOk());
}

TEST_CASE("parse_rules errors")
{
    auto check_error = [](const char* json, const char* expected_path) {
        auto res
            = parse_rules(string_fragment::from_c_str(json), "test.json");

        REQUIRE_MESSAGE(res.isErr(), json);
        CHECK(res.unwrapErr().ce_path == expected_path);
    };

    check_error("[]", "test.json:");
    check_error("{\"rules\": {}}", "test.json:/rules");
    check_error("{\"rules\": [{\"name\": 1}]}", "test.json:/rules/0/name");
    check_error("{\"rules\": [{\"name\": \"a\", \"merge-policy\": \"x\"}]}",
                "test.json:/rules/0/merge-policy");
    check_error(
        "{\"rules\": [{\"name\": \"a\", \"file-patterns\": [\"a\", 2]}]}",
        "test.json:/rules/0/file-patterns/1");
    check_error("{\"rules\": [{\"name\": \"a\", \"filters\": [{}]}]}",
                "test.json:/rules/0/filters/0/expression");
    check_error(
        "{\"rules\": [{\"name\": \"a\", \"columns\": [{\"align\": \"up\"}]}]}",
        "test.json:/rules/0/columns/0/align");
    check_error(
        "{\"rules\": [{\"name\": \"a\", \"columns\": [{\"width\": -1}]}]}",
        "test.json:/rules/0/columns/0/width");
    check_error("{\"global\": {\"reload-on-truncate\": \"yes\"}}",
                "test.json:/global/reload-on-truncate");

    auto invalid = parse_rules("{\"rules\": ["_frag, "test.json");
    REQUIRE(invalid.isErr());
    CHECK(invalid.unwrapErr().ce_message.find("invalid JSON") == 0);
}

TEST_CASE("load_rules_file missing file")
{
    auto res = load_rules_file("/tmp/lsift.no-such-rules.json");

    REQUIRE(res.isErr());
    CHECK(res.unwrapErr().ce_path == "/tmp/lsift.no-such-rules.json");
}
