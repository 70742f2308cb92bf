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
 * @file field_extractor.tests.cc
 */

#include "field_extractor.hh"

#include "config.h"
#include "doctest/doctest.h"

using namespace lsift;

namespace {

struct extractor_fixture {
    regex_cache ef_cache;
    extract_context ef_context;

    std::vector<field_extractor> make(std::vector<const char*> specs)
    {
        std::vector<field_extractor> retval;

        for (const auto* spec : specs) {
            auto fe_res = field_extractor::from_spec(
                string_fragment::from_c_str(spec), this->ef_cache);

            REQUIRE_MESSAGE(fe_res.isOk(), spec);
            retval.emplace_back(fe_res.unwrap());
        }
        return retval;
    }

    field_map run(const std::vector<field_extractor>& fes,
                  const char* line,
                  merge_policy policy = merge_policy::first_wins)
    {
        field_map retval;

        run_extractors(fes,
                       policy,
                       string_fragment::from_c_str(line),
                       this->ef_context,
                       retval);
        this->ef_context.ec_line_number += 1;
        return retval;
    }
};

std::string
value_of(const field_map& fields, const char* key)
{
    const auto* value = fields.find(string_fragment::from_c_str(key));

    return value == nullptr ? "<absent>" : *value;
}

}  // namespace

TEST_CASE_FIXTURE(extractor_fixture, "logfmt extractor")
{
    auto fes = this->make({"logfmt"});
    auto fields
        = this->run(fes, "level=info msg=\"user logged in\" bare dur=1.5s");

    CHECK(fields.size() == 3);
    CHECK(value_of(fields, "level") == "info");
    CHECK(value_of(fields, "msg") == "user logged in");
    CHECK(value_of(fields, "dur") == "1.5s");

    fields = this->run(fes, "level=warn msg=\"hello world code=7");
    CHECK(value_of(fields, "level") == "warn");
    CHECK(value_of(fields, "msg") == "\"hello");
    CHECK(value_of(fields, "code") == "7");
}

TEST_CASE_FIXTURE(extractor_fixture, "pattern extractor")
{
    auto fes = this->make({"pattern <a> <b>"});
    auto fields = this->run(fes, "1 2");

    CHECK(value_of(fields, "a") == "1");
    CHECK(value_of(fields, "b") == "2");

    CHECK(this->run(fes, "12").empty());
}

TEST_CASE_FIXTURE(extractor_fixture, "regex extractor")
{
    auto fes = this->make(
        {R"(regex ^(?<method>[A-Z]+) (?<path>\S+)(?: (?<_proto>HTTP/\S+))?(?: (?<size>\d+))?$)"});
    auto fields = this->run(fes, "GET /index.html HTTP/1.1");

    CHECK(value_of(fields, "method") == "GET");
    CHECK(value_of(fields, "path") == "/index.html");
    CHECK(value_of(fields, "_proto") == "<absent>");
    CHECK(value_of(fields, "size") == "<absent>");

    CHECK(this->run(fes, "not a request").empty());
}

TEST_CASE_FIXTURE(extractor_fixture, "csv extractor with extra columns")
{
    auto fes = this->make({"csv"});

    CHECK(this->run(fes, "time;level;msg").empty());

    auto fields = this->run(fes, "10:00;ERROR;\"disk; full\";extra1;extra2");
    CHECK(fields.size() == 5);
    CHECK(value_of(fields, "time") == "10:00");
    CHECK(value_of(fields, "level") == "ERROR");
    CHECK(value_of(fields, "msg") == "disk; full");
    CHECK(value_of(fields, "header_3") == "extra1");
    CHECK(value_of(fields, "header_4") == "extra2");
    CHECK(this->ef_context.ec_csv_separator == ';');
}

TEST_CASE_FIXTURE(extractor_fixture, "csv extractor with explicit separator")
{
    auto fes = this->make({"csv tab"});

    this->run(fes, "a,b\tc");
    auto fields = this->run(fes, "1,2\t3");
    CHECK(value_of(fields, "a,b") == "1,2");
    CHECK(value_of(fields, "c") == "3");
}

TEST_CASE_FIXTURE(extractor_fixture, "json extractor")
{
    auto fes = this->make({"json"});
    auto fields = this->run(fes, R"({"level":"warn","ctx":{"user":"bob"}})");

    CHECK(value_of(fields, "level") == "warn");
    CHECK(value_of(fields, "ctx.user") == "bob");
    CHECK(this->run(fes, "{broken").empty());
}

TEST_CASE_FIXTURE(extractor_fixture, "journal extractor")
{
    auto fes = this->make({"journal"});
    auto fields = this->run(
        fes, "2024-03-01T10:15:30+0000 web01 sshd[99]: session opened");

    CHECK(value_of(fields, "timestamp") == "2024-03-01T10:15:30+0000");
    CHECK(value_of(fields, "hostname") == "web01");
    CHECK(value_of(fields, "service") == "sshd");
    CHECK(value_of(fields, "pid") == "99");
    CHECK(value_of(fields, "message") == "session opened");
}

TEST_CASE_FIXTURE(extractor_fixture, "transform normalizes timestamps")
{
    auto fes = this->make({"logfmt", "transform timestamp iso8601"});

    auto fields = this->run(fes, "timestamp=\"10/Oct/2023:13:55:36 -0700\"");
    CHECK(value_of(fields, "timestamp") == "2023-10-10T13:55:36-07:00");

    fields = this->run(fes, "timestamp=\"2023-10-10 13:55:36.125\" a=1");
    CHECK(value_of(fields, "timestamp") == "2023-10-10T13:55:36.125+00:00");
    // the field keeps its position
    CHECK(fields.begin()->first == "timestamp");

    fields = this->run(fes, "timestamp=whenever");
    CHECK(value_of(fields, "timestamp") == "whenever");

    fields = this->run(fes, "a=1");
    CHECK(value_of(fields, "timestamp") == "<absent>");
}

TEST_CASE_FIXTURE(extractor_fixture, "transform of another field")
{
    auto fes = this->make({"logfmt", "transform when rfc3339"});
    auto fields = this->run(fes, "when=2023-10-10T13:55:36Z");

    CHECK(value_of(fields, "when") == "2023-10-10T13:55:36+00:00");
}

TEST_CASE_FIXTURE(extractor_fixture, "autodatetime")
{
    auto fes = this->make({"logfmt", "autodatetime"});

    auto fields = this->run(fes, "2023-10-10 13:55:36 level=info started");
    CHECK(value_of(fields, "timestamp") == "2023-10-10 13:55:36");

    fields = this->run(
        fes, "127.0.0.1 - - [10/Oct/2023:13:55:36 -0700] \"GET / HTTP/1.1\"");
    CHECK(value_of(fields, "timestamp") == "10/Oct/2023:13:55:36 -0700");

    fields = this->run(fes, "Oct 10 13:55:36 host cron[1]: tick");
    CHECK(value_of(fields, "timestamp") == "Oct 10 13:55:36");

    fields = this->run(fes, "timestamp=early 2023-10-10T13:55:36Z");
    CHECK(value_of(fields, "timestamp") == "early");

    fields = this->run(fes, "nothing to see");
    CHECK(value_of(fields, "timestamp") == "<absent>");
}

TEST_CASE_FIXTURE(extractor_fixture, "merge policies")
{
    auto fes = this->make({"logfmt", "pattern <level> <rest>"});
    const char* line = "level=info msg=hi";

    auto first = this->run(fes, line, merge_policy::first_wins);
    CHECK(value_of(first, "level") == "info");
    CHECK(value_of(first, "rest") == "msg=hi");

    auto last = this->run(fes, line, merge_policy::last_wins);
    CHECK(value_of(last, "level") == "level=info");
    CHECK(value_of(last, "msg") == "hi");
    // an overwritten key keeps its original position
    CHECK(last.begin()->first == "level");
}

TEST_CASE("merge_policy names")
{
    CHECK(merge_policy_from_name("first-wins"_frag).value()
          == merge_policy::first_wins);
    CHECK(merge_policy_from_name("last-wins"_frag).value()
          == merge_policy::last_wins);
    CHECK_FALSE(merge_policy_from_name("newest"_frag).has_value());
    CHECK(std::string(merge_policy_name(merge_policy::last_wins))
          == "last-wins");
}

TEST_CASE("field_extractor rejects malformed extractors")
{
    regex_cache cache;

    auto check_error = [&cache](const char* spec, const char* expected) {
        auto res = field_extractor::from_spec(
            string_fragment::from_c_str(spec), cache);

        REQUIRE_MESSAGE(res.isErr(), spec);
        auto ce = res.unwrapErr();
        CHECK_MESSAGE(ce.ce_message.find(expected) != std::string::npos,
                      ce.ce_message);
    };

    check_error("xml", "unknown extractor kind: xml");
    check_error("", "empty extractor");
    check_error("logfmt strict", "does not take arguments");
    check_error("regex", "requires a pattern");
    check_error("regex (unclosed", "invalid regex");
    check_error("pattern <a><b>", "invalid pattern");
    check_error("csv ::", "invalid CSV separator");
    check_error("transform timestamp epoch", "unsupported transform");
}
