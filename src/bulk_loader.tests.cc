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
 * @file bulk_loader.tests.cc
 */

#include <atomic>

#include "bulk_loader.hh"

#include "config.h"
#include "doctest/doctest.h"
#include "fmt/format.h"

using namespace lsift;

namespace {

std::shared_ptr<const rule>
make_rule(std::vector<std::string> extractors)
{
    static regex_cache cache;
    rule_def rd;

    rd.rd_name = "test";
    rd.rd_extractors = std::move(extractors);

    return rule::compile(rd, cache, "/rules/0").unwrap();
}

}  // namespace

TEST_CASE("bulk load keeps the line order")
{
    auto r = make_rule({"logfmt"});
    std::vector<std::string> lines;

    for (int lpc = 0; lpc < 10000; lpc++) {
        lines.emplace_back(fmt::format(FMT_STRING("seq={} msg=hello"), lpc));
    }

    extract_context ctx;
    ctx.ec_source_name = "seq.log";
    auto records = bulk_loader(*r, 7)
                       .with_chunk_size(97)
                       .with_max_tasks(4)
                       .load(lines, ctx);

    REQUIRE(records.size() == lines.size());
    for (size_t lpc = 0; lpc < records.size(); lpc++) {
        const auto& rec = records[lpc];

        REQUIRE(rec.get_original() == lines[lpc]);
        REQUIRE(*rec.get_fields().find("seq"_frag) == std::to_string(lpc));
        REQUIRE(*rec.get_fields().find("line_number"_frag)
                == std::to_string(lpc + 1));
        REQUIRE(rec.get_source_id() == 7);
    }
    CHECK(*records[0].get_fields().find("filename"_frag) == "seq.log");
    CHECK(ctx.ec_line_number == lines.size());
}

TEST_CASE("bulk load shares the CSV header with every chunk")
{
    auto r = make_rule({"csv"});
    std::vector<std::string> lines = {"id;name"};

    for (int lpc = 1; lpc < 50; lpc++) {
        lines.emplace_back(fmt::format(FMT_STRING("{};user{}"), lpc, lpc));
    }

    extract_context ctx;
    auto records
        = bulk_loader(*r, 1).with_chunk_size(5).load(std::move(lines), ctx);

    REQUIRE(records.size() == 50);
    CHECK(records[0].get_fields().find("id"_frag) == nullptr);
    CHECK(*records[49].get_fields().find("id"_frag) == "49");
    CHECK(*records[49].get_fields().find("name"_frag) == "user49");
}

TEST_CASE("bulk load continues the line numbers")
{
    auto r = make_rule({"logfmt"});
    extract_context ctx;

    ctx.ec_source_name = "app.log";
    auto first = bulk_loader(*r, 1).load({"a=1", "a=2"}, ctx);
    auto second = bulk_loader(*r, 1).load({"a=3"}, ctx);

    REQUIRE(second.size() == 1);
    CHECK(*second[0].get_fields().find("line_number"_frag) == "3");
}

TEST_CASE("bulk load metadata does not replace extracted fields")
{
    auto r = make_rule({"logfmt"});
    extract_context ctx;

    ctx.ec_source_name = "app.log";
    auto records = bulk_loader(*r, 1).load({"filename=other.c line=1"}, ctx);

    CHECK(*records[0].get_fields().find("filename"_frag) == "other.c");
    CHECK(*records[0].get_fields().find("line_number"_frag) == "1");
}

TEST_CASE("bulk load stops when interrupted")
{
    auto r = make_rule({"logfmt"});
    std::atomic<bool> looping{false};
    std::vector<std::string> lines;

    for (int lpc = 0; lpc < 1000; lpc++) {
        lines.emplace_back(fmt::format(FMT_STRING("n={}"), lpc));
    }

    extract_context ctx;
    auto records = bulk_loader(*r, 1)
                       .with_chunk_size(10)
                       .with_max_tasks(1)
                       .with_looping(&looping)
                       .load(lines, ctx);

    CHECK(records.size() < lines.size());
    for (size_t lpc = 0; lpc < records.size(); lpc++) {
        REQUIRE(records[lpc].get_original() == lines[lpc]);
    }
}
