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
 * @file filter.eval.tests.cc
 */

#include "filter.eval.hh"

#include "config.h"
#include "doctest/doctest.h"

using namespace lsift;

static record
make_record(const char* line,
            std::vector<std::pair<std::string, std::string>> fields = {})
{
    record retval{line};

    for (auto& field : fields) {
        retval.get_fields().set(std::move(field.first),
                                std::move(field.second));
    }
    return retval;
}

static bool
matches(const char* expr, const record& rec)
{
    static regex_cache cache;

    auto compile_res = filter::compiled_filter::compile(
        string_fragment::from_c_str(expr), cache);
    REQUIRE_MESSAGE(compile_res.isOk(), expr);

    return compile_res.unwrap()->matches(rec);
}

TEST_CASE("free text matches the line and field values")
{
    auto error_line = make_record("2024-01-01 ERROR disk full");
    auto error_field = make_record("something failed", {{"level", "ERROR"}});
    auto info_line = make_record("2024-01-01 INFO all good");

    CHECK(matches("ERROR", error_line));
    CHECK(matches("ERROR", error_field));
    CHECK_FALSE(matches("ERROR", info_line));

    CHECK(matches("\"ERROR\"", error_line));
    CHECK(matches("\"ERROR\"", error_field));
    CHECK_FALSE(matches("\"ERROR\"", info_line));

    CHECK_FALSE(matches("error", error_line));
    CHECK(matches("\"disk full\"", error_line));
}

TEST_CASE("numeric comparisons")
{
    auto not_found = make_record("GET /missing", {{"status", "404"}});
    auto ok = make_record("GET /", {{"status", "200"}});
    auto no_status = make_record("GET /");

    CHECK(matches("status >= 400", not_found));
    CHECK_FALSE(matches("status >= 400", ok));
    CHECK_FALSE(matches("status >= 400", no_status));
    CHECK(matches("status == 404", not_found));
    CHECK(matches("status == 404.0", not_found));
    CHECK(matches("status != 404", ok));
    CHECK(matches("status < 300", ok));
    CHECK(matches("status <= 200", ok));
    CHECK(matches("status > 99", ok));
}

TEST_CASE("string comparisons")
{
    auto rec = make_record("x",
                           {{"level", "ERROR"},
                            {"ts", "2024-01-02T03:04:05+00:00"},
                            {"size", "10"}});

    CHECK(matches("level == ERROR", rec));
    CHECK(matches("level == \"ERROR\"", rec));
    CHECK_FALSE(matches("level == error", rec));
    CHECK(matches("level != INFO", rec));
    CHECK(matches("ts > \"2024-01-01T00:00:00+00:00\"", rec));
    CHECK_FALSE(matches("ts > \"2024-02-01T00:00:00+00:00\"", rec));
    // quoted numbers still compare as numbers
    CHECK(matches("size > 9", rec));
    CHECK(matches("size > \"9\"", rec));
    CHECK(matches("size < abc", rec));
}

TEST_CASE("regex predicates")
{
    auto get = make_record("GET /index.html", {{"path", "/index.html"}});
    auto post = make_record("POST /login", {{"path", "/login.php"}});

    CHECK(matches("~ \"^GET\"", get));
    CHECK_FALSE(matches("~ \"^GET\"", post));
    CHECK(matches("path ~ \"\\.php$\"", post));
    CHECK_FALSE(matches("path ~ \"\\.php$\"", get));
    CHECK_FALSE(matches("missing ~ \".\"", get));
}

TEST_CASE("boolean operators")
{
    auto rec = make_record("a b", {{"level", "WARN"}, {"status", "503"}});

    CHECK(matches("level == WARN && status >= 500", rec));
    CHECK_FALSE(matches("level == WARN && status < 500", rec));
    CHECK(matches("level == INFO || status >= 500", rec));
    CHECK(matches("!ERROR", rec));
    CHECK_FALSE(matches("!!ERROR", rec));
    CHECK(matches("level == INFO || level == WARN && b", rec));
    CHECK_FALSE(matches("level == INFO && a || c", rec));
}

TEST_CASE("compiling twice gives the same answers")
{
    regex_cache cache;
    std::vector<record> sample = {
        make_record("GET / 200", {{"status", "200"}}),
        make_record("GET /x 404", {{"status", "404"}}),
        make_record("POST /y 500", {{"status", "500"}, {"level", "ERROR"}}),
        make_record("plain text"),
    };
    const auto expr = "status >= 400 && ~ \"^GET\" || level == ERROR"_frag;

    auto first = filter::compiled_filter::compile(expr, cache).unwrap();
    auto second = filter::compiled_filter::compile(expr, cache).unwrap();

    for (const auto& rec : sample) {
        CHECK(first->matches(rec) == second->matches(rec));
    }
    CHECK(first->get_text() == "status >= 400 && ~ \"^GET\" || level == ERROR");
}

TEST_CASE("compile errors")
{
    regex_cache cache;

    auto bad_regex = filter::compiled_filter::compile("~ \"(\""_frag, cache);
    REQUIRE(bad_regex.isErr());
    CHECK(bad_regex.unwrapErr().ce_message.find("invalid regular expression")
          == 0);

    CHECK(filter::compiled_filter::compile(""_frag, cache).isErr());
    CHECK(filter::compiled_filter::compile("a ||"_frag, cache).isErr());
}
