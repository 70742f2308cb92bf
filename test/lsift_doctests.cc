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
 * @file lsift_doctests.cc
 */

#include <chrono>
#include <filesystem>
#include <functional>
#include <thread>

#include "config.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "base/auto_fd.hh"
#include "base/fs_util.hh"
#include "doctest/doctest.h"
#include "ingest_queue.hh"
#include "line_buffer.hh"
#include "regex_cache.hh"
#include "rule.hh"
#include "session.hh"

using namespace lsift;
using namespace std::chrono_literals;

namespace {

class temp_file {
public:
    explicit temp_file(const char* content)
    {
        auto temp_pair
            = filesystem::open_temp_file("/tmp/lsift.test.XXXXXX").unwrap();

        this->tf_path = temp_pair.first;
        this->replace(content);
    }

    ~temp_file()
    {
        std::error_code ec;

        std::filesystem::remove(this->tf_path, ec);
    }

    const std::filesystem::path& get_path() const { return this->tf_path; }

    void replace(const char* content)
    {
        auto write_res = filesystem::write_file(
            this->tf_path, string_fragment::from_c_str(content));

        REQUIRE(write_res.isOk());
    }

    void append(const char* content)
    {
        auto fd = filesystem::open_file(this->tf_path, O_WRONLY | O_APPEND)
                      .unwrap();

        REQUIRE(fd.write_fully(string_fragment::from_c_str(content)).isOk());
    }

private:
    std::filesystem::path tf_path;
};

bool
poll_until(session& sess, const std::function<bool()>& pred)
{
    auto deadline = std::chrono::steady_clock::now() + 10s;

    while (std::chrono::steady_clock::now() < deadline) {
        sess.poll();
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(20ms);
    }

    return false;
}

std::vector<std::string>
originals(const session& sess)
{
    std::vector<std::string> retval;

    for (size_t lpc = 0; lpc < sess.record_count(); lpc++) {
        retval.emplace_back(sess.get_record(lpc)->get_original());
    }
    return retval;
}

std::string
field_of(const record* rec, const char* key)
{
    const auto* value
        = rec->get_fields().find(string_fragment::from_c_str(key));

    return value == nullptr ? "<absent>" : *value;
}

struct session_fixture {
    explicit session_fixture(bool reload_on_truncate = false)
    {
        global_options global;

        global.go_reload_on_truncate = reload_on_truncate;
        this->sf_rules = std::make_unique<rule_set>(
            rule_set::compile(builtin_rule_defs(), global, this->sf_cache)
                .unwrap());
        this->sf_session
            = std::make_unique<session>(*this->sf_rules, this->sf_cache);
    }

    session& sess() { return *this->sf_session; }

    regex_cache sf_cache;
    std::unique_ptr<rule_set> sf_rules;
    std::unique_ptr<session> sf_session;
};

struct reloading_fixture : session_fixture {
    reloading_fixture() : session_fixture(true) {}
};

}  // namespace

TEST_CASE("line_buffer splits lines from a pipe")
{
    auto_fd fds[2];

    REQUIRE(auto_fd::pipe(fds) == 0);
    REQUIRE(fds[1]
                .write_fully("one\r\ntwo \xff\nthree"_frag)
                .isOk());
    fds[1].reset();

    line_buffer lb(std::move(fds[0]));
    CHECK_FALSE(lb.is_seekable());

    auto lines = lb.read_available_lines().unwrap();
    std::vector<std::string> expected = {
        "one",
        "two \xef\xbf\xbd",
        "three",
    };
    CHECK(lines == expected);
    CHECK(lb.get_encoding_errors() == 1);
    CHECK(lb.is_eof());
}

TEST_CASE("line_buffer holds a partial line from a file")
{
    temp_file tf("first\nsecond\npart");
    auto fd = filesystem::open_file(tf.get_path(), O_RDONLY).unwrap();
    line_buffer lb(std::move(fd));

    CHECK(lb.is_seekable());
    auto lines = lb.read_available_lines().unwrap();
    std::vector<std::string> expected = {"first", "second"};
    CHECK(lines == expected);
    CHECK(lb.get_read_offset() == 17);

    tf.append("ial\n");
    lines = lb.read_available_lines().unwrap();
    expected = {"partial"};
    CHECK(lines == expected);
}

TEST_CASE("ingest_queue keeps the order of events")
{
    ingest_queue queue;

    CHECK(queue.empty());
    queue.push_records(1, {record{"a"}, record{"b"}}, 0);
    queue.push_records(1, {}, 0);
    queue.push_state(2, source_state::error, "boom");
    queue.push_records(1, {record{"c"}}, 2);
    CHECK_FALSE(queue.empty());

    auto events = queue.drain();
    CHECK(queue.empty());
    REQUIRE(events.size() == 3);
    CHECK(events[0].ie_source == 1);
    CHECK(events[0].ie_payload.get<record_batch>().rb_records.size() == 2);
    CHECK(events[1].ie_payload.get<state_change>().sc_message == "boom");
    CHECK(events[2].ie_payload.get<record_batch>().rb_encoding_errors == 2);
    CHECK(std::string(source_state_name(source_state::truncated))
          == "truncated");
}

TEST_CASE_FIXTURE(session_fixture, "appending with an active filter")
{
    auto sid = this->sess().add_source("app.log");
    auto filt = this->sess().compile_filter("level == \"ERROR\""_frag).unwrap();

    this->sess().append_line(sid, "level=ERROR msg=one");
    this->sess().append_line(sid, "level=INFO msg=two");
    const auto& view = this->sess().apply_filter(filt);
    REQUIRE(view.size() == 1);

    this->sess().append_line(sid, "level=INFO msg=three");
    CHECK(view.size() == 1);

    auto index = this->sess().append_line(sid, "level=ERROR msg=four");
    REQUIRE(index.has_value());
    CHECK(view.size() == 2);
    CHECK(view.get_indexes().back() == index.value());

    CHECK_FALSE(this->sess().append_line(99, "lost").has_value());
}

TEST_CASE_FIXTURE(session_fixture, "records carry metadata fields")
{
    auto sid = this->sess().add_source("/var/log/app.log");

    this->sess().append_line(sid, "2024-01-01T00:00:00Z level=info started");
    this->sess().append_line(sid, "bad \xc3 byte");

    const auto* first = this->sess().get_record(0);
    CHECK(field_of(first, "filename") == "/var/log/app.log");
    CHECK(field_of(first, "line_number") == "1");
    CHECK(field_of(first, "timestamp") == "2024-01-01T00:00:00Z");
    CHECK(field_of(this->sess().get_record(1), "line_number") == "2");
    CHECK(this->sess().get_record(1)->get_original()
          == "bad \xef\xbf\xbd byte");
    CHECK(this->sess().source_status(sid)->si_encoding_errors == 1);
    CHECK(this->sess().source_status(sid)->si_rule_name == "default");
}

TEST_CASE_FIXTURE(session_fixture, "bulk load is the identity view")
{
    auto sid = this->sess().add_source("data.csv");
    std::vector<std::string> lines = {"a,b"};

    for (int lpc = 0; lpc < 5000; lpc++) {
        lines.emplace_back(std::to_string(lpc) + ",x");
    }

    auto indexes = this->sess().bulk_load(sid, lines);
    REQUIRE(indexes.size() == lines.size());
    CHECK(originals(this->sess()) == lines);

    const auto& view = this->sess().get_view();
    REQUIRE(view.size() == lines.size());
    for (size_t lpc = 0; lpc < view.size(); lpc++) {
        REQUIRE(view.at(lpc).value() == lpc);
    }
    CHECK(field_of(this->sess().get_record(5000), "a") == "4999");
}

TEST_CASE_FIXTURE(session_fixture, "loading a file counts invalid bytes")
{
    temp_file tf("level=info ok\nbad \xc3 byte\nlast \xff");

    auto sid = this->sess().load_file(tf.get_path()).unwrap();
    const auto* info = this->sess().source_status(sid);

    REQUIRE(this->sess().record_count() == 3);
    CHECK(this->sess().get_record(1)->get_original()
          == "bad \xef\xbf\xbd byte");
    CHECK(this->sess().get_record(2)->get_original() == "last \xef\xbf\xbd");
    CHECK(info->si_encoding_errors == 2);
    CHECK(info->si_name == tf.get_path().string());
    CHECK_FALSE(this->sess().has_running_sources());

    CHECK(this->sess().load_file("/tmp/lsift.no-such-dir/x.log").isErr());
}

TEST_CASE_FIXTURE(session_fixture, "a bad filter edit keeps the old filter")
{
    auto sid = this->sess().add_source("app.log");
    auto& editor = this->sess().get_filter_editor();

    this->sess().append_line(sid, "GET /a");
    this->sess().append_line(sid, "POST /b");

    editor.begin_edit();
    editor.set_draft("~ \"^GET\"");
    REQUIRE(this->sess().commit_filter_edit().isOk());
    CHECK(this->sess().get_view().size() == 1);

    CHECK(this->sess().compile_filter("~ \"(\""_frag).isErr());
    editor.begin_edit();
    editor.set_draft("~ \"(\"");
    CHECK(this->sess().commit_filter_edit().isErr());
    CHECK(editor.is_editing());

    this->sess().append_line(sid, "GET /c");
    this->sess().append_line(sid, "POST /d");
    std::vector<record_index_t> expected = {0, 2};
    CHECK(this->sess().get_view().get_indexes() == expected);

    editor.begin_edit();
    editor.set_draft("");
    REQUIRE(this->sess().commit_filter_edit().isOk());
    CHECK(this->sess().get_view().size() == 4);
}

TEST_CASE_FIXTURE(session_fixture, "search, marks and field updates")
{
    auto sid = this->sess().add_source("app.log");

    for (int lpc = 0; lpc < 12; lpc++) {
        auto is_match = lpc == 2 || lpc == 5 || lpc == 9;

        this->sess().append_line(sid, is_match ? "msg=needle" : "msg=hay");
    }

    this->sess().set_search(
        this->sess().compile_filter("needle"_frag).unwrap());
    CHECK(this->sess().search_next(9).value() == 2);
    CHECK(this->sess().search_previous(2).value() == 9);

    this->sess().append_line(sid, "msg=needle");
    CHECK(this->sess().search_next(9).value() == 12);

    CHECK(this->sess().toggle_mark(5, "red").value());
    CHECK(this->sess().next_mark(9).value() == 5);
    CHECK_FALSE(this->sess().toggle_mark(5, "red").value());
    CHECK_FALSE(this->sess().get_record(5)->is_marked());
    CHECK_FALSE(this->sess().next_mark(0).has_value());

    CHECK(this->sess().update_field(3, "msg", std::string("edited")));
    CHECK(field_of(this->sess().get_record(3), "msg") == "edited");
    CHECK(this->sess().update_field(3, "msg", std::nullopt));
    CHECK(field_of(this->sess().get_record(3), "msg") == "<absent>");

    this->sess().clear_records();
    CHECK(this->sess().record_count() == 0);
    CHECK(this->sess().get_view().empty());
    CHECK(this->sess().get_search().get_matches().empty());
}

TEST_CASE_FIXTURE(session_fixture, "named filters come from the rules")
{
    auto sid = this->sess().add_source("access.log");

    this->sess().append_line(
        sid,
        R"(1.2.3.4 - - [10/Oct/2023:13:55:36 -0700] "GET / HTTP/1.1" 503 12)");
    this->sess().append_line(
        sid,
        R"(1.2.3.4 - - [10/Oct/2023:13:55:37 -0700] "GET /x HTTP/1.1" 200 12)");

    CHECK(this->sess().apply_named_filter("errors"_frag));
    std::vector<record_index_t> expected = {0};
    CHECK(this->sess().get_view().get_indexes() == expected);
    CHECK_FALSE(this->sess().apply_named_filter("no-such-filter"_frag));
}

TEST_CASE_FIXTURE(session_fixture, "tailing a file that grows")
{
    temp_file tf("level=info n=1\nlevel=info n=2\n");

    auto sid = this->sess().open_file(tf.get_path()).unwrap();
    REQUIRE(poll_until(this->sess(),
                       [this]() { return this->sess().record_count() == 2; }));

    tf.append("level=warn n=3\nlevel=warn n=");
    REQUIRE(poll_until(this->sess(),
                       [this]() { return this->sess().record_count() == 3; }));
    tf.append("4\n");
    REQUIRE(poll_until(this->sess(),
                       [this]() { return this->sess().record_count() == 4; }));

    CHECK(field_of(this->sess().get_record(3), "n") == "4");
    CHECK(field_of(this->sess().get_record(3), "line_number") == "4");
    CHECK(this->sess().has_running_sources());

    this->sess().close_source(sid);
    CHECK_FALSE(this->sess().has_running_sources());
    CHECK(this->sess().source_status(sid)->si_state
          == source_state::finished);
}

TEST_CASE_FIXTURE(session_fixture, "a truncated file stops the tailer")
{
    temp_file tf("line one\nline two\nline three\n");

    auto sid = this->sess().open_file(tf.get_path()).unwrap();
    REQUIRE(poll_until(this->sess(),
                       [this]() { return this->sess().record_count() == 3; }));

    tf.replace("x\n");
    REQUIRE(poll_until(this->sess(), [this]() {
        return !this->sess().has_running_sources();
    }));

    const auto* info = this->sess().source_status(sid);
    CHECK(info->si_state == source_state::truncated);
    CHECK(this->sess().record_count() == 3);
}

TEST_CASE_FIXTURE(reloading_fixture, "a truncated file is reloaded")
{
    temp_file tf("line one\nline two\nline three\n");

    auto sid = this->sess().open_file(tf.get_path()).unwrap();
    REQUIRE(poll_until(this->sess(),
                       [this]() { return this->sess().record_count() == 3; }));

    tf.replace("fresh\n");
    REQUIRE(poll_until(this->sess(),
                       [this]() { return this->sess().record_count() == 4; }));

    const auto* rec = this->sess().get_record(3);
    CHECK(rec->get_original() == "fresh");
    CHECK(field_of(rec, "line_number") == "1");
    CHECK(this->sess().source_status(sid)->si_state == source_state::running);
}

TEST_CASE_FIXTURE(session_fixture, "a missing file is an error")
{
    auto sid
        = this->sess().open_file("/tmp/lsift.no-such-dir/app.log").unwrap();

    REQUIRE(poll_until(this->sess(), [this]() {
        return !this->sess().has_running_sources();
    }));

    const auto* info = this->sess().source_status(sid);
    CHECK(info->si_state == source_state::error);
    CHECK(info->si_message.find("/tmp/lsift.no-such-dir/app.log")
          != std::string::npos);
}

TEST_CASE_FIXTURE(session_fixture, "a command ends with an EXIT record")
{
    auto sid = this->sess()
                   .open_command({"sh", "-c", "echo out; echo err >&2; exit 3"})
                   .unwrap();

    REQUIRE(poll_until(this->sess(), [this]() {
        return !this->sess().has_running_sources();
    }));

    REQUIRE(this->sess().record_count() == 3);

    const record* out_rec = nullptr;
    const record* err_rec = nullptr;
    for (size_t lpc = 0; lpc < 2; lpc++) {
        const auto* rec = this->sess().get_record(lpc);

        if (rec->get_original() == "out") {
            out_rec = rec;
        } else if (rec->get_original() == "err") {
            err_rec = rec;
        }
    }
    REQUIRE(out_rec != nullptr);
    REQUIRE(err_rec != nullptr);
    CHECK(field_of(out_rec, "stream") == "<absent>");
    CHECK(field_of(err_rec, "stream") == "stderr");

    const auto* exit_rec = this->sess().get_record(2);
    CHECK(exit_rec->get_original() == "EXIT: exit status: 3");
    CHECK(exit_rec->has_mark("red"));
    CHECK(this->sess().next_mark(0).value() == 2);

    const auto* info = this->sess().source_status(sid);
    CHECK(info->si_state == source_state::finished);
    CHECK(info->si_name == "sh -c echo out; echo err >&2; exit 3");
}

TEST_CASE_FIXTURE(session_fixture, "closing a command stops it")
{
    auto sid = this->sess().open_command({"sleep", "30"}).unwrap();
    auto start = std::chrono::steady_clock::now();

    this->sess().close_source(sid);

    CHECK(std::chrono::steady_clock::now() - start < 5s);
    CHECK_FALSE(this->sess().has_running_sources());
    CHECK(this->sess().source_status(sid)->si_message == "closed");
}

TEST_CASE_FIXTURE(session_fixture, "reading from a pipe")
{
    auto_fd fds[2];

    REQUIRE(auto_fd::pipe(fds) == 0);
    auto sid = this->sess().open_fd("pipe", std::move(fds[0])).unwrap();

    REQUIRE(fds[1].write_fully("a=1\na=2\na="_frag).isOk());
    REQUIRE(poll_until(this->sess(),
                       [this]() { return this->sess().record_count() == 2; }));

    REQUIRE(fds[1].write_fully("3"_frag).isOk());
    fds[1].reset();
    REQUIRE(poll_until(this->sess(), [this]() {
        return !this->sess().has_running_sources();
    }));

    REQUIRE(this->sess().record_count() == 3);
    CHECK(field_of(this->sess().get_record(2), "a") == "3");
    CHECK(this->sess().source_status(sid)->si_state
          == source_state::finished);
}
