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
 * @file filtered_view.tests.cc
 */

#include "filtered_view.hh"

#include "config.h"
#include "doctest/doctest.h"
#include "filter_editor.hh"
#include "search_cursor.hh"

using namespace lsift;

namespace {

struct store_fixture {
    regex_cache sf_cache;
    record_store sf_store;

    record_index_t append(const char* line, const char* level = nullptr)
    {
        record rec{line};

        if (level != nullptr) {
            rec.get_fields().set("level", level);
        }
        return this->sf_store.append(std::move(rec));
    }

    filtered_view::filter_ptr compile(const char* expr)
    {
        auto compile_res = filter::compiled_filter::compile(
            string_fragment::from_c_str(expr), this->sf_cache);

        REQUIRE_MESSAGE(compile_res.isOk(), expr);
        return compile_res.unwrap();
    }
};

}  // namespace

TEST_CASE_FIXTURE(store_fixture, "view without a filter is the identity")
{
    filtered_view view;

    for (int lpc = 0; lpc < 5; lpc++) {
        this->append("line");
    }
    view.clear_filter(this->sf_store);

    std::vector<record_index_t> expected = {0, 1, 2, 3, 4};
    CHECK(view.get_indexes() == expected);

    this->append("another");
    CHECK(view.refresh(this->sf_store) == 1);
    CHECK(view.size() == 6);
    CHECK(view.at(5).value() == 5);
    CHECK_FALSE(view.at(6).has_value());
}

TEST_CASE_FIXTURE(store_fixture, "view only evaluates new records")
{
    filtered_view view;

    this->append("a", "ERROR");
    this->append("b", "INFO");
    view.set_filter(this->compile("level == \"ERROR\""), this->sf_store);

    REQUIRE(view.size() == 1);
    CHECK(view.get_evaluated_count() == 2);

    this->append("c", "INFO");
    CHECK(view.refresh(this->sf_store) == 0);
    CHECK(view.size() == 1);
    CHECK(view.get_evaluated_count() == 3);

    auto index = this->append("d", "ERROR");
    CHECK(view.refresh(this->sf_store) == 1);
    CHECK(view.size() == 2);
    CHECK(view.get_indexes().back() == index);

    view.clear_filter(this->sf_store);
    CHECK(view.size() == 4);
}

TEST_CASE_FIXTURE(store_fixture, "view is rebuilt after the store is cleared")
{
    filtered_view view;

    this->append("a", "ERROR");
    this->append("b", "ERROR");
    view.set_filter(this->compile("level == ERROR"), this->sf_store);
    REQUIRE(view.size() == 2);

    this->sf_store.clear();
    this->append("c", "INFO");
    this->append("d", "ERROR");
    view.refresh(this->sf_store);

    std::vector<record_index_t> expected = {1};
    CHECK(view.get_indexes() == expected);
}

TEST_CASE_FIXTURE(store_fixture, "search wraps around")
{
    filtered_view view;
    search_cursor search;

    for (int lpc = 0; lpc < 12; lpc++) {
        auto is_match = lpc == 2 || lpc == 5 || lpc == 9;

        this->append(is_match ? "needle" : "hay");
    }
    view.clear_filter(this->sf_store);
    search.set_predicate(this->compile("needle"), this->sf_store, view);

    std::vector<record_index_t> expected = {2, 5, 9};
    CHECK(search.get_matches() == expected);

    CHECK(search.next(9).value() == 2);
    CHECK(search.previous(2).value() == 9);
    CHECK(search.next(3).value() == 5);
    CHECK(search.previous(5).value() == 2);

    CHECK(search.next(std::nullopt).value() == 2);
    CHECK(search.next().value() == 5);
    CHECK(search.next().value() == 9);
    CHECK(search.next().value() == 2);
    CHECK(search.previous().value() == 9);
    CHECK(search.get_current().value() == 9);
}

TEST_CASE_FIXTURE(store_fixture, "search without matches does not move")
{
    filtered_view view;
    search_cursor search;

    this->append("hay");
    this->append("needle");
    view.clear_filter(this->sf_store);

    search.set_predicate(this->compile("needle"), this->sf_store, view);
    CHECK(search.next(std::nullopt).value() == 1);

    search.set_predicate(this->compile("pin"), this->sf_store, view);
    CHECK_FALSE(search.next().has_value());
    CHECK_FALSE(search.previous().has_value());
    CHECK_FALSE(search.get_current().has_value());
}

TEST_CASE_FIXTURE(store_fixture, "search follows the view")
{
    filtered_view view;
    search_cursor search;

    this->append("needle one", "INFO");
    this->append("needle two", "ERROR");
    view.clear_filter(this->sf_store);
    search.set_predicate(this->compile("needle"), this->sf_store, view);
    CHECK(search.get_matches().size() == 2);

    view.set_filter(this->compile("level == ERROR"), this->sf_store);
    search.refresh(this->sf_store, view);
    std::vector<record_index_t> expected = {1};
    CHECK(search.get_matches() == expected);

    this->append("needle three", "ERROR");
    view.refresh(this->sf_store);
    CHECK(search.refresh(this->sf_store, view) == 1);
    CHECK(search.get_matches().back() == 2);
}

TEST_CASE_FIXTURE(store_fixture, "editor keeps the old filter on error")
{
    filtered_view view;
    filter_editor editor(this->sf_cache);

    CHECK(editor.get_state() == filter_editor::state_t::idle);

    editor.begin_edit();
    editor.set_draft("level == ERROR");
    REQUIRE(editor.commit().isOk());
    CHECK_FALSE(editor.is_editing());
    REQUIRE(editor.get_active() != nullptr);
    auto previous = editor.get_active();

    view.set_filter(editor.get_active(), this->sf_store);

    editor.begin_edit();
    CHECK(editor.get_draft() == "level == ERROR");
    editor.set_draft("~ \"(\"");
    auto commit_res = editor.commit();
    REQUIRE(commit_res.isErr());
    CHECK(editor.is_editing());
    REQUIRE(editor.get_error().has_value());
    CHECK(editor.get_error()->ce_message.find("invalid regular expression")
          == 0);
    CHECK(editor.get_active() == previous);

    this->append("x", "ERROR");
    this->append("y", "INFO");
    view.refresh(this->sf_store);
    std::vector<record_index_t> expected = {0};
    CHECK(view.get_indexes() == expected);

    editor.cancel();
    CHECK_FALSE(editor.is_editing());
    CHECK_FALSE(editor.get_error().has_value());
    CHECK(editor.get_active() == previous);
}

TEST_CASE_FIXTURE(store_fixture, "editor clears on an empty draft")
{
    filter_editor editor(this->sf_cache);

    editor.set_draft("ERROR");
    REQUIRE(editor.commit().isOk());
    REQUIRE(editor.get_active() != nullptr);

    editor.begin_edit();
    editor.set_draft("   ");
    REQUIRE(editor.commit().isOk());
    CHECK(editor.get_active() == nullptr);
    CHECK_FALSE(editor.is_editing());
}
