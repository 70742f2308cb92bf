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
 * @file record_store.tests.cc
 */

#include "record_store.hh"

#include "config.h"
#include "doctest/doctest.h"

using namespace lsift;

TEST_CASE("field_map keeps insertion order")
{
    field_map fields;

    CHECK(fields.insert("b", "1"));
    CHECK(fields.insert("a", "2"));
    CHECK_FALSE(fields.insert("b", "3"));
    fields.set("b", "4");
    fields.set("c", "5");

    std::vector<field_map::value_type> expected = {
        {"b", "4"},
        {"a", "2"},
        {"c", "5"},
    };
    CHECK(std::vector<field_map::value_type>(fields.begin(), fields.end())
          == expected);

    CHECK(fields.erase("a"_frag));
    CHECK_FALSE(fields.erase("a"_frag));
    CHECK(fields.size() == 2);
    CHECK(fields.find("c"_frag) != nullptr);
    CHECK(fields.find("zzz"_frag) == nullptr);
}

TEST_CASE("record_store append and get")
{
    record_store store;

    CHECK(store.empty());
    CHECK(store.append(record{"first"}) == 0);
    CHECK(store.append(record{"second", 3}) == 1);

    CHECK(store.size() == 2);
    CHECK(store.get(1).get_original() == "second");
    CHECK(store.get(1).get_index() == 1);
    CHECK(store.get(1).get_source_id() == 3);
    CHECK(store.find(2) == nullptr);
}

TEST_CASE("record_store clear restarts indexing")
{
    record_store store;

    store.append(record{"a"});
    store.append(record{"b"});
    store.toggle_mark(1, "red");

    auto gen = store.generation();
    store.clear();

    CHECK(store.empty());
    CHECK(store.generation() == gen + 1);
    CHECK(store.marked_indices().empty());
    CHECK(store.append(record{"c"}) == 0);
}

TEST_CASE("record_store update_field")
{
    record_store store;
    record rec{"GET /"};

    rec.get_fields().set("method", "GET");
    rec.get_fields().set("status", "200");
    store.append(std::move(rec));

    CHECK(store.update_field(0, "status", std::string("500")));
    CHECK(*store.get(0).get_fields().find("status"_frag) == "500");
    CHECK(store.get(0).get_fields().begin()->first == "method");

    CHECK(store.update_field(0, "note", std::string("checked")));
    CHECK(std::prev(store.get(0).get_fields().end())->first == "note");

    CHECK(store.update_field(0, "method", std::nullopt));
    CHECK_FALSE(store.get(0).get_fields().contains("method"_frag));
    CHECK_FALSE(store.update_field(0, "method", std::nullopt));

    CHECK_FALSE(store.update_field(5, "x", std::string("y")));
}

TEST_CASE("record_store toggle_mark twice restores the record")
{
    record_store store;

    store.append(record{"a"});
    store.append(record{"b"});

    CHECK(store.toggle_mark(1, "blue").value());
    CHECK(store.get(1).has_mark("blue"));
    CHECK(store.marked_indices().contains(1));

    CHECK_FALSE(store.toggle_mark(1, "blue").value());
    CHECK_FALSE(store.get(1).is_marked());
    CHECK(store.get(1).get_marks().empty());
    CHECK(store.marked_indices().empty());

    CHECK_FALSE(store.toggle_mark(7, "blue").has_value());
}

TEST_CASE("record_store mark navigation wraps")
{
    record_store store;

    for (int lpc = 0; lpc < 10; lpc++) {
        store.append(record{"line"});
    }
    store.toggle_mark(2, "red");
    store.toggle_mark(5, "green");
    store.toggle_mark(5, "red");
    store.toggle_mark(9, "red");

    CHECK(store.next_mark(0).value() == 2);
    CHECK(store.next_mark(2).value() == 5);
    CHECK(store.next_mark(9).value() == 2);
    CHECK(store.prev_mark(2).value() == 9);
    CHECK(store.prev_mark(6).value() == 5);

    // removing one color leaves the record marked
    store.toggle_mark(5, "red");
    CHECK(store.next_mark(2).value() == 5);
    store.toggle_mark(5, "green");
    CHECK(store.next_mark(2).value() == 9);
}

TEST_CASE("record_store keeps marks from appended records")
{
    record_store store;
    record rec{"EXIT: exit status: 1"};

    rec.toggle_mark("red");
    store.append(record{"before"});
    store.append(std::move(rec));

    CHECK(store.next_mark(0).value() == 1);
}
