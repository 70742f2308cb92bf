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
 * @file session.cc
 */

#include "session.hh"

#include <unistd.h>

#include "base/fs_util.hh"
#include "base/lsift_log.hh"
#include "base/string_util.hh"
#include "bulk_loader.hh"
#include "config.h"
#include "fmt/format.h"
#include "line_buffer.hh"
#include "stream_looper.hh"

namespace lsift {

session::session(const rule_set& rules, regex_cache& cache)
    : s_rules(rules), s_cache(cache), s_filter_editor(cache),
      s_search_editor(cache)
{
    this->s_view.clear_filter(this->s_store);
}

session::~session()
{
    for (auto& pair : this->s_sources) {
        if (pair.second.se_producer) {
            pair.second.se_producer->stop();
        }
    }
}

session::source_entry&
session::create_source(std::string name)
{
    auto sid = this->s_next_source_id++;
    auto& entry = this->s_sources[sid];
    const auto& r = this->s_rules.find_rule(string_fragment::from_str(name));

    entry.se_info.si_id = sid;
    entry.se_info.si_name = name;
    entry.se_info.si_rule_name = r.get_name();
    entry.se_rule = &r;
    entry.se_context.ec_source_name = std::move(name);

    log_info("source %u: %s using rule %s",
             sid,
             entry.se_info.si_name.c_str(),
             r.get_name().c_str());

    return entry;
}

source_id_t
session::add_source(std::string name)
{
    return this->create_source(std::move(name)).se_info.si_id;
}

record_index_t
session::append_record(source_entry& entry, record rec)
{
    entry.se_info.si_record_count += 1;
    return this->s_store.append(std::move(rec));
}

void
session::update_views()
{
    this->s_view.refresh(this->s_store);
    this->s_search.refresh(this->s_store, this->s_view);
}

std::optional<record_index_t>
session::append_line(source_id_t sid, std::string raw_line)
{
    auto iter = this->s_sources.find(sid);
    if (iter == this->s_sources.end()) {
        log_warning("append_line: unknown source %u", sid);
        return std::nullopt;
    }

    auto& entry = iter->second;
    entry.se_info.si_encoding_errors += scrub_to_utf8(raw_line);
    auto rec = extract_record(
        *entry.se_rule, entry.se_context, std::move(raw_line), sid);
    auto retval = this->append_record(entry, std::move(rec));

    this->update_views();

    return retval;
}

std::vector<record_index_t>
session::bulk_load(source_id_t sid,
                   std::vector<std::string> lines,
                   size_t encoding_errors)
{
    std::vector<record_index_t> retval;

    auto iter = this->s_sources.find(sid);
    if (iter == this->s_sources.end()) {
        log_warning("bulk_load: unknown source %u", sid);
        return retval;
    }

    auto& entry = iter->second;
    entry.se_info.si_encoding_errors += encoding_errors;
    for (auto& line : lines) {
        entry.se_info.si_encoding_errors += scrub_to_utf8(line);
    }

    auto records = bulk_loader(*entry.se_rule, sid)
                       .load(std::move(lines), entry.se_context);
    retval.reserve(records.size());
    for (auto& rec : records) {
        retval.emplace_back(this->append_record(entry, std::move(rec)));
    }

    this->update_views();

    return retval;
}

Result<source_id_t, std::string>
session::load_file(const std::filesystem::path& path)
{
    auto fd = TRY(filesystem::open_file(path, O_RDONLY));
    line_buffer lb(std::move(fd));
    auto lines = TRY(lb.read_available_lines());
    auto partial = lb.pop_partial();
    if (partial) {
        lines.emplace_back(std::move(partial.value()));
    }

    auto sid = this->add_source(path.string());
    log_info("loaded %zu lines from %s", lines.size(), path.c_str());
    this->bulk_load(sid, std::move(lines), lb.get_encoding_errors());

    return Ok(sid);
}

Result<source_id_t, std::string>
session::start_producer(source_entry& entry,
                        std::unique_ptr<ingest_source> producer)
{
    auto sid = entry.se_info.si_id;
    auto start_res = producer->start();

    if (start_res.isErr()) {
        this->s_sources.erase(sid);
        return Err(start_res.unwrapErr());
    }
    entry.se_producer = std::move(producer);

    return Ok(sid);
}

Result<source_id_t, std::string>
session::open_file(const std::filesystem::path& path)
{
    auto& entry = this->create_source(path.string());
    tail_options opts;

    opts.to_reload_on_truncate
        = this->s_rules.get_global().go_reload_on_truncate;

    return this->start_producer(
        entry,
        std::make_unique<file_tailer>(
            entry.se_info.si_id, path, *entry.se_rule, this->s_queue, opts));
}

Result<source_id_t, std::string>
session::open_fd(std::string name, auto_fd fd)
{
    auto& entry = this->create_source(std::move(name));

    return this->start_producer(entry,
                                stream_looper::for_fd(entry.se_info.si_id,
                                                      entry.se_info.si_name,
                                                      std::move(fd),
                                                      *entry.se_rule,
                                                      this->s_queue));
}

Result<source_id_t, std::string>
session::open_stdin()
{
    auto fd = TRY(auto_fd::dup_of(STDIN_FILENO));

    return this->open_fd("stdin", std::move(fd));
}

Result<source_id_t, std::string>
session::open_command(const std::vector<std::string>& argv)
{
    std::string name;

    for (const auto& arg : argv) {
        if (!name.empty()) {
            name.push_back(' ');
        }
        name.append(arg);
    }

    auto& entry = this->create_source(name);
    auto looper_res = stream_looper::for_command(entry.se_info.si_id,
                                                 name,
                                                 argv,
                                                 *entry.se_rule,
                                                 this->s_queue);
    if (looper_res.isErr()) {
        this->s_sources.erase(entry.se_info.si_id);
        return Err(looper_res.unwrapErr());
    }

    return this->start_producer(entry, looper_res.unwrap());
}

void
session::close_source(source_id_t sid)
{
    auto iter = this->s_sources.find(sid);
    if (iter == this->s_sources.end()) {
        return;
    }

    auto& entry = iter->second;
    if (entry.se_producer) {
        log_info("closing source %u: %s", sid, entry.se_info.si_name.c_str());
        entry.se_producer.reset();
    }
    if (entry.se_info.si_state == source_state::running) {
        entry.se_info.si_state = source_state::finished;
        entry.se_info.si_message = "closed";
    }
}

size_t
session::poll()
{
    size_t retval = 0;
    auto events = this->s_queue.drain();

    for (auto& event : events) {
        auto iter = this->s_sources.find(event.ie_source);
        if (iter == this->s_sources.end()) {
            continue;
        }

        auto& entry = iter->second;
        event.ie_payload.match(
            [this, &entry, &retval](record_batch& batch) {
                for (auto& rec : batch.rb_records) {
                    this->append_record(entry, std::move(rec));
                    retval += 1;
                }
                entry.se_info.si_encoding_errors = batch.rb_encoding_errors;
            },
            [&entry](state_change& sc) {
                if (entry.se_info.si_state == source_state::error) {
                    return;
                }
                entry.se_info.si_state = sc.sc_state;
                entry.se_info.si_message = std::move(sc.sc_message);
            });
    }

    if (!events.empty()) {
        this->update_views();
    }

    return retval;
}

bool
session::has_running_sources() const
{
    for (const auto& pair : this->s_sources) {
        if (pair.second.se_producer
            && pair.second.se_info.si_state == source_state::running)
        {
            return true;
        }
    }

    return false;
}

const source_info*
session::source_status(source_id_t sid) const
{
    auto iter = this->s_sources.find(sid);
    if (iter == this->s_sources.end()) {
        return nullptr;
    }

    return &iter->second.se_info;
}

std::vector<source_info>
session::get_sources() const
{
    std::vector<source_info> retval;

    for (const auto& pair : this->s_sources) {
        retval.emplace_back(pair.second.se_info);
    }

    return retval;
}

void
session::clear_records()
{
    this->s_store.clear();
    for (auto& pair : this->s_sources) {
        pair.second.se_info.si_record_count = 0;
    }
    this->update_views();
}

Result<session::filter_ptr, filter::compile_error>
session::compile_filter(string_fragment text)
{
    return filter::compiled_filter::compile(text, this->s_cache);
}

const filtered_view&
session::apply_filter(filter_ptr filt)
{
    this->s_view.set_filter(std::move(filt), this->s_store);
    this->s_search.refresh(this->s_store, this->s_view);

    return this->s_view;
}

bool
session::apply_named_filter(string_fragment name)
{
    const rule::named_filter* found = nullptr;

    for (const auto& pair : this->s_sources) {
        found = pair.second.se_rule->find_filter(name);
        if (found != nullptr) {
            break;
        }
    }
    if (found == nullptr) {
        for (const auto& r : this->s_rules.get_rules()) {
            found = r->find_filter(name);
            if (found != nullptr) {
                break;
            }
        }
    }
    if (found == nullptr) {
        log_warning("no filter named: %.*s", name.length(), name.data());
        return false;
    }

    this->apply_filter(found->nf_filter);
    return true;
}

void
session::set_search(filter_ptr pred)
{
    if (!pred) {
        this->s_search.clear();
        return;
    }
    this->s_search.set_predicate(std::move(pred), this->s_store, this->s_view);
}

std::optional<record_index_t>
session::search_next(std::optional<record_index_t> from)
{
    return this->s_search.next(from);
}

std::optional<record_index_t>
session::search_previous(std::optional<record_index_t> from)
{
    return this->s_search.previous(from);
}

std::optional<bool>
session::toggle_mark(record_index_t index, const std::string& color)
{
    return this->s_store.toggle_mark(index, color);
}

bool
session::update_field(record_index_t index,
                      const std::string& key,
                      std::optional<std::string> value)
{
    return this->s_store.update_field(index, key, std::move(value));
}

Result<void, filter::compile_error>
session::commit_filter_edit()
{
    TRY(this->s_filter_editor.commit());

    if (this->s_filter_editor.get_active() != this->s_view.get_filter()) {
        this->apply_filter(this->s_filter_editor.get_active());
    }

    return Ok();
}

Result<void, filter::compile_error>
session::commit_search_edit()
{
    TRY(this->s_search_editor.commit());

    if (this->s_search_editor.get_active() != this->s_search.get_predicate())
    {
        this->set_search(this->s_search_editor.get_active());
    }

    return Ok();
}

}  // namespace lsift
