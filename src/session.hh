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
 * @file session.hh
 */

#ifndef lsift_session_hh
#define lsift_session_hh

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "base/auto_fd.hh"
#include "base/string_fragment.hh"
#include "file_tailer.hh"
#include "filter.eval.hh"
#include "filter.lexer.hh"
#include "filter_editor.hh"
#include "filtered_view.hh"
#include "ingest_queue.hh"
#include "ingest_source.hh"
#include "record.hh"
#include "record_store.hh"
#include "regex_cache.hh"
#include "result.h"
#include "rule.hh"
#include "search_cursor.hh"

namespace lsift {

struct source_info {
    source_id_t si_id{0};
    std::string si_name;
    std::string si_rule_name;
    source_state si_state{source_state::running};
    std::string si_message;
    size_t si_record_count{0};
    size_t si_encoding_errors{0};
};

/**
 * The entry point for a user interface.  A session owns the record store,
 * the active filter and search, and the sources that feed the store.  All
 * of the methods must be called from the same thread; the sources run on
 * their own threads and their output is only added to the store by poll().
 */
class session {
public:
    using filter_ptr = std::shared_ptr<const filter::compiled_filter>;

    session(const rule_set& rules, regex_cache& cache);

    session(const session&) = delete;
    session& operator=(const session&) = delete;

    ~session();

    /**
     * Register a source that will be fed through append_line() or
     * bulk_load().  The rule is picked using the name.
     */
    source_id_t add_source(std::string name);

    /**
     * Extract and append a single line.
     *
     * @return The index of the new record or nullopt if the source is not
     * known.
     */
    std::optional<record_index_t> append_line(source_id_t sid,
                                              std::string raw_line);

    /**
     * Extract a block of lines in parallel and append them in order.
     *
     * @param encoding_errors Invalid UTF-8 sequences that were already
     * replaced while the lines were read.
     * @return The indexes of the new records.
     */
    std::vector<record_index_t> bulk_load(source_id_t sid,
                                          std::vector<std::string> lines,
                                          size_t encoding_errors = 0);

    /**
     * Read a file once, up to its current end, and bulk load its lines.
     * A last line without a newline is included.
     */
    Result<source_id_t, std::string> load_file(
        const std::filesystem::path& path);

    Result<source_id_t, std::string> open_file(
        const std::filesystem::path& path);

    Result<source_id_t, std::string> open_fd(std::string name, auto_fd fd);

    Result<source_id_t, std::string> open_stdin();

    Result<source_id_t, std::string> open_command(
        const std::vector<std::string>& argv);

    /**
     * Stop the source's thread and release its descriptors.  Records that
     * it already produced stay in the store.
     */
    void close_source(source_id_t sid);

    /**
     * Move the output of the sources into the store and bring the filtered
     * view and search matches up to date.  Never blocks on the sources.
     *
     * @return The number of records that were added.
     */
    size_t poll();

    /**
     * @return True if a source opened with one of the open_*() methods is
     * still producing records.
     */
    bool has_running_sources() const;

    const source_info* source_status(source_id_t sid) const;

    std::vector<source_info> get_sources() const;

    const record* get_record(record_index_t index) const
    {
        return this->s_store.find(index);
    }

    size_t record_count() const { return this->s_store.size(); }

    const record_store& get_store() const { return this->s_store; }

    void clear_records();

    Result<filter_ptr, filter::compile_error> compile_filter(
        string_fragment text);

    /**
     * Make the given filter the active one and rebuild the view.  Passing
     * nullptr shows every record.
     */
    const filtered_view& apply_filter(filter_ptr filt);

    const filtered_view& get_view() const { return this->s_view; }

    /**
     * Apply a named filter from the rules.  The rules of the open sources
     * are searched first.
     *
     * @return False if no rule has a filter with that name.
     */
    bool apply_named_filter(string_fragment name);

    void set_search(filter_ptr pred);

    const search_cursor& get_search() const { return this->s_search; }

    std::optional<record_index_t> search_next(
        std::optional<record_index_t> from);

    std::optional<record_index_t> search_previous(
        std::optional<record_index_t> from);

    std::optional<bool> toggle_mark(record_index_t index,
                                    const std::string& color);

    std::optional<record_index_t> next_mark(record_index_t from) const
    {
        return this->s_store.next_mark(from);
    }

    std::optional<record_index_t> prev_mark(record_index_t from) const
    {
        return this->s_store.prev_mark(from);
    }

    bool update_field(record_index_t index,
                      const std::string& key,
                      std::optional<std::string> value);

    filter_editor& get_filter_editor() { return this->s_filter_editor; }

    filter_editor& get_search_editor() { return this->s_search_editor; }

    /**
     * Commit the filter editor and, if the draft compiled, apply it.  On
     * error the previous filter stays in effect.
     */
    Result<void, filter::compile_error> commit_filter_edit();

    Result<void, filter::compile_error> commit_search_edit();

    const rule_set& get_rules() const { return this->s_rules; }

private:
    struct source_entry {
        source_info se_info;
        const rule* se_rule{nullptr};
        extract_context se_context;
        std::unique_ptr<ingest_source> se_producer;
    };

    source_entry& create_source(std::string name);
    Result<source_id_t, std::string> start_producer(
        source_entry& entry, std::unique_ptr<ingest_source> producer);
    record_index_t append_record(source_entry& entry, record rec);
    void update_views();

    const rule_set& s_rules;
    regex_cache& s_cache;
    ingest_queue s_queue;
    record_store s_store;
    filtered_view s_view;
    search_cursor s_search;
    filter_editor s_filter_editor;
    filter_editor s_search_editor;
    std::map<source_id_t, source_entry> s_sources;
    source_id_t s_next_source_id{1};
};

}  // namespace lsift

#endif
