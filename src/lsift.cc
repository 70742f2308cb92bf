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
 * @file lsift.cc
 */

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <signal.h>
#include <stdlib.h>
#include <unistd.h>

#include "CLI/CLI.hpp"
#include "base/lsift_log.hh"
#include "config.h"
#include "fmt/format.h"
#include "regex_cache.hh"
#include "rule.hh"
#include "rules_loader.hh"
#include "session.hh"

using namespace std::chrono_literals;

static volatile sig_atomic_t looping = 1;

static void
sigint(int sig)
{
    looping = 0;
}

static size_t
print_rows(const lsift::session& sess, size_t start_row)
{
    const auto& view = sess.get_view();
    auto row = start_row;

    for (; row < view.size(); row++) {
        auto index = view.at(row).value();
        const auto* rec = sess.get_record(index);

        fmt::print(FMT_STRING("{:>6} {}{}\n"),
                   index,
                   rec->is_marked() ? "* " : "",
                   rec->get_original());
        for (const auto& field : rec->get_fields()) {
            fmt::print(FMT_STRING("         {} = {}\n"), field.first, field.second);
        }
    }

    return row;
}

int
main(int argc, char* argv[])
{
    std::string rules_path;
    std::string filter_text;
    std::string filter_name;
    std::string search_text;
    std::string debug_log;
    bool follow = false;
    bool run_command = false;

    CLI::App app{"Sift through log files"};

    app.add_option("-r", rules_path, "Load rules from the given JSON file.")
        ->type_name("FILE");
    app.add_option("-f", filter_text, "Only show records matching the filter.")
        ->type_name("EXPR");
    app.add_option("-F", filter_name, "Apply a filter defined in the rules.")
        ->type_name("NAME");
    app.add_option("-s", search_text, "Mark records matching the search.")
        ->type_name("EXPR");
    app.add_option("-d", debug_log, "Write debug messages to the given file.")
        ->type_name("FILE");
    app.add_flag("-t", follow, "Keep following files as they grow.");
    app.add_flag("-c", run_command, "Run the arguments as a command.");
    app.set_version_flag("-V,--version", LSIFT_VERSION_STRING);
    app.prefix_command();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (!debug_log.empty()) {
        auto* file = fopen(debug_log.c_str(), "ae");

        if (file != nullptr) {
            lsift_log_file = file;
            lsift_log_level = lsift_log_level_t::DEBUG;
        }
    }
    log_argv(argc, argv);
    log_host_info();

    auto args = app.remaining();
    if (args.empty()) {
        fmt::print(stderr, FMT_STRING("error: expecting a file, '-' or -c CMD\n"));
        fmt::print(stderr, FMT_STRING("{}"), app.help());
        return EXIT_FAILURE;
    }

    lsift::regex_cache cache;
    auto defs = lsift::builtin_rule_defs();
    lsift::global_options global;

    global.go_reload_on_truncate = true;
    if (!rules_path.empty()) {
        auto load_res = lsift::load_rules_file(rules_path);

        if (load_res.isErr()) {
            fmt::print(stderr,
                       FMT_STRING("error: {}\n"),
                       load_res.unwrapErr().to_string());
            return EXIT_FAILURE;
        }

        auto config = load_res.unwrap();
        defs.insert(defs.begin(),
                    std::make_move_iterator(config.rc_rules.begin()),
                    std::make_move_iterator(config.rc_rules.end()));
        global = config.rc_global;
    }

    auto rules_res = lsift::rule_set::compile(defs, global, cache);
    if (rules_res.isErr()) {
        fmt::print(stderr,
                   FMT_STRING("error: {}\n"),
                   rules_res.unwrapErr().to_string());
        return EXIT_FAILURE;
    }
    auto rules = rules_res.unwrap();
    lsift::session sess(rules, cache);

    if (!filter_text.empty()) {
        auto filter_res
            = sess.compile_filter(string_fragment::from_str(filter_text));

        if (filter_res.isErr()) {
            auto ce = filter_res.unwrapErr();

            fmt::print(stderr,
                       FMT_STRING("error: invalid filter\n  {}\n  {:>{}}\n  {}\n"),
                       filter_text,
                       "^",
                       ce.ce_offset + 1,
                       ce.ce_message);
            return EXIT_FAILURE;
        }
        sess.apply_filter(filter_res.unwrap());
    } else if (!filter_name.empty()) {
        if (!sess.apply_named_filter(string_fragment::from_str(filter_name))) {
            fmt::print(
                stderr, FMT_STRING("error: unknown filter: {}\n"), filter_name);
            return EXIT_FAILURE;
        }
    }

    std::vector<lsift::source_id_t> sids;
    if (run_command) {
        auto open_res = sess.open_command(args);

        if (open_res.isErr()) {
            fmt::print(stderr,
                       FMT_STRING("error: unable to run command: {}\n"),
                       open_res.unwrapErr());
            return EXIT_FAILURE;
        }
        sids.emplace_back(open_res.unwrap());
    } else {
        for (const auto& arg : args) {
            if (arg == "-") {
                auto open_res = sess.open_stdin();

                if (open_res.isErr()) {
                    fmt::print(stderr,
                               FMT_STRING("error: {}\n"),
                               open_res.unwrapErr());
                    return EXIT_FAILURE;
                }
                sids.emplace_back(open_res.unwrap());
            } else if (follow) {
                auto open_res = sess.open_file(arg);

                if (open_res.isErr()) {
                    fmt::print(stderr,
                               FMT_STRING("error: {}\n"),
                               open_res.unwrapErr());
                    return EXIT_FAILURE;
                }
                sids.emplace_back(open_res.unwrap());
            } else {
                auto load_res = sess.load_file(arg);

                if (load_res.isErr()) {
                    fmt::print(stderr,
                               FMT_STRING("error: {}: {}\n"),
                               arg,
                               load_res.unwrapErr());
                    return EXIT_FAILURE;
                }
                sids.emplace_back(load_res.unwrap());
            }
        }
    }

    signal(SIGINT, sigint);
    signal(SIGTERM, sigint);

    size_t printed = 0;
    do {
        sess.poll();
        if (!search_text.empty() && !sess.get_search().get_predicate()) {
            auto search_res
                = sess.compile_filter(string_fragment::from_str(search_text));

            if (search_res.isErr()) {
                fmt::print(stderr,
                           FMT_STRING("error: invalid search: {}\n"),
                           search_res.unwrapErr().ce_message);
                return EXIT_FAILURE;
            }
            sess.set_search(search_res.unwrap());
        }
        for (auto index : sess.get_search().get_matches()) {
            const auto* rec = sess.get_record(index);

            if (rec != nullptr && !rec->has_mark("search")) {
                sess.toggle_mark(index, "search");
            }
        }
        printed = print_rows(sess, printed);
        if (!sess.has_running_sources()) {
            break;
        }
        std::this_thread::sleep_for(100ms);
    } while (looping);

    auto retval = EXIT_SUCCESS;
    for (auto sid : sids) {
        const auto* info = sess.source_status(sid);

        if (info == nullptr) {
            continue;
        }
        if (info->si_encoding_errors > 0) {
            fmt::print(stderr,
                       FMT_STRING("warning: {}: replaced {} invalid UTF-8 "
                                  "sequences\n"),
                       info->si_name,
                       info->si_encoding_errors);
        }
        if (info->si_state == lsift::source_state::error
            || info->si_state == lsift::source_state::truncated)
        {
            fmt::print(stderr,
                       FMT_STRING("error: {}: {}\n"),
                       info->si_name,
                       info->si_message);
            retval = EXIT_FAILURE;
        }
    }

    return retval;
}
