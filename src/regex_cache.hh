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
 * @file regex_cache.hh
 */

#ifndef lsift_regex_cache_hh
#define lsift_regex_cache_hh

#include <list>
#include <map>
#include <memory>
#include <utility>
#include <string>

#include "base/string_fragment.hh"
#include "line_pattern.hh"
#include "pcrepp/pcre2pp.hh"
#include "result.h"
#include "safe/safe.h"

namespace lsift {

/**
 * Cache of compiled regular expressions and line templates keyed by their
 * source text.  Rules and filters that use the same text share a single
 * compiled object.  The cache is safe to use from multiple threads.
 */
class regex_cache {
public:
    static constexpr size_t DEFAULT_CAPACITY = 100;

    explicit regex_cache(size_t capacity = DEFAULT_CAPACITY)
        : rc_capacity(capacity)
    {
    }

    regex_cache(const regex_cache&) = delete;
    regex_cache& operator=(const regex_cache&) = delete;

    Result<std::shared_ptr<const pcre2pp::code>, pcre2pp::compile_error>
    get_regex(string_fragment pattern);

    Result<std::shared_ptr<const line_pattern>, std::string> get_pattern(
        string_fragment tmpl);

    struct stats {
        size_t s_hits{0};
        size_t s_misses{0};
        size_t s_size{0};
    };

    stats get_stats();

private:
    template<typename T>
    struct lru_table {
        using value_ptr = std::shared_ptr<const T>;
        using order_list = std::list<std::string>;

        std::map<std::string, std::pair<value_ptr, order_list::iterator>>
            lt_entries;
        order_list lt_order;

        /**
         * Look up a key and, if it is present, make it the most recently
         * used.
         */
        value_ptr find(const std::string& key)
        {
            auto iter = this->lt_entries.find(key);
            if (iter == this->lt_entries.end()) {
                return nullptr;
            }

            this->lt_order.splice(
                this->lt_order.end(), this->lt_order, iter->second.second);
            return iter->second.first;
        }

        void insert(const std::string& key, value_ptr value, size_t capacity)
        {
            if (this->lt_entries.count(key) > 0) {
                return;
            }

            auto order_iter = this->lt_order.insert(this->lt_order.end(), key);
            this->lt_entries.emplace(
                key, std::make_pair(std::move(value), order_iter));
            while (this->lt_entries.size() > capacity) {
                this->lt_entries.erase(this->lt_order.front());
                this->lt_order.pop_front();
            }
        }

        size_t size() const { return this->lt_entries.size(); }
    };

    struct state {
        lru_table<pcre2pp::code> s_regexes;
        lru_table<line_pattern> s_patterns;
        stats s_stats;
    };

    using safe_state = safe::Safe<state>;

    size_t rc_capacity;
    safe_state rc_state;
};

}  // namespace lsift

#endif
