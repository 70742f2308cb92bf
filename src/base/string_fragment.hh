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
 * @file string_fragment.hh
 */

#ifndef lsift_string_fragment_hh
#define lsift_string_fragment_hh

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <string.h>

#include "fmt/format.h"

/**
 * A non-owning range of characters inside a buffer owned by someone else,
 * usually a record's original line.  The offsets are relative to the start
 * of the buffer so that a piece split off of a fragment can be turned back
 * into a range of its parent.
 */
struct string_fragment {
    using split_result
        = std::optional<std::pair<string_fragment, string_fragment>>;

    static string_fragment from_c_str(const char* str)
    {
        return string_fragment{str, 0, str != nullptr ? (int) strlen(str) : 0};
    }

    template<std::size_t N>
    static constexpr string_fragment from_const(const char (&str)[N])
    {
        return string_fragment{str, 0, (int) N - 1};
    }

    static string_fragment from_str(const std::string& str)
    {
        return string_fragment{str.c_str(), 0, (int) str.size()};
    }

    constexpr string_fragment() : sf_string(""), sf_begin(0), sf_end(0) {}

    explicit constexpr string_fragment(const char* str, int begin, int end)
        : sf_string(str), sf_begin(begin), sf_end(end)
    {
    }

    explicit string_fragment(const char* str)
        : sf_string(str), sf_begin(0), sf_end((int) strlen(str))
    {
    }

    string_fragment(const std::string& str)
        : sf_string(str.c_str()), sf_begin(0), sf_end((int) str.length())
    {
    }

    constexpr int length() const { return this->sf_end - this->sf_begin; }

    constexpr bool empty() const { return this->sf_begin >= this->sf_end; }

    constexpr const char* data() const
    {
        return this->sf_string + this->sf_begin;
    }

    const unsigned char* udata() const
    {
        return (const unsigned char*) this->data();
    }

    const char* begin() const { return this->data(); }

    const char* end() const { return this->sf_string + this->sf_end; }

    constexpr char front() const { return this->sf_string[this->sf_begin]; }

    constexpr char back() const { return this->sf_string[this->sf_end - 1]; }

    constexpr char operator[](int index) const
    {
        return this->sf_string[this->sf_begin + index];
    }

    bool operator==(const string_fragment& other) const
    {
        return this->length() == other.length()
            && memcmp(this->data(), other.data(), this->length()) == 0;
    }

    bool operator!=(const string_fragment& other) const
    {
        return !(*this == other);
    }

    bool operator==(const std::string& str) const
    {
        return *this == string_fragment::from_str(str);
    }

    template<std::size_t N>
    bool operator==(const char (&str)[N]) const
    {
        return *this == string_fragment::from_const(str);
    }

    template<typename... Args>
    bool is_one_of(const Args&... args) const
    {
        return (... || (*this == args));
    }

    bool startswith(const char* prefix) const;

    bool endswith(const string_fragment& suffix) const;

    /**
     * @return The fragment starting at the given offset, clamped to the end.
     */
    string_fragment substr(int begin) const
    {
        return this->sub_range(begin, this->length());
    }

    /**
     * @return The range [begin, end) of this fragment.  Offsets past the end
     * are clamped.
     */
    string_fragment sub_range(int begin, int end) const;

    std::optional<int> find(char ch) const
    {
        const auto* hit = memchr(this->data(), ch, this->length());

        if (hit == nullptr) {
            return std::nullopt;
        }
        return (int) ((const char*) hit - this->data());
    }

    /**
     * @return The offset of the first occurrence of the needle, relative to
     * the start of this fragment.
     */
    std::optional<int> find(const string_fragment& needle) const;

    /**
     * @return The number of leading characters that satisfy the predicate.
     */
    template<typename P>
    int prefix_length(P&& predicate) const
    {
        int retval = 0;

        while (retval < this->length() && predicate(this->data()[retval])) {
            retval += 1;
        }
        return retval;
    }

    template<typename P>
    string_fragment skip(P&& predicate) const
    {
        return this->substr(this->prefix_length(predicate));
    }

    /**
     * Split after the leading characters that satisfy the predicate.
     */
    template<typename P>
    split_result split_while(P&& predicate) const
    {
        auto len = this->prefix_length(predicate);

        if (len == 0) {
            return std::nullopt;
        }
        return std::make_pair(this->sub_range(0, len), this->substr(len));
    }

    /**
     * Split around the first character that satisfies the predicate.  The
     * separator is not included in either half.
     */
    template<typename P>
    split_result split_pair(P&& predicate) const
    {
        auto len = this->prefix_length(
            [&predicate](char ch) { return !predicate(ch); });

        if (len == this->length()) {
            return std::nullopt;
        }
        return std::make_pair(this->sub_range(0, len), this->substr(len + 1));
    }

    /**
     * Stateful predicate for the body of a double-quoted string: true until
     * the first double quote that is not escaped by a backslash.
     */
    struct quoted_string_body {
        bool qs_in_escape{false};

        bool operator()(char ch)
        {
            if (this->qs_in_escape) {
                this->qs_in_escape = false;
                return true;
            }
            if (ch == '\\') {
                this->qs_in_escape = true;
                return true;
            }
            return ch != '"';
        }
    };

    /** @return The fragment without leading and trailing whitespace. */
    string_fragment trim() const;

    std::string to_string() const
    {
        return {this->data(), (size_t) this->length()};
    }

    std::string_view to_string_view() const
    {
        return {this->data(), (size_t) this->length()};
    }

    /**
     * @return The text of a double-quoted string body with its backslash
     * escapes decoded.
     */
    std::string to_unquoted_string() const;

    const char* sf_string;
    int sf_begin;
    int sf_end;
};

inline bool
operator==(const std::string& left, const string_fragment& right)
{
    return right == left;
}

constexpr string_fragment
operator"" _frag(const char* str, std::size_t len)
{
    return string_fragment{str, 0, (int) len};
}

namespace fmt {
template<>
struct formatter<string_fragment> : formatter<string_view> {
    template<typename FormatContext>
    auto format(const string_fragment& sf, FormatContext& ctx) const
    {
        return formatter<string_view>::format(
            string_view{sf.data(), (size_t) sf.length()}, ctx);
    }
};
}  // namespace fmt

#endif
