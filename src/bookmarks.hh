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
 * @file bookmarks.hh
 */

#ifndef lsift_bookmarks_hh
#define lsift_bookmarks_hh

#include <algorithm>
#include <optional>
#include <vector>

#include "base/lsift_log.hh"

namespace lsift {

/**
 * Extension of the STL vector that is used to store bookmarks, where a
 * bookmark is just a particular record index.  The value-added over the
 * standard vector are some methods for doing content-wise iteration.  In
 * other words, given a value that may or may not be in the vector, find the
 * next or previous value that is in the vector.
 *
 * @param LineType The type used to store indexes.
 *
 * @note The vector is expected to be sorted.
 */
template<typename LineType>
class bookmark_vector : public std::vector<LineType> {
    using base_vector = std::vector<LineType>;

public:
    using size_type = typename base_vector::size_type;
    using iterator = typename base_vector::iterator;
    using const_iterator = typename base_vector::const_iterator;

    /**
     * Insert a bookmark into this vector, but only if it is not already in the
     * vector.
     *
     * @return True if the value was inserted.
     */
    bool insert_once(LineType vl)
    {
        if (this->empty() || this->back() < vl) {
            this->push_back(vl);
            return true;
        }

        auto lb = std::lower_bound(this->begin(), this->end(), vl);
        if (lb == this->end() || *lb != vl) {
            this->insert(lb, vl);
            return true;
        }

        return false;
    }

    /**
     * @return True if the value was in the vector and has been removed.
     */
    bool erase_once(LineType vl)
    {
        auto lb = std::lower_bound(this->begin(), this->end(), vl);
        if (lb != this->end() && *lb == vl) {
            this->erase(lb);
            return true;
        }

        return false;
    }

    bool contains(LineType vl) const
    {
        return std::binary_search(this->cbegin(), this->cend(), vl);
    }

    /**
     * @param start The value to start the search for the next bookmark.
     * @return The next bookmark value in the vector or nullopt if there are
     * no more remaining bookmarks.  If the 'start' value is a bookmark,
     * the next bookmark is returned.  If the 'start' value is not a
     * bookmark, the next highest value in the vector is returned.
     */
    std::optional<LineType> next(LineType start) const;

    /**
     * @param start The value to start the search for the previous
     * bookmark.
     * @return The previous bookmark value in the vector or nullopt if there
     * are no more prior bookmarks.
     * @see next
     */
    std::optional<LineType> prev(LineType start) const;

    /**
     * Like next(), but wraps around to the first bookmark.
     */
    std::optional<LineType> next_wrapped(LineType start) const
    {
        auto retval = this->next(start);

        if (!retval && !this->empty()) {
            retval = this->front();
        }
        return retval;
    }

    /**
     * Like prev(), but wraps around to the last bookmark.
     */
    std::optional<LineType> prev_wrapped(LineType start) const
    {
        auto retval = this->prev(start);

        if (!retval && !this->empty()) {
            retval = this->back();
        }
        return retval;
    }
};

template<typename LineType>
std::optional<LineType>
bookmark_vector<LineType>::next(LineType start) const
{
    std::optional<LineType> retval;

    auto ub = std::upper_bound(this->cbegin(), this->cend(), start);
    if (ub != this->cend()) {
        retval = *ub;
    }

    ensure(!retval || start < retval.value());

    return retval;
}

template<typename LineType>
std::optional<LineType>
bookmark_vector<LineType>::prev(LineType start) const
{
    std::optional<LineType> retval;

    auto lb = std::lower_bound(this->cbegin(), this->cend(), start);
    if (lb != this->cbegin()) {
        lb -= 1;
        retval = *lb;
    }

    ensure(!retval || retval.value() < start);

    return retval;
}

}  // namespace lsift

#endif
