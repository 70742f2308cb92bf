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
 * @file auto_mem.hh
 */

#ifndef lsift_auto_mem_hh
#define lsift_auto_mem_hh

/**
 * Owner of an object that was allocated by a C library and must be released
 * with that library's free function, like `pcre2_code_free()` or
 * `yajl_tree_free()`.
 *
 * @tparam T The type of the object, not the pointer.
 */
template<typename T>
class auto_mem {
public:
    using free_func_t = void (*)(T*);

    explicit auto_mem(free_func_t free_func, T* ptr = nullptr) noexcept
        : am_free_func(free_func), am_ptr(ptr)
    {
    }

    auto_mem(const auto_mem&) = delete;
    auto_mem& operator=(const auto_mem&) = delete;

    auto_mem(auto_mem&& other) noexcept
        : am_free_func(other.am_free_func), am_ptr(other.am_ptr)
    {
        other.am_ptr = nullptr;
    }

    auto_mem& operator=(auto_mem&& other) noexcept
    {
        if (this != &other) {
            this->reset(other.am_ptr);
            this->am_free_func = other.am_free_func;
            other.am_ptr = nullptr;
        }
        return *this;
    }

    ~auto_mem() { this->reset(); }

    T* in() const { return this->am_ptr; }

    bool empty() const { return this->am_ptr == nullptr; }

    void reset(T* ptr = nullptr)
    {
        if (this->am_ptr != nullptr && this->am_ptr != ptr) {
            this->am_free_func(this->am_ptr);
        }
        this->am_ptr = ptr;
    }

private:
    free_func_t am_free_func;
    T* am_ptr;
};

#endif
