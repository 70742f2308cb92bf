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
 * @file json.flatten.cc
 */

#include "json.flatten.hh"

#include <yajl/yajl_tree.h>

#include "base/auto_mem.hh"
#include "base/lsift_log.hh"
#include "config.h"

namespace lsift::json {

static void
flatten_value(const std::string& path,
              yajl_val val,
              std::vector<flat_pair>& pairs_out)
{
    switch (val->type) {
        case yajl_t_string:
            pairs_out.emplace_back(path, YAJL_GET_STRING(val));
            break;
        case yajl_t_number:
            pairs_out.emplace_back(path, YAJL_GET_NUMBER(val));
            break;
        case yajl_t_true:
            pairs_out.emplace_back(path, "true");
            break;
        case yajl_t_false:
            pairs_out.emplace_back(path, "false");
            break;
        case yajl_t_null:
            pairs_out.emplace_back(path, "null");
            break;
        case yajl_t_object: {
            const auto* obj = YAJL_GET_OBJECT(val);

            for (size_t lpc = 0; lpc < obj->len; lpc++) {
                auto sub_path = path.empty()
                    ? std::string(obj->keys[lpc])
                    : path + "." + obj->keys[lpc];

                flatten_value(sub_path, obj->values[lpc], pairs_out);
            }
            break;
        }
        case yajl_t_array: {
            const auto* arr = YAJL_GET_ARRAY(val);

            for (size_t lpc = 0; lpc < arr->len; lpc++) {
                auto sub_path = path.empty() ? std::to_string(lpc)
                                             : path + "." + std::to_string(lpc);

                flatten_value(sub_path, arr->values[lpc], pairs_out);
            }
            break;
        }
        default:
            break;
    }
}

bool
flatten_object(string_fragment line, std::vector<flat_pair>& pairs_out)
{
    auto trimmed = line.trim();

    if (trimmed.empty() || trimmed.front() != '{') {
        return false;
    }

    char error_buffer[256];
    auto content = trimmed.to_string();
    auto_mem<yajl_val_s> tree(
        yajl_tree_free,
        yajl_tree_parse(content.c_str(), error_buffer, sizeof(error_buffer)));
    if (tree.empty()) {
        log_trace("JSON parse failed -- %s", error_buffer);
        return false;
    }
    if (!YAJL_IS_OBJECT(tree.in())) {
        return false;
    }

    flatten_value("", tree.in(), pairs_out);

    return true;
}

}  // namespace lsift::json
