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
 * @file rules_loader.cc
 */

#include "rules_loader.hh"

#include <yajl/yajl_tree.h>

#include "base/auto_mem.hh"
#include "base/fs_util.hh"
#include "base/lsift_log.hh"
#include "config.h"
#include "fmt/format.h"

namespace lsift {

namespace {

struct json_walker {
    std::string jw_src;

    config_error error(const std::string& path, const std::string& msg) const
    {
        return config_error{
            fmt::format(FMT_STRING("{}:{}"), this->jw_src, path),
            msg,
        };
    }

    config_error type_error(const std::string& path,
                            const char* expected) const
    {
        return this->error(
            path, fmt::format(FMT_STRING("expecting {}"), expected));
    }

    void unknown_key(const std::string& path) const
    {
        log_warning("%s: ignoring unknown key %s",
                    this->jw_src.c_str(),
                    path.c_str());
    }

    Result<std::string, config_error> get_string(const std::string& path,
                                                 yajl_val val) const
    {
        if (!YAJL_IS_STRING(val)) {
            return Err(this->type_error(path, "a string"));
        }
        return Ok(std::string(YAJL_GET_STRING(val)));
    }

    Result<bool, config_error> get_bool(const std::string& path,
                                        yajl_val val) const
    {
        if (YAJL_IS_TRUE(val)) {
            return Ok(true);
        }
        if (YAJL_IS_FALSE(val)) {
            return Ok(false);
        }
        return Err(this->type_error(path, "a boolean"));
    }

    Result<size_t, config_error> get_size(const std::string& path,
                                          yajl_val val) const
    {
        if (!YAJL_IS_INTEGER(val) || YAJL_GET_INTEGER(val) < 0) {
            return Err(this->type_error(path, "a non-negative integer"));
        }
        return Ok((size_t) YAJL_GET_INTEGER(val));
    }

    Result<std::vector<std::string>, config_error> get_string_array(
        const std::string& path, yajl_val val) const
    {
        std::vector<std::string> retval;

        if (!YAJL_IS_ARRAY(val)) {
            return Err(this->type_error(path, "an array of strings"));
        }
        const auto* arr = YAJL_GET_ARRAY(val);
        for (size_t lpc = 0; lpc < arr->len; lpc++) {
            retval.emplace_back(TRY(this->get_string(
                fmt::format(FMT_STRING("{}/{}"), path, lpc),
                arr->values[lpc])));
        }

        return Ok(std::move(retval));
    }

    Result<filter_def, config_error> get_filter(const std::string& path,
                                                yajl_val val) const
    {
        filter_def retval;

        if (!YAJL_IS_OBJECT(val)) {
            return Err(this->type_error(path, "an object"));
        }
        const auto* obj = YAJL_GET_OBJECT(val);
        for (size_t lpc = 0; lpc < obj->len; lpc++) {
            auto key = string_fragment::from_c_str(obj->keys[lpc]);
            auto key_path = fmt::format(FMT_STRING("{}/{}"), path, key);
            auto* sub_val = obj->values[lpc];

            if (key == "name") {
                retval.fd_name = TRY(this->get_string(key_path, sub_val));
            } else if (key == "expression") {
                retval.fd_expression = TRY(this->get_string(key_path, sub_val));
            } else if (key == "highlight") {
                retval.fd_highlight = TRY(this->get_string(key_path, sub_val));
            } else if (key == "gutter") {
                retval.fd_gutter = TRY(this->get_string(key_path, sub_val));
            } else {
                this->unknown_key(key_path);
            }
        }
        if (retval.fd_expression.empty()) {
            return Err(this->error(path + "/expression",
                                   "filter expression is required"));
        }

        return Ok(std::move(retval));
    }

    Result<column_def, config_error> get_column(const std::string& path,
                                                yajl_val val) const
    {
        column_def retval;

        if (!YAJL_IS_OBJECT(val)) {
            return Err(this->type_error(path, "an object"));
        }
        const auto* obj = YAJL_GET_OBJECT(val);
        for (size_t lpc = 0; lpc < obj->len; lpc++) {
            auto key = string_fragment::from_c_str(obj->keys[lpc]);
            auto key_path = fmt::format(FMT_STRING("{}/{}"), path, key);
            auto* sub_val = obj->values[lpc];

            if (key == "name") {
                retval.cd_name = TRY(this->get_string(key_path, sub_val));
            } else if (key == "width") {
                retval.cd_width = TRY(this->get_size(key_path, sub_val));
            } else if (key == "align") {
                auto align = TRY(this->get_string(key_path, sub_val));

                if (align == "left") {
                    retval.cd_align = column_align::left;
                } else if (align == "right") {
                    retval.cd_align = column_align::right;
                } else {
                    return Err(this->error(
                        key_path,
                        fmt::format(FMT_STRING("unknown alignment: {}"),
                                    align)));
                }
            } else {
                this->unknown_key(key_path);
            }
        }

        return Ok(std::move(retval));
    }

    Result<rule_def, config_error> get_rule(const std::string& path,
                                            yajl_val val) const
    {
        rule_def retval;

        if (!YAJL_IS_OBJECT(val)) {
            return Err(this->type_error(path, "an object"));
        }
        const auto* obj = YAJL_GET_OBJECT(val);
        for (size_t lpc = 0; lpc < obj->len; lpc++) {
            auto key = string_fragment::from_c_str(obj->keys[lpc]);
            auto key_path = fmt::format(FMT_STRING("{}/{}"), path, key);
            auto* sub_val = obj->values[lpc];

            if (key == "name") {
                retval.rd_name = TRY(this->get_string(key_path, sub_val));
            } else if (key == "file-patterns") {
                retval.rd_file_patterns
                    = TRY(this->get_string_array(key_path, sub_val));
            } else if (key == "extractors") {
                retval.rd_extractors
                    = TRY(this->get_string_array(key_path, sub_val));
            } else if (key == "merge-policy") {
                auto name = TRY(this->get_string(key_path, sub_val));
                auto mp = merge_policy_from_name(
                    string_fragment::from_str(name));

                if (!mp) {
                    return Err(this->error(
                        key_path,
                        fmt::format(FMT_STRING("unknown merge policy: {}"),
                                    name)));
                }
                retval.rd_merge_policy = mp.value();
            } else if (key == "filters") {
                if (!YAJL_IS_ARRAY(sub_val)) {
                    return Err(this->type_error(key_path, "an array"));
                }
                const auto* arr = YAJL_GET_ARRAY(sub_val);
                for (size_t fi = 0; fi < arr->len; fi++) {
                    retval.rd_filters.emplace_back(TRY(this->get_filter(
                        fmt::format(FMT_STRING("{}/{}"), key_path, fi),
                        arr->values[fi])));
                }
            } else if (key == "columns") {
                if (!YAJL_IS_ARRAY(sub_val)) {
                    return Err(this->type_error(key_path, "an array"));
                }
                const auto* arr = YAJL_GET_ARRAY(sub_val);
                for (size_t ci = 0; ci < arr->len; ci++) {
                    retval.rd_columns.emplace_back(TRY(this->get_column(
                        fmt::format(FMT_STRING("{}/{}"), key_path, ci),
                        arr->values[ci])));
                }
            } else {
                this->unknown_key(key_path);
            }
        }

        return Ok(std::move(retval));
    }
};

}  // namespace

Result<rules_config, config_error>
parse_rules(string_fragment json_text, const std::string& src_name)
{
    json_walker jw{src_name};
    rules_config retval;
    char error_buffer[1024];
    auto content = json_text.to_string();
    auto_mem<yajl_val_s> tree(
        yajl_tree_free,
        yajl_tree_parse(content.c_str(), error_buffer, sizeof(error_buffer)));
    if (tree.empty()) {
        return Err(jw.error("", fmt::format(FMT_STRING("invalid JSON: {}"),
                                            error_buffer)));
    }
    if (!YAJL_IS_OBJECT(tree.in())) {
        return Err(jw.type_error("", "an object at the top level"));
    }

    const auto* top = YAJL_GET_OBJECT(tree.in());
    for (size_t lpc = 0; lpc < top->len; lpc++) {
        auto key = string_fragment::from_c_str(top->keys[lpc]);
        auto key_path = fmt::format(FMT_STRING("/{}"), key);
        auto* val = top->values[lpc];

        if (key == "global") {
            if (!YAJL_IS_OBJECT(val)) {
                return Err(jw.type_error(key_path, "an object"));
            }
            const auto* gobj = YAJL_GET_OBJECT(val);
            for (size_t gi = 0; gi < gobj->len; gi++) {
                auto gkey = string_fragment::from_c_str(gobj->keys[gi]);
                auto gpath = fmt::format(FMT_STRING("{}/{}"), key_path, gkey);

                if (gkey == "reload-on-truncate") {
                    retval.rc_global.go_reload_on_truncate
                        = TRY(jw.get_bool(gpath, gobj->values[gi]));
                } else {
                    jw.unknown_key(gpath);
                }
            }
        } else if (key == "rules") {
            if (!YAJL_IS_ARRAY(val)) {
                return Err(jw.type_error(key_path, "an array"));
            }
            const auto* arr = YAJL_GET_ARRAY(val);
            for (size_t ri = 0; ri < arr->len; ri++) {
                retval.rc_rules.emplace_back(TRY(jw.get_rule(
                    fmt::format(FMT_STRING("{}/{}"), key_path, ri),
                    arr->values[ri])));
            }
        } else {
            jw.unknown_key(key_path);
        }
    }

    log_info("%s: loaded %zu rules",
             src_name.c_str(),
             retval.rc_rules.size());

    return Ok(std::move(retval));
}

Result<rules_config, config_error>
load_rules_file(const std::string& path)
{
    auto read_res = filesystem::read_file(path);

    if (read_res.isErr()) {
        return Err(config_error{
            path,
            fmt::format(FMT_STRING("unable to read rules file: {}"),
                        read_res.unwrapErr()),
        });
    }

    auto content = read_res.unwrap();
    return parse_rules(string_fragment::from_str(content), path);
}

}  // namespace lsift
