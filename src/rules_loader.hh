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
 * @file rules_loader.hh
 */

#ifndef lsift_rules_loader_hh
#define lsift_rules_loader_hh

#include <string>
#include <vector>

#include "base/string_fragment.hh"
#include "config_error.hh"
#include "result.h"
#include "rule.hh"

namespace lsift {

struct rules_config {
    global_options rc_global;
    std::vector<rule_def> rc_rules;
};

/**
 * Parse the JSON text of a rules file:
 *
 *   {
 *     "global": { "reload-on-truncate": true },
 *     "rules": [ { "name": ..., "file-patterns": [...], ... } ]
 *   }
 *
 * Unknown keys are logged and skipped.  Values of the wrong type are
 * reported with the JSON path to the value.
 */
Result<rules_config, config_error> parse_rules(string_fragment json_text,
                                               const std::string& src_name);

Result<rules_config, config_error> load_rules_file(const std::string& path);

}  // namespace lsift

#endif
