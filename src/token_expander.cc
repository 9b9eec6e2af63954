/**
 * Copyright (c) 2022, Timothy Stack
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
 */

#include "token_expander.hh"

#include "base/rxlog_log.hh"
#include "config.h"
#include "pcrepp/pcre2pp.hh"

namespace rxlog {

const std::string&
resolve_alias(const std::string& raw, const alias_table& aliases)
{
    auto iter = aliases.find(raw);

    if (iter == aliases.end()) {
        return raw;
    }

    return iter->second;
}

std::string
substitute_tokens(string_fragment escaped, const std::vector<token_rule>& rules)
{
    std::string retval;

    retval.reserve(escaped.length() * 4);
    for (int lpc = 0; lpc < escaped.length();) {
        auto rest = escaped.substr(lpc);
        const token_rule* found = nullptr;

        for (const auto& rule : rules) {
            if (!rule.tr_match.empty() && rest.startswith(rule.tr_match)) {
                found = &rule;
                break;
            }
        }

        if (found == nullptr) {
            retval.push_back(escaped[lpc]);
            lpc += 1;
            continue;
        }

        retval.append(found->tr_fragment);
        lpc += found->tr_match.size();
    }

    return retval;
}

std::string
expand_template(const std::string& raw, const template_dialect& dialect)
{
    const auto& effective = resolve_alias(raw, dialect.get_aliases());

    if (&effective != &raw) {
        log_debug("%s: alias %s -> %s",
                  dialect.get_name().c_str(),
                  raw.c_str(),
                  effective.c_str());
    }

    auto escaped = pcre2pp::quote(effective);
    auto prepped = dialect.apply_pre_hook(escaped);
    auto substituted = substitute_tokens(prepped, dialect.get_token_rules());

    return dialect.apply_post_hook(substituted);
}

}  // namespace rxlog
