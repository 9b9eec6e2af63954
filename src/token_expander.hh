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

#ifndef rxlog_token_expander_hh
#define rxlog_token_expander_hh

#include <string>
#include <vector>

#include "base/string_fragment.hh"
#include "template_dialect.hh"

namespace rxlog {

/**
 * @return The alias target when the template is exactly an alias name,
 *   otherwise the template itself.
 */
const std::string& resolve_alias(const std::string& raw,
                                 const alias_table& aliases);

/**
 * Replace every token in an escaped template with its fragment.  At each
 * position the rules are tried in order and the first one that matches
 * wins.  Text that is not a token is copied as-is.
 */
std::string substitute_tokens(string_fragment escaped,
                              const std::vector<token_rule>& rules);

/**
 * Expand a raw template into a tagged template: alias resolution,
 * escaping, the pre-hook, token substitution and then the post-hook.
 */
std::string expand_template(const std::string& raw,
                            const template_dialect& dialect);

}  // namespace rxlog

#endif
