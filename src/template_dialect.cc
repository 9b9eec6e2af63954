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

#include "template_dialect.hh"

#include "base/rxlog_log.hh"
#include "config.h"
#include "fmt/format.h"
#include "pcrepp/pcre2pp.hh"

namespace rxlog {

static std::string
identity_hook(const std::string& str)
{
    return str;
}

static Result<void, template_error>
check_fragment(const std::string& key, const std::string& fragment)
{
    if (key.empty()) {
        return Err(template_error{
            template_error::kind::config,
            fragment,
            "a token key cannot be empty",
            0,
        });
    }

    auto pair_res = pair_field_markers(fragment);
    if (pair_res.isErr()) {
        auto err = pair_res.unwrapErr();

        err.te_reason = fmt::format(
            FMT_STRING("token \"{}\": {}"), key, err.te_reason);
        return Err(err);
    }

    auto compile_res = pcre2pp::code::from(fragment);
    if (compile_res.isErr()) {
        auto ce = compile_res.unwrapErr();

        return Err(template_error{
            template_error::kind::config,
            fragment,
            fmt::format(FMT_STRING("token \"{}\" is not a valid pattern -- {}"),
                        key,
                        ce.get_message()),
            ce.ce_offset,
        });
    }

    auto co = compile_res.unwrap();
    if (co.get_capture_count() > 0) {
        auto caps = co.get_captures();
        auto first_cap = caps.empty() ? string_fragment::from_const("(")
                                      : caps.front();

        return Err(template_error{
            template_error::kind::config,
            fragment,
            fmt::format(FMT_STRING("token \"{}\" has its own capturing group "
                                   "{}, use (?:...) instead"),
                        key,
                        first_cap),
            caps.empty() ? 0 : (size_t) caps.front().sf_begin,
        });
    }

    return Ok();
}

Result<std::shared_ptr<const template_dialect>, template_error>
template_dialect::builder::build() const
{
    for (const auto& token_pair : this->b_tokens) {
        auto check_res = check_fragment(token_pair.first, token_pair.second);

        if (check_res.isErr()) {
            auto err = check_res.unwrapErr();

            log_error("dialect %s: %s",
                      this->b_name.c_str(),
                      err.get_message().c_str());
            return Err(err);
        }
    }

    auto retval = std::make_shared<template_dialect>(private_key{});

    retval->td_name = this->b_name;
    retval->td_tokens = this->b_tokens;
    retval->td_aliases = this->b_aliases;
    retval->td_pre_hook = this->b_pre_hook ? this->b_pre_hook : identity_hook;
    retval->td_post_hook
        = this->b_post_hook ? this->b_post_hook : identity_hook;
    retval->td_default_format = this->b_default_format;
    retval->td_default_capture = this->b_default_capture;
    retval->td_field_names = all_field_names(this->b_tokens);

    // The greatest key is tried first so that "%ab" wins over "%a".
    for (auto iter = this->b_tokens.rbegin(); iter != this->b_tokens.rend();
         ++iter)
    {
        retval->td_token_rules.emplace_back(token_rule{
            iter->first,
            pcre2pp::quote(iter->first),
            iter->second,
        });
    }

    log_info("registered dialect %s: %zu tokens, %zu aliases, %zu fields",
             retval->td_name.c_str(),
             retval->td_tokens.size(),
             retval->td_aliases.size(),
             retval->td_field_names.size());

    return Ok(std::shared_ptr<const template_dialect>(std::move(retval)));
}

template_dialect::builder
template_dialect::to_builder() const
{
    builder retval(this->td_name);

    retval.b_tokens = this->td_tokens;
    retval.b_aliases = this->td_aliases;
    retval.b_pre_hook = this->td_pre_hook;
    retval.b_post_hook = this->td_post_hook;
    retval.b_default_format = this->td_default_format;
    retval.b_default_capture = this->td_default_capture;

    return retval;
}

}  // namespace rxlog
