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

#ifndef rxlog_template_dialect_hh
#define rxlog_template_dialect_hh

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "capture_set.hh"
#include "field_marker.hh"
#include "result.h"
#include "template_error.hh"

namespace rxlog {

/**
 * A token as it is looked for in an escaped template.
 */
struct token_rule {
    std::string tr_key;
    /** The key with its metacharacters escaped. */
    std::string tr_match;
    std::string tr_fragment;
};

/**
 * The tables and hooks that specialize the template compiler for one log
 * format.  Dialects are immutable once built and are shared by every
 * compiler for that format.
 */
class template_dialect {
public:
    using hook_func = std::function<std::string(const std::string&)>;

    class builder {
    public:
        explicit builder(std::string name) : b_name(std::move(name)) {}

        builder& with_token(std::string key, std::string fragment)
        {
            this->b_tokens[std::move(key)] = std::move(fragment);
            return *this;
        }

        builder& with_alias(std::string name, std::string tmpl)
        {
            this->b_aliases[std::move(name)] = std::move(tmpl);
            return *this;
        }

        builder& with_pre_hook(hook_func func)
        {
            this->b_pre_hook = std::move(func);
            return *this;
        }

        builder& with_post_hook(hook_func func)
        {
            this->b_post_hook = std::move(func);
            return *this;
        }

        builder& with_default_format(std::string format)
        {
            this->b_default_format = std::move(format);
            return *this;
        }

        builder& with_default_capture(std::vector<capture_instruction> instrs)
        {
            this->b_default_capture = std::move(instrs);
            return *this;
        }

        /**
         * Check every fragment and produce the dialect.  A fragment with
         * unbalanced markers, with a capturing group of its own, or that
         * PCRE2 cannot compile is rejected.
         */
        Result<std::shared_ptr<const template_dialect>, template_error> build()
            const;

    private:
        friend template_dialect;

        std::string b_name;
        token_table b_tokens;
        alias_table b_aliases;
        hook_func b_pre_hook;
        hook_func b_post_hook;
        std::string b_default_format;
        std::vector<capture_instruction> b_default_capture;
    };

    /**
     * Start a new dialect from this one, for example to patch a fragment.
     */
    builder to_builder() const;

    const std::string& get_name() const { return this->td_name; }

    const token_table& get_tokens() const { return this->td_tokens; }

    const alias_table& get_aliases() const { return this->td_aliases; }

    /** The tokens in the order they are tried at each template position. */
    const std::vector<token_rule>& get_token_rules() const
    {
        return this->td_token_rules;
    }

    const std::set<std::string>& get_field_names() const
    {
        return this->td_field_names;
    }

    const std::string& get_default_format() const
    {
        return this->td_default_format;
    }

    const std::vector<capture_instruction>& get_default_capture() const
    {
        return this->td_default_capture;
    }

    std::string apply_pre_hook(const std::string& str) const
    {
        return this->td_pre_hook(str);
    }

    std::string apply_post_hook(const std::string& str) const
    {
        return this->td_post_hook(str);
    }

private:
    struct private_key {};

public:
    /** Use builder::build() to create a dialect. */
    explicit template_dialect(private_key) {}

private:

    std::string td_name;
    token_table td_tokens;
    alias_table td_aliases;
    std::vector<token_rule> td_token_rules;
    std::set<std::string> td_field_names;
    hook_func td_pre_hook;
    hook_func td_post_hook;
    std::string td_default_format;
    std::vector<capture_instruction> td_default_capture;
};

}  // namespace rxlog

#endif
