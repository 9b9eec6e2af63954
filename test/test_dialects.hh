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

#ifndef rxlog_test_dialects_hh
#define rxlog_test_dialects_hh

#include <memory>
#include <string>

#include "template_dialect.hh"

/**
 * Collapse runs of spaces into one.
 */
inline std::string
squeeze_spaces(const std::string& str)
{
    std::string retval;

    for (auto ch : str) {
        if (ch == ' ' && !retval.empty() && retval.back() == ' ') {
            continue;
        }
        retval.push_back(ch);
    }

    return retval;
}

inline rxlog::template_dialect::builder
foo_dialect_builder()
{
    rxlog::template_dialect::builder retval("foo");

    retval.with_token("%a", R"((?#a)\d+(?#!a))")
        .with_token("%b", R"((?#b)th(?:is|at)(?#!b))")
        .with_token("%c", R"((?#c)(?#cs)\w+(?#!cs)/(?#cn)\d+(?#!cn)(?#!c))")
        .with_token("%d", R"((?#d)(?:foo|bar|baz)(?#!d))")
        .with_alias(":default", "%a %b %c")
        .with_pre_hook(squeeze_spaces)
        .with_default_format("%d %c %b")
        .with_default_capture({rxlog::select_field{"c"}});

    return retval;
}

inline std::shared_ptr<const rxlog::template_dialect>
foo_dialect()
{
    static const auto retval = foo_dialect_builder().build().unwrap();

    return retval;
}

#endif
