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

#include <ctype.h>

#include "field_marker.hh"

#include "config.h"
#include "fmt/format.h"

namespace rxlog {

static bool
is_field_name_char(char ch)
{
    return isalnum((unsigned char) ch) || ch == '_' || ch == '-';
}

std::string
start_marker(string_fragment name)
{
    return fmt::format(FMT_STRING("(?#{})"), name);
}

std::string
end_marker(string_fragment name)
{
    return fmt::format(FMT_STRING("(?#!{})"), name);
}

std::vector<field_marker>
scan_field_markers(string_fragment pattern)
{
    static const auto COMMENT_START = string_fragment::from_const("(?#");

    bool in_class = false, in_escape = false, in_literal = false;
    std::vector<field_marker> retval;

    for (int lpc = 0; lpc < pattern.length(); lpc++) {
        auto ch = pattern[lpc];

        // \Q...\E also quotes inside a class.
        if (in_literal) {
            if (ch == '\\' && lpc + 1 < pattern.length()
                && pattern[lpc + 1] == 'E')
            {
                in_literal = false;
                lpc += 1;
            }
        } else if (in_escape) {
            in_escape = false;
            if (ch == 'Q') {
                in_literal = true;
            }
        } else if (in_class) {
            if (ch == ']') {
                in_class = false;
            }
            if (ch == '\\') {
                in_escape = true;
            }
        } else {
            switch (ch) {
                case '\\':
                    in_escape = true;
                    break;
                case '[':
                    in_class = true;
                    break;
                case '(': {
                    auto rest = pattern.substr(lpc);

                    if (!rest.startswith(COMMENT_START)) {
                        break;
                    }

                    auto name_begin = lpc + COMMENT_START.length();
                    auto fm_kind = field_marker::kind::start;
                    if (name_begin < pattern.length()
                        && pattern[name_begin] == '!')
                    {
                        fm_kind = field_marker::kind::end;
                        name_begin += 1;
                    }

                    auto name_end = name_begin;
                    while (name_end < pattern.length()
                           && is_field_name_char(pattern[name_end]))
                    {
                        name_end += 1;
                    }

                    if (name_end > name_begin && name_end < pattern.length()
                        && pattern[name_end] == ')')
                    {
                        retval.emplace_back(field_marker{
                            fm_kind,
                            pattern.sub_range(name_begin, name_end),
                            lpc,
                            name_end + 1,
                        });
                        lpc = name_end;
                        break;
                    }

                    // An ordinary comment, which ends at the first paren.
                    auto close = pattern.substr(lpc).find(')');
                    if (close) {
                        lpc += close.value();
                    } else {
                        lpc = pattern.length();
                    }
                    break;
                }
            }
        }
    }

    return retval;
}

Result<std::vector<field_span>, template_error>
pair_field_markers(string_fragment pattern)
{
    std::vector<field_span> retval;
    std::vector<size_t> open_stack;

    for (const auto& fm : scan_field_markers(pattern)) {
        if (fm.fm_kind == field_marker::kind::start) {
            for (const auto open_index : open_stack) {
                if (fm.fm_name == retval[open_index].fs_name) {
                    return Err(template_error{
                        template_error::kind::config,
                        pattern.to_string(),
                        fmt::format(
                            FMT_STRING(
                                "field \"{}\" is opened again before it is "
                                "closed"),
                            fm.fm_name),
                        (size_t) fm.fm_begin,
                    });
                }
            }

            open_stack.push_back(retval.size());
            retval.emplace_back(field_span{
                fm.fm_name.to_string(),
                fm.fm_begin,
                fm.fm_end,
                -1,
                -1,
                open_stack.size() - 1,
            });
            continue;
        }

        if (open_stack.empty()) {
            return Err(template_error{
                template_error::kind::config,
                pattern.to_string(),
                fmt::format(FMT_STRING("field \"{}\" is closed but never opened"),
                            fm.fm_name),
                (size_t) fm.fm_begin,
            });
        }

        auto& innermost = retval[open_stack.back()];
        if (fm.fm_name != innermost.fs_name) {
            return Err(template_error{
                template_error::kind::config,
                pattern.to_string(),
                fmt::format(
                    FMT_STRING("field \"{}\" is closed while the nested field "
                               "\"{}\" is still open"),
                    fm.fm_name,
                    innermost.fs_name),
                (size_t) fm.fm_begin,
            });
        }

        innermost.fs_inner_end = fm.fm_begin;
        innermost.fs_end = fm.fm_end;
        open_stack.pop_back();
    }

    if (!open_stack.empty()) {
        const auto& unclosed = retval[open_stack.back()];

        return Err(template_error{
            template_error::kind::config,
            pattern.to_string(),
            fmt::format(FMT_STRING("field \"{}\" is never closed"),
                        unclosed.fs_name),
            (size_t) unclosed.fs_begin,
        });
    }

    return Ok(std::move(retval));
}

std::vector<std::string>
field_names(string_fragment pattern)
{
    std::vector<std::string> retval;

    for (const auto& fm : scan_field_markers(pattern)) {
        if (fm.fm_kind == field_marker::kind::start) {
            retval.emplace_back(fm.fm_name.to_string());
        }
    }

    return retval;
}

std::set<std::string>
all_field_names(const token_table& tokens)
{
    std::set<std::string> retval;

    for (const auto& token_pair : tokens) {
        for (auto& name : field_names(token_pair.second)) {
            retval.emplace(std::move(name));
        }
    }

    return retval;
}

}  // namespace rxlog
