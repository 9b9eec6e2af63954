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

#include <stdio.h>

#include "pattern_assembler.hh"

#include "base/rxlog_log.hh"
#include "config.h"
#include "field_marker.hh"
#include "fmt/format.h"

namespace rxlog {

trace_sink
stderr_trace_sink()
{
    return [](string_fragment sf) {
        fwrite(sf.data(), 1, sf.length(), stderr);
    };
}

static std::string
build_body(const resolved_template& rt, const assemble_options& opts)
{
    auto pattern = string_fragment::from_str(rt.rt_pattern);
    std::string retval;
    int copied = 0;

    retval.reserve(pattern.length());
    for (const auto& fm : scan_field_markers(pattern)) {
        retval.append(pattern.data() + copied, fm.fm_begin - copied);
        if (opts.ao_keep_markers) {
            retval.append(pattern.data() + fm.fm_begin,
                          fm.fm_end - fm.fm_begin);
        }
        if (opts.ao_trace && fm.fm_kind == field_marker::kind::end) {
            retval.append(
                fmt::format(FMT_STRING("(?C\"{}\")"), fm.fm_name));
        }
        copied = fm.fm_end;
    }
    retval.append(pattern.data() + copied, pattern.length() - copied);

    return retval;
}

Result<compiled_pattern, template_error>
assemble_pattern(const resolved_template& rt, const assemble_options& opts)
{
    auto anchored = fmt::format(FMT_STRING("^{}(?:{})$"),
                                opts.ao_trace ? "(?C1)" : "",
                                build_body(rt, opts));
    int options = 0;

    if (opts.ao_trace) {
        // Keep PCRE2 from skipping over callouts.
        options |= PCRE2_NO_START_OPTIMIZE | PCRE2_NO_AUTO_POSSESS;
    }

    auto compile_res = pcre2pp::code::from(anchored, options);
    if (compile_res.isErr()) {
        auto ce = compile_res.unwrapErr();

        log_error("unable to compile pattern: %s -- %s",
                  anchored.c_str(),
                  ce.get_message().c_str());
        return Err(template_error{
            template_error::kind::compile,
            anchored,
            ce.get_message(),
            ce.ce_offset,
        });
    }

    auto co = compile_res.unwrap();
    if (co.get_capture_count() != rt.rt_captures.size()) {
        auto reason = fmt::format(
            FMT_STRING("the pattern has {} capturing groups for {} captured "
                       "fields, a hook added or removed a group"),
            co.get_capture_count(),
            rt.rt_captures.size());

        log_error("%s -- %s", anchored.c_str(), reason.c_str());
        return Err(template_error{
            template_error::kind::config,
            anchored,
            reason,
            0,
        });
    }
    if (opts.ao_trace) {
        auto sink = opts.ao_trace_sink ? opts.ao_trace_sink
                                       : stderr_trace_sink();

        co.with_callout([sink](const pcre2pp::callout& c) {
            if (!c.c_string.is_valid()) {
                sink(string_fragment::from_const("\n"));
            } else {
                sink(fmt::format(FMT_STRING("{} "), c.c_string));
            }
            return 0;
        });
    }

    log_debug("assembled pattern: %s", anchored.c_str());

    return Ok(compiled_pattern{std::move(co), rt.rt_captures});
}

bool
compiled_pattern::matches(string_fragment line) const
{
    return this->cp_code.find_in(line).ignore_error().has_value();
}

std::optional<std::vector<extracted_field>>
compiled_pattern::extract(string_fragment line) const
{
    auto md = this->cp_code.create_match_data();
    auto find_res
        = this->cp_code.capture_from(line).into(md).matches().ignore_error();

    if (!find_res) {
        return std::nullopt;
    }

    std::vector<extracted_field> retval;

    retval.reserve(this->cp_captures.size());
    for (size_t lpc = 0; lpc < this->cp_captures.size(); lpc++) {
        retval.emplace_back(extracted_field{
            this->cp_captures[lpc],
            md[lpc + 1],
        });
    }

    return retval;
}

}  // namespace rxlog
