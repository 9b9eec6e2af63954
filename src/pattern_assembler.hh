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

#ifndef rxlog_pattern_assembler_hh
#define rxlog_pattern_assembler_hh

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "base/string_fragment.hh"
#include "pcrepp/pcre2pp.hh"
#include "result.h"
#include "tag_resolver.hh"
#include "template_error.hh"

namespace rxlog {

/**
 * Receives the output of trace mode while a line is matched.
 */
using trace_sink = std::function<void(string_fragment)>;

/**
 * A sink that writes to stderr.
 */
trace_sink stderr_trace_sink();

struct assemble_options {
    /** Leave the field markers, as comments, in the pattern. */
    bool ao_keep_markers{false};
    /** Report the field boundaries reached while matching. */
    bool ao_trace{false};
    trace_sink ao_trace_sink;
};

struct extracted_field {
    std::string ef_name;
    /** Unset when the field's group did not take part in the match. */
    std::optional<string_fragment> ef_value;
};

/**
 * An anchored pattern together with the names of its capturing groups.
 */
class compiled_pattern {
public:
    compiled_pattern(pcre2pp::code co, std::vector<std::string> captures)
        : cp_code(std::move(co)), cp_captures(std::move(captures))
    {
    }

    const std::string& get_pattern() const
    {
        return this->cp_code.get_pattern();
    }

    /** The captured field names, in the order of their groups. */
    const std::vector<std::string>& get_captures() const
    {
        return this->cp_captures;
    }

    const pcre2pp::code& get_code() const { return this->cp_code; }

    bool matches(string_fragment line) const;

    /**
     * Match a line and pair each captured field name with its value.
     *
     * @return The fields in capture order or nullopt if the line does not
     *   match.
     */
    std::optional<std::vector<extracted_field>> extract(
        string_fragment line) const;

private:
    pcre2pp::code cp_code;
    std::vector<std::string> cp_captures;
};

/**
 * Turn a resolved template into a compiled pattern: inject the trace
 * callouts, strip the markers, anchor and compile.
 */
Result<compiled_pattern, template_error> assemble_pattern(
    const resolved_template& rt, const assemble_options& opts);

}  // namespace rxlog

#endif
