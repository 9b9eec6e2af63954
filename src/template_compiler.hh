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

#ifndef rxlog_template_compiler_hh
#define rxlog_template_compiler_hh

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "capture_set.hh"
#include "pattern_assembler.hh"
#include "result.h"
#include "template_dialect.hh"
#include "template_error.hh"

namespace rxlog {

struct compiler_options {
    /** The template, the dialect's default when unset. */
    std::optional<std::string> co_format;
    /** The initial capture instructions, the dialect's default when unset. */
    std::optional<std::vector<capture_instruction>> co_capture;
    bool co_keep_markers{false};
    bool co_trace{false};
    /** Where trace output goes, stderr when unset. */
    trace_sink co_trace_sink;
};

/**
 * Compiles log-format templates of one dialect into anchored patterns that
 * capture the requested fields.
 *
 *   auto tc = template_compiler(dialect);
 *
 *   tc.set_format("%h %l %u %t");
 *   tc.set_capture({select_field{"host"}, select_field{"time"}});
 *   auto pattern = tc.compile().unwrap();
 *   auto fields = pattern.extract(line);
 *
 * The compiler is not thread-safe, but the dialect can be shared.
 */
class template_compiler {
public:
    explicit template_compiler(std::shared_ptr<const template_dialect> dialect,
                               compiler_options opts = {});

    const template_dialect& get_dialect() const { return *this->tc_dialect; }

    const std::string& get_format() const { return this->tc_format; }

    /**
     * @return The previous format.
     */
    std::string set_format(std::string format);

    /**
     * @return The format after alias resolution.
     */
    const std::string& get_effective_format() const;

    /**
     * @return The fields that the compiled pattern will capture, in the
     *   order of their groups.
     */
    std::vector<std::string> get_capture() const;

    /**
     * Apply capture instructions.
     *
     * @return The new capture order.
     */
    std::vector<std::string> set_capture(
        const std::vector<capture_instruction>& instrs);

    const capture_set& get_capture_set() const { return this->tc_capture; }

    Result<compiled_pattern, template_error> compile() const;

    Result<compiled_pattern, template_error> regex() const
    {
        return this->compile();
    }

    /**
     * Every field the dialect's tokens can produce.  Hooks can make this
     * inaccurate.
     */
    const std::set<std::string>& all_fields() const;

    bool get_keep_markers() const { return this->tc_keep_markers; }

    /**
     * @return The previous value.
     */
    bool set_keep_markers(bool value);

    bool get_trace() const { return this->tc_trace; }

    /**
     * @return The previous value.
     */
    bool set_trace(bool value);

    void set_trace_sink(trace_sink sink)
    {
        this->tc_trace_sink = std::move(sink);
    }

    /**
     * @return The expanded format, with its field markers.
     */
    const std::string& get_tagged_template() const;

private:
    std::shared_ptr<const template_dialect> tc_dialect;
    std::string tc_format;
    capture_set tc_capture;
    bool tc_keep_markers;
    bool tc_trace;
    trace_sink tc_trace_sink;
    mutable std::optional<std::string> tc_tagged;
};

}  // namespace rxlog

#endif
