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

#include "template_compiler.hh"

#include "base/rxlog_log.hh"
#include "config.h"
#include "field_marker.hh"
#include "tag_resolver.hh"
#include "token_expander.hh"

namespace rxlog {

template_compiler::template_compiler(
    std::shared_ptr<const template_dialect> dialect, compiler_options opts)
    : tc_dialect(std::move(dialect)), tc_keep_markers(opts.co_keep_markers),
      tc_trace(opts.co_trace), tc_trace_sink(std::move(opts.co_trace_sink))
{
    require(this->tc_dialect != nullptr);

    this->tc_format = opts.co_format.value_or(
        this->tc_dialect->get_default_format());
    this->tc_capture = apply_capture(
        opts.co_capture.value_or(this->tc_dialect->get_default_capture()),
        {},
        this->tc_dialect->get_tokens());
}

std::string
template_compiler::set_format(std::string format)
{
    auto retval = std::move(this->tc_format);

    this->tc_format = std::move(format);
    this->tc_tagged = std::nullopt;

    return retval;
}

const std::string&
template_compiler::get_effective_format() const
{
    return resolve_alias(this->tc_format, this->tc_dialect->get_aliases());
}

const std::string&
template_compiler::get_tagged_template() const
{
    if (!this->tc_tagged) {
        this->tc_tagged = expand_template(this->tc_format, *this->tc_dialect);
        log_debug("%s: expanded \"%s\" -> %s",
                  this->tc_dialect->get_name().c_str(),
                  this->tc_format.c_str(),
                  this->tc_tagged->c_str());
    }

    return this->tc_tagged.value();
}

std::vector<std::string>
template_compiler::get_capture() const
{
    std::vector<std::string> retval;

    for (auto& name : field_names(this->get_tagged_template())) {
        if (this->tc_capture.count(name) > 0) {
            retval.emplace_back(std::move(name));
        }
    }

    return retval;
}

std::vector<std::string>
template_compiler::set_capture(const std::vector<capture_instruction>& instrs)
{
    this->tc_capture = apply_capture(
        instrs, std::move(this->tc_capture), this->tc_dialect->get_tokens());

    return this->get_capture();
}

Result<compiled_pattern, template_error>
template_compiler::compile() const
{
    const auto& tagged = this->get_tagged_template();
    auto resolve_res = resolve_fields(tagged, this->tc_capture);

    if (resolve_res.isErr()) {
        auto err = resolve_res.unwrapErr();

        log_error("%s: cannot compile \"%s\" -- %s",
                  this->tc_dialect->get_name().c_str(),
                  this->tc_format.c_str(),
                  err.get_message().c_str());
        return Err(err);
    }

    assemble_options ao;

    ao.ao_keep_markers = this->tc_keep_markers;
    ao.ao_trace = this->tc_trace;
    ao.ao_trace_sink = this->tc_trace_sink;

    return assemble_pattern(resolve_res.unwrap(), ao);
}

const std::set<std::string>&
template_compiler::all_fields() const
{
    return this->tc_dialect->get_field_names();
}

bool
template_compiler::set_keep_markers(bool value)
{
    auto retval = this->tc_keep_markers;

    this->tc_keep_markers = value;
    return retval;
}

bool
template_compiler::set_trace(bool value)
{
    auto retval = this->tc_trace;

    this->tc_trace = value;
    return retval;
}

}  // namespace rxlog
