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

#ifndef rxlog_capture_set_hh
#define rxlog_capture_set_hh

#include <set>
#include <string>
#include <vector>

#include "base/string_fragment.hh"
#include "field_marker.hh"
#include "mapbox/variant.hpp"

namespace rxlog {

/** Drop every field from the capture set. */
struct select_none {};

/** Capture every field the dialect can produce. */
struct select_all {};

struct select_field {
    std::string sf_name;
};

class capture_instruction
    : public mapbox::util::variant<select_none, select_all, select_field> {
public:
    using variant::variant;

    /**
     * Parse the textual form used in configuration: ":none", ":all" or a
     * field name.
     */
    static capture_instruction from(string_fragment sf);

    std::string to_string() const;
};

std::vector<capture_instruction> capture_instructions_from(
    const std::vector<std::string>& names);

using capture_set = std::set<std::string>;

/**
 * Apply the instructions, left to right, to a copy of the current set.
 */
capture_set apply_capture(const std::vector<capture_instruction>& instrs,
                          capture_set current,
                          const token_table& tokens);

}  // namespace rxlog

#endif
