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

#include "capture_set.hh"

#include "config.h"

namespace rxlog {

capture_instruction
capture_instruction::from(string_fragment sf)
{
    if (sf == ":none") {
        return select_none{};
    }
    if (sf == ":all") {
        return select_all{};
    }

    return select_field{sf.to_string()};
}

std::string
capture_instruction::to_string() const
{
    return this->match([](const select_none&) { return std::string(":none"); },
                       [](const select_all&) { return std::string(":all"); },
                       [](const select_field& sf) { return sf.sf_name; });
}

std::vector<capture_instruction>
capture_instructions_from(const std::vector<std::string>& names)
{
    std::vector<capture_instruction> retval;

    retval.reserve(names.size());
    for (const auto& name : names) {
        retval.emplace_back(capture_instruction::from(name));
    }

    return retval;
}

capture_set
apply_capture(const std::vector<capture_instruction>& instrs,
              capture_set current,
              const token_table& tokens)
{
    for (const auto& instr : instrs) {
        instr.match([&current](const select_none&) { current.clear(); },
                    [&current, &tokens](const select_all&) {
                        current = all_field_names(tokens);
                    },
                    [&current](const select_field& sf) {
                        current.emplace(sf.sf_name);
                    });
    }

    return current;
}

}  // namespace rxlog
