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

#include <algorithm>

#include "tag_resolver.hh"

#include "config.h"
#include "field_marker.hh"

namespace rxlog {

Result<resolved_template, template_error>
resolve_fields(string_fragment tagged, const capture_set& captures)
{
    auto pair_res = pair_field_markers(tagged);
    if (pair_res.isErr()) {
        return Err(pair_res.unwrapErr());
    }

    auto spans = pair_res.unwrap();
    std::vector<int> close_offsets;

    close_offsets.reserve(spans.size());
    for (const auto& span : spans) {
        close_offsets.push_back(span.fs_end);
    }
    std::sort(close_offsets.begin(), close_offsets.end());

    resolved_template retval;
    size_t open_index = 0, close_index = 0;
    int copied = 0;
    auto copy_to = [&tagged, &retval, &copied](int offset) {
        retval.rt_pattern.append(tagged.data() + copied, offset - copied);
        copied = offset;
    };

    retval.rt_pattern.reserve(tagged.length() + spans.size() * 4);
    while (open_index < spans.size() || close_index < close_offsets.size()) {
        // A group that ends where the next one starts is closed first.
        if (close_index < close_offsets.size()
            && (open_index == spans.size()
                || close_offsets[close_index] <= spans[open_index].fs_begin))
        {
            copy_to(close_offsets[close_index]);
            retval.rt_pattern.push_back(')');
            close_index += 1;
            continue;
        }

        const auto& span = spans[open_index];

        copy_to(span.fs_begin);
        if (captures.count(span.fs_name) > 0) {
            retval.rt_pattern.push_back('(');
            retval.rt_captures.emplace_back(span.fs_name);
        } else {
            retval.rt_pattern.append("(?:");
        }
        open_index += 1;
    }
    copy_to(tagged.length());

    return Ok(std::move(retval));
}

}  // namespace rxlog
