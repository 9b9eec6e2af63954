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

#ifndef rxlog_field_marker_hh
#define rxlog_field_marker_hh

#include <map>
#include <set>
#include <string>
#include <vector>

#include "base/string_fragment.hh"
#include "result.h"
#include "template_error.hh"

namespace rxlog {

/** Placeholder token -> pattern fragment annotated with field markers. */
using token_table = std::map<std::string, std::string>;

/** Alias name -> template. */
using alias_table = std::map<std::string, std::string>;

/**
 * A field marker found in a pattern.  A start marker is written as
 * "(?#NAME)" and the matching end marker as "(?#!NAME)", where NAME is made
 * of letters, digits, underscores and dashes.  Both are PCRE comments.
 */
struct field_marker {
    enum class kind {
        start,
        end,
    };

    kind fm_kind;
    string_fragment fm_name;
    /** Offsets of the whole marker text, relative to the scanned pattern. */
    int fm_begin;
    int fm_end;
};

/**
 * A start marker paired with its end marker.
 */
struct field_span {
    std::string fs_name;
    /** Offset of the start marker. */
    int fs_begin;
    /** Offset just past the start marker. */
    int fs_inner_begin;
    /** Offset of the end marker. */
    int fs_inner_end;
    /** Offset just past the end marker. */
    int fs_end;
    size_t fs_depth;
};

std::string start_marker(string_fragment name);

std::string end_marker(string_fragment name);

/**
 * Find the field markers in a pattern, left to right.  Text that is
 * escaped, quoted with \Q...\E, or inside a character class is skipped.
 */
std::vector<field_marker> scan_field_markers(string_fragment pattern);

/**
 * Pair the start and end markers of a pattern.  The spans are returned in
 * the order of their start markers.
 */
Result<std::vector<field_span>, template_error> pair_field_markers(
    string_fragment pattern);

/**
 * The names of the start markers in a pattern, in order, repeats kept.
 */
std::vector<std::string> field_names(string_fragment pattern);

/**
 * The union of the field names in every fragment of a token table.
 */
std::set<std::string> all_field_names(const token_table& tokens);

}  // namespace rxlog

#endif
