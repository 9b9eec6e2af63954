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

#include "config.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"
#include "field_marker.hh"
#include "test_dialects.hh"

using namespace rxlog;

TEST_CASE("scan_field_markers")
{
    auto pat = string_fragment::from_const(R"((?#a)\d+(?#!a)-(?#b-2)x(?#!b-2))");
    auto markers = scan_field_markers(pat);

    REQUIRE(markers.size() == 4);
    CHECK(markers[0].fm_kind == field_marker::kind::start);
    CHECK(markers[0].fm_name == "a");
    CHECK(markers[0].fm_begin == 0);
    CHECK(markers[0].fm_end == 5);
    CHECK(markers[1].fm_kind == field_marker::kind::end);
    CHECK(markers[1].fm_name == "a");
    CHECK(markers[1].fm_begin == 8);
    CHECK(markers[2].fm_name == "b-2");
    CHECK(markers[3].fm_kind == field_marker::kind::end);
    CHECK(markers[3].fm_end == pat.length());
}

TEST_CASE("scan_field_markers-not-markers")
{
    const static std::string not_markers[] = {
        R"(\(?#a\))",
        R"([(?#a)])",
        R"(\Q(?#a)\E)",
        R"((?# a comment ))",
        R"((?#a b))",
        R"((?#))",
        R"((?#!))",
    };

    for (const auto& pat : not_markers) {
        CHECK(scan_field_markers(pat).empty());
    }
}

TEST_CASE("scan_field_markers-after-comment")
{
    auto markers = scan_field_markers(
        string_fragment::from_const(R"((?# note (?#a)x(?#!a))"));

    // The ordinary comment ends at the first paren, after "(?#a".
    REQUIRE(markers.size() == 1);
    CHECK(markers[0].fm_kind == field_marker::kind::end);
}

TEST_CASE("scan_field_markers-quoted-class")
{
    auto pat = string_fragment::from_const(R"((?#k)[\Q(?#x)\E]+(?#!k))");
    auto markers = scan_field_markers(pat);

    REQUIRE(markers.size() == 2);
    CHECK(markers[0].fm_name == "k");
    CHECK(markers[1].fm_kind == field_marker::kind::end);
    CHECK(markers[1].fm_name == "k");
    CHECK(pair_field_markers(pat).isOk());
}

TEST_CASE("pair_field_markers-nested")
{
    auto pat = string_fragment::from_const(
        R"((?#c)(?#cs)\w+(?#!cs)/(?#cn)\d+(?#!cn)(?#!c))");
    auto pair_res = pair_field_markers(pat);

    REQUIRE(pair_res.isOk());
    auto spans = pair_res.unwrap();
    REQUIRE(spans.size() == 3);
    CHECK(spans[0].fs_name == "c");
    CHECK(spans[0].fs_depth == 0);
    CHECK(spans[0].fs_begin == 0);
    CHECK(spans[0].fs_end == pat.length());
    CHECK(spans[1].fs_name == "cs");
    CHECK(spans[1].fs_depth == 1);
    CHECK(pat.sub_range(spans[1].fs_inner_begin, spans[1].fs_inner_end)
          == R"(\w+)");
    CHECK(spans[2].fs_name == "cn");
    CHECK(spans[2].fs_depth == 1);
    CHECK(pat.sub_range(spans[2].fs_inner_begin, spans[2].fs_inner_end)
          == R"(\d+)");
}

TEST_CASE("pair_field_markers-repeated-name")
{
    auto pair_res = pair_field_markers(
        string_fragment::from_const("(?#a)1(?#!a) (?#a)2(?#!a)"));

    REQUIRE(pair_res.isOk());
    auto spans = pair_res.unwrap();
    CHECK(spans.size() == 2);
    CHECK(spans[1].fs_begin == 13);
}

TEST_CASE("pair_field_markers-errors")
{
    SUBCASE("never closed")
    {
        auto pair_res
            = pair_field_markers(string_fragment::from_const("x(?#a)\\d+"));

        REQUIRE(pair_res.isErr());
        auto err = pair_res.unwrapErr();
        CHECK(err.te_kind == template_error::kind::config);
        CHECK(err.te_offset == 1);
        CHECK(err.te_reason == "field \"a\" is never closed");
    }

    SUBCASE("never opened")
    {
        auto pair_res
            = pair_field_markers(string_fragment::from_const("\\d+(?#!a)"));

        REQUIRE(pair_res.isErr());
        CHECK(pair_res.unwrapErr().te_offset == 3);
    }

    SUBCASE("interleaved")
    {
        auto pair_res = pair_field_markers(
            string_fragment::from_const("(?#a)(?#b)x(?#!a)(?#!b)"));

        REQUIRE(pair_res.isErr());
        CHECK(pair_res.unwrapErr().te_reason
              == "field \"a\" is closed while the nested field \"b\" is "
                 "still open");
    }

    SUBCASE("reopened")
    {
        auto pair_res = pair_field_markers(
            string_fragment::from_const("(?#a)(?#a)x(?#!a)(?#!a)"));

        REQUIRE(pair_res.isErr());
        CHECK(pair_res.unwrapErr().te_offset == 5);
    }
}

TEST_CASE("field_names")
{
    auto names = field_names(string_fragment::from_const(
        R"((?#d)x(?#!d) (?#c)(?#cs)y(?#!cs)(?#!c) (?#d)z(?#!d))"));
    const std::vector<std::string> expected = {"d", "c", "cs", "d"};

    CHECK(names == expected);
}

TEST_CASE("all_field_names")
{
    const std::set<std::string> expected = {"a", "b", "c", "cn", "cs", "d"};

    CHECK(all_field_names(foo_dialect()->get_tokens()) == expected);
    CHECK(all_field_names({}).empty());
}
