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
#include "capture_set.hh"
#include "doctest/doctest.h"
#include "test_dialects.hh"

using namespace rxlog;

TEST_CASE("capture_instruction::from")
{
    CHECK(capture_instruction::from(string_fragment::from_const(":none"))
              .is<select_none>());
    CHECK(capture_instruction::from(string_fragment::from_const(":all"))
              .is<select_all>());

    auto ci = capture_instruction::from(string_fragment::from_const("host"));
    REQUIRE(ci.is<select_field>());
    CHECK(ci.get<select_field>().sf_name == "host");
    CHECK(ci.to_string() == "host");

    // Only the exact spellings are directives.
    CHECK(capture_instruction::from(string_fragment::from_const(":nonesuch"))
              .is<select_field>());
}

TEST_CASE("apply_capture")
{
    const auto& tokens = foo_dialect()->get_tokens();

    SUBCASE("fields accumulate")
    {
        auto cs = apply_capture(
            {select_field{"a"}, select_field{"c"}, select_field{"a"}},
            {},
            tokens);

        CHECK(cs == capture_set{"a", "c"});
    }

    SUBCASE("none always empties")
    {
        auto cs = apply_capture({select_none{}}, {"a", "b", "zz"}, tokens);

        CHECK(cs.empty());
    }

    SUBCASE("all")
    {
        auto cs = apply_capture({select_all{}}, {"zz"}, tokens);

        CHECK(cs == capture_set{"a", "b", "c", "cn", "cs", "d"});
    }

    SUBCASE("none then all is all")
    {
        auto none_all = apply_capture(
            {select_none{}, select_all{}}, {"a", "zz"}, tokens);
        auto all = apply_capture({select_all{}}, {}, tokens);

        CHECK(none_all == all);
    }

    SUBCASE("left to right")
    {
        auto cs = apply_capture(
            {select_field{"a"}, select_none{}, select_field{"cn"}},
            {"b"},
            tokens);

        CHECK(cs == capture_set{"cn"});
    }

    SUBCASE("unknown names are kept")
    {
        auto cs = apply_capture({select_field{"nope"}}, {}, tokens);

        CHECK(cs == capture_set{"nope"});
    }

    SUBCASE("idempotent")
    {
        const std::vector<capture_instruction> instrs = {
            select_field{"d"},
            select_field{"cs"},
        };
        auto once = apply_capture(instrs, {}, tokens);
        auto twice = apply_capture(instrs, once, tokens);

        CHECK(once == twice);
    }
}

TEST_CASE("capture_instructions_from")
{
    auto instrs = capture_instructions_from({":none", "host", ":all"});

    REQUIRE(instrs.size() == 3);
    CHECK(instrs[0].is<select_none>());
    CHECK(instrs[1].is<select_field>());
    CHECK(instrs[2].is<select_all>());
}
