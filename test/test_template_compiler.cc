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

#include "config.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"
#include "template_compiler.hh"
#include "test_dialects.hh"

using namespace rxlog;

using names = std::vector<std::string>;

TEST_CASE("defaults")
{
    template_compiler tc(foo_dialect());

    CHECK(tc.get_format() == "%d %c %b");
    CHECK(tc.get_capture() == names{"c"});
    CHECK_FALSE(tc.get_keep_markers());
    CHECK_FALSE(tc.get_trace());
}

TEST_CASE("extract-parent-field")
{
    template_compiler tc(foo_dialect());
    auto pattern = tc.compile().unwrap();

    CHECK(pattern.get_pattern()
          == R"(^(?:(?:(?:foo|bar|baz)) ((?:\w+)/(?:\d+)) (?:th(?:is|at)))$)");
    CHECK(pattern.get_captures() == names{"c"});
    CHECK(pattern.get_code().get_capture_count() == 1);

    auto fields = pattern.extract(
        string_fragment::from_const("foo that/42 this"));
    REQUIRE(fields.has_value());
    REQUIRE(fields->size() == 1);
    CHECK(fields->at(0).ef_name == "c");
    CHECK(fields->at(0).ef_value.value() == "that/42");

    CHECK_FALSE(pattern.matches(string_fragment::from_const("foo that/x this")));
    CHECK_FALSE(
        pattern.extract(string_fragment::from_const("xfoo that/42 this")));
    CHECK_FALSE(
        pattern.extract(string_fragment::from_const("foo that/42 thisx")));
}

TEST_CASE("nested-captures")
{
    template_compiler tc(foo_dialect());

    SUBCASE("only the child")
    {
        CHECK(tc.set_capture({select_none{}, select_field{"cn"}})
              == names{"cn"});

        auto pattern = tc.compile().unwrap();
        CHECK(pattern.get_pattern().find(R"((?:(?:\w+)/(\d+)))")
              != std::string::npos);
        CHECK(pattern.get_code().get_capture_count() == 1);

        auto fields
            = pattern.extract(string_fragment::from_const("bar this/7 that"));
        REQUIRE(fields.has_value());
        CHECK(fields->at(0).ef_name == "cn");
        CHECK(fields->at(0).ef_value.value() == "7");
    }

    SUBCASE("parent and child")
    {
        CHECK(tc.set_capture({select_field{"cn"}}) == names{"c", "cn"});

        auto pattern = tc.compile().unwrap();
        CHECK(pattern.get_pattern().find(R"(((?:\w+)/(\d+)))")
              != std::string::npos);

        auto fields
            = pattern.extract(string_fragment::from_const("baz this/99 this"));
        REQUIRE(fields.has_value());
        REQUIRE(fields->size() == 2);
        CHECK(fields->at(0).ef_name == "c");
        CHECK(fields->at(0).ef_value.value() == "this/99");
        CHECK(fields->at(1).ef_name == "cn");
        CHECK(fields->at(1).ef_value.value() == "99");
    }
}

TEST_CASE("capture-order-follows-template")
{
    template_compiler tc(foo_dialect());

    auto order = tc.set_capture({select_none{},
                                 select_field{"b"},
                                 select_field{"cs"},
                                 select_field{"d"}});
    CHECK(order == names{"d", "cs", "b"});
    CHECK(tc.set_capture({select_all{}}) == names{"d", "c", "cs", "cn", "b"});

    for (const auto& name : tc.get_capture()) {
        CHECK(tc.all_fields().count(name) == 1);
    }

    auto fields = tc.compile().unwrap().extract(
        string_fragment::from_const("foo this/1 that"));
    REQUIRE(fields.has_value());
    names values;
    for (const auto& ef : fields.value()) {
        values.emplace_back(ef.ef_value->to_string());
    }
    CHECK(values == names{"foo", "this/1", "this", "1", "that"});
}

TEST_CASE("capture-missing-field")
{
    template_compiler tc(foo_dialect());

    CHECK(tc.set_capture({select_none{}, select_field{"a"}}).empty());
    CHECK(tc.set_capture({select_field{"nope"}}).empty());

    auto pattern = tc.compile().unwrap();
    CHECK(pattern.get_captures().empty());
    CHECK(pattern.matches(string_fragment::from_const("foo this/1 that")));
}

TEST_CASE("none-then-all")
{
    template_compiler fresh(foo_dialect());
    template_compiler reset(foo_dialect());

    fresh.set_capture({select_all{}});
    reset.set_capture({select_field{"d"}});
    reset.set_capture({select_none{}, select_all{}});
    CHECK(fresh.get_capture_set() == reset.get_capture_set());

    reset.set_capture({select_none{}});
    CHECK(reset.get_capture_set().empty());
    CHECK(reset.get_capture().empty());
}

TEST_CASE("compile-is-idempotent")
{
    template_compiler tc(foo_dialect());

    tc.set_capture({select_field{"b"}, select_field{"cs"}});

    auto first = tc.compile().unwrap();
    auto second = tc.regex().unwrap();
    CHECK(first.get_pattern() == second.get_pattern());
    CHECK(first.get_captures() == second.get_captures());
}

TEST_CASE("set_format")
{
    template_compiler tc(foo_dialect());

    auto tagged_before = tc.get_tagged_template();
    CHECK(tc.set_format("%a %b") == "%d %c %b");
    CHECK(tc.get_format() == "%a %b");
    CHECK(tc.get_tagged_template() != tagged_before);
    CHECK(tc.get_capture().empty());

    tc.set_capture({select_field{"a"}});
    auto fields
        = tc.compile().unwrap().extract(string_fragment::from_const("12 that"));
    REQUIRE(fields.has_value());
    CHECK(fields->at(0).ef_value.value() == "12");
}

TEST_CASE("alias")
{
    compiler_options opts;

    opts.co_format = ":default";
    opts.co_capture = capture_instructions_from({":none", "a", "cs"});

    template_compiler tc(foo_dialect(), opts);

    CHECK(tc.get_format() == ":default");
    CHECK(tc.get_effective_format() == "%a %b %c");
    CHECK(tc.get_capture() == names{"a", "cs"});

    auto fields = tc.compile().unwrap().extract(
        string_fragment::from_const("42 that bar/7"));
    REQUIRE(fields.has_value());
    CHECK(fields->at(0).ef_value.value() == "42");
    CHECK(fields->at(1).ef_value.value() == "bar");
}

TEST_CASE("literal-text")
{
    compiler_options opts;

    opts.co_format = "[%a]  (%z) %d.";
    opts.co_capture = std::vector<capture_instruction>{select_all{}};

    template_compiler tc(foo_dialect(), opts);
    auto pattern = tc.compile().unwrap();

    CHECK(pattern.matches(string_fragment::from_const("[1] (%z) baz.")));
    CHECK_FALSE(pattern.matches(string_fragment::from_const("[1] (%z) baz!")));
    CHECK_FALSE(pattern.matches(string_fragment::from_const("1 %z bazx")));
}

TEST_CASE("keep-markers")
{
    template_compiler tc(foo_dialect());

    CHECK_FALSE(tc.set_keep_markers(true));
    CHECK(tc.get_keep_markers());

    auto pattern = tc.compile().unwrap();
    CHECK(pattern.get_pattern()
          == "^(?:(?:(?#d)(?:foo|bar|baz)(?#!d)) "
             R"(((?#c)(?:(?#cs)\w+(?#!cs))/(?:(?#cn)\d+(?#!cn))(?#!c)) )"
             "(?:(?#b)th(?:is|at)(?#!b)))$");
    CHECK(pattern.get_code().get_capture_count() == 1);

    auto fields
        = pattern.extract(string_fragment::from_const("bar that/3 that"));
    REQUIRE(fields.has_value());
    CHECK(fields->at(0).ef_value.value() == "that/3");

    CHECK(tc.set_keep_markers(false));
    CHECK(tc.compile().unwrap().get_pattern().find("(?#")
          == std::string::npos);
}

TEST_CASE("trace")
{
    std::string trace_out;
    compiler_options opts;

    opts.co_format = "%a %b";
    opts.co_trace = true;
    opts.co_trace_sink
        = [&trace_out](string_fragment sf) { trace_out += sf.to_string(); };

    template_compiler tc(foo_dialect(), opts);
    auto pattern = tc.compile().unwrap();

    CHECK(pattern.get_pattern()
          == R"(^(?C1)(?:(?:\d+(?C"a")) (?:th(?:is|at)(?C"b")))$)");

    SUBCASE("match")
    {
        CHECK(pattern.matches(string_fragment::from_const("42 this")));
        CHECK(trace_out == "\na b ");

        trace_out.clear();
        CHECK(pattern.matches(string_fragment::from_const("7 that")));
        CHECK(trace_out == "\na b ");
    }

    SUBCASE("backtracking is visible")
    {
        CHECK_FALSE(pattern.matches(string_fragment::from_const("42 thus")));
        CHECK(std::count(trace_out.begin(), trace_out.end(), '\n') == 1);
        CHECK(trace_out == "\na a ");
    }

    SUBCASE("trace off")
    {
        CHECK(tc.set_trace(false));
        auto quiet = tc.compile().unwrap();

        CHECK(quiet.get_pattern().find("(?C") == std::string::npos);
        CHECK(quiet.matches(string_fragment::from_const("42 this")));
        CHECK(trace_out.empty());
    }
}

TEST_CASE("hook-breaks-markers")
{
    auto dialect = foo_dialect_builder()
                       .with_post_hook([](const std::string& str) {
                           return str + "(?#!a)";
                       })
                       .build()
                       .unwrap();
    template_compiler tc(dialect);

    tc.set_format("%a");
    auto compile_res = tc.compile();
    REQUIRE(compile_res.isErr());
    auto err = compile_res.unwrapErr();
    CHECK(err.te_kind == template_error::kind::config);
    CHECK(err.te_reason == "field \"a\" is closed but never opened");
}

TEST_CASE("hook-adds-group")
{
    auto dialect = foo_dialect_builder()
                       .with_post_hook([](const std::string& str) {
                           return R"((\s*))" + str;
                       })
                       .build()
                       .unwrap();
    template_compiler tc(dialect);

    tc.set_format("%a %b");
    CHECK(tc.set_capture({select_field{"b"}}) == names{"b"});

    auto compile_res = tc.compile();
    REQUIRE(compile_res.isErr());
    auto err = compile_res.unwrapErr();
    CHECK(err.te_kind == template_error::kind::config);
    CHECK(err.te_source.find(R"((\s*))") != std::string::npos);
}

TEST_CASE("quoted-class-fragment")
{
    auto dialect = template_dialect::builder("quoted")
                       .with_token("%k", R"((?#k)[\Qab\E]+(?#!k))")
                       .with_token("%n", R"((?#n)\d+(?#!n))")
                       .build()
                       .unwrap();
    compiler_options opts;

    opts.co_format = "%k-%n";
    opts.co_capture = capture_instructions_from({":all"});

    template_compiler tc(dialect, opts);
    auto fields = tc.compile().unwrap().extract(
        string_fragment::from_const("abba-12"));
    REQUIRE(fields.has_value());
    REQUIRE(fields->size() == 2);
    CHECK(fields->at(0).ef_value.value() == "abba");
    CHECK(fields->at(1).ef_value.value() == "12");
}

TEST_CASE("non-utf8-line")
{
    static const char LINE[] = "12 caf\xe9";

    auto dialect = template_dialect::builder("latin1")
                       .with_token("%a", R"((?#a)\d+(?#!a))")
                       .with_token("%b", "(?#b)[^ ]+(?#!b)")
                       .build()
                       .unwrap();
    compiler_options opts;

    opts.co_format = "%a %b";
    opts.co_capture = capture_instructions_from({"b"});

    template_compiler tc(dialect, opts);
    auto fields
        = tc.compile().unwrap().extract(string_fragment::from_const(LINE));
    REQUIRE(fields.has_value());
    CHECK(fields->at(0).ef_name == "b");
    CHECK(fields->at(0).ef_value.value() == "caf\xe9");
}

TEST_CASE("hook-breaks-syntax")
{
    auto dialect = foo_dialect_builder()
                       .with_post_hook([](const std::string& str) {
                           return str + "[";
                       })
                       .build()
                       .unwrap();
    template_compiler tc(dialect);

    auto compile_res = tc.compile();
    REQUIRE(compile_res.isErr());
    auto err = compile_res.unwrapErr();
    CHECK(err.te_kind == template_error::kind::compile);
    CHECK(err.te_source.find("th(?:is|at))[") != std::string::npos);
    CHECK_FALSE(err.get_message().empty());
}

TEST_CASE("bad-dialects")
{
    SUBCASE("unbalanced")
    {
        auto build_res = template_dialect::builder("bad")
                             .with_token("%a", R"((?#a)\d+)")
                             .build();

        REQUIRE(build_res.isErr());
        auto err = build_res.unwrapErr();
        CHECK(err.te_kind == template_error::kind::config);
        CHECK(err.te_reason == "token \"%a\": field \"a\" is never closed");
    }

    SUBCASE("capturing group")
    {
        auto build_res = template_dialect::builder("bad")
                             .with_token("%a", R"((?#a)(\d+)(?#!a))")
                             .build();

        REQUIRE(build_res.isErr());
        auto err = build_res.unwrapErr();
        CHECK(err.te_kind == template_error::kind::config);
        CHECK(err.te_offset == 5);
    }

    SUBCASE("invalid pattern")
    {
        auto build_res = template_dialect::builder("bad")
                             .with_token("%a", R"((?#a)[\d+(?#!a))")
                             .build();

        REQUIRE(build_res.isErr());
        CHECK(build_res.unwrapErr().te_kind == template_error::kind::config);
    }

    SUBCASE("empty key")
    {
        auto build_res
            = template_dialect::builder("bad").with_token("", "x").build();

        REQUIRE(build_res.isErr());
    }
}

TEST_CASE("patched-dialect")
{
    auto patched = foo_dialect()
                       ->to_builder()
                       .with_token("%d", "(?#d)(?:fu|foo|bar|baz)(?#!d)")
                       .build()
                       .unwrap();
    compiler_options opts;

    opts.co_capture = capture_instructions_from({"d"});

    template_compiler orig(foo_dialect(), opts);
    template_compiler tc(patched, opts);

    CHECK_FALSE(orig.compile().unwrap().matches(
        string_fragment::from_const("fu this/1 that")));

    auto fields = tc.compile().unwrap().extract(
        string_fragment::from_const("fu this/1 that"));
    REQUIRE(fields.has_value());
    CHECK(fields->at(0).ef_value.value() == "fu");
    CHECK(foo_dialect()->get_tokens().at("%d")
          == "(?#d)(?:foo|bar|baz)(?#!d)");
}

TEST_CASE("pre-hook")
{
    compiler_options opts;

    opts.co_format = "%d   %c    %b";

    template_compiler tc(foo_dialect(), opts);

    CHECK(tc.compile().unwrap().matches(
        string_fragment::from_const("foo this/1 that")));
}
