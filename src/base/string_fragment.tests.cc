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

#include <string>

#include "string_fragment.hh"

#include "config.h"
#include "doctest/doctest.h"

TEST_CASE("string_fragment::startswith")
{
    std::string empty;
    auto sf = string_fragment::from_str(empty);

    CHECK_FALSE(sf.startswith(string_fragment::from_const("abc")));
    CHECK(string_fragment::from_const("(?#abc)")
              .startswith(string_fragment::from_const("(?#")));
}

TEST_CASE("string_fragment::find")
{
    auto sf = string_fragment::from_const("a(?#b)c");

    CHECK(sf.find('(').value() == 1);
    CHECK_FALSE(sf.find('z').has_value());
    CHECK(sf.sub_range(1, 6).find(')').value() == 4);
}

TEST_CASE("string_fragment::substr")
{
    auto sf = string_fragment::from_const("hello, world");

    CHECK(sf.substr(7) == "world");
    CHECK(sf.sub_range(0, 5).to_string() == "hello");
    CHECK(sf.sub_range(3, 3).empty());
}

TEST_CASE("string_fragment::invalid")
{
    auto sf = string_fragment::invalid();

    CHECK_FALSE(sf.is_valid());
    sf = string_fragment::from_const("x");
    CHECK(sf.is_valid());
    sf.invalidate();
    CHECK_FALSE(sf.is_valid());
}

TEST_CASE("string_fragment::format")
{
    auto sf = string_fragment::from_const("abcdef").sub_range(1, 4);

    CHECK(fmt::format(FMT_STRING("<{}>"), sf) == "<bcd>");
}
