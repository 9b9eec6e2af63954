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

#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include <string>

#include "config.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"
#include "rxlog_log.hh"

static std::string
read_ring()
{
    auto* tmp = tmpfile();
    std::string retval;
    char buffer[4096];
    size_t rc;

    REQUIRE(tmp != nullptr);
    log_write_ring_to(fileno(tmp));
    rewind(tmp);
    while ((rc = fread(buffer, 1, sizeof(buffer), tmp)) > 0) {
        retval.append(buffer, rc);
    }
    fclose(tmp);

    return retval;
}

TEST_CASE("log-default-level")
{
    CHECK(rxlog_log_level == rxlog_log_level_t::DEBUG);
    CHECK_FALSE(rxlog_log_file.has_value());
}

TEST_CASE("log_level_from_name")
{
    CHECK(log_level_from_name("trace") == rxlog_log_level_t::TRACE);
    CHECK(log_level_from_name("Warning") == rxlog_log_level_t::WARNING);
    CHECK(log_level_from_name("ERROR") == rxlog_log_level_t::ERROR);
    CHECK_FALSE(log_level_from_name("loud"));
    CHECK_FALSE(log_level_from_name(nullptr));
}

TEST_CASE("log-level-filter")
{
    auto saved = rxlog_log_level;

    rxlog_log_level = rxlog_log_level_t::INFO;
    log_info("kept message %d", 1);
    log_debug("dropped message %d", 2);
    rxlog_log_level = saved;

    auto ring = read_ring();
    CHECK(ring.find("kept message 1") != std::string::npos);
    CHECK(ring.find(" I rxlog_log.tests.cc:") != std::string::npos);
    CHECK(ring.find("dropped message") == std::string::npos);
}

TEST_CASE("log-to-env-file")
{
    char path[] = "/tmp/rxlog.tests.XXXXXX";
    auto fd = mkstemp(path);

    REQUIRE(fd != -1);
    close(fd);
    setenv("RXLOG_LOG_PATH", path, 1);
    setenv("RXLOG_LOG_LEVEL", "warning", 1);

    auto saved = rxlog_log_level;
    log_from_env();
    CHECK(rxlog_log_level == rxlog_log_level_t::WARNING);
    REQUIRE(rxlog_log_file.has_value());

    log_warning("written to the file");
    log_info("not written");
    fclose(rxlog_log_file.value());
    rxlog_log_file = std::nullopt;
    rxlog_log_level = saved;
    unsetenv("RXLOG_LOG_PATH");
    unsetenv("RXLOG_LOG_LEVEL");

    auto* in = fopen(path, "r");
    REQUIRE(in != nullptr);
    char buffer[1024];
    auto rc = fread(buffer, 1, sizeof(buffer) - 1, in);
    buffer[rc] = '\0';
    fclose(in);
    unlink(path);

    CHECK(strstr(buffer, "written to the file") != nullptr);
    CHECK(strstr(buffer, "not written") == nullptr);
}

TEST_CASE("log_host_info")
{
    auto saved = rxlog_log_level;

    rxlog_log_level = rxlog_log_level_t::INFO;
    log_host_info();
    rxlog_log_level = saved;

    auto ring = read_ring();
    CHECK(ring.find("jittarget=") != std::string::npos);
    CHECK(ring.find(PACKAGE_STRING) != std::string::npos);
}
