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
 *
 * @file rxlog_log.cc
 */

#include <assert.h>
#include <signal.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/time.h>
#include <sys/utsname.h>
#include <time.h>
#include <unistd.h>

#include <mutex>

#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

#include "config.h"
#include "rxlog_log.hh"

static constexpr size_t BUFFER_SIZE = 256 * 1024;
static constexpr size_t MAX_LOG_LINE_SIZE = 2 * 1024;

std::optional<FILE*> rxlog_log_file;
rxlog_log_level_t rxlog_log_level = rxlog_log_level_t::DEBUG;

// NOTE: This mutex is leaked so that it is not destroyed during exit.
// Otherwise, any attempts to log will fail.
static std::mutex*
rxlog_log_mutex()
{
    static auto* retval = new std::mutex();

    return retval;
}

static struct {
    size_t lr_length;
    off_t lr_frag_start;
    off_t lr_frag_end;
    char lr_data[BUFFER_SIZE];
} log_ring = {0, BUFFER_SIZE, 0, {}};

static const char* LEVEL_NAMES[] = {
    "T",
    "D",
    "I",
    "W",
    "E",
};

static char*
log_alloc()
{
    off_t data_end = log_ring.lr_length + MAX_LOG_LINE_SIZE;

    if (data_end >= (off_t) BUFFER_SIZE) {
        const char* new_start = &log_ring.lr_data[MAX_LOG_LINE_SIZE];

        new_start = (const char*) memchr(
            new_start, '\n', log_ring.lr_length - MAX_LOG_LINE_SIZE);
        log_ring.lr_frag_start = new_start - log_ring.lr_data;
        log_ring.lr_frag_end = log_ring.lr_length;
        log_ring.lr_length = 0;

        assert(log_ring.lr_frag_start >= 0);
        assert(log_ring.lr_frag_start <= (off_t) BUFFER_SIZE);
    } else if (data_end >= log_ring.lr_frag_start) {
        const char* new_start = &log_ring.lr_data[log_ring.lr_frag_start];

        new_start = (const char*) memchr(
            new_start, '\n', log_ring.lr_frag_end - log_ring.lr_frag_start);
        assert(new_start != nullptr);
        log_ring.lr_frag_start = new_start - log_ring.lr_data;
        assert(log_ring.lr_frag_start >= 0);
        assert(log_ring.lr_frag_start <= (off_t) BUFFER_SIZE);
    }

    return &log_ring.lr_data[log_ring.lr_length];
}

std::optional<rxlog_log_level_t>
log_level_from_name(const char* name)
{
    static const struct {
        const char* ln_name;
        rxlog_log_level_t ln_level;
    } NAMES[] = {
        {"trace", rxlog_log_level_t::TRACE},
        {"debug", rxlog_log_level_t::DEBUG},
        {"info", rxlog_log_level_t::INFO},
        {"warning", rxlog_log_level_t::WARNING},
        {"error", rxlog_log_level_t::ERROR},
    };

    if (name == nullptr) {
        return std::nullopt;
    }
    for (const auto& ln : NAMES) {
        if (strcasecmp(ln.ln_name, name) == 0) {
            return ln.ln_level;
        }
    }

    return std::nullopt;
}

void
log_from_env()
{
    const char* log_path = getenv("RXLOG_LOG_PATH");

    if (log_path != nullptr) {
        auto* file = fopen(log_path, "ae");

        if (file != nullptr) {
            rxlog_log_file = file;
        }
    }

    const char* level_name = getenv("RXLOG_LOG_LEVEL");
    auto level = log_level_from_name(level_name);
    if (level) {
        rxlog_log_level = level.value();
    } else if (level_name != nullptr) {
        log_warning("unknown RXLOG_LOG_LEVEL: %s", level_name);
    }
}

void
log_host_info()
{
    char jittarget[128];
    char pcre_version[64];
    struct utsname un;
    uint32_t pcre_jit;

    uname(&un);
    pcre2_config(PCRE2_CONFIG_JIT, &pcre_jit);
    pcre2_config(PCRE2_CONFIG_JITTARGET, jittarget);
    pcre2_config(PCRE2_CONFIG_VERSION, pcre_version);

    log_info("uname:");
    log_info("  sysname=%s", un.sysname);
    log_info("  machine=%s", un.machine);
    log_info("  release=%s", un.release);
    log_info("PCRE:");
    log_info("  version=%s", pcre_version);
    log_info("  jit=%d", pcre_jit);
    log_info("  jittarget=%s", jittarget);
    log_info("Library:");
    log_info("  version=%s", PACKAGE_STRING);
}

void
log_msg(rxlog_log_level_t level,
        const char* src_file,
        int line_number,
        const char* fmt,
        ...)
{
    struct timeval curr_time;
    struct tm localtm;
    ssize_t prefix_size;
    va_list args;
    ssize_t rc;

    if (level < rxlog_log_level) {
        return;
    }

    std::lock_guard<std::mutex> log_lock(*rxlog_log_mutex());

    {
        // get the base name of the file.  NB: can't use basename() since it
        // can modify its argument
        const char* last_slash = src_file;

        for (int lpc = 0; src_file[lpc]; lpc++) {
            if (src_file[lpc] == '/' || src_file[lpc] == '\\') {
                last_slash = &src_file[lpc + 1];
            }
        }

        src_file = last_slash;
    }

    va_start(args, fmt);
    gettimeofday(&curr_time, nullptr);
    localtime_r(&curr_time.tv_sec, &localtm);
    auto line = log_alloc();
    prefix_size = snprintf(line,
                           MAX_LOG_LINE_SIZE,
                           "%4d-%02d-%02dT%02d:%02d:%02d.%03d %s %s:%d ",
                           localtm.tm_year + 1900,
                           localtm.tm_mon + 1,
                           localtm.tm_mday,
                           localtm.tm_hour,
                           localtm.tm_min,
                           localtm.tm_sec,
                           (int) (curr_time.tv_usec / 1000),
                           LEVEL_NAMES[static_cast<uint32_t>(level)],
                           src_file,
                           line_number);
    rc = vsnprintf(
        &line[prefix_size], MAX_LOG_LINE_SIZE - prefix_size, fmt, args);
    if (rc >= (ssize_t) (MAX_LOG_LINE_SIZE - prefix_size)) {
        rc = MAX_LOG_LINE_SIZE - prefix_size - 1;
    }
    line[prefix_size + rc] = '\n';
    log_ring.lr_length += prefix_size + rc + 1;
    if (rxlog_log_file) {
        fwrite(line, 1, prefix_size + rc + 1, rxlog_log_file.value());
        fflush(rxlog_log_file.value());
    }
    va_end(args);
}

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-result"
void
log_write_ring_to(int fd)
{
    std::lock_guard<std::mutex> log_lock(*rxlog_log_mutex());

    if (log_ring.lr_frag_start < (off_t) BUFFER_SIZE) {
        (void) write(fd,
                     &log_ring.lr_data[log_ring.lr_frag_start],
                     log_ring.lr_frag_end - log_ring.lr_frag_start);
    }
    (void) write(fd, log_ring.lr_data, log_ring.lr_length);
}
#pragma GCC diagnostic pop

void
log_abort()
{
    raise(SIGABRT);
    _exit(1);
}
