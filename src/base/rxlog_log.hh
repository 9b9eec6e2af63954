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
 * @file rxlog_log.hh
 */

#ifndef rxlog_log_hh
#define rxlog_log_hh

#include <cstdint>
#include <optional>
#include <string>

#include <stdio.h>

#ifndef rxlog_dead2
#    define rxlog_dead2 __attribute__((noreturn))
#endif

enum class rxlog_log_level_t : uint32_t {
    TRACE,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
};

#if defined(__GNUC__) || defined(__clang__)
#    define RXLOG_ATTR_FORMAT_PRINTF(a, b) \
        __attribute__((format(printf, a, b)))
#else
#    define RXLOG_ATTR_FORMAT_PRINTF(a, b)
#endif

/**
 * Configure the log from the environment: RXLOG_LOG_PATH names a file to
 * append to and RXLOG_LOG_LEVEL is one of trace, debug, info, warning or
 * error.  The library never calls this itself; an application that wants
 * the environment honored must call it at startup.  Until then the level
 * is rxlog_log_level's default, debug, and messages only go to the ring.
 */
void log_from_env();
void log_host_info();
void log_msg(enum rxlog_log_level_t level,
             const char* src_file,
             int line_number,
             const char* fmt,
             ...) RXLOG_ATTR_FORMAT_PRINTF(4, 5);
void log_abort() rxlog_dead2;

std::optional<rxlog_log_level_t> log_level_from_name(const char* name);

/**
 * Copy the in-memory ring of recent log lines to the given descriptor.
 */
void log_write_ring_to(int fd);

extern std::optional<FILE*> rxlog_log_file;
/** The minimum level that is recorded, debug by default. */
extern enum rxlog_log_level_t rxlog_log_level;

#define log_msg_wrapper(level, fmt...) \
    do { \
        if (rxlog_log_level <= level) { \
            log_msg(level, __FILE__, __LINE__, fmt); \
        } \
    } while (false)

#define log_error(fmt...) log_msg_wrapper(rxlog_log_level_t::ERROR, fmt);

#define log_warning(fmt...) log_msg_wrapper(rxlog_log_level_t::WARNING, fmt);

#define log_info(fmt...) log_msg_wrapper(rxlog_log_level_t::INFO, fmt);

#define log_debug(fmt...) log_msg_wrapper(rxlog_log_level_t::DEBUG, fmt);

#define require(e) ((void) ((e) ? 0 : rxlog_require(#e, __FILE__, __LINE__)))
#define rxlog_require(e, file, line) \
    (log_msg( \
         rxlog_log_level_t::ERROR, file, line, "failed precondition `%s'", e), \
     log_abort(), \
     1)

#endif
