/** \copyright
 * Copyright (c) 2026, Stuart W Baker
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 * 
 *  - Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 *  - Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 *
 * \file logging.h
 * Facility to do debug printf's on a configurable loglevel.
 *
 * @author Balazs Racz
 * @date 19 October 2026
 */

#ifndef _UTILS_LOGGING_H_
#define _UTILS_LOGGING_H_

#include <stdio.h>
#include <inttypes.h>

#include "blinky_features.h"

static const int FATAL = 0;
static const int ERROR = 1;
static const int WARNING = 2;
static const int INFO = 3;
static const int VERBOSE = 4;

#ifdef __cplusplus
#define GLOBAL_LOG_OUTPUT ::log_output
#else
#define GLOBAL_LOG_OUTPUT log_output
#endif

/// Formats a log line and hands it to log_output(). Logging happens from the
/// single boot thread only, so the shared buffer is not locked.
#define LOG(level, message...)                                                 \
    do                                                                         \
    {                                                                          \
        if (LOGLEVEL >= level)                                                 \
        {                                                                      \
            int sret = snprintf(logbuffer, sizeof(logbuffer), message);        \
            if (sret >= (int)sizeof(logbuffer))                                \
                sret = sizeof(logbuffer) - 1;                                  \
            GLOBAL_LOG_OUTPUT(logbuffer, sret);                                \
        }                                                                      \
    } while (0)

#if BLINKY_FEATURE_HOST_STDIO
extern char logbuffer[4096];
#else
extern char logbuffer[256];
#endif

#ifndef LOGLEVEL
#if BLINKY_FEATURE_BARE_METAL
#define LOGLEVEL FATAL
#else
#define LOGLEVEL INFO
#endif
#endif // ifndef LOGLEVEL

#ifdef __cplusplus
extern "C" {
#endif
/// Emits one formatted log line. The buffer is not terminated; size is the
/// number of valid characters. Tests and applications may replace this.
void log_output(char *buf, int size);
#ifdef __cplusplus
}
#endif

#endif // _UTILS_LOGGING_H_
