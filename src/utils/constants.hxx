/** \copyright
 * Copyright (c) 2026, Balazs Racz
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
 * \file constants.hxx
 *
 * Utility to specify linking-time constants and overrides for them. A
 * library declares the constant and provides a weak default value; an
 * application may replace the value by a strong definition without
 * recompiling the library.
 *
 * Usage:
 *
 * In a header: DECLARE_CONST(led_blink_interval_msec);
 * In the library: DEFAULT_CONST(led_blink_interval_msec, 500);
 * In the application: OVERRIDE_CONST(led_blink_interval_msec, 250);
 * To read: config_led_blink_interval_msec()
 *
 * @author Balazs Racz
 * @date 19 October 2026
 */

#ifndef _UTILS_CONSTANTS_HXX_
#define _UTILS_CONSTANTS_HXX_

#include <stddef.h>

#ifdef __cplusplus
#define EXTERNC extern "C" {
#define EXTERNCEND }
#else
#define EXTERNC
#define EXTERNCEND
#endif

/// Declares a linking-time constant and the config_NAME() accessor for it.
#define DECLARE_CONST(name)                                                    \
    EXTERNC extern const ptrdiff_t _sym_##name;                                \
    EXTERNCEND                                                                 \
    static inline ptrdiff_t config_##name(void)                                \
    {                                                                          \
        return _sym_##name;                                                    \
    }

/// Provides the default value of a constant. Must appear in exactly one
/// translation unit of the library that declared the constant.
#define DEFAULT_CONST(name, value)                                             \
    EXTERNC extern const ptrdiff_t _sym_##name;                                \
    extern const ptrdiff_t __attribute__((weak)) _sym_##name = value;          \
    EXTERNCEND

/// Replaces the default value of a constant. Must appear in exactly one
/// translation unit of the final binary.
#define OVERRIDE_CONST(name, value)                                            \
    EXTERNC extern const ptrdiff_t _sym_##name;                                \
    extern const ptrdiff_t _sym_##name = value;                                \
    EXTERNCEND

#endif // _UTILS_CONSTANTS_HXX_
