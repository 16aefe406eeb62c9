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
 * \file blinky_features.h
 *
 * This file defines compilation-time configuration options for blinky, which
 * are exclusively in the form of C-compatible macros. These control
 * conditional compilation on the host and on the bare-metal target.
 *
 * @author Balazs Racz
 * @date 19 October 2026
 */

#ifndef _INCLUDE_BLINKY_FEATURES_
#define _INCLUDE_BLINKY_FEATURES_

#if defined(STM32F303xC) || defined(STM32F303xE)
#define BLINKY_FEATURE_STM32_HAL 1
#endif

#if defined(__linux__) || defined(__MACH__)
#define BLINKY_FEATURE_HOST_STDIO 1
#endif

#if !BLINKY_FEATURE_HOST_STDIO
#define BLINKY_FEATURE_BARE_METAL 1
#endif

#endif // _INCLUDE_BLINKY_FEATURES_
