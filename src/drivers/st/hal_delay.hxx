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
 * \file hal_delay.hxx
 * Conversion of sleep requests to STM32Cube HAL_Delay() arguments.
 *
 * @author Balazs Racz
 * @date 19 October 2026
 */

#ifndef _DRIVERS_ST_HAL_DELAY_HXX_
#define _DRIVERS_ST_HAL_DELAY_HXX_

#include <stdint.h>

namespace blinky
{

/// Computes the argument of HAL_Delay() for a sleep of at least usec
/// microseconds. HAL_Delay(n) waits n + 1 ticks of 1 msec, so the
/// rounded-up millisecond count is reduced by one tick.
///
/// @param usec requested sleep time. Must be non-zero; HAL_Delay() cannot
/// wait less than one tick.
/// @return number of msec to pass to HAL_Delay().
inline uint32_t usec_to_hal_delay(uint32_t usec)
{
    uint32_t msec = usec / 1000 + (usec % 1000 ? 1 : 0);
    return msec - 1;
}

} // namespace blinky

#endif // _DRIVERS_ST_HAL_DELAY_HXX_
