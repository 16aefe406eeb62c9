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
 * \file Peripherals.cxx
 *
 * One-time credential granting exclusive configuration rights over the
 * on-chip peripherals.
 *
 * @author Balazs Racz
 * @date 19 October 2026
 */

#include "board/Peripherals.hxx"

#include <atomic>

#include "utils/logging.h"

namespace blinky
{

namespace
{
/// Set by the first Peripherals::take().
std::atomic<bool> peripheralsTaken{false};
} // namespace

// static
Peripherals Peripherals::take(PeripheralDriver *driver)
{
    HASSERT(driver);
    if (peripheralsTaken.exchange(true))
    {
        LOG(FATAL, "Peripherals: access token requested twice.");
        DIE("Peripherals already taken");
    }
    return Peripherals(driver);
}

// static
Peripherals Peripherals::steal(PeripheralDriver *driver)
{
    HASSERT(driver);
    return Peripherals(driver);
}

} // namespace blinky
