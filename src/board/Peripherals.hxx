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
 * \file Peripherals.hxx
 *
 * One-time credential granting exclusive configuration rights over the
 * on-chip peripherals.
 *
 * @author Balazs Racz
 * @date 19 October 2026
 */

#ifndef _BOARD_PERIPHERALS_HXX_
#define _BOARD_PERIPHERALS_HXX_

#include "board/PeripheralDriver.hxx"
#include "utils/macros.h"

namespace blinky
{

class Hardware;

/// Move-only access token for the peripheral set behind a
/// PeripheralDriver. The token can be taken only once per process; passing
/// it by value to Hardware::init() consumes it.
///
/// Usage:
///
///   static Stm32PeripheralDriver driver;
///   Hardware hw = Hardware::init(Peripherals::take(&driver));
class Peripherals
{
public:
    /// Claims the peripherals. Crashes if called a second time in the same
    /// process.
    ///
    /// @param driver the peripheral-access framework. Not owned, must
    /// outlive every handle created from this token.
    static Peripherals take(PeripheralDriver *driver);

    /// Creates a token without checking whether one was already taken. Only
    /// for test harnesses that build several boards in the same process.
    static Peripherals steal(PeripheralDriver *driver);

    /// Transfers the ownership. Leaves `o` empty.
    Peripherals(Peripherals &&o)
        : driver_(o.driver_)
    {
        o.driver_ = nullptr;
    }

    /// @return true if this token still holds the peripherals, false after
    /// it was moved from or consumed.
    bool valid() const
    {
        return driver_ != nullptr;
    }

private:
    friend class Hardware;

    explicit Peripherals(PeripheralDriver *driver)
        : driver_(driver)
    {
    }

    /// Consumes the token. @return the driver it held.
    PeripheralDriver *release()
    {
        HASSERT(driver_);
        PeripheralDriver *d = driver_;
        driver_ = nullptr;
        return d;
    }

    /// Peripheral-access framework; nullptr when empty.
    PeripheralDriver *driver_;

    DISALLOW_COPY_AND_ASSIGN(Peripherals);
};

} // namespace blinky

#endif // _BOARD_PERIPHERALS_HXX_
