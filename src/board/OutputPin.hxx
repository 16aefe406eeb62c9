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
 * \file OutputPin.hxx
 *
 * Owned handle of a push-pull GPIO output.
 *
 * @author Balazs Racz
 * @date 19 October 2026
 */

#ifndef _BOARD_OUTPUTPIN_HXX_
#define _BOARD_OUTPUTPIN_HXX_

#include "board/PeripheralDriver.hxx"
#include "os/Gpio.hxx"

namespace blinky
{

class Hardware;

/// Exclusive owner of one GPIO line that was configured as an output by
/// Hardware::init(). The handle can be moved but not copied; using a
/// moved-from handle crashes.
class OutputPin : public Gpio
{
public:
    /// Transfers the ownership. Leaves `o` empty.
    OutputPin(OutputPin &&o)
        : driver_(o.driver_)
        , pin_(o.pin_)
    {
        o.driver_ = nullptr;
    }

    using Gpio::write;

    void write(Value new_state) const override;

    Value read() const override;

    /// Inverts the output level.
    void toggle() const
    {
        write(!is_set());
    }

    /// The LED pin is an output for its entire life. Crashes on an attempt
    /// to turn it into an input.
    void set_direction(Direction dir) const override
    {
        HASSERT(dir == DOUTPUT);
    }

    Direction direction() const override
    {
        return DOUTPUT;
    }

    /// @return which GPIO line this handle drives.
    PinId pin() const
    {
        return pin_;
    }

private:
    friend class Hardware;

    OutputPin(PeripheralDriver *driver, PinId pin)
        : driver_(driver)
        , pin_(pin)
    {
    }

    PeripheralDriver *driver_;
    PinId pin_;

    DISALLOW_COPY_AND_ASSIGN(OutputPin);
};

} // namespace blinky

#endif // _BOARD_OUTPUTPIN_HXX_
