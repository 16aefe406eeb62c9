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
 * \file Hardware.hxx
 *
 * Hardware configuration of the ST Nucleo-F303RE board: the user LED and the
 * serial channel to the ST-LINK virtual COM port, bundled into one owned
 * object.
 *
 * @author Balazs Racz
 * @date 19 October 2026
 */

#ifndef _BOARD_HARDWARE_HXX_
#define _BOARD_HARDWARE_HXX_

#include <utility>

#include "board/OutputPin.hxx"
#include "board/Peripherals.hxx"
#include "board/UartTx.hxx"
#include "board/messages.hxx"

namespace blinky
{

/// All initialized peripherals of the board. Whoever holds this object
/// exclusively owns the LED and the serial transmitter; it can be moved but
/// never copied, and the only way to create one is Hardware::init().
class Hardware
{
public:
    /// Onboard LED LD2 (green).
    static constexpr PinId LED_PIN{GpioPort::A, 5};
    /// USART2 TX, wired to the ST-LINK virtual COM port.
    static constexpr PinId VCP_TX_PIN{GpioPort::A, 2};
    /// Serial peripheral connected to the virtual COM port.
    static constexpr UsartId VCP_USART = UsartId::USART2;

    /// Configures the serial transmitter (115200-8N1, no DMA) and the LED
    /// output (push-pull, low speed, initially LOW), consuming the access
    /// token.
    ///
    /// There is no degraded mode: if the serial channel cannot be
    /// configured, this function logs the failure and terminates the
    /// program. It never returns a partially initialized object.
    ///
    /// Must be called exactly once, before any other task runs.
    ///
    /// @param peripherals access token, obtained from Peripherals::take().
    /// @return the configured peripherals.
    static Hardware init(Peripherals peripherals);

    Hardware(Hardware &&o) = default;

    /// User LED, push-pull output on PA5.
    OutputPin led;

    /// Blocking transmitter of USART2 on PA2.
    UartTx usart;

private:
    Hardware(OutputPin &&led, UartTx &&usart)
        : led(std::move(led))
        , usart(std::move(usart))
    {
    }

    DISALLOW_COPY_AND_ASSIGN(Hardware);
};

} // namespace blinky

#endif // _BOARD_HARDWARE_HXX_
