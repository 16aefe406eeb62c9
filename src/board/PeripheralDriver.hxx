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
 * \file PeripheralDriver.hxx
 *
 * Interface between the board hardware layer and whatever actually programs
 * the peripheral registers: the STM32 HAL on the target, a simulation on a
 * host, or a mock in the unit tests.
 *
 * @author Stuart W. Baker
 * @date 19 October 2026
 */

#ifndef _BOARD_PERIPHERALDRIVER_HXX_
#define _BOARD_PERIPHERALDRIVER_HXX_

#include <stddef.h>
#include <stdint.h>

#include "os/Gpio.hxx"

namespace blinky
{

/// GPIO ports of the STM32F303.
enum class GpioPort : uint8_t
{
    A,
    B,
    C,
    D,
    E,
    F,
};

/// Identifies one GPIO line, e.g. {GpioPort::A, 5} for PA5.
struct PinId
{
    GpioPort port;
    /// Pin number within the port, 0..15.
    uint8_t num;

    bool operator==(const PinId &o) const
    {
        return port == o.port && num == o.num;
    }

    bool operator!=(const PinId &o) const
    {
        return !(*this == o);
    }
};

/// U(S)ART instances of the STM32F303xE.
enum class UsartId : uint8_t
{
    USART1,
    USART2,
    USART3,
    UART4,
    UART5,
};

/// Slew rate of a GPIO output stage.
enum class OutputSpeed : uint8_t
{
    LOW,    ///< 2 MHz
    MEDIUM, ///< 10 MHz
    HIGH,   ///< 50 MHz
};

/// Serial line parameters.
struct UartConfig
{
    enum Parity : uint8_t
    {
        PARITY_NONE,
        PARITY_EVEN,
        PARITY_ODD,
    };

    uint32_t baudRate;
    /// 7, 8 or 9.
    uint8_t dataBits;
    Parity parity;
    /// 1 or 2.
    uint8_t stopBits;
    /// true if the transmitter should be fed by DMA.
    bool useDma;

    /// @return 115200 baud, 8 data bits, no parity, 1 stop bit, no DMA.
    static constexpr UartConfig default_8n1()
    {
        return UartConfig{115200, 8, PARITY_NONE, 1, false};
    }
};

/// Abstract peripheral-access framework. All calls are synchronous. Error
/// returns are 0 or a positive count on success and a negative errno value
/// on failure.
class PeripheralDriver
{
public:
    virtual ~PeripheralDriver()
    {
    }

    /// Configures a UART transmit channel and routes it to a pin.
    ///
    /// @param usart which peripheral instance to configure.
    /// @param tx_pin GPIO line to use as the TX output.
    /// @param cfg line parameters.
    ///
    /// @return 0 on success; -EINVAL if the parameters cannot be realized
    /// (pin not routable to that USART, baud rate out of range for the
    /// peripheral clock, DMA requested); -EIO, -EBUSY or -ETIMEDOUT if the
    /// hardware rejected the request.
    virtual int uart_tx_init(
        UsartId usart, PinId tx_pin, const UartConfig &cfg) = 0;

    /// Transmits bytes, blocking until all of them have been handed to the
    /// peripheral.
    ///
    /// @return len on success, or a negative errno value.
    virtual int uart_tx_write(UsartId usart, const uint8_t *data, size_t len) = 0;

    /// Blocks until the last byte has left the transmit shift register.
    ///
    /// @return 0 on success, or a negative errno value.
    virtual int uart_tx_flush(UsartId usart) = 0;

    /// Configures a pin as push-pull output and drives it to the initial
    /// level. Cannot fail for a valid PinId.
    virtual void gpio_output_init(
        PinId pin, Gpio::Value initial, OutputSpeed speed) = 0;

    /// Drives an output pin.
    virtual void gpio_write(PinId pin, Gpio::Value value) = 0;

    /// @return the current level of a pin.
    virtual Gpio::Value gpio_read(PinId pin) = 0;
};

/// @return a short printable name of a USART, e.g. "USART2".
const char *usart_name(UsartId usart);

/// @return the alternate function number that routes the TX output of
/// `usart` to `pin` on the STM32F303xE, or -1 if the pin cannot carry that
/// signal.
int usart_tx_alternate_function(UsartId usart, PinId pin);

/// @return the port letter of a GPIO port, e.g. 'A'.
inline char port_letter(GpioPort port)
{
    return 'A' + static_cast<int>(port);
}

} // namespace blinky

#endif // _BOARD_PERIPHERALDRIVER_HXX_
