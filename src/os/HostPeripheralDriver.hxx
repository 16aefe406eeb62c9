/** \copyright
 * Copyright (c) 2026, Robert Heller
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
 * \file HostPeripheralDriver.hxx
 *
 * Simulates the Nucleo-F303RE peripherals on a Linux host. UART output is
 * written to a file descriptor (stdout unless told otherwise); GPIO levels
 * are kept in memory and every change is logged at VERBOSE level.
 *
 * The UART parameters are checked the way the STM32F303 would check them,
 * so a configuration that the real hardware rejects is rejected here too.
 *
 * @author Robert Heller
 * @date 19 October 2026
 */

#ifndef _OS_HOSTPERIPHERALDRIVER_HXX_
#define _OS_HOSTPERIPHERALDRIVER_HXX_

#include <unistd.h>

#include "board/PeripheralDriver.hxx"

namespace blinky
{

class HostPeripheralDriver : public PeripheralDriver
{
public:
    /// Kernel clock of USART1 (APB2) at 72 MHz SYSCLK.
    static constexpr uint32_t APB2_CLOCK_HZ = 72000000;
    /// Kernel clock of USART2..UART5 (APB1) at 72 MHz SYSCLK.
    static constexpr uint32_t APB1_CLOCK_HZ = 36000000;

    /// @param tx_fd file descriptor that receives the transmitted bytes of
    /// every UART. Not owned.
    explicit HostPeripheralDriver(int tx_fd = STDOUT_FILENO);

    /// Makes every subsequent uart_tx_init() fail.
    /// @param error negative errno value to return, or 0 to heal.
    void inject_uart_init_fault(int error)
    {
        uartInitFault_ = error;
    }

    int uart_tx_init(
        UsartId usart, PinId tx_pin, const UartConfig &cfg) override;
    int uart_tx_write(UsartId usart, const uint8_t *data, size_t len) override;
    int uart_tx_flush(UsartId usart) override;
    void gpio_output_init(
        PinId pin, Gpio::Value initial, OutputSpeed speed) override;
    void gpio_write(PinId pin, Gpio::Value value) override;
    Gpio::Value gpio_read(PinId pin) override;

    /// @return true if uart_tx_init() succeeded for this USART.
    bool is_uart_configured(UsartId usart) const
    {
        return uartConfigured_ & (1u << static_cast<unsigned>(usart));
    }

    /// @return true if gpio_output_init() was called for this pin.
    bool is_output(PinId pin) const
    {
        return outputs_[port_index(pin)] & (1u << pin.num);
    }

private:
    static constexpr unsigned NUM_PORTS = 6;

    static unsigned port_index(PinId pin)
    {
        return static_cast<unsigned>(pin.port);
    }

    /// Updates the output latch of a pin without checking its mode.
    void set_level(PinId pin, Gpio::Value value);

    /// @return 0 if the STM32F303 can realize cfg on the given USART,
    /// -EINVAL otherwise.
    static int check_config(UsartId usart, const UartConfig &cfg);

    /// Receives the transmitted bytes.
    int txFd_;
    /// Forced result of uart_tx_init(), 0 if none.
    int uartInitFault_;
    /// Bit mask of configured UsartIds.
    uint8_t uartConfigured_;
    /// Bit masks of output pins, one per port.
    uint16_t outputs_[NUM_PORTS];
    /// Bit masks of pin levels, one per port.
    uint16_t levels_[NUM_PORTS];

    DISALLOW_COPY_AND_ASSIGN(HostPeripheralDriver);
};

} // namespace blinky

#endif // _OS_HOSTPERIPHERALDRIVER_HXX_
