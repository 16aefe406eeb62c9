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
 * \file HostPeripheralDriver.cxx
 *
 * Simulates the Nucleo-F303RE peripherals on a Linux host.
 *
 * @author Robert Heller
 * @date 19 October 2026
 */

#include "os/HostPeripheralDriver.hxx"

#include <errno.h>
#include <string.h>

#include "utils/logging.h"

namespace blinky
{

constexpr uint32_t HostPeripheralDriver::APB2_CLOCK_HZ;
constexpr uint32_t HostPeripheralDriver::APB1_CLOCK_HZ;

HostPeripheralDriver::HostPeripheralDriver(int tx_fd)
    : txFd_(tx_fd)
    , uartInitFault_(0)
    , uartConfigured_(0)
{
    memset(outputs_, 0, sizeof(outputs_));
    memset(levels_, 0, sizeof(levels_));
}

// static
int HostPeripheralDriver::check_config(UsartId usart, const UartConfig &cfg)
{
    if (cfg.useDma)
    {
        // The simulated transmitter is polled only.
        return -EINVAL;
    }
    unsigned frame_bits =
        cfg.dataBits + (cfg.parity == UartConfig::PARITY_NONE ? 0 : 1);
    if (cfg.dataBits < 7 || frame_bits > 9)
    {
        return -EINVAL;
    }
    if (cfg.stopBits != 1 && cfg.stopBits != 2)
    {
        return -EINVAL;
    }
    if (cfg.parity > UartConfig::PARITY_ODD)
    {
        return -EINVAL;
    }
    if (cfg.baudRate == 0)
    {
        return -EINVAL;
    }
    // 16x oversampling: BRR = f_ck / baud, must fit 16..0xFFFF.
    uint32_t clock =
        usart == UsartId::USART1 ? APB2_CLOCK_HZ : APB1_CLOCK_HZ;
    uint32_t brr = (clock + cfg.baudRate / 2) / cfg.baudRate;
    if (brr < 16 || brr > 0xFFFF)
    {
        return -EINVAL;
    }
    return 0;
}

int HostPeripheralDriver::uart_tx_init(
    UsartId usart, PinId tx_pin, const UartConfig &cfg)
{
    if (uartInitFault_ < 0)
    {
        return uartInitFault_;
    }
    if (usart_tx_alternate_function(usart, tx_pin) < 0)
    {
        LOG(ERROR, "%s cannot transmit on P%c%u", usart_name(usart),
            port_letter(tx_pin.port), tx_pin.num);
        return -EINVAL;
    }
    int ret = check_config(usart, cfg);
    if (ret < 0)
    {
        return ret;
    }
    uartConfigured_ |= 1u << static_cast<unsigned>(usart);
    LOG(VERBOSE, "%s: %u baud on P%c%u", usart_name(usart),
        (unsigned)cfg.baudRate, port_letter(tx_pin.port), tx_pin.num);
    return 0;
}

int HostPeripheralDriver::uart_tx_write(
    UsartId usart, const uint8_t *data, size_t len)
{
    if (!is_uart_configured(usart))
    {
        return -EINVAL;
    }
    size_t done = 0;
    while (done < len)
    {
        ssize_t ret = ::write(txFd_, data + done, len - done);
        if (ret < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return -errno;
        }
        done += ret;
    }
    return (int)len;
}

int HostPeripheralDriver::uart_tx_flush(UsartId usart)
{
    if (!is_uart_configured(usart))
    {
        return -EINVAL;
    }
    // Bytes handed to the kernel are already on the "wire".
    return 0;
}

void HostPeripheralDriver::gpio_output_init(
    PinId pin, Gpio::Value initial, OutputSpeed speed)
{
    HASSERT(port_index(pin) < NUM_PORTS && pin.num < 16);
    // Same order as the hardware: output latch first, then the mode.
    set_level(pin, initial);
    outputs_[port_index(pin)] |= 1u << pin.num;
    LOG(VERBOSE, "P%c%u: output, speed %u, %s", port_letter(pin.port),
        pin.num, static_cast<unsigned>(speed), initial ? "HIGH" : "LOW");
}

void HostPeripheralDriver::gpio_write(PinId pin, Gpio::Value value)
{
    HASSERT(is_output(pin));
    set_level(pin, value);
    LOG(VERBOSE, "P%c%u -> %s", port_letter(pin.port), pin.num,
        value ? "HIGH" : "LOW");
}

void HostPeripheralDriver::set_level(PinId pin, Gpio::Value value)
{
    uint16_t mask = 1u << pin.num;
    if (value)
    {
        levels_[port_index(pin)] |= mask;
    }
    else
    {
        levels_[port_index(pin)] &= ~mask;
    }
}

Gpio::Value HostPeripheralDriver::gpio_read(PinId pin)
{
    HASSERT(port_index(pin) < NUM_PORTS && pin.num < 16);
    return (levels_[port_index(pin)] & (1u << pin.num)) ? Gpio::SET
                                                        : Gpio::CLR;
}

} // namespace blinky
