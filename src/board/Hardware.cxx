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
 * \file Hardware.cxx
 *
 * Hardware configuration of the ST Nucleo-F303RE board.
 *
 * @author Balazs Racz
 * @date 19 October 2026
 */

#include "board/Hardware.hxx"

#include <string.h>

#include "utils/logging.h"

namespace blinky
{

constexpr PinId Hardware::LED_PIN;
constexpr PinId Hardware::VCP_TX_PIN;
constexpr UsartId Hardware::VCP_USART;

// static
Hardware Hardware::init(Peripherals peripherals)
{
    PeripheralDriver *driver = peripherals.release();

    const UartConfig cfg = UartConfig::default_8n1();
    int ret = driver->uart_tx_init(VCP_USART, VCP_TX_PIN, cfg);
    if (ret < 0)
    {
        LOG(FATAL, "Hardware: failed to configure %s on P%c%u: %s",
            usart_name(VCP_USART), port_letter(VCP_TX_PIN.port),
            VCP_TX_PIN.num, strerror(-ret));
        DIE("serial channel initialization failed");
    }
    UartTx usart(driver, VCP_USART, cfg);

    driver->gpio_output_init(LED_PIN, Gpio::CLR, OutputSpeed::LOW);
    OutputPin led(driver, LED_PIN);

    LOG(INFO, "Hardware: %s %u-%u%c%u on P%c%u, LED on P%c%u.",
        usart_name(VCP_USART), (unsigned)cfg.baudRate, cfg.dataBits,
        "NEO"[cfg.parity], cfg.stopBits, port_letter(VCP_TX_PIN.port),
        VCP_TX_PIN.num, port_letter(LED_PIN.port), LED_PIN.num);
    return Hardware(std::move(led), std::move(usart));
}

} // namespace blinky
