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
 * \file PeripheralDriver.cxx
 *
 * Helpers shared by all peripheral driver implementations.
 *
 * @author Stuart W. Baker
 * @date 19 October 2026
 */

#include "board/PeripheralDriver.hxx"

#include "utils/macros.h"

namespace blinky
{

namespace
{

/// One possible routing of a U(S)ART TX signal to a GPIO pin.
struct TxRoute
{
    UsartId usart;
    PinId pin;
    uint8_t af;
};

/// TX pin options of the STM32F303xE (datasheet table 14/15).
const TxRoute TX_ROUTES[] = {
    {UsartId::USART1, {GpioPort::A, 9}, 7},
    {UsartId::USART1, {GpioPort::B, 6}, 7},
    {UsartId::USART1, {GpioPort::C, 4}, 7},
    {UsartId::USART1, {GpioPort::E, 0}, 7},
    {UsartId::USART2, {GpioPort::A, 2}, 7},
    {UsartId::USART2, {GpioPort::A, 14}, 7},
    {UsartId::USART2, {GpioPort::B, 3}, 7},
    {UsartId::USART2, {GpioPort::D, 5}, 7},
    {UsartId::USART3, {GpioPort::B, 10}, 7},
    {UsartId::USART3, {GpioPort::C, 10}, 7},
    {UsartId::USART3, {GpioPort::D, 8}, 7},
    {UsartId::UART4, {GpioPort::C, 10}, 5},
    {UsartId::UART5, {GpioPort::C, 12}, 5},
};

} // namespace

int usart_tx_alternate_function(UsartId usart, PinId pin)
{
    for (unsigned i = 0; i < ARRAYSIZE(TX_ROUTES); ++i)
    {
        if (TX_ROUTES[i].usart == usart && TX_ROUTES[i].pin == pin)
        {
            return TX_ROUTES[i].af;
        }
    }
    return -1;
}

const char *usart_name(UsartId usart)
{
    switch (usart)
    {
        case UsartId::USART1:
            return "USART1";
        case UsartId::USART2:
            return "USART2";
        case UsartId::USART3:
            return "USART3";
        case UsartId::UART4:
            return "UART4";
        case UsartId::UART5:
            return "UART5";
    }
    return "USART?";
}

} // namespace blinky
