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
 * \file UartTx.hxx
 * Owned handle of a blocking UART transmitter.
 *
 * @author Stuart W. Baker
 * @date 19 October 2026
 */

#ifndef _BOARD_UARTTX_HXX_
#define _BOARD_UARTTX_HXX_

#include "board/PeripheralDriver.hxx"
#include "board/messages.hxx"
#include "utils/macros.h"

namespace blinky
{

class Hardware;

/** Exclusive owner of one UART transmit channel. Every write blocks the
 * caller until the bytes are handed to the peripheral; there is no interrupt
 * or DMA assist.
 */
class UartTx
{
public:
    /** Transfers the ownership. Leaves `o` empty. */
    UartTx(UartTx &&o)
        : driver_(o.driver_)
        , usart_(o.usart_)
        , config_(o.config_)
    {
        o.driver_ = nullptr;
    }

    /** Transmits a buffer.
     * @param data bytes to send
     * @param len number of bytes to send
     * @return len on success, or a negative errno value
     */
    int blocking_write(const uint8_t *data, size_t len);

    /** Transmits a pre-formatted message.
     * @param msg message to send, e.g. messages::LED_ON
     * @return number of bytes sent, or a negative errno value
     */
    int blocking_write(const messages::Message &msg)
    {
        return blocking_write(msg.data(), msg.size);
    }

    /** Waits until the last byte has left the shift register.
     * @return 0 on success, or a negative errno value
     */
    int blocking_flush();

    /** @return the line parameters this channel was configured with. */
    const UartConfig &config() const
    {
        return config_;
    }

    /** @return which peripheral instance this handle drives. */
    UsartId usart() const
    {
        return usart_;
    }

private:
    friend class Hardware;

    UartTx(PeripheralDriver *driver, UsartId usart, const UartConfig &config)
        : driver_(driver)
        , usart_(usart)
        , config_(config)
    {
    }

    PeripheralDriver *driver_; /**< nullptr once moved from */
    UsartId usart_; /**< peripheral instance */
    UartConfig config_; /**< parameters applied by uart_tx_init */

    DISALLOW_COPY_AND_ASSIGN(UartTx);
};

} // namespace blinky

#endif // _BOARD_UARTTX_HXX_
