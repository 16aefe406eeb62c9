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
 * \file UartTx.cxx
 * Owned handle of a blocking UART transmitter.
 *
 * @author Stuart W. Baker
 * @date 19 October 2026
 */

#include "board/UartTx.hxx"

#include "utils/logging.h"

namespace blinky
{

/** Transmits a buffer.
 * @param data bytes to send
 * @param len number of bytes to send
 * @return len on success, or a negative errno value
 */
int UartTx::blocking_write(const uint8_t *data, size_t len)
{
    HASSERT(driver_);
    if (len == 0)
    {
        return 0;
    }
    int ret = driver_->uart_tx_write(usart_, data, len);
    if (ret < 0)
    {
        LOG(WARNING, "%s: write of %u bytes failed: %d", usart_name(usart_),
            (unsigned)len, ret);
    }
    return ret;
}

/** Waits until the last byte has left the shift register.
 * @return 0 on success, or a negative errno value
 */
int UartTx::blocking_flush()
{
    HASSERT(driver_);
    return driver_->uart_tx_flush(usart_);
}

} // namespace blinky
