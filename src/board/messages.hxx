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
 * \file messages.hxx
 *
 * Pre-formatted messages sent over the virtual COM port. Each message is
 * ASCII text terminated by CR LF, without length prefix or checksum.
 *
 * @author Balazs Racz
 * @date 19 October 2026
 */

#ifndef _BOARD_MESSAGES_HXX_
#define _BOARD_MESSAGES_HXX_

#include <stddef.h>
#include <stdint.h>

namespace blinky
{
namespace messages
{

/// Immutable byte sequence. Does not include the C string terminator.
struct Message
{
    const char *text;
    size_t size;

    /// @return the payload as raw bytes.
    const uint8_t *data() const
    {
        return reinterpret_cast<const uint8_t *>(text);
    }
};

/// Builds a Message from a string literal, dropping the trailing NUL.
template <size_t N> constexpr Message make_message(const char (&text)[N])
{
    return Message{text, N - 1};
}

/// Sent when the LED is switched on.
constexpr Message LED_ON = make_message("LED ON\r\n");

/// Sent when the LED is switched off.
constexpr Message LED_OFF = make_message("LED OFF\r\n");

/// @return LED_ON if on is true, LED_OFF otherwise.
constexpr Message for_state(bool on)
{
    return on ? LED_ON : LED_OFF;
}

} // namespace messages
} // namespace blinky

#endif // _BOARD_MESSAGES_HXX_
