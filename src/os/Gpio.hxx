/** \copyright
 * Copyright (c) 2026, Stuart Baker
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
 * \file Gpio.hxx
 *
 * OS-independent interface of a single GPIO line. Library code that needs to
 * drive a pin takes a const Gpio pointer or reference and does not care
 * which peripheral driver sits behind it.
 *
 * @author Stuart Baker
 * @date 19 October 2026
 */

#ifndef _OS_GPIO_HXX_
#define _OS_GPIO_HXX_

#include "utils/macros.h"

/** Generic GPIO interface. */
class Gpio
{
public:
    /** Values representing the voltage on a GPIO pin */
    enum Value : bool
    {
        CLR = false, /**< GPIO is clear, in other words, currently a '0' */
        SET = true,  /**< GPIO is set, in other words, currently a '1' */
        VLOW = CLR,  /**< alias for CLR */
        VHIGH = SET, /**< alias for SET */
    };

    /** Direction of the GPIO pin */
    enum Direction
    {
        DINPUT,  /**< GPIO is an input */
        DOUTPUT, /**< GPIO is an output */
    };

    virtual ~Gpio()
    {
    }

    /** Writes a GPIO output pin (set or clear to a specific state).
     * @param new_state the desired output state.  See @ref Value.
     */
    virtual void write(Value new_state) const = 0;

    /** Writes a GPIO output pin by a boolean value.
     * @param new_state true for SET, false for CLR.
     */
    void write(bool new_state) const
    {
        write(new_state ? SET : CLR);
    }

    /** Retrieves the current @ref Value of a GPIO input pin.
     * @return @ref SET if currently high, @ref CLR if currently low.
     */
    virtual Value read() const = 0;

    /** Tests the GPIO pin to see if it is set.
     * @return true if currently high, false if currently low.
     */
    bool is_set() const
    {
        return read() == SET;
    }

    /** Tests the GPIO pin to see if it is clear.
     * @return true if currently low, false if currently high.
     */
    bool is_clr() const
    {
        return read() == CLR;
    }

    /** Sets the GPIO output pin to high. */
    virtual void set() const
    {
        write(SET);
    }

    /** Clears the GPIO output pin to low. */
    virtual void clr() const
    {
        write(CLR);
    }

    /** Sets the direction of the GPIO pin.
     * @param dir direction to set
     */
    virtual void set_direction(Direction dir) const = 0;

    /** Gets the GPIO direction.
     * @return @ref DINPUT or @ref DOUTPUT
     */
    virtual Direction direction() const = 0;
};

#endif /* _OS_GPIO_HXX_ */
