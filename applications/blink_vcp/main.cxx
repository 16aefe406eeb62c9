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
 * \file main.cxx
 *
 * An application that blinks the user LED and reports every change on the
 * virtual COM port.
 *
 * @author Balazs Racz
 * @date 19 October 2026
 */

#include <unistd.h>

#include "blinky_config.h"
#include "board/Hardware.hxx"
#include "hardware.hxx"
#include "os/os.h"
#include "utils/logging.h"

using blinky::Hardware;
using blinky::Peripherals;
namespace messages = blinky::messages;

/// Peripheral-access framework. Lives for the whole program.
static BoardPeripheralDriver driver;

/// Sets the LED and reports the new state on the serial line.
static void show_state(Hardware *hw, bool on)
{
    hw->led.write(on);
    int ret = hw->usart.blocking_write(messages::for_state(on));
    if (ret < 0)
    {
        LOG(WARNING, "blink_vcp: could not report LED state: %d", ret);
    }
}

/** Entry point to application.
 * @param argc number of command line arguments
 * @param argv array of command line arguments
 * @return 0, should never return
 */
int appl_main(int argc, char *argv[])
{
    Hardware hw = Hardware::init(Peripherals::take(&driver));
    const useconds_t interval_usec = config_led_blink_interval_msec() * 1000;
    while (1)
    {
        show_state(&hw, true);
        usleep(interval_usec);
        show_state(&hw, false);
        usleep(interval_usec);
    }
    return 0;
}
