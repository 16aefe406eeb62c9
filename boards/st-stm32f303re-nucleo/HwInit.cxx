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
 * \file HwInit.cxx
 *
 * Early hardware bring-up of the ST Nucleo-F303RE: HAL, clock tree and
 * SysTick. The 8 MHz HSE comes from the ST-LINK MCO output (bypass mode).
 *
 * @author Balazs Racz
 * @date 19 October 2026
 */

#include <string.h>
#include <unistd.h>

#include "drivers/st/hal_delay.hxx"
#include "drivers/st/stm32f_hal_conf.hxx"

#include "os/os.h"
#include "utils/macros.h"

/** Sets up the clock tree: HSE bypass 8 MHz, PLL x9 = 72 MHz SYSCLK, APB1
 * 36 MHz, APB2 72 MHz. */
static void clock_setup(void)
{
    RCC_OscInitTypeDef osc_init;
    memset(&osc_init, 0, sizeof(osc_init));
    osc_init.OscillatorType = RCC_OSCILLATORTYPE_HSE;
    osc_init.HSEState = RCC_HSE_BYPASS;
    osc_init.PLL.PLLState = RCC_PLL_ON;
    osc_init.PLL.PLLSource = RCC_PLLSOURCE_HSE;
    osc_init.PLL.PLLMUL = RCC_PLL_MUL9;
    // predivider stays at /1 (zero)
    if (HAL_RCC_OscConfig(&osc_init) != HAL_OK)
    {
        DIE("HSE / PLL failed to start");
    }

    RCC_ClkInitTypeDef clk_init;
    memset(&clk_init, 0, sizeof(clk_init));
    clk_init.ClockType = RCC_CLOCKTYPE_SYSCLK | RCC_CLOCKTYPE_HCLK |
        RCC_CLOCKTYPE_PCLK1 | RCC_CLOCKTYPE_PCLK2;
    clk_init.SYSCLKSource = RCC_SYSCLKSOURCE_PLLCLK;
    clk_init.AHBCLKDivider = RCC_SYSCLK_DIV1;
    clk_init.APB1CLKDivider = RCC_HCLK_DIV2;
    clk_init.APB2CLKDivider = RCC_HCLK_DIV1;
    if (HAL_RCC_ClockConfig(&clk_init, FLASH_LATENCY_2) != HAL_OK)
    {
        DIE("clock switch failed");
    }
}

extern "C" {

void hw_preinit(void)
{
    HAL_Init();
    clock_setup();
}

/// Drives the HAL time base (HAL_GetTick, HAL_Delay, UART timeouts).
void SysTick_Handler(void)
{
    HAL_IncTick();
}

/// There is no scheduler on this board; sleeping is a busy wait on the HAL
/// tick, rounded up to whole milliseconds.
int usleep(useconds_t usec)
{
    if (usec == 0)
    {
        return 0;
    }
    HAL_Delay(blinky::usec_to_hal_delay(usec));
    return 0;
}

} // extern "C"
