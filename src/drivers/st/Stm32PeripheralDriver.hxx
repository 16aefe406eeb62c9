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
 * \file Stm32PeripheralDriver.hxx
 * Peripheral driver for the STM32F303 on top of the STM32Cube HAL. The UART
 * transmitters are polled; no interrupt or DMA is used.
 *
 * @author Stuart W. Baker
 * @date 19 October 2026
 */

#ifndef _DRIVERS_ST_STM32PERIPHERALDRIVER_HXX_
#define _DRIVERS_ST_STM32PERIPHERALDRIVER_HXX_

#include "drivers/st/stm32f_hal_conf.hxx"

#include "board/PeripheralDriver.hxx"

#if BLINKY_FEATURE_STM32_HAL
  #define NUM_USART 5
#else
#error don_t know this STM32 MCU
#endif

namespace blinky
{

/** Specialization of PeripheralDriver for STM32F3xx devices.
 */
class Stm32PeripheralDriver : public PeripheralDriver
{
public:
    /** Constructor. Does not touch the hardware. */
    Stm32PeripheralDriver();

    /** Enables the clocks, routes the TX pin and calls HAL_UART_Init().
     * @return 0 on success; -EINVAL if the pin cannot carry the TX signal,
     * DMA is requested or the HAL rejects the line parameters; -EBUSY or
     * -ETIMEDOUT if the peripheral did not become ready */
    int uart_tx_init(
        UsartId usart, PinId tx_pin, const UartConfig &cfg) override;

    /** Polled transmission through HAL_UART_Transmit(). */
    int uart_tx_write(UsartId usart, const uint8_t *data, size_t len) override;

    /** Busy-waits for the transmission complete flag. */
    int uart_tx_flush(UsartId usart) override;

    void gpio_output_init(
        PinId pin, Gpio::Value initial, OutputSpeed speed) override;
    void gpio_write(PinId pin, Gpio::Value value) override;
    Gpio::Value gpio_read(PinId pin) override;

private:
    /** @return the register block of a GPIO port. */
    static GPIO_TypeDef *port(GpioPort port);

    /** @return the register block of a U(S)ART. */
    static USART_TypeDef *instance(UsartId usart);

    /** Turns on the AHB clock of a GPIO port. */
    static void enable_port_clock(GpioPort port);

    /** Turns on the APB clock of a U(S)ART. */
    static void enable_usart_clock(UsartId usart);

    /** Converts a HAL status to 0 or a negative errno value.
     * @param status return value of a HAL call
     * @param error_code errno to use for HAL_ERROR */
    static int status_to_errno(HAL_StatusTypeDef status, int error_code);

    /** @return the HAL handle of a configured U(S)ART, or nullptr if
     * uart_tx_init() has not succeeded for it. */
    UART_HandleTypeDef *handle(UsartId usart);

    /** Handles to the UART setup, indexed by UsartId */
    UART_HandleTypeDef uartHandle[NUM_USART];

    DISALLOW_COPY_AND_ASSIGN(Stm32PeripheralDriver);
};

} // namespace blinky

#endif /* _DRIVERS_ST_STM32PERIPHERALDRIVER_HXX_ */
