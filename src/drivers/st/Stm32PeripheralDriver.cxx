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
 * \file Stm32PeripheralDriver.cxx
 * Peripheral driver for the STM32F303 on top of the STM32Cube HAL.
 *
 * @author Stuart W. Baker
 * @date 19 October 2026
 */

#include "drivers/st/Stm32PeripheralDriver.hxx"

#include <errno.h>
#include <string.h>

namespace blinky
{

/** Constructor.
 */
Stm32PeripheralDriver::Stm32PeripheralDriver()
{
    memset(uartHandle, 0, sizeof(uartHandle));
}

// static
GPIO_TypeDef *Stm32PeripheralDriver::port(GpioPort port)
{
    switch (port)
    {
        case GpioPort::A:
            return GPIOA;
        case GpioPort::B:
            return GPIOB;
        case GpioPort::C:
            return GPIOC;
        case GpioPort::D:
            return GPIOD;
        case GpioPort::E:
            return GPIOE;
        case GpioPort::F:
            return GPIOF;
    }
    DIE("unknown GPIO port");
}

// static
USART_TypeDef *Stm32PeripheralDriver::instance(UsartId usart)
{
    switch (usart)
    {
        case UsartId::USART1:
            return USART1;
        case UsartId::USART2:
            return USART2;
        case UsartId::USART3:
            return USART3;
        case UsartId::UART4:
            return UART4;
        case UsartId::UART5:
            return UART5;
    }
    DIE("unknown USART");
}

// static
void Stm32PeripheralDriver::enable_port_clock(GpioPort port)
{
    switch (port)
    {
        case GpioPort::A:
            __HAL_RCC_GPIOA_CLK_ENABLE();
            break;
        case GpioPort::B:
            __HAL_RCC_GPIOB_CLK_ENABLE();
            break;
        case GpioPort::C:
            __HAL_RCC_GPIOC_CLK_ENABLE();
            break;
        case GpioPort::D:
            __HAL_RCC_GPIOD_CLK_ENABLE();
            break;
        case GpioPort::E:
            __HAL_RCC_GPIOE_CLK_ENABLE();
            break;
        case GpioPort::F:
            __HAL_RCC_GPIOF_CLK_ENABLE();
            break;
    }
}

// static
void Stm32PeripheralDriver::enable_usart_clock(UsartId usart)
{
    switch (usart)
    {
        case UsartId::USART1:
            __HAL_RCC_USART1_CLK_ENABLE();
            break;
        case UsartId::USART2:
            __HAL_RCC_USART2_CLK_ENABLE();
            break;
        case UsartId::USART3:
            __HAL_RCC_USART3_CLK_ENABLE();
            break;
        case UsartId::UART4:
            __HAL_RCC_UART4_CLK_ENABLE();
            break;
        case UsartId::UART5:
            __HAL_RCC_UART5_CLK_ENABLE();
            break;
    }
}

// static
int Stm32PeripheralDriver::status_to_errno(
    HAL_StatusTypeDef status, int error_code)
{
    switch (status)
    {
        case HAL_OK:
            return 0;
        case HAL_BUSY:
            return -EBUSY;
        case HAL_TIMEOUT:
            return -ETIMEDOUT;
        case HAL_ERROR:
        default:
            return -error_code;
    }
}

UART_HandleTypeDef *Stm32PeripheralDriver::handle(UsartId usart)
{
    UART_HandleTypeDef *h = &uartHandle[static_cast<unsigned>(usart)];
    if (h->Instance == nullptr)
    {
        return nullptr;
    }
    return h;
}

int Stm32PeripheralDriver::uart_tx_init(
    UsartId usart, PinId tx_pin, const UartConfig &cfg)
{
    int af = usart_tx_alternate_function(usart, tx_pin);
    if (af < 0 || cfg.useDma || cfg.baudRate == 0)
    {
        return -EINVAL;
    }

    UART_HandleTypeDef *h = &uartHandle[static_cast<unsigned>(usart)];
    memset(h, 0, sizeof(*h));
    h->Init.BaudRate = cfg.baudRate;
    // The word length includes the parity bit.
    switch (cfg.dataBits + (cfg.parity == UartConfig::PARITY_NONE ? 0 : 1))
    {
        case 7:
            h->Init.WordLength = UART_WORDLENGTH_7B;
            break;
        case 8:
            h->Init.WordLength = UART_WORDLENGTH_8B;
            break;
        case 9:
            h->Init.WordLength = UART_WORDLENGTH_9B;
            break;
        default:
            return -EINVAL;
    }
    switch (cfg.parity)
    {
        case UartConfig::PARITY_NONE:
            h->Init.Parity = UART_PARITY_NONE;
            break;
        case UartConfig::PARITY_EVEN:
            h->Init.Parity = UART_PARITY_EVEN;
            break;
        case UartConfig::PARITY_ODD:
            h->Init.Parity = UART_PARITY_ODD;
            break;
        default:
            return -EINVAL;
    }
    switch (cfg.stopBits)
    {
        case 1:
            h->Init.StopBits = UART_STOPBITS_1;
            break;
        case 2:
            h->Init.StopBits = UART_STOPBITS_2;
            break;
        default:
            return -EINVAL;
    }
    h->Init.Mode = UART_MODE_TX;
    h->Init.HwFlowCtl = UART_HWCONTROL_NONE;
    h->Init.OverSampling = UART_OVERSAMPLING_16;
    h->Init.OneBitSampling = UART_ONE_BIT_SAMPLE_DISABLE;
    h->AdvancedInit.AdvFeatureInit = UART_ADVFEATURE_NO_INIT;

    enable_port_clock(tx_pin.port);
    enable_usart_clock(usart);

    GPIO_InitTypeDef gpio_init;
    memset(&gpio_init, 0, sizeof(gpio_init));
    gpio_init.Pin = 1u << tx_pin.num;
    gpio_init.Mode = GPIO_MODE_AF_PP;
    gpio_init.Pull = GPIO_PULLUP;
    gpio_init.Speed = GPIO_SPEED_FREQ_HIGH;
    gpio_init.Alternate = af;
    HAL_GPIO_Init(port(tx_pin.port), &gpio_init);

    // Fails with HAL_ERROR when the baud rate does not fit the kernel clock.
    h->Instance = instance(usart);
    int ret = status_to_errno(HAL_UART_Init(h), EINVAL);
    if (ret < 0)
    {
        HAL_UART_DeInit(h);
        memset(h, 0, sizeof(*h));
        return ret;
    }
    return 0;
}

int Stm32PeripheralDriver::uart_tx_write(
    UsartId usart, const uint8_t *data, size_t len)
{
    UART_HandleTypeDef *h = handle(usart);
    if (!h)
    {
        return -EINVAL;
    }
    size_t done = 0;
    while (done < len)
    {
        size_t chunk = len - done;
        if (chunk > 0xFFFF)
        {
            chunk = 0xFFFF;
        }
        // Older HAL releases take a non-const buffer.
        int ret = status_to_errno(
            HAL_UART_Transmit(h, const_cast<uint8_t *>(data + done),
                chunk, HAL_MAX_DELAY),
            EIO);
        if (ret < 0)
        {
            return ret;
        }
        done += chunk;
    }
    return (int)len;
}

int Stm32PeripheralDriver::uart_tx_flush(UsartId usart)
{
    UART_HandleTypeDef *h = handle(usart);
    if (!h)
    {
        return -EINVAL;
    }
    while (!__HAL_UART_GET_FLAG(h, UART_FLAG_TC))
    {
    }
    return 0;
}

void Stm32PeripheralDriver::gpio_output_init(
    PinId pin, Gpio::Value initial, OutputSpeed speed)
{
    enable_port_clock(pin.port);

    GPIO_InitTypeDef gpio_init;
    memset(&gpio_init, 0, sizeof(gpio_init));
    gpio_init.Pin = 1u << pin.num;
    gpio_init.Mode = GPIO_MODE_OUTPUT_PP;
    gpio_init.Pull = GPIO_NOPULL;
    switch (speed)
    {
        case OutputSpeed::LOW:
            gpio_init.Speed = GPIO_SPEED_FREQ_LOW;
            break;
        case OutputSpeed::MEDIUM:
            gpio_init.Speed = GPIO_SPEED_FREQ_MEDIUM;
            break;
        case OutputSpeed::HIGH:
            gpio_init.Speed = GPIO_SPEED_FREQ_HIGH;
            break;
    }
    // Loads ODR while the pin is still an input, so that it never drives a
    // stale level.
    gpio_write(pin, initial);
    HAL_GPIO_Init(port(pin.port), &gpio_init);
}

void Stm32PeripheralDriver::gpio_write(PinId pin, Gpio::Value value)
{
    uint32_t mask = 1u << pin.num;
    if (value)
    {
        port(pin.port)->BSRR = mask;
    }
    else
    {
        port(pin.port)->BSRR = mask << 16;
    }
}

Gpio::Value Stm32PeripheralDriver::gpio_read(PinId pin)
{
    return (port(pin.port)->IDR & (1u << pin.num)) ? Gpio::SET : Gpio::CLR;
}

} // namespace blinky
