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
 * \file board_test_helper.hxx
 *
 * Mock peripheral driver and a test fixture that creates a Hardware object
 * on top of it.
 *
 * @author Balazs Racz
 * @date 19 October 2026
 */

#ifndef _BOARD_BOARD_TEST_HELPER_HXX_
#define _BOARD_BOARD_TEST_HELPER_HXX_

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "board/Hardware.hxx"

namespace blinky
{

/// Allows gtest to print PinId values in failure messages.
inline void PrintTo(const PinId &pin, ::std::ostream *os)
{
    *os << 'P' << port_letter(pin.port) << static_cast<unsigned>(pin.num);
}

class MockPeripheralDriver : public PeripheralDriver
{
public:
    MOCK_METHOD3(
        uart_tx_init, int(UsartId, PinId, const UartConfig &));
    MOCK_METHOD3(uart_tx_write, int(UsartId, const uint8_t *, size_t));
    MOCK_METHOD1(uart_tx_flush, int(UsartId));
    MOCK_METHOD3(gpio_output_init, void(PinId, Gpio::Value, OutputSpeed));
    MOCK_METHOD2(gpio_write, void(PinId, Gpio::Value));
    MOCK_METHOD1(gpio_read, Gpio::Value(PinId));
};

/// Base class for tests that need an initialized Hardware object. The mock
/// driver behaves like a working board by default: configuration succeeds,
/// written bytes are collected in txData_ and the level of the (single)
/// output pin is remembered in pinLevel_.
class HardwareTestBase : public ::testing::Test
{
protected:
    HardwareTestBase()
    {
        using ::testing::_;
        using ::testing::Invoke;
        using ::testing::Return;
        using ::testing::ReturnPointee;
        using ::testing::SaveArg;

        ON_CALL(driver_, uart_tx_init(_, _, _)).WillByDefault(Return(0));
        ON_CALL(driver_, uart_tx_flush(_)).WillByDefault(Return(0));
        ON_CALL(driver_, uart_tx_write(_, _, _))
            .WillByDefault(
                Invoke([this](UsartId, const uint8_t *data, size_t len) {
                    txData_.append(reinterpret_cast<const char *>(data), len);
                    return static_cast<int>(len);
                }));
        ON_CALL(driver_, gpio_output_init(_, _, _))
            .WillByDefault(SaveArg<1>(&pinLevel_));
        ON_CALL(driver_, gpio_write(_, _))
            .WillByDefault(SaveArg<1>(&pinLevel_));
        ON_CALL(driver_, gpio_read(_)).WillByDefault(ReturnPointee(&pinLevel_));
    }

    /// Runs the initializer on a fresh token of the mock driver.
    Hardware create_hardware()
    {
        return Hardware::init(Peripherals::steal(&driver_));
    }

    ::testing::NiceMock<MockPeripheralDriver> driver_;
    /// Level of the output pin as last configured or written. Starts SET so
    /// that a missing initialization is visible.
    Gpio::Value pinLevel_{Gpio::SET};
    /// Concatenation of all bytes written to any UART.
    std::string txData_;
};

} // namespace blinky

#endif // _BOARD_BOARD_TEST_HELPER_HXX_
