#include "utils/test_main.hxx"

#include <errno.h>

#include "board/board_test_helper.hxx"

using ::testing::_;
using ::testing::Return;

namespace blinky
{

class UartTxTest : public HardwareTestBase
{
protected:
    UartTxTest()
        : hw_(create_hardware())
    {
    }

    Hardware hw_;
};

TEST_F(UartTxTest, WriteMessages)
{
    EXPECT_EQ(8, hw_.usart.blocking_write(messages::LED_ON));
    EXPECT_EQ(9, hw_.usart.blocking_write(messages::LED_OFF));
    EXPECT_EQ("LED ON\r\nLED OFF\r\n", txData_);
}

TEST_F(UartTxTest, WriteRawBytes)
{
    static const uint8_t payload[] = {'h', 'i', '\r', '\n'};
    EXPECT_CALL(driver_, uart_tx_write(UsartId::USART2, payload, 4));
    EXPECT_EQ(4, hw_.usart.blocking_write(payload, sizeof(payload)));
    EXPECT_EQ("hi\r\n", txData_);
}

TEST_F(UartTxTest, EmptyWriteSkipsDriver)
{
    EXPECT_CALL(driver_, uart_tx_write(_, _, _)).Times(0);
    EXPECT_EQ(0, hw_.usart.blocking_write(nullptr, 0));
}

TEST_F(UartTxTest, WriteErrorIsReturned)
{
    ScopedOverride ov(&mute_log_output, true);
    EXPECT_CALL(driver_, uart_tx_write(_, _, _)).WillOnce(Return(-EIO));
    EXPECT_EQ(-EIO, hw_.usart.blocking_write(messages::LED_ON));
    EXPECT_EQ("", txData_);
}

TEST_F(UartTxTest, Flush)
{
    EXPECT_CALL(driver_, uart_tx_flush(UsartId::USART2))
        .WillOnce(Return(0))
        .WillOnce(Return(-ETIMEDOUT));
    EXPECT_EQ(0, hw_.usart.blocking_flush());
    EXPECT_EQ(-ETIMEDOUT, hw_.usart.blocking_flush());
}

TEST_F(UartTxTest, MovedFromDies)
{
    UartTx other(std::move(hw_.usart));
    EXPECT_EQ(8, other.blocking_write(messages::LED_ON));
    EXPECT_EQ(UsartId::USART2, other.usart());
    EXPECT_DEATH(hw_.usart.blocking_write(messages::LED_ON), "");
}

} // namespace blinky
