#include "utils/test_main.hxx"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

#include "board/Hardware.hxx"
#include "os/HostPeripheralDriver.hxx"

namespace blinky
{

class HostPeripheralDriverTest : public ::testing::Test
{
protected:
    HostPeripheralDriverTest()
        : driver_(open_pipe())
    {
    }

    ~HostPeripheralDriverTest()
    {
        ::close(fds_[0]);
        ::close(fds_[1]);
    }

    /// @return the write end of a freshly created non-blocking pipe.
    int open_pipe()
    {
        int ret = ::pipe(fds_);
        HASSERT(ret == 0);
        ::fcntl(fds_[0], F_SETFL, O_NONBLOCK);
        return fds_[1];
    }

    /// @return everything written to the UART so far.
    std::string read_tx()
    {
        std::string ret;
        char buf[64];
        ssize_t n;
        while ((n = ::read(fds_[0], buf, sizeof(buf))) > 0)
        {
            ret.append(buf, n);
        }
        return ret;
    }

    int fds_[2];
    HostPeripheralDriver driver_;
};

TEST_F(HostPeripheralDriverTest, AcceptsVcpConfig)
{
    EXPECT_FALSE(driver_.is_uart_configured(UsartId::USART2));
    EXPECT_EQ(0,
        driver_.uart_tx_init(
            UsartId::USART2, PinId{GpioPort::A, 2}, UartConfig::default_8n1()));
    EXPECT_TRUE(driver_.is_uart_configured(UsartId::USART2));
    EXPECT_FALSE(driver_.is_uart_configured(UsartId::USART1));
}

TEST_F(HostPeripheralDriverTest, RejectsUnroutablePin)
{
    ScopedOverride ov(&mute_log_output, true);
    EXPECT_EQ(-EINVAL,
        driver_.uart_tx_init(
            UsartId::USART2, PinId{GpioPort::A, 5}, UartConfig::default_8n1()));
    EXPECT_EQ(-EINVAL,
        driver_.uart_tx_init(
            UsartId::USART1, PinId{GpioPort::A, 2}, UartConfig::default_8n1()));
    EXPECT_FALSE(driver_.is_uart_configured(UsartId::USART2));
}

TEST_F(HostPeripheralDriverTest, RejectsBadLineParameters)
{
    const PinId tx{GpioPort::A, 2};
    UartConfig cfg = UartConfig::default_8n1();
    cfg.useDma = true;
    EXPECT_EQ(-EINVAL, driver_.uart_tx_init(UsartId::USART2, tx, cfg));

    cfg = UartConfig::default_8n1();
    cfg.baudRate = 0;
    EXPECT_EQ(-EINVAL, driver_.uart_tx_init(UsartId::USART2, tx, cfg));

    // BRR would overflow 16 bits.
    cfg.baudRate = 1;
    EXPECT_EQ(-EINVAL, driver_.uart_tx_init(UsartId::USART2, tx, cfg));

    // BRR would be below 16.
    cfg.baudRate = 10000000;
    EXPECT_EQ(-EINVAL, driver_.uart_tx_init(UsartId::USART2, tx, cfg));

    cfg = UartConfig::default_8n1();
    cfg.dataBits = 9;
    cfg.parity = UartConfig::PARITY_EVEN;
    EXPECT_EQ(-EINVAL, driver_.uart_tx_init(UsartId::USART2, tx, cfg));

    cfg = UartConfig::default_8n1();
    cfg.stopBits = 3;
    EXPECT_EQ(-EINVAL, driver_.uart_tx_init(UsartId::USART2, tx, cfg));

    EXPECT_FALSE(driver_.is_uart_configured(UsartId::USART2));
}

TEST_F(HostPeripheralDriverTest, InjectedFault)
{
    driver_.inject_uart_init_fault(-EIO);
    EXPECT_EQ(-EIO,
        driver_.uart_tx_init(
            UsartId::USART2, PinId{GpioPort::A, 2}, UartConfig::default_8n1()));
    driver_.inject_uart_init_fault(0);
    EXPECT_EQ(0,
        driver_.uart_tx_init(
            UsartId::USART2, PinId{GpioPort::A, 2}, UartConfig::default_8n1()));
}

TEST_F(HostPeripheralDriverTest, WriteNeedsInit)
{
    static const uint8_t byte = 'x';
    EXPECT_EQ(-EINVAL, driver_.uart_tx_write(UsartId::USART2, &byte, 1));
    EXPECT_EQ(-EINVAL, driver_.uart_tx_flush(UsartId::USART2));
    EXPECT_EQ("", read_tx());
}

TEST_F(HostPeripheralDriverTest, WriteReachesFd)
{
    ASSERT_EQ(0,
        driver_.uart_tx_init(
            UsartId::USART2, PinId{GpioPort::A, 2}, UartConfig::default_8n1()));
    EXPECT_EQ(8,
        driver_.uart_tx_write(
            UsartId::USART2, messages::LED_ON.data(), messages::LED_ON.size));
    EXPECT_EQ(0, driver_.uart_tx_flush(UsartId::USART2));
    EXPECT_EQ("LED ON\r\n", read_tx());
}

TEST_F(HostPeripheralDriverTest, WriteErrorIsNegativeErrno)
{
    ASSERT_EQ(0,
        driver_.uart_tx_init(
            UsartId::USART2, PinId{GpioPort::A, 2}, UartConfig::default_8n1()));
    // Closing the read end turns the next write into EPIPE.
    ::signal(SIGPIPE, SIG_IGN);
    ::close(fds_[0]);
    fds_[0] = ::open("/dev/null", O_RDONLY);
    EXPECT_EQ(-EPIPE,
        driver_.uart_tx_write(
            UsartId::USART2, messages::LED_OFF.data(), messages::LED_OFF.size));
}

TEST_F(HostPeripheralDriverTest, PinLevels)
{
    const PinId led{GpioPort::A, 5};
    EXPECT_FALSE(driver_.is_output(led));
    driver_.gpio_output_init(led, Gpio::CLR, OutputSpeed::LOW);
    EXPECT_TRUE(driver_.is_output(led));
    EXPECT_EQ(Gpio::CLR, driver_.gpio_read(led));
    driver_.gpio_write(led, Gpio::SET);
    EXPECT_EQ(Gpio::SET, driver_.gpio_read(led));
    // Neighbors are unaffected.
    EXPECT_EQ(Gpio::CLR, driver_.gpio_read(PinId{GpioPort::A, 4}));
    EXPECT_EQ(Gpio::CLR, driver_.gpio_read(PinId{GpioPort::B, 5}));
    driver_.gpio_write(led, Gpio::CLR);
    EXPECT_EQ(Gpio::CLR, driver_.gpio_read(led));
}

TEST_F(HostPeripheralDriverTest, OutputStartsAtInitialLevel)
{
    const PinId pin{GpioPort::C, 13};
    driver_.gpio_output_init(pin, Gpio::SET, OutputSpeed::HIGH);
    EXPECT_TRUE(driver_.is_output(pin));
    EXPECT_EQ(Gpio::SET, driver_.gpio_read(pin));

    // Re-initializing LOW clears the latch before the pin drives it again.
    driver_.gpio_output_init(pin, Gpio::CLR, OutputSpeed::LOW);
    EXPECT_EQ(Gpio::CLR, driver_.gpio_read(pin));
}

TEST(BoardFeaturesTest, HostBuildHasNoHal)
{
#if BLINKY_FEATURE_STM32_HAL
    FAIL() << "host build must not select the STM32 HAL";
#endif
    EXPECT_EQ(1, BLINKY_FEATURE_HOST_STDIO);
}

TEST_F(HostPeripheralDriverTest, WriteToInputDies)
{
    EXPECT_DEATH(driver_.gpio_write(PinId{GpioPort::A, 6}, Gpio::SET), "");
}

TEST_F(HostPeripheralDriverTest, BlinkThroughHardware)
{
    Hardware hw = Hardware::init(Peripherals::steal(&driver_));
    EXPECT_TRUE(driver_.is_uart_configured(UsartId::USART2));
    EXPECT_TRUE(driver_.is_output(Hardware::LED_PIN));
    EXPECT_TRUE(hw.led.is_clr());

    for (bool on : {true, false, true, false})
    {
        hw.led.write(on);
        EXPECT_EQ(on, hw.led.is_set());
        hw.usart.blocking_write(messages::for_state(on));
    }
    EXPECT_EQ("LED ON\r\nLED OFF\r\nLED ON\r\nLED OFF\r\n", read_tx());
}

TEST_F(HostPeripheralDriverTest, RejectedSerialIsFatal)
{
    driver_.inject_uart_init_fault(-EIO);
    EXPECT_DEATH(Hardware::init(Peripherals::steal(&driver_)),
        "failed to configure USART2 on PA2");
}

} // namespace blinky
