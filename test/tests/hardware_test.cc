#include "utils/test_main.hxx"

#include <errno.h>
#include <signal.h>
#include <unistd.h>
#include <type_traits>

#include "board/board_test_helper.hxx"

using ::testing::_;
using ::testing::DoAll;
using ::testing::Eq;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::SaveArg;

namespace blinky
{

static_assert(!std::is_default_constructible<Hardware>::value,
    "Hardware must only come from Hardware::init");
static_assert(!std::is_copy_constructible<Hardware>::value,
    "Hardware must not be duplicated");
static_assert(std::is_move_constructible<Hardware>::value,
    "Hardware ownership must be transferable");
static_assert(!std::is_copy_constructible<OutputPin>::value, "");
static_assert(!std::is_copy_constructible<UartTx>::value, "");
static_assert(!std::is_copy_constructible<Peripherals>::value, "");
static_assert(!std::is_constructible<Hardware, OutputPin &&, UartTx &&>::value,
    "the bundle constructor is private");

class HardwareTest : public HardwareTestBase
{
};

TEST_F(HardwareTest, PinMap)
{
    EXPECT_EQ(GpioPort::A, Hardware::LED_PIN.port);
    EXPECT_EQ(5, Hardware::LED_PIN.num);
    EXPECT_EQ(GpioPort::A, Hardware::VCP_TX_PIN.port);
    EXPECT_EQ(2, Hardware::VCP_TX_PIN.num);
    EXPECT_EQ(UsartId::USART2, Hardware::VCP_USART);
}

TEST_F(HardwareTest, InitSequence)
{
    {
        InSequence s;
        EXPECT_CALL(driver_,
            uart_tx_init(UsartId::USART2, Eq(PinId{GpioPort::A, 2}), _));
        EXPECT_CALL(driver_, gpio_output_init(
            Eq(PinId{GpioPort::A, 5}), Gpio::CLR, OutputSpeed::LOW));
    }
    Hardware hw = create_hardware();
    EXPECT_EQ(Hardware::LED_PIN, hw.led.pin());
    EXPECT_EQ(UsartId::USART2, hw.usart.usart());
}

TEST_F(HardwareTest, SerialIs115200_8N1WithoutDma)
{
    UartConfig cfg{0, 0, UartConfig::PARITY_EVEN, 0, true};
    EXPECT_CALL(driver_, uart_tx_init(_, _, _))
        .WillOnce(DoAll(SaveArg<2>(&cfg), Return(0)));
    Hardware hw = create_hardware();

    EXPECT_EQ(115200u, cfg.baudRate);
    EXPECT_EQ(8, cfg.dataBits);
    EXPECT_EQ(UartConfig::PARITY_NONE, cfg.parity);
    EXPECT_EQ(1, cfg.stopBits);
    EXPECT_FALSE(cfg.useDma);

    EXPECT_EQ(115200u, hw.usart.config().baudRate);
    EXPECT_EQ(8, hw.usart.config().dataBits);
    EXPECT_EQ(UartConfig::PARITY_NONE, hw.usart.config().parity);
    EXPECT_EQ(1, hw.usart.config().stopBits);
    EXPECT_FALSE(hw.usart.config().useDma);
}

TEST_F(HardwareTest, LedStartsLow)
{
    Hardware hw = create_hardware();
    EXPECT_EQ(Gpio::CLR, hw.led.read());
    EXPECT_TRUE(hw.led.is_clr());
    EXPECT_EQ(Gpio::DOUTPUT, hw.led.direction());
}

TEST_F(HardwareTest, ConsumesToken)
{
    Peripherals p = Peripherals::steal(&driver_);
    Peripherals moved(std::move(p));
    EXPECT_FALSE(p.valid());
    EXPECT_TRUE(moved.valid());
    Hardware hw = Hardware::init(std::move(moved));
    EXPECT_FALSE(moved.valid());
}

TEST_F(HardwareTest, MoveTransfersOwnership)
{
    Hardware hw = create_hardware();
    Hardware other(std::move(hw));
    other.led.set();
    EXPECT_TRUE(other.led.is_set());
    EXPECT_EQ(9, other.usart.blocking_write(messages::LED_OFF));
    EXPECT_EQ("LED OFF\r\n", txData_);
}

TEST_F(HardwareTest, EmptyTokenDies)
{
    Peripherals p = Peripherals::steal(&driver_);
    Peripherals moved(std::move(p));
    EXPECT_DEATH(Hardware::init(std::move(p)), "");
}

TEST_F(HardwareTest, SerialRejectedIsFatal)
{
    EXPECT_CALL(driver_, uart_tx_init(_, _, _)).WillRepeatedly(Return(-EINVAL));
    EXPECT_DEATH(
        {
            Hardware hw = create_hardware();
            // Not reached: no partial bundle may escape.
            fprintf(stderr, "bundle returned");
        },
        "failed to configure USART2 on PA2");
}

TEST_F(HardwareTest, SerialRejectedNeverTouchesLed)
{
    EXPECT_CALL(driver_, uart_tx_init(_, _, _)).WillRepeatedly(Return(-EIO));
    EXPECT_EXIT(
        {
            ON_CALL(driver_, gpio_output_init(_, _, _))
                .WillByDefault(::testing::InvokeWithoutArgs(
                    []() { _exit(3); }));
            create_hardware();
        },
        ::testing::KilledBySignal(SIGABRT), "serial channel initialization");
}

} // namespace blinky
