#include "utils/test_main.hxx"

#include "board/board_test_helper.hxx"

using ::testing::_;
using ::testing::Eq;

namespace blinky
{

class OutputPinTest : public HardwareTestBase
{
protected:
    OutputPinTest()
        : hw_(create_hardware())
    {
    }

    Hardware hw_;
};

TEST_F(OutputPinTest, SetClr)
{
    EXPECT_CALL(driver_, gpio_write(Eq(Hardware::LED_PIN), Gpio::SET));
    hw_.led.set();
    EXPECT_TRUE(hw_.led.is_set());
    EXPECT_EQ(Gpio::SET, pinLevel_);

    EXPECT_CALL(driver_, gpio_write(Eq(Hardware::LED_PIN), Gpio::CLR));
    hw_.led.clr();
    EXPECT_TRUE(hw_.led.is_clr());
}

TEST_F(OutputPinTest, WriteBoolAndValue)
{
    hw_.led.write(true);
    EXPECT_EQ(Gpio::SET, hw_.led.read());
    hw_.led.write(false);
    EXPECT_EQ(Gpio::CLR, hw_.led.read());
    hw_.led.write(Gpio::VHIGH);
    EXPECT_EQ(Gpio::SET, hw_.led.read());
    hw_.led.write(Gpio::VLOW);
    EXPECT_EQ(Gpio::CLR, hw_.led.read());
}

TEST_F(OutputPinTest, Toggle)
{
    hw_.led.toggle();
    EXPECT_TRUE(hw_.led.is_set());
    hw_.led.toggle();
    EXPECT_TRUE(hw_.led.is_clr());
}

TEST_F(OutputPinTest, UsableThroughGpioInterface)
{
    const Gpio *gpio = &hw_.led;
    gpio->set();
    EXPECT_EQ(Gpio::SET, pinLevel_);
    gpio->write(false);
    EXPECT_EQ(Gpio::CLR, pinLevel_);
    EXPECT_EQ(Gpio::DOUTPUT, gpio->direction());
    gpio->set_direction(Gpio::DOUTPUT);
}

TEST_F(OutputPinTest, CannotBecomeInput)
{
    EXPECT_DEATH(hw_.led.set_direction(Gpio::DINPUT), "");
}

TEST_F(OutputPinTest, MovedFromDies)
{
    OutputPin other(std::move(hw_.led));
    other.set();
    EXPECT_TRUE(other.is_set());
    EXPECT_DEATH(hw_.led.set(), "");
}

} // namespace blinky
