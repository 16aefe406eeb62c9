#include "utils/test_main.hxx"

#include <stdlib.h>

#include "board/board_test_helper.hxx"

namespace blinky
{

// Peripherals::take() may run only once per process, so every test that
// calls it does so inside a death test child.

TEST(PeripheralsTest, TakeOnceSucceeds)
{
    MockPeripheralDriver driver;
    EXPECT_EXIT(
        {
            Peripherals p = Peripherals::take(&driver);
            ::testing::Mock::AllowLeak(&driver);
            exit(p.valid() ? 0 : 1);
        },
        ::testing::ExitedWithCode(0), "");
}

TEST(PeripheralsTest, TakeTwiceDies)
{
    MockPeripheralDriver driver;
    EXPECT_DEATH(
        {
            Peripherals::take(&driver);
            Peripherals::take(&driver);
        },
        "access token requested twice");
}

TEST(PeripheralsTest, TakeNullDies)
{
    EXPECT_DEATH(Peripherals::take(nullptr), "");
}

TEST(PeripheralsTest, StealIsRepeatable)
{
    MockPeripheralDriver driver;
    Peripherals p1 = Peripherals::steal(&driver);
    Peripherals p2 = Peripherals::steal(&driver);
    EXPECT_TRUE(p1.valid());
    EXPECT_TRUE(p2.valid());
}

TEST(PeripheralsTest, MoveEmptiesSource)
{
    MockPeripheralDriver driver;
    Peripherals p1 = Peripherals::steal(&driver);
    Peripherals p2(std::move(p1));
    EXPECT_FALSE(p1.valid());
    EXPECT_TRUE(p2.valid());
    Peripherals p3(std::move(p1));
    EXPECT_FALSE(p3.valid());
}

class TakeHardwareTest : public HardwareTestBase
{
};

TEST_F(TakeHardwareTest, FullBootOnce)
{
    EXPECT_EXIT(
        {
            Hardware hw = Hardware::init(Peripherals::take(&driver_));
            // The fixture is not destroyed in the exiting child.
            ::testing::Mock::AllowLeak(&driver_);
            exit(hw.led.is_clr() ? 0 : 1);
        },
        ::testing::ExitedWithCode(0), "");
}

} // namespace blinky
