#include "utils/test_main.hxx"

#include "blinky_config.h"
#include "drivers/st/hal_delay.hxx"

namespace blinky
{

// HAL_Delay(n) busy-waits n + 1 ticks.
static uint32_t ticks_waited(uint32_t usec)
{
    return usec_to_hal_delay(usec) + 1;
}

TEST(HalDelayTest, BlinkHalfPeriodIsExact)
{
    EXPECT_EQ(500u, ticks_waited(config_led_blink_interval_msec() * 1000));
    EXPECT_EQ(499u, usec_to_hal_delay(500000));
}

TEST(HalDelayTest, WholeMilliseconds)
{
    EXPECT_EQ(0u, usec_to_hal_delay(1000));
    EXPECT_EQ(1u, ticks_waited(1000));
    EXPECT_EQ(10u, ticks_waited(10000));
}

TEST(HalDelayTest, RoundsUp)
{
    EXPECT_EQ(1u, ticks_waited(1));
    EXPECT_EQ(1u, ticks_waited(999));
    EXPECT_EQ(2u, ticks_waited(1001));
    EXPECT_EQ(501u, ticks_waited(500001));
}

} // namespace blinky
