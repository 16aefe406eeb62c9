#include "utils/test_main.hxx"

#include "blinky_config.h"

OVERRIDE_CONST(led_blink_interval_msec, 250);

TEST(ConstantsOverrideTest, BinaryOverridesDefault)
{
    EXPECT_EQ(250, config_led_blink_interval_msec());
}
