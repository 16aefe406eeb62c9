#include "utils/test_main.hxx"

#include <string.h>

#include "blinky_config.h"
#include "board/messages.hxx"

namespace blinky
{
namespace messages
{

TEST(MessagesTest, LedOn)
{
    EXPECT_EQ(8u, LED_ON.size);
    EXPECT_EQ(0, memcmp("LED ON\r\n", LED_ON.data(), LED_ON.size));
    EXPECT_EQ('\r', LED_ON.text[6]);
    EXPECT_EQ('\n', LED_ON.text[7]);
}

TEST(MessagesTest, LedOff)
{
    EXPECT_EQ(9u, LED_OFF.size);
    EXPECT_EQ(0, memcmp("LED OFF\r\n", LED_OFF.data(), LED_OFF.size));
}

TEST(MessagesTest, ForState)
{
    EXPECT_EQ(LED_ON.text, for_state(true).text);
    EXPECT_EQ(LED_OFF.text, for_state(false).text);
    static_assert(for_state(true).size == 8, "LED ON is 8 bytes");
    static_assert(for_state(false).size == 9, "LED OFF is 9 bytes");
}

TEST(MessagesTest, MakeMessageDropsTerminator)
{
    constexpr Message m = make_message("x\r\n");
    EXPECT_EQ(3u, m.size);
    EXPECT_EQ(std::string("x\r\n"),
        std::string(reinterpret_cast<const char *>(m.data()), m.size));
}

} // namespace messages

TEST(ConfigTest, DefaultBlinkInterval)
{
    EXPECT_EQ(500, config_led_blink_interval_msec());
}

} // namespace blinky
