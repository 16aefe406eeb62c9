#define NDEBUG
#include <stdint.h>
#include "gtest/gtest.h"
#include "os/os.h"

#include "utils/macros.h"

// Release builds of the target keep HASSERT and DIE but drop DASSERT.

TEST(MacrosNdebugTest, HassertPasses)
{
    HASSERT(1 + 1 == 2);
}

TEST(MacrosNdebugTest, HassertFailureNamesExpression)
{
    EXPECT_DEATH({ HASSERT(sizeof(uint8_t) == 2); }, "sizeof\\(uint8_t\\) == 2");
}

TEST(MacrosNdebugTest, DassertIsCompiledOut)
{
    DASSERT(false);
}

TEST(MacrosNdebugTest, DieReportsMessage)
{
    EXPECT_DEATH(DIE("serial channel initialization failed"),
        "Crashed in file .*serial channel initialization failed");
}

TEST(MacrosNdebugTest, ArraySize)
{
    static const uint16_t brr[] = {16, 313, 0xFFFF};
    EXPECT_EQ(3u, ARRAYSIZE(brr));
}

int appl_main(int argc, char *argv[])
{
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
