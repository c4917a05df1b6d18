#include "common/status.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace sandbox;

TEST(StatusTest, EveryStatusHasParsableName) {
    for (int i = (int)status::SUCCESS; i <= (int)status::SYSTEM_ERROR; ++i) {
        status stat = (status)i;
        auto parsed = parse_status_name(get_status_name(stat));
        ASSERT_TRUE(parsed) << get_status_name(stat);
        EXPECT_TRUE(*parsed == stat);
    }
}

TEST(StatusTest, DisplayMessages) {
    EXPECT_STREQ("Time Limit Exceeded", get_display_message(status::TIME_LIMIT_EXCEEDED));
    EXPECT_STREQ("memory_limit_exceeded", get_status_name(status::MEMORY_LIMIT_EXCEEDED));
    EXPECT_FALSE(parse_status_name("accepted"));
}
