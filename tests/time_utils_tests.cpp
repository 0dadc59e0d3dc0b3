#include <limits>
#include <regex>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "utils/time_utils.hpp"

namespace {

TEST(TimeUtilsTests, RoundsFractionalSecondsUp) {
    EXPECT_EQ(TimeUtils::seconds_to_milliseconds_ceil(0.0), 0);
    EXPECT_EQ(TimeUtils::seconds_to_milliseconds_ceil(0.0001), 1);
    EXPECT_EQ(TimeUtils::seconds_to_milliseconds_ceil(1.5), 1500);
    EXPECT_EQ(TimeUtils::seconds_to_milliseconds_ceil(0.5005), 501);
}

TEST(TimeUtilsTests, RejectsDurationsThatDoNotFit) {
    EXPECT_THROW(TimeUtils::seconds_to_milliseconds_ceil(1e19), std::out_of_range);
    EXPECT_THROW(TimeUtils::seconds_to_milliseconds_ceil(-1.0), std::out_of_range);
    EXPECT_THROW(TimeUtils::seconds_to_milliseconds_ceil(std::numeric_limits<double>::infinity()), std::out_of_range);
    EXPECT_THROW(TimeUtils::seconds_to_milliseconds_ceil(std::numeric_limits<double>::quiet_NaN()), std::out_of_range);
}

TEST(TimeUtilsTests, FormatsMillisecondTimestamp) {
    std::string formatted = TimeUtils::format_time_with_milliseconds(std::chrono::system_clock::now());
    EXPECT_TRUE(std::regex_match(formatted, std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3})"))) << formatted;
}

} // namespace
