#include "sconv/core/format.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;

TEST(FormatTest, BytesBelowOneKilobyteAreExact) {
    EXPECT_EQ(sconv::format_bytes(0), "0 B");
    EXPECT_EQ(sconv::format_bytes(512), "512 B");
    EXPECT_EQ(sconv::format_bytes(1023), "1023 B");
}

TEST(FormatTest, BytesUseThreeSignificantDigits) {
    EXPECT_EQ(sconv::format_bytes(1024), "1.00 KB");
    EXPECT_EQ(sconv::format_bytes(12800), "12.5 KB");
    EXPECT_EQ(sconv::format_bytes(150ULL * 1024 * 1024), "150 MB");
    EXPECT_EQ(sconv::format_bytes(1536ULL * 1024 * 1024), "1.50 GB");
}

TEST(FormatTest, RateNeedsElapsedTime) {
    EXPECT_EQ(sconv::format_rate(1024, 0ms), "n/a");
    EXPECT_EQ(sconv::format_rate(2048, 2000ms), "1.00 KB/s");
}

TEST(FormatTest, DurationPicksTwoLargestUnits) {
    EXPECT_EQ(sconv::format_duration(45s), "45s");
    EXPECT_EQ(sconv::format_duration(192s), "3m 12s");
    EXPECT_EQ(sconv::format_duration(3840s), "1h 4m");
}
