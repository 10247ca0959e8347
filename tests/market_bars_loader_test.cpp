// market_bars_loader_test.cpp - historical bar CSV parsing

#include <gtest/gtest.h>

#include "test_file_helpers.hpp"
#include "trader/market_data/market_bars_loader.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace RegimeTrader::Core;

class MarketBarsLoaderTest : public RegimeTrader::Testing::TemporaryDirectoryTest {};

TEST_F(MarketBarsLoaderTest, LoadsIsoAndEpochTimestamps) {
    std::string bars_path = write_file("bars.csv",
        "timestamp,open,high,low,close,volume\n"
        "2024-01-02T09:30:00Z,100.0,101.0,99.5,100.5,1200\n"
        "# halted\n"
        "\n"
        "2024-01-02 09:31:00,100.5,100.9,100.1,100.2,800\n"
        "1704187920,100.2,100.4,99.9,100.0,650\n");

    MarketBarsLoader loader(bars_path);
    std::vector<Bar> bars = loader.load_bars();

    ASSERT_EQ(bars.size(), 3u);
    EXPECT_EQ(bars[0].timestamp, 1704187800);
    EXPECT_EQ(bars[1].timestamp, 1704187860);
    EXPECT_EQ(bars[2].timestamp, 1704187920);
    EXPECT_DOUBLE_EQ(bars[0].high_price, 101.0);
    EXPECT_DOUBLE_EQ(bars[1].close_price, 100.2);
    EXPECT_DOUBLE_EQ(bars[2].volume, 650.0);
}

TEST_F(MarketBarsLoaderTest, HeaderIsOptional) {
    std::string bars_path = write_file("bars.csv", "1704187800,10,11,9,10.5,1\n1704187860,10.5,11,10,10.8,1\n");
    EXPECT_EQ(MarketBarsLoader(bars_path).load_bars().size(), 2u);
}

TEST_F(MarketBarsLoaderTest, MissingFileThrows) {
    MarketBarsLoader loader((scratch_directory / "absent.csv").string());
    EXPECT_THROW(loader.load_bars(), std::runtime_error);
}

TEST_F(MarketBarsLoaderTest, OutOfOrderTimestampsThrow) {
    std::string bars_path = write_file("bars.csv", "1704187860,10,11,9,10.5,1\n1704187800,10.5,11,10,10.8,1\n");
    EXPECT_THROW(MarketBarsLoader(bars_path).load_bars(), std::runtime_error);
}

TEST(MarketBarsLoaderParseTest, RejectsMalformedRows) {
    EXPECT_THROW(MarketBarsLoader::parse_bar_line("1704187800,10,11,9,10.5", 2), std::runtime_error);
    EXPECT_THROW(MarketBarsLoader::parse_bar_line("1704187800,10,11,9,abc,1", 2), std::runtime_error);
    EXPECT_THROW(MarketBarsLoader::parse_bar_line("yesterday,10,11,9,10.5,1", 2), std::runtime_error);
    EXPECT_THROW(MarketBarsLoader::parse_bar_line("1704187800,10,11,9,-1,1", 2), std::runtime_error);
    EXPECT_THROW(MarketBarsLoader::parse_bar_line("1704187800,10,9,11,10,1", 2), std::runtime_error);
}

TEST(MarketBarsLoaderParseTest, ErrorNamesLine) {
    try {
        MarketBarsLoader::parse_bar_line("1704187800,10,11,9", 17);
        FAIL() << "expected a parse error";
    } catch (const std::runtime_error& parse_error) {
        EXPECT_NE(std::string(parse_error.what()).find("Line 17"), std::string::npos);
    }
}

TEST(MarketBarsLoaderParseTest, DetectsHeaderRow) {
    EXPECT_TRUE(MarketBarsLoader::is_header_line("Timestamp,Open,High,Low,Close,Volume"));
    EXPECT_FALSE(MarketBarsLoader::is_header_line("1704187800,10,11,9,10.5,1"));
}
