#include "raw_pulse_codec.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <stdexcept>

TEST(RawPulseCodec, DecodesToSingleRawMatch)
{
    RawPulseCodec codec;
    auto decoded = codec.decode({300, 600, 1200, 0, 0, 0, 0, 0}, "0101");
    ASSERT_EQ(decoded.size(), 1u);
    EXPECT_EQ(decoded[0].protocol, "raw");
    EXPECT_EQ(decoded[0].values.at("pulse_lengths"), "300 600 1200");
    EXPECT_EQ(decoded[0].values.at("pulse_sequence"), "0101");
}

TEST(RawPulseCodec, EncodesPulseSequenceWithConfiguredLengths)
{
    RawPulseCodec codec({260, 2680});
    EXPECT_EQ(codec.encode("raw", {{"pulse_sequence", "0201"}}), "0201");
    EXPECT_EQ(codec.pulseLengths("raw"), (std::vector<int>{260, 2680}));
    EXPECT_THROW(codec.encode("raw", {{"pulse_sequence", "02x1"}}), std::invalid_argument);
    EXPECT_THROW(codec.encode("raw", {}), std::invalid_argument);
    EXPECT_THROW(codec.encode("switch1", {{"pulse_sequence", "01"}}), std::invalid_argument);
}

TEST(NaturalLess, OrdersEmbeddedNumbersByValue)
{
    std::vector<std::string> names = {"switch10", "switch2", "pir1", "switch1", "dimmer3", "switch02b"};
    std::sort(names.begin(), names.end(), naturalLess);
    EXPECT_EQ(names, (std::vector<std::string>{"dimmer3", "pir1", "switch1", "switch2", "switch02b", "switch10"}));
    EXPECT_FALSE(naturalLess("switch1", "switch1"));
    EXPECT_TRUE(naturalLess("switch", "switch1"));
}

TEST(FormatValues, RendersSortedKeyValuePairs)
{
    EXPECT_EQ(formatValues({}), "{}");
    EXPECT_EQ(formatValues({{"unit", "0"}, {"id", "9"}}), "{\"id\": \"9\", \"unit\": \"0\"}");
}

TEST(FormatValues, EscapesQuotesAndBackslashes)
{
    EXPECT_EQ(formatValues({{"name", "say \"hi\""}, {"path", "C:\\rf"}}),
              "{\"name\": \"say \\\"hi\\\"\", \"path\": \"C:\\\\rf\"}");
    EXPECT_EQ(formatValues({{"k\"ey", ""}}), "{\"k\\\"ey\": \"\"}");
}
