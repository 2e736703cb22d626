#include <gtest/gtest.h>
#include <bandwidthpp/accumulator.hpp>
#include <bandwidthpp/parse.hpp>

#include "parse_failure.hpp"

#include <string_view>
#include <vector>

using namespace HumanBandwidth;

namespace {

std::optional<ParseError> parseFailure(std::string_view text) {
    return parseFailureOf([text]() { return parseBandwidth(text); });
}

} // namespace

// ==============================================================================
// Accumulation
// ==============================================================================

TEST(AccumulatorTest, EmptyTokenListIsZero) {
    const auto result = accumulate({});
    ASSERT_TRUE(static_cast<bool>(result));
    EXPECT_TRUE(result.value().isZero());
}

TEST(AccumulatorTest, SumsAcrossTheGigabitBoundary) {
    const std::vector<Token> tokens{
        {.magnitude = 999, .unit = findUnit("Mbps")},
        {.magnitude = 1'500, .unit = findUnit("Mbps")},
        {.magnitude = 7, .unit = findUnit("bps")},
    };
    const auto result = accumulate(tokens);
    ASSERT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), Bandwidth(2, 499'000'007));
}

TEST(AccumulatorTest, ReachesMaximumExactly) {
    const std::vector<Token> tokens{
        {.magnitude = 18446744073709551615ull, .unit = findUnit("Gbps")},
        {.magnitude = 999'999'999, .unit = findUnit("bps")},
    };
    const auto result = accumulate(tokens);
    ASSERT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), Bandwidth::max());
}

TEST(AccumulatorTest, OverflowPastMaximum) {
    const std::vector<Token> tokens{
        {.magnitude = 18446744073709551615ull, .unit = findUnit("Gbps"), .offset = 0},
        {.magnitude = 999'999'999, .unit = findUnit("bps"), .offset = 25},
        {.magnitude = 1, .unit = findUnit("bps"), .offset = 39},
    };
    const auto error = parseFailureOf([&tokens]() { return accumulate(tokens); });
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ParseErrc::NumberOverflow);
    EXPECT_EQ(error->offset, 39u);
}

// ==============================================================================
// Parsing
// ==============================================================================

TEST(ParseTest, CanonicalExamples) {
    EXPECT_EQ(parseBandwidthOrThrow("9Tbps 420Gbps"), Bandwidth(9'420, 0));
    EXPECT_EQ(parseBandwidthOrThrow("32Mbps"), Bandwidth(0, 32'000'000));
}

TEST(ParseTest, Zero) {
    EXPECT_EQ(parseBandwidthOrThrow("0bps"), Bandwidth(0, 0));
    EXPECT_EQ(parseBandwidthOrThrow("0Tbps 0Gbps"), Bandwidth(0, 0));
}

TEST(ParseTest, TerabitIsNotStrayLetterPlusBps) {
    EXPECT_EQ(parseBandwidthOrThrow("1Tbps"), Bandwidth(1'000, 0));
}

TEST(ParseTest, OrderInsensitive) {
    EXPECT_EQ(parseBandwidthOrThrow("420Gbps 9Tbps"), parseBandwidthOrThrow("9Tbps 420Gbps"));
    EXPECT_EQ(parseBandwidthOrThrow("24bps 12kbps 36Mbps"), Bandwidth(0, 36'012'024));
}

TEST(ParseTest, RepeatedUnitsAreSummed) {
    EXPECT_EQ(parseBandwidthOrThrow("1Gbps 2Gbps"), Bandwidth(3, 0));
    EXPECT_EQ(parseBandwidthOrThrow("10Gbps 11gbps 12Gbit/s"), Bandwidth(33, 0));
    EXPECT_EQ(parseBandwidthOrThrow("13Tbps 14tbps 15Tbit/s"), Bandwidth(42'000, 0));
}

TEST(ParseTest, EveryAlias) {
    EXPECT_EQ(parseBandwidthOrThrow("1bps"), Bandwidth(0, 1));
    EXPECT_EQ(parseBandwidthOrThrow("2bit/s"), Bandwidth(0, 2));
    EXPECT_EQ(parseBandwidthOrThrow("15b/s"), Bandwidth(0, 15));
    EXPECT_EQ(parseBandwidthOrThrow("51kbps"), Bandwidth(0, 51'000));
    EXPECT_EQ(parseBandwidthOrThrow("79Kbps"), Bandwidth(0, 79'000));
    EXPECT_EQ(parseBandwidthOrThrow("81kbit/s"), Bandwidth(0, 81'000));
    EXPECT_EQ(parseBandwidthOrThrow("100Kbit/s"), Bandwidth(0, 100'000));
    EXPECT_EQ(parseBandwidthOrThrow("150kb/s"), Bandwidth(0, 150'000));
    EXPECT_EQ(parseBandwidthOrThrow("410Kb/s"), Bandwidth(0, 410'000));
    EXPECT_EQ(parseBandwidthOrThrow("12Mbps"), Bandwidth(0, 12'000'000));
    EXPECT_EQ(parseBandwidthOrThrow("16mbps"), Bandwidth(0, 16'000'000));
    EXPECT_EQ(parseBandwidthOrThrow("24Mbit/s"), Bandwidth(0, 24'000'000));
    EXPECT_EQ(parseBandwidthOrThrow("36mbit/s"), Bandwidth(0, 36'000'000));
    EXPECT_EQ(parseBandwidthOrThrow("48Mb/s"), Bandwidth(0, 48'000'000));
    EXPECT_EQ(parseBandwidthOrThrow("96mb/s"), Bandwidth(0, 96'000'000));
    EXPECT_EQ(parseBandwidthOrThrow("2Gbps"), Bandwidth(2, 0));
    EXPECT_EQ(parseBandwidthOrThrow("4gbps"), Bandwidth(4, 0));
    EXPECT_EQ(parseBandwidthOrThrow("6Gbit/s"), Bandwidth(6, 0));
    EXPECT_EQ(parseBandwidthOrThrow("8gbit/s"), Bandwidth(8, 0));
    EXPECT_EQ(parseBandwidthOrThrow("16Gb/s"), Bandwidth(16, 0));
    EXPECT_EQ(parseBandwidthOrThrow("40gb/s"), Bandwidth(40, 0));
    EXPECT_EQ(parseBandwidthOrThrow("2tbps"), Bandwidth(2'000, 0));
    EXPECT_EQ(parseBandwidthOrThrow("4Tbit/s"), Bandwidth(4'000, 0));
    EXPECT_EQ(parseBandwidthOrThrow("8tbit/s"), Bandwidth(8'000, 0));
    EXPECT_EQ(parseBandwidthOrThrow("16Tb/s"), Bandwidth(16'000, 0));
    EXPECT_EQ(parseBandwidthOrThrow("32tb/s"), Bandwidth(32'000, 0));
}

TEST(ParseTest, LargeButRepresentable) {
    // Wider than 64 bits in total, still a valid bandwidth.
    EXPECT_EQ(parseBandwidthOrThrow("100000000000000Mbps"), Bandwidth(100'000'000'000, 0));
    EXPECT_EQ(parseBandwidthOrThrow("18446744073709551615Gbps 999999999bps"), Bandwidth::max());
    EXPECT_EQ(parseBandwidthOrThrow("18446744073709551615bps"), Bandwidth(18'446'744'073, 709'551'615));
}

TEST(ParseTest, MalformedInputIsInvalidFormat) {
    for (auto text : {"", "Gbps5", "5Xbps", "123", "1.5Gbps", "2 Mbps kbps"}) {
        const auto error = parseFailure(text);
        ASSERT_TRUE(error.has_value()) << text;
        EXPECT_EQ(error->category(), ParseErrorCategory::InvalidFormat) << text;
    }
}

TEST(ParseTest, OverflowingInput) {
    for (auto text :
         {"100000000000000000000bps",
          "18446744073709551615Tbps",
          "10000000000000000000Tbps",
          "100000000000000000000Gbps",
          "18446744073709551615Gbps 1Gbps"}) {
        const auto error = parseFailure(text);
        ASSERT_TRUE(error.has_value()) << text;
        EXPECT_EQ(error->kind, ParseErrc::NumberOverflow) << text;
        EXPECT_EQ(error->category(), ParseErrorCategory::Overflow) << text;
    }
}

// ==============================================================================
// Error reporting
// ==============================================================================

TEST(ParseErrorTest, Messages) {
    EXPECT_EQ(parseFailure("123")->message(), "bandwidth unit needed, for example 123Mbps or 123bps");
    EXPECT_EQ(parseFailure("10 Gbps 1")->message(), "bandwidth unit needed, for example 1Mbps or 1bps");
    EXPECT_EQ(
        parseFailure("10 byte/s")->message(),
        "unknown bandwidth unit \"byte/s\", supported units: bps, kbps, Mbps, Gbps, Tbps");
    EXPECT_EQ(parseFailure("")->message(), "value was empty");
    EXPECT_EQ(parseFailure("Gbps")->message(), "expected number at 0");
    EXPECT_EQ(parseFailure("1,5Gbps")->message(), "invalid character ',' at 1");
    EXPECT_EQ(parseFailure("10000000000000000000Tbps")->message(), "number is too large");
}

TEST(ParseErrorTest, NonPrintableCharacterIsEscaped) {
    EXPECT_EQ(parseFailure("5\xC2\xB5"
                           "bps")
                  ->message(),
              "invalid character '\\xC2' at 1");
}

TEST(ParseErrorTest, ThrowingVariantKeepsTheParseError) {
    try {
        static_cast<void>(parseBandwidthOrThrow("5Xbps"));
        FAIL() << "expected BandwidthDecodeError";
    } catch (BandwidthDecodeError const& exc) {
        EXPECT_EQ(exc.error().kind, ParseErrc::UnknownUnit);
        EXPECT_EQ(exc.error().text, "Xbps");
        EXPECT_STREQ(
            exc.what(),
            "Cannot parse bandwidth '5Xbps': unknown bandwidth unit \"Xbps\", supported units: bps, kbps, Mbps, "
            "Gbps, Tbps");
    }
}

TEST(ParseErrorTest, ThrowingVariantIsInvalidArgument) {
    EXPECT_THROW(parseBandwidthOrThrow(""), std::invalid_argument);
    EXPECT_THROW(parseBandwidthOrThrow("18446744073709551615Tbps"), BandwidthDecodeError);
}
