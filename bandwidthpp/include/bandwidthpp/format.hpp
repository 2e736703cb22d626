#pragma once

#include <bandwidthpp/bandwidth.hpp>
#include <bandwidthpp/unit_table.hpp>

#include <string>
#include <vector>

namespace HumanBandwidth
{
    struct FormatOptions;

    /**
     * Greedy decomposition into the fewest tokens, largest unit first. Zero yields a single token of the smallest
     * unit. Binary units round the bit count to whole bytes.
     */
    std::vector<Token> decomposeBandwidth(Bandwidth const& value, UnitSystem system = UnitSystem::Decimal);

    std::string formatBandwidth(Bandwidth const& value);
    std::string formatBinaryBandwidth(Bandwidth const& value);

    /**
     * Largest unit with the rest as a decimal fraction, e.g. "150.024kbps" or "4.5GiB/s".
     * parseBandwidth does not accept fractions.
     */
    std::string formatBandwidthDecimal(Bandwidth const& value);
    std::string formatBinaryBandwidthDecimal(Bandwidth const& value);

    std::string formatBandwidth(Bandwidth const& value, FormatOptions const& options);
}
