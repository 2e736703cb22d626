#pragma once

#include <bandwidthpp/parse_error.hpp>
#include <bandwidthpp/unit_table.hpp>

#include <boost/leaf.hpp>

#include <string_view>
#include <vector>

namespace HumanBandwidth
{
    /**
     * Splits text like "9Tbps 420Gbps" into (magnitude, unit) tokens. A unit is the longest run of ASCII letters
     * and '/' after the number and must be a spelling of the given unit system.
     *
     * Fails with a ParseError.
     */
    boost::leaf::result<std::vector<Token>>
    tokenize(std::string_view text, UnitSystem system = UnitSystem::Decimal);
}
