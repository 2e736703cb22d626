#pragma once

#include <bandwidthpp/bandwidth.hpp>
#include <bandwidthpp/parse_error.hpp>
#include <bandwidthpp/unit_table.hpp>

#include <boost/leaf.hpp>

#include <span>

namespace HumanBandwidth
{
    /**
     * Fails with a NumberOverflow ParseError as soon as the running sum exceeds Bandwidth::max().
     */
    boost::leaf::result<Bandwidth> accumulate(std::span<Token const> tokens);
}
