#pragma once

#include <bandwidthpp/bandwidth.hpp>
#include <bandwidthpp/parse_error.hpp>

#include <boost/leaf.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace HumanBandwidth
{
    /**
     * Parses bandwidth in free form like "2Gbps 340Mbps" or "9Tbps 420Gbps". Errors carry a ParseError.
     */
    boost::leaf::result<Bandwidth> parseBandwidth(std::string_view text);

    /**
     * Same for byte based units: "9TiB/s 420GiB/s", "4MiBps". Errors carry a ParseError.
     */
    boost::leaf::result<Bandwidth> parseBinaryBandwidth(std::string_view text);

    class BandwidthDecodeError : public std::invalid_argument
    {
      public:
        BandwidthDecodeError(std::string_view text, ParseError error);

        ParseError const& error() const;

      private:
        ParseError error_;
    };

    Bandwidth parseBandwidthOrThrow(std::string_view text);
    Bandwidth parseBinaryBandwidthOrThrow(std::string_view text);
}
