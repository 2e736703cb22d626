#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <compare>
#include <cstdint>
#include <iosfwd>

namespace HumanBandwidth
{
    using BitCount = boost::multiprecision::uint128_t;

    constexpr static std::uint32_t BitsPerGigabit = 1'000'000'000;

    class Bandwidth
    {
      public:
        constexpr Bandwidth() = default;

        /**
         * Carries bps values >= BitsPerGigabit into the gigabit part.
         *
         * @throws std::overflow_error if the carry does not fit.
         */
        Bandwidth(std::uint64_t gbps, std::uint32_t bps);

        static Bandwidth max();

        /**
         * @throws std::overflow_error if bits exceeds max().totalBits().
         */
        static Bandwidth fromBits(BitCount const& bits);

        std::uint64_t gbps() const;
        std::uint32_t subGbpsBps() const;
        BitCount totalBits() const;
        bool isZero() const;

        friend auto operator<=>(Bandwidth const&, Bandwidth const&) = default;

      private:
        std::uint64_t gbps_ = 0;
        std::uint32_t bps_ = 0;
    };

    std::ostream& operator<<(std::ostream& os, Bandwidth const& bandwidth);
}
