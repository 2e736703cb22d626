#include <bandwidthpp/bandwidth.hpp>
#include <bandwidthpp/format.hpp>

#include <limits>
#include <ostream>
#include <stdexcept>

namespace HumanBandwidth
{
    //#####################################################################################################################
    Bandwidth::Bandwidth(std::uint64_t gbps, std::uint32_t bps)
        : gbps_{gbps}
        , bps_{bps % BitsPerGigabit}
    {
        const std::uint64_t carry = bps / BitsPerGigabit;
        if (gbps_ > std::numeric_limits<std::uint64_t>::max() - carry)
            throw std::overflow_error("Bandwidth overflow while normalizing sub-gigabit part");
        gbps_ += carry;
    }
    //---------------------------------------------------------------------------------------------------------------------
    Bandwidth Bandwidth::max()
    {
        return Bandwidth{std::numeric_limits<std::uint64_t>::max(), BitsPerGigabit - 1};
    }
    //---------------------------------------------------------------------------------------------------------------------
    Bandwidth Bandwidth::fromBits(BitCount const& bits)
    {
        if (bits > max().totalBits())
            throw std::overflow_error("Bit count exceeds the largest representable bandwidth");

        return Bandwidth{
            BitCount{bits / BitsPerGigabit}.convert_to<std::uint64_t>(),
            BitCount{bits % BitsPerGigabit}.convert_to<std::uint32_t>()};
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::uint64_t Bandwidth::gbps() const
    {
        return gbps_;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::uint32_t Bandwidth::subGbpsBps() const
    {
        return bps_;
    }
    //---------------------------------------------------------------------------------------------------------------------
    BitCount Bandwidth::totalBits() const
    {
        BitCount total{gbps_};
        total *= BitsPerGigabit;
        total += bps_;
        return total;
    }
    //---------------------------------------------------------------------------------------------------------------------
    bool Bandwidth::isZero() const
    {
        return gbps_ == 0 && bps_ == 0;
    }
    //#####################################################################################################################
    std::ostream& operator<<(std::ostream& os, Bandwidth const& bandwidth)
    {
        return os << formatBandwidth(bandwidth);
    }
    //#####################################################################################################################
}
