#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace HumanBandwidth
{
    enum class UnitSystem
    {
        /// bps, kbps, Mbps, Gbps, Tbps
        Decimal,
        /// B/s, kiB/s, MiB/s, GiB/s, TiB/s
        Binary
    };

    struct Unit
    {
        std::string_view symbol;
        std::uint64_t bitsPerSecond;
        std::span<std::string_view const> aliases;

        bool isSpelledAs(std::string_view spelling) const;
    };

    struct Token
    {
        std::uint64_t magnitude;
        Unit const* unit;
        std::size_t offset = 0;
    };

    std::span<Unit const> unitTable(UnitSystem system = UnitSystem::Decimal);
    std::span<Unit const> binaryUnitTable();

    Unit const& smallestUnit(UnitSystem system = UnitSystem::Decimal);

    /// Case-sensitive. nullptr if no unit of the system is spelled like that.
    Unit const* findUnit(std::string_view spelling, UnitSystem system = UnitSystem::Decimal);

    std::string supportedUnits(UnitSystem system = UnitSystem::Decimal);
}
