#include <bandwidthpp/unit_table.hpp>

#include <algorithm>
#include <array>

namespace HumanBandwidth
{
    namespace
    {
        constexpr std::string_view teraAliases[] = {"tbps", "Tbit/s", "tbit/s", "Tb/s", "tb/s"};
        constexpr std::string_view gigaAliases[] = {"gbps", "Gbit/s", "gbit/s", "Gb/s", "gb/s"};
        constexpr std::string_view megaAliases[] = {"mbps", "Mbit/s", "mbit/s", "Mb/s", "mb/s"};
        constexpr std::string_view kiloAliases[] = {"Kbps", "kbit/s", "Kbit/s", "kb/s", "Kb/s"};
        constexpr std::string_view baseAliases[] = {"bit/s", "b/s"};

        constexpr std::array<Unit, 5> decimalUnits{{
            {.symbol = "Tbps", .bitsPerSecond = 1'000'000'000'000, .aliases = teraAliases},
            {.symbol = "Gbps", .bitsPerSecond = 1'000'000'000, .aliases = gigaAliases},
            {.symbol = "Mbps", .bitsPerSecond = 1'000'000, .aliases = megaAliases},
            {.symbol = "kbps", .bitsPerSecond = 1'000, .aliases = kiloAliases},
            {.symbol = "bps", .bitsPerSecond = 1, .aliases = baseAliases},
        }};

        constexpr std::string_view tebiAliases[] =
            {"TiBps", "tiBps", "TiByte/s", "tiByte/s", "tiB/s", "Tiops", "tiops", "Tio/s", "tio/s"};
        constexpr std::string_view gibiAliases[] =
            {"GiBps", "giBps", "GiByte/s", "giByte/s", "giB/s", "Giops", "giops", "Gio/s", "gio/s"};
        constexpr std::string_view mebiAliases[] =
            {"MiBps", "miBps", "MiByte/s", "miByte/s", "miB/s", "Miops", "miops", "Mio/s", "mio/s"};
        constexpr std::string_view kibiAliases[] =
            {"kiBps", "KiBps", "kiByte/s", "KiByte/s", "KiB/s", "kiops", "Kiops", "kio/s", "Kio/s"};
        constexpr std::string_view byteAliases[] = {"Bps", "Byte/s", "ops", "o/s"};

        constexpr std::uint64_t bitsPerByte = 8;

        constexpr std::array<Unit, 5> binaryUnits{{
            {.symbol = "TiB/s", .bitsPerSecond = bitsPerByte << 40, .aliases = tebiAliases},
            {.symbol = "GiB/s", .bitsPerSecond = bitsPerByte << 30, .aliases = gibiAliases},
            {.symbol = "MiB/s", .bitsPerSecond = bitsPerByte << 20, .aliases = mebiAliases},
            {.symbol = "kiB/s", .bitsPerSecond = bitsPerByte << 10, .aliases = kibiAliases},
            {.symbol = "B/s", .bitsPerSecond = bitsPerByte, .aliases = byteAliases},
        }};

        constexpr bool strictlyDecreasing(std::array<Unit, 5> const& units)
        {
            for (std::size_t i = 1; i < units.size(); ++i)
            {
                if (units[i - 1].bitsPerSecond <= units[i].bitsPerSecond)
                    return false;
            }
            return true;
        }

        static_assert(strictlyDecreasing(decimalUnits), "unit table must be ordered by decreasing multiplier");
        static_assert(strictlyDecreasing(binaryUnits), "unit table must be ordered by decreasing multiplier");
        static_assert(decimalUnits.back().bitsPerSecond == 1, "greedy formatting needs a unit of 1 bps");
    }
    //#####################################################################################################################
    bool Unit::isSpelledAs(std::string_view spelling) const
    {
        return symbol == spelling || std::find(aliases.begin(), aliases.end(), spelling) != aliases.end();
    }
    //#####################################################################################################################
    std::span<Unit const> unitTable(UnitSystem system)
    {
        if (system == UnitSystem::Binary)
            return binaryUnits;
        return decimalUnits;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::span<Unit const> binaryUnitTable()
    {
        return binaryUnits;
    }
    //---------------------------------------------------------------------------------------------------------------------
    Unit const& smallestUnit(UnitSystem system)
    {
        return unitTable(system).back();
    }
    //---------------------------------------------------------------------------------------------------------------------
    Unit const* findUnit(std::string_view spelling, UnitSystem system)
    {
        for (auto const& unit : unitTable(system))
        {
            if (unit.isSpelledAs(spelling))
                return &unit;
        }
        return nullptr;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string supportedUnits(UnitSystem system)
    {
        const auto units = unitTable(system);
        std::string result;
        for (auto unit = units.rbegin(); unit != units.rend(); ++unit)
        {
            if (!result.empty())
                result += ", ";
            result += unit->symbol;
        }
        return result;
    }
    //#####################################################################################################################
}
