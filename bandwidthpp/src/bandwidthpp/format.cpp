#include <bandwidthpp/format.hpp>
#include <bandwidthpp/config.hpp>

#include <algorithm>
#include <iterator>

namespace HumanBandwidth
{
    namespace
    {
        std::string renderToken(Token const& token)
        {
            return std::to_string(token.magnitude) + std::string{token.unit->symbol};
        }

        std::string renderTokens(std::vector<Token> const& tokens)
        {
            std::string result;
            for (auto const& token : tokens)
            {
                if (!result.empty())
                    result.push_back(' ');
                result += renderToken(token);
            }
            return result;
        }

        /// Total in multiples of the smallest unit, rounded half up.
        BitCount totalSteps(Bandwidth const& value, UnitSystem system)
        {
            const BitCount step = smallestUnit(system).bitsPerSecond;
            return (value.totalBits() + step / 2) / step;
        }

        std::string formatDecimal(Bandwidth const& value, UnitSystem system)
        {
            const auto units = unitTable(system);
            const BitCount step = smallestUnit(system).bitsPerSecond;
            const BitCount total = totalSteps(value, system);

            const auto unit = std::find_if(units.begin(), units.end(), [&](Unit const& candidate) {
                return total >= candidate.bitsPerSecond / step;
            });
            if (unit == units.end())
                return renderToken(Token{.magnitude = 0, .unit = &smallestUnit(system)});

            // Neighbouring units are about 1000 apart, so every step down the table adds three fraction digits.
            const auto position = static_cast<std::size_t>(std::distance(unit, units.end()) - 1);
            BitCount scale = 1;
            for (std::size_t i = 0; i < position; ++i)
                scale *= 1000;

            const BitCount per = unit->bitsPerSecond / step;
            // scale <= per < 2 * scale, so the rounded fraction stays below scale.
            const BitCount whole = total / per;
            const BitCount fraction = (total % per * scale * 2 + per) / (per * 2);

            std::string result = whole.str();
            if (fraction != 0)
            {
                auto digits = fraction.str();
                result.push_back('.');
                result.append(position * 3 - digits.size(), '0');
                digits.erase(digits.find_last_not_of('0') + 1);
                result += digits;
            }
            result += unit->symbol;
            return result;
        }
    }
    //#####################################################################################################################
    std::vector<Token> decomposeBandwidth(Bandwidth const& value, UnitSystem system)
    {
        const BitCount step = smallestUnit(system).bitsPerSecond;

        std::vector<Token> tokens;
        BitCount rest = totalSteps(value, system);
        for (auto const& unit : unitTable(system))
        {
            const BitCount per = unit.bitsPerSecond / step;
            const BitCount magnitude = rest / per;
            if (magnitude == 0)
                continue;
            tokens.push_back(Token{.magnitude = magnitude.convert_to<std::uint64_t>(), .unit = &unit});
            rest -= magnitude * per;
        }

        if (tokens.empty())
            tokens.push_back(Token{.magnitude = 0, .unit = &smallestUnit(system)});
        return tokens;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string formatBandwidth(Bandwidth const& value)
    {
        return renderTokens(decomposeBandwidth(value, UnitSystem::Decimal));
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string formatBinaryBandwidth(Bandwidth const& value)
    {
        return renderTokens(decomposeBandwidth(value, UnitSystem::Binary));
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string formatBandwidthDecimal(Bandwidth const& value)
    {
        return formatDecimal(value, UnitSystem::Decimal);
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string formatBinaryBandwidthDecimal(Bandwidth const& value)
    {
        return formatDecimal(value, UnitSystem::Binary);
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string formatBandwidth(Bandwidth const& value, FormatOptions const& options)
    {
        switch (options.style)
        {
            case FormatStyle::Decimal:
                return formatDecimal(value, options.units);
            case FormatStyle::Integer:
                break;
        }
        return renderTokens(decomposeBandwidth(value, options.units));
    }
    //#####################################################################################################################
}
