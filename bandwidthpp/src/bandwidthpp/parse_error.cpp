#include <bandwidthpp/parse_error.hpp>
#include <bandwidthpp/printable_string.hpp>
#include <bandwidthpp/unit_table.hpp>

#include <utility>

using namespace std::string_literals;

namespace HumanBandwidth
{
    //#####################################################################################################################
    ParseErrorCategory ParseError::category() const
    {
        if (kind == ParseErrc::NumberOverflow)
            return ParseErrorCategory::Overflow;
        return ParseErrorCategory::InvalidFormat;
    }
    //---------------------------------------------------------------------------------------------------------------------
    std::string ParseError::message() const
    {
        switch (kind)
        {
            case ParseErrc::Empty:
                return "value was empty";
            case ParseErrc::InvalidCharacter:
                return "invalid character '"s + makePrintableString(text) + "' at " + std::to_string(offset);
            case ParseErrc::NumberExpected:
                return "expected number at "s + std::to_string(offset);
            case ParseErrc::UnknownUnit:
            {
                if (text.empty())
                {
                    const auto number = std::to_string(value);
                    return "bandwidth unit needed, for example "s + number + "Mbps or " + number + "bps";
                }
                return "unknown bandwidth unit \""s + text + "\", supported units: " + supportedUnits();
            }
            case ParseErrc::UnknownBinaryUnit:
            {
                if (text.empty())
                {
                    const auto number = std::to_string(value);
                    return "binary bandwidth unit needed, for example "s + number + "MiB/s or " + number + "B/s";
                }
                return "unknown binary bandwidth unit \""s + text +
                    "\", supported units: " + supportedUnits(UnitSystem::Binary);
            }
            case ParseErrc::NumberOverflow:
                return "number is too large";
        }
        return "unknown parse error";
    }
    //---------------------------------------------------------------------------------------------------------------------
    ParseError ParseError::empty(std::size_t offset)
    {
        return ParseError{.kind = ParseErrc::Empty, .offset = offset};
    }
    //---------------------------------------------------------------------------------------------------------------------
    ParseError ParseError::invalidCharacter(std::size_t offset, char character)
    {
        return ParseError{.kind = ParseErrc::InvalidCharacter, .offset = offset, .text = std::string(1, character)};
    }
    //---------------------------------------------------------------------------------------------------------------------
    ParseError ParseError::numberExpected(std::size_t offset)
    {
        return ParseError{.kind = ParseErrc::NumberExpected, .offset = offset};
    }
    //---------------------------------------------------------------------------------------------------------------------
    ParseError ParseError::unknownUnit(std::size_t start, std::size_t end, std::string unit, std::uint64_t value)
    {
        return ParseError{
            .kind = ParseErrc::UnknownUnit, .offset = start, .end = end, .text = std::move(unit), .value = value};
    }
    //---------------------------------------------------------------------------------------------------------------------
    ParseError
    ParseError::unknownBinaryUnit(std::size_t start, std::size_t end, std::string unit, std::uint64_t value)
    {
        return ParseError{
            .kind = ParseErrc::UnknownBinaryUnit,
            .offset = start,
            .end = end,
            .text = std::move(unit),
            .value = value};
    }
    //---------------------------------------------------------------------------------------------------------------------
    ParseError ParseError::numberOverflow(std::size_t offset)
    {
        return ParseError{.kind = ParseErrc::NumberOverflow, .offset = offset};
    }
    //#####################################################################################################################
    char const* toString(ParseErrc kind)
    {
        switch (kind)
        {
            case ParseErrc::Empty:
                return "Empty";
            case ParseErrc::InvalidCharacter:
                return "InvalidCharacter";
            case ParseErrc::NumberExpected:
                return "NumberExpected";
            case ParseErrc::UnknownUnit:
                return "UnknownUnit";
            case ParseErrc::UnknownBinaryUnit:
                return "UnknownBinaryUnit";
            case ParseErrc::NumberOverflow:
                return "NumberOverflow";
        }
        return "Unknown";
    }
    //#####################################################################################################################
}
