#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace HumanBandwidth
{
    enum class ParseErrc
    {
        Empty,
        InvalidCharacter,
        NumberExpected,
        /// The letters after a number are not a known unit. An empty unit means the unit is missing.
        UnknownUnit,
        UnknownBinaryUnit,
        /// The number does not fit into 64 bits, or the sum exceeds the largest bandwidth.
        NumberOverflow
    };

    enum class ParseErrorCategory
    {
        InvalidFormat,
        Overflow
    };

    struct ParseError
    {
        ParseErrc kind;
        std::size_t offset = 0;
        /// Exclusive end of an unknown unit.
        std::size_t end = 0;
        std::string text = {};
        /// The number that preceded an unknown unit.
        std::uint64_t value = 0;

        ParseErrorCategory category() const;
        std::string message() const;

        static ParseError empty(std::size_t offset);
        static ParseError invalidCharacter(std::size_t offset, char character);
        static ParseError numberExpected(std::size_t offset);
        static ParseError unknownUnit(std::size_t start, std::size_t end, std::string unit, std::uint64_t value);
        static ParseError
        unknownBinaryUnit(std::size_t start, std::size_t end, std::string unit, std::uint64_t value);
        static ParseError numberOverflow(std::size_t offset);
    };

    char const* toString(ParseErrc kind);
}
