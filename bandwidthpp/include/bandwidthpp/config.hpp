#pragma once

#include <bandwidthpp/json.hpp>
#include <bandwidthpp/unit_table.hpp>

#include <filesystem>

namespace HumanBandwidth
{
    enum class FormatStyle
    {
        Integer,
        Decimal
    };

    NLOHMANN_JSON_SERIALIZE_ENUM(FormatStyle, {{FormatStyle::Integer, "integer"}, {FormatStyle::Decimal, "decimal"}})
    NLOHMANN_JSON_SERIALIZE_ENUM(UnitSystem, {{UnitSystem::Decimal, "decimal"}, {UnitSystem::Binary, "binary"}})

    struct FormatOptions
    {
        FormatStyle style = FormatStyle::Integer;
        UnitSystem units = UnitSystem::Decimal;

        bool operator==(FormatOptions const&) const = default;
    };

    void to_json(json& j, FormatOptions const& options);

    /**
     * Absent keys keep their defaults.
     *
     * @throws std::invalid_argument for a value that names no style or unit system.
     */
    void from_json(json const& j, FormatOptions& options);

    FormatOptions loadFormatOptions(std::filesystem::path const& path);

    void saveFormatOptions(std::filesystem::path const& path, FormatOptions const& options);
}
