#pragma once

#include <bandwidthpp/bandwidth.hpp>
#include <bandwidthpp/parse_error.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace HumanBandwidth
{
    using json = nlohmann::json;

    /// A bandwidth string that does not parse. Carries the ParseError of the rejected value.
    class BandwidthJsonError : public json::exception
    {
      public:
        constexpr static int Id = 601;

        BandwidthJsonError(ParseError error, std::string const& message);

        ParseError const& error() const;

      private:
        ParseError error_;
    };

    /// Stored in binary units, e.g. "4MiB/s", instead of the canonical "33Mbps 554kbps 432bps".
    struct BinaryBandwidth
    {
        Bandwidth value;

        bool operator==(BinaryBandwidth const&) const = default;
    };

    void to_json(json& j, Bandwidth const& value);

    /**
     * @throws BandwidthJsonError if the string does not parse.
     * @throws nlohmann::json::type_error if the value is not a string.
     */
    void from_json(json const& j, Bandwidth& value);

    void to_json(json& j, BinaryBandwidth const& value);
    void from_json(json const& j, BinaryBandwidth& value);

    /// An absent value is null.
    template <typename T>
    struct NullableSerializer
    {
        static void to_json(json& j, std::optional<T> const& v)
        {
            if (v.has_value())
                j = *v;
            else
                j = nullptr;
        }

        static void from_json(json const& j, std::optional<T>& v)
        {
            if (j.is_null())
                v = std::nullopt;
            else
                v = j.get<T>();
        }
    };
} // namespace HumanBandwidth

namespace nlohmann
{
    template <>
    struct adl_serializer<std::optional<HumanBandwidth::Bandwidth>>
        : HumanBandwidth::NullableSerializer<HumanBandwidth::Bandwidth>
    {};

    template <>
    struct adl_serializer<std::optional<HumanBandwidth::BinaryBandwidth>>
        : HumanBandwidth::NullableSerializer<HumanBandwidth::BinaryBandwidth>
    {};
} // namespace nlohmann
