#include <bandwidthpp/json.hpp>
#include <bandwidthpp/format.hpp>
#include <bandwidthpp/parse.hpp>
#include <bandwidthpp/printable_string.hpp>

#include <spdlog/spdlog.h>

#include <utility>

using namespace std::string_literals;

namespace HumanBandwidth
{
    namespace
    {
        template <typename ParseFunction>
        Bandwidth decodeString(json const& j, ParseFunction&& parse)
        {
            const auto text = j.get<std::string>();
            try
            {
                return parse(text);
            }
            catch (BandwidthDecodeError const& exc)
            {
                spdlog::debug(
                    "Rejected bandwidth field '{}' ({}): {}",
                    makePrintableString(text),
                    toString(exc.error().kind),
                    exc.error().message());
                throw BandwidthJsonError{exc.error(), exc.what()};
            }
        }
    }
    //#####################################################################################################################
    BandwidthJsonError::BandwidthJsonError(ParseError error, std::string const& message)
        : json::exception{Id, ("[json.exception.bandwidth_error."s + std::to_string(Id) + "] " + message).c_str()}
        , error_{std::move(error)}
    {}
    //---------------------------------------------------------------------------------------------------------------------
    ParseError const& BandwidthJsonError::error() const
    {
        return error_;
    }
    //#####################################################################################################################
    void to_json(json& j, Bandwidth const& value)
    {
        j = formatBandwidth(value);
    }
    //---------------------------------------------------------------------------------------------------------------------
    void from_json(json const& j, Bandwidth& value)
    {
        value = decodeString(j, parseBandwidthOrThrow);
    }
    //---------------------------------------------------------------------------------------------------------------------
    void to_json(json& j, BinaryBandwidth const& value)
    {
        j = formatBinaryBandwidth(value.value);
    }
    //---------------------------------------------------------------------------------------------------------------------
    void from_json(json const& j, BinaryBandwidth& value)
    {
        value.value = decodeString(j, parseBinaryBandwidthOrThrow);
    }
    //#####################################################################################################################
}
