#include <bandwidthpp/parse.hpp>
#include <bandwidthpp/accumulator.hpp>
#include <bandwidthpp/printable_string.hpp>
#include <bandwidthpp/tokenizer.hpp>

#include <utility>

using namespace std::string_literals;

namespace leaf = boost::leaf;

namespace HumanBandwidth
{
    namespace
    {
        leaf::result<Bandwidth> parseIn(std::string_view text, UnitSystem system)
        {
            BOOST_LEAF_AUTO(tokens, tokenize(text, system));
            return accumulate(tokens);
        }

        Bandwidth parseInOrThrow(std::string_view text, UnitSystem system)
        {
            return leaf::try_handle_all(
                [text, system]() -> leaf::result<Bandwidth> {
                    return parseIn(text, system);
                },
                [text](ParseError const& error) -> Bandwidth {
                    throw BandwidthDecodeError{text, error};
                },
                [text](leaf::error_info const& unmatched) -> Bandwidth {
                    throw std::runtime_error(
                        "Parsing bandwidth '"s + makePrintableString(text) +
                        "' failed without a parse error, error id: " + std::to_string(unmatched.error().value()));
                });
        }
    }
    //#####################################################################################################################
    leaf::result<Bandwidth> parseBandwidth(std::string_view text)
    {
        return parseIn(text, UnitSystem::Decimal);
    }
    //---------------------------------------------------------------------------------------------------------------------
    leaf::result<Bandwidth> parseBinaryBandwidth(std::string_view text)
    {
        return parseIn(text, UnitSystem::Binary);
    }
    //---------------------------------------------------------------------------------------------------------------------
    Bandwidth parseBandwidthOrThrow(std::string_view text)
    {
        return parseInOrThrow(text, UnitSystem::Decimal);
    }
    //---------------------------------------------------------------------------------------------------------------------
    Bandwidth parseBinaryBandwidthOrThrow(std::string_view text)
    {
        return parseInOrThrow(text, UnitSystem::Binary);
    }
    //#####################################################################################################################
    BandwidthDecodeError::BandwidthDecodeError(std::string_view text, ParseError error)
        : std::invalid_argument{"Cannot parse bandwidth '"s + makePrintableString(text) + "': " + error.message()}
        , error_{std::move(error)}
    {}
    //---------------------------------------------------------------------------------------------------------------------
    ParseError const& BandwidthDecodeError::error() const
    {
        return error_;
    }
    //#####################################################################################################################
}
