#include <bandwidthpp/config.hpp>

#include <spdlog/spdlog.h>

#include <fstream>
#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace std::literals;

namespace HumanBandwidth
{
    namespace
    {
        template <typename EnumT>
        void readOption(json const& j, char const* key, std::initializer_list<EnumT> known, EnumT& option)
        {
            const auto field = j.find(key);
            if (field == j.end())
                return;

            for (auto const& value : known)
            {
                if (json(value) == *field)
                {
                    option = value;
                    return;
                }
            }

            std::string expected;
            for (auto const& value : known)
            {
                if (!expected.empty())
                    expected += ", ";
                expected += json(value).get<std::string>();
            }
            throw std::invalid_argument(
                "Unknown format option "s + key + " " + field->dump() + ", expected one of: " + expected);
        }
    }
    //#####################################################################################################################
    void to_json(json& j, FormatOptions const& options)
    {
        j = json{{"style", options.style}, {"units", options.units}};
    }
    //---------------------------------------------------------------------------------------------------------------------
    void from_json(json const& j, FormatOptions& options)
    {
        if (!j.is_object())
            throw std::invalid_argument("Format options must be a JSON object, got " + j.dump());

        readOption(j, "style", {FormatStyle::Integer, FormatStyle::Decimal}, options.style);
        readOption(j, "units", {UnitSystem::Decimal, UnitSystem::Binary}, options.units);
    }
    //#####################################################################################################################
    FormatOptions loadFormatOptions(std::filesystem::path const& path)
    {
        std::ifstream reader{path, std::ios_base::binary};
        if (!reader.good())
            throw std::runtime_error("Cannot load format options from "s + path.string());
        std::stringstream sstr;
        sstr << reader.rdbuf();

        auto options = json::parse(sstr.str()).get<FormatOptions>();
        spdlog::debug("Loaded bandwidth format options from '{}'", path.string());
        return options;
    }
    //---------------------------------------------------------------------------------------------------------------------
    void saveFormatOptions(std::filesystem::path const& path, FormatOptions const& options)
    {
        if (path.has_parent_path())
            std::filesystem::create_directories(path.parent_path());

        std::ofstream writer{path, std::ios_base::binary};
        if (!writer.good())
            throw std::runtime_error("Cannot open format options file for writing "s + path.string());
        writer << json(options).dump(4);
        spdlog::debug("Saved bandwidth format options to '{}'", path.string());
    }
    //#####################################################################################################################
}
