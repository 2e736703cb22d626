#pragma once

#include <bandwidthpp/bandwidth.hpp>
#include <bandwidthpp/format.hpp>

#include <spdlog/fmt/fmt.h>

#include <string_view>

/// Lets spdlog and fmt print a Bandwidth in canonical form: spdlog::info("limit: {}", bandwidth)
template <>
struct fmt::formatter<HumanBandwidth::Bandwidth> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(HumanBandwidth::Bandwidth const& value, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(HumanBandwidth::formatBandwidth(value), ctx);
    }
};
