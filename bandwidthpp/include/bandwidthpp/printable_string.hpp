#pragma once

#include <string>
#include <string_view>

namespace HumanBandwidth
{
    std::string makePrintableString(std::string_view input);
}
