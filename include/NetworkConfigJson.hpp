#pragma once

#include "NetworkConfig.hpp"

#include <string>
#include <vector>

namespace signalnet
{
    struct ConfigParseResult
    {
        bool ok = false;
        NetworkConfig config{};
        std::vector<std::string> errors;
    };

    std::string networkConfigToJson(const NetworkConfig &config);
    ConfigParseResult networkConfigFromJson(const std::string &json_text);
    std::string validationErrorsToJson(const std::vector<std::string> &errors);
} // namespace signalnet
