#pragma once

#include "ScenarioConfig.hpp"

#include <string>
#include <vector>

namespace greenwave
{
    struct ScenarioParseResult
    {
        bool ok = false;
        ScenarioConfig config{};
        std::vector<std::string> errors;
    };

    std::string scenarioConfigToJson(const ScenarioConfig &config);
    ScenarioParseResult scenarioConfigFromJson(const std::string &json_text);
    std::string validationErrorsToJson(const std::vector<std::string> &errors);
} // namespace greenwave
