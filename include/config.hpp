#pragma once

#include "core.hpp"
#include "tb.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace labelcheck
{

using nlohmann::json;

struct ValidatorConfig
{
    std::vector<std::string> rules;
    std::vector<std::string> rule_files;
    std::vector<std::string> flags;
    std::vector<std::string> ignores;
};

void to_json(json& j, const ValidatorConfig& config);
void from_json(const json& j, ValidatorConfig& config);

// One rule per line, blank lines are skipped
tb::result<std::vector<std::string>, DocumentError>
LoadRules(const std::filesystem::path& path);

// Rule files are resolved against the directory of the configuration file
// and their rules appended to the configured ones
tb::result<ValidatorConfig, DocumentError> LoadConfig(const std::filesystem::path& path);

}
