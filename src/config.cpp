#include "config.hpp"

#include "io.hpp"

#include <fmt/core.h>

#include <sstream>

namespace labelcheck
{

// JSON conversion functions

void to_json(json& j, const ValidatorConfig& config)
{
    j = {
        { "rules", config.rules },
        { "flags", config.flags },
        { "ignores", config.ignores }
    };
    if (!config.rule_files.empty()) j["rule_files"] = config.rule_files;
}

void from_json(const json& j, ValidatorConfig& config)
{
    if (j.contains("rules")) j["rules"].get_to(config.rules);
    if (j.contains("rule_files")) j["rule_files"].get_to(config.rule_files);
    if (j.contains("flags")) j["flags"].get_to(config.flags);
    if (j.contains("ignores")) j["ignores"].get_to(config.ignores);
}

// Loading

tb::result<std::vector<std::string>, DocumentError>
LoadRules(const std::filesystem::path& path)
{
    auto text = ReadText(path);
    if (text.is_error()) return text.get_error();

    std::vector<std::string> rules;
    std::istringstream in(text.get_unchecked());
    ForEachLine(in, [&rules] (size_t, std::string_view line) {
        rules.emplace_back(line);
        return true;
    });

    logger(LogLevel::DEBUG, fmt::format("Loaded {} rules from {}", rules.size(),
                                        path.string()));
    return rules;
}

tb::result<ValidatorConfig, DocumentError> LoadConfig(const std::filesystem::path& path)
{
    auto document = ReadDocument(path);
    if (document.is_error()) return document.get_error();

    if (!document.get_unchecked().is_object()) {
        return DocumentError {
            .type = DocumentErrorType::INVALID_JSON, .source = path.string(),
            .detail = "configuration must be an object"
        };
    }

    ValidatorConfig config;
    try {
        document.get_unchecked().get_to(config);
    } catch (const json::exception& e) {
        return DocumentError {
            .type = DocumentErrorType::INVALID_JSON, .source = path.string(),
            .detail = e.what()
        };
    }

    for (std::string& rule_file : config.rule_files) {
        std::filesystem::path rule_path { rule_file };
        if (rule_path.is_relative()) rule_path = path.parent_path() / rule_path;
        rule_file = rule_path.string();

        auto rules = LoadRules(rule_path);
        if (rules.is_error()) return rules.get_error();
        config.rules.insert(config.rules.end(), rules.get_unchecked().begin(),
                            rules.get_unchecked().end());
    }

    return config;
}

}
