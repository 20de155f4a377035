#include "core.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace labelcheck
{

// Logging & library initialisation

void DefaultLog(LogLevel l, std::string_view message)
{
    constexpr static std::string_view LEVEL_NAMES[] = {
        "DEBUG", "INFO", "WARNING", "SEVERE"
    };
    if (l < min_log_level) return;
    fmt::print("[{}] {}\n", LEVEL_NAMES[static_cast<size_t>(l)], message);
}

void Initialise(LogCallback logcb, LogLevel min_level)
{
    min_log_level = min_level;
    logger = logcb ? logcb : DefaultLog;
}

// Error descriptions

std::string ParseError::Describe() const
{
    return fmt::format("Invalid {} #{} \"{}\": {}",
        type == ParseErrorType::UNRECOGNIZED_FLAG
            || type == ParseErrorType::CONFLICTING_FLAGS ? "flag" : "rule",
        index, expression, reason);
}

std::string EvalError::Describe() const
{
    switch (type) {
    case EvalErrorType::FIELD_NOT_FOUND:
        return fmt::format("Rule \"{}\" is not applicable to element {}: "
                           "field \"{}\" not found", rule, element, field);
    case EvalErrorType::TYPE_MISMATCH:
        return fmt::format("Rule \"{}\" is not applicable to element {}: {}",
                           rule, element, detail);
    case EvalErrorType::NOT_AN_OBJECT:
        return fmt::format("Element {} is not an object but {}", element, detail);
    case EvalErrorType::NOT_AN_ANNOTATION:
        return fmt::format("Element {} is not an annotation: {}", element, detail);
    }
    return "Unknown evaluation error";
}

std::string DocumentError::Describe() const
{
    switch (type) {
    case DocumentErrorType::FILE_NOT_FOUND:
        return fmt::format("{}: file not found", source);
    case DocumentErrorType::READ_ERROR:
        return fmt::format("{}: failed to read: {}", source, detail);
    case DocumentErrorType::INVALID_JSON:
        return fmt::format("{}: invalid JSON: {}", source, detail);
    }
    return "Unknown document error";
}

std::string Describe(const ValidateError& error)
{
    return std::visit([] (const auto& e) { return e.Describe(); }, error);
}

std::string_view OutcomeName(Outcome o)
{
    switch (o) {
    case Outcome::PASSED: return "passed";
    case Outcome::FAILED: return "failed";
    case Outcome::SKIPPED: return "skipped";
    }
    return "unknown";
}

bool Options::Ignored(std::string_view name) const
{
    return std::ranges::find(ignores, name) != ignores.end();
}

}
