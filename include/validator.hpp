#pragma once

#include "config.hpp"
#include "core.hpp"
#include "rule.hpp"
#include "tb.hpp"
#include "validate.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace labelcheck
{

using nlohmann::json;

// Immutable after construction, may be shared between threads
class Validator
{
public:
    static tb::result<Validator, ConstructionError> Create(
        const std::vector<std::string>& rules, const std::vector<std::string>& flags = {},
        const std::vector<std::string>& ignores = {});
    static tb::result<Validator, ConstructionError> Create(const ValidatorConfig& config);

    // Detailed results
    tb::result<ValidationReport, EvalError> Evaluate(const json& document) const;
    tb::result<ValidationReport, ValidateError> EvaluateString(std::string_view text) const;
    tb::result<ValidationReport, ValidateError>
    EvaluateFile(const std::filesystem::path& path) const;

    // True only if the document passed; skipped documents are false
    tb::result<bool, ValidateError> Validate(const json& document) const;
    tb::result<bool, ValidateError> ValidateString(std::string_view text) const;
    tb::result<bool, ValidateError> ValidateFile(const std::filesystem::path& path) const;

    // JSON Lines, every non-blank line is a document
    tb::result<bool, ValidateError> ValidateLines(std::istream& in) const;

    // Copies the JSON Lines documents that pass to out. Inverted, copies those
    // that fail or cannot be evaluated. Returns the number of lines copied.
    tb::result<size_t, DocumentError>
    FilterLines(std::istream& in, std::ostream& out, bool invert = false) const;

    const std::vector<Rule>& Rules() const { return rules; }
    const Options& GetOptions() const { return options; }

    std::string ToString() const;
private:
    Validator(std::vector<Rule>&& rules, Options&& options);

    std::vector<Rule> rules;
    Options options;
};

}
