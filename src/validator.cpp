#include "validator.hpp"

#include "io.hpp"

#include <fmt/format.h>

#include <optional>
#include <utility>

namespace labelcheck
{

namespace
{

std::string Quoted(const std::vector<std::string>& items)
{
    std::vector<std::string> quoted;
    quoted.reserve(items.size());
    for (const std::string& item : items) quoted.push_back(fmt::format("'{}'", item));
    return fmt::format("[{}]", fmt::join(quoted, ", "));
}

}

Validator::Validator(std::vector<Rule>&& rules, Options&& options)
    : rules(std::move(rules)), options(std::move(options)) {}

// Construction

tb::result<Validator, ConstructionError> Validator::Create(
    const std::vector<std::string>& rule_list, const std::vector<std::string>& flags,
    const std::vector<std::string>& ignores)
{
    auto parsed = ParseRules(rule_list);
    if (parsed.is_error()) {
        logger(LogLevel::DEBUG, parsed.get_error().Describe());
        return parsed.get_error();
    }

    auto options = ParseFlags(flags);
    if (options.is_error()) {
        logger(LogLevel::DEBUG, options.get_error().Describe());
        return options.get_error();
    }

    options.get_mut_unchecked().ignores = ignores;

    logger(LogLevel::DEBUG, fmt::format("Parsed {} rules, {} flags, {} ignores",
        rule_list.size(), flags.size(), ignores.size()));

    return Validator { std::move(parsed.get_mut_unchecked()),
                       std::move(options.get_mut_unchecked()) };
}

tb::result<Validator, ConstructionError> Validator::Create(const ValidatorConfig& config)
{
    return Create(config.rules, config.flags, config.ignores);
}

// Evaluation

tb::result<ValidationReport, EvalError> Validator::Evaluate(const json& document) const
{
    return labelcheck::Evaluate(document, rules, options);
}

tb::result<ValidationReport, ValidateError>
Validator::EvaluateString(std::string_view text) const
{
    auto document = ParseDocument(text);
    if (document.is_error()) return ValidateError { document.get_error() };

    auto report = Evaluate(document.get_unchecked());
    if (report.is_error()) return ValidateError { report.get_error() };
    return report.get_unchecked();
}

tb::result<ValidationReport, ValidateError>
Validator::EvaluateFile(const std::filesystem::path& path) const
{
    auto document = ReadDocument(path);
    if (document.is_error()) return ValidateError { document.get_error() };

    auto report = Evaluate(document.get_unchecked());
    if (report.is_error()) return ValidateError { report.get_error() };
    return report.get_unchecked();
}

tb::result<bool, ValidateError> Validator::Validate(const json& document) const
{
    auto report = Evaluate(document);
    if (report.is_error()) return ValidateError { report.get_error() };
    return report.get_unchecked().Passed();
}

tb::result<bool, ValidateError> Validator::ValidateString(std::string_view text) const
{
    auto report = EvaluateString(text);
    if (report.is_error()) return report.get_error();
    return report.get_unchecked().Passed();
}

tb::result<bool, ValidateError>
Validator::ValidateFile(const std::filesystem::path& path) const
{
    auto report = EvaluateFile(path);
    if (report.is_error()) return report.get_error();
    return report.get_unchecked().Passed();
}

tb::result<bool, ValidateError> Validator::ValidateLines(std::istream& in) const
{
    bool passed = true;
    std::optional<ValidateError> error;

    ForEachLine(in, [&] (size_t number, std::string_view line) {
        auto document = ParseDocument(line, fmt::format("line {}", number));
        if (document.is_error()) {
            error = document.get_error();
            return false;
        }

        auto report = Evaluate(document.get_unchecked());
        if (report.is_error()) {
            error = report.get_error();
            return false;
        }

        passed = passed && report.get_unchecked().Passed();
        return true;
    });

    if (error) return *error;
    return passed;
}

tb::result<size_t, DocumentError>
Validator::FilterLines(std::istream& in, std::ostream& out, bool invert) const
{
    size_t copied = 0;
    std::optional<DocumentError> error;

    ForEachLine(in, [&] (size_t number, std::string_view line) {
        auto document = ParseDocument(line, fmt::format("line {}", number));
        if (document.is_error()) {
            error = document.get_error();
            return false;
        }

        auto report = Evaluate(document.get_unchecked());

        bool copy = false;
        if (report.is_error()) {
            logger(LogLevel::DEBUG, fmt::format("line {}: {}", number,
                                                report.get_error().Describe()));
            copy = invert;
        } else {
            switch (report.get_unchecked().outcome) {
            case Outcome::PASSED: copy = !invert; break;
            case Outcome::FAILED: copy = invert; break;
            case Outcome::SKIPPED: break;
            }
        }

        if (copy) {
            out << line << '\n';
            ++copied;
        }
        return true;
    });

    if (error) return *error;
    return copied;
}

std::string Validator::ToString() const
{
    std::vector<std::string> expressions;
    expressions.reserve(rules.size());
    for (const Rule& rule : rules) expressions.push_back(rule.expression);

    return fmt::format("Validator({}, {}, {})", Quoted(expressions),
                       Quoted(options.tokens), Quoted(options.ignores));
}

}
