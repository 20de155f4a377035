#include "validate.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <utility>

namespace labelcheck
{

namespace predicates
{

namespace
{

bool IsEquality(Operator op) { return op == Operator::EQUAL || op == Operator::NOT_EQUAL; }

Comparison FromBool(bool b) { return b ? Comparison::SATISFIED : Comparison::UNSATISFIED; }

template<typename T>
bool Apply(Operator op, const T& lhs, const T& rhs)
{
    switch (op) {
    case Operator::EQUAL: return lhs == rhs;
    case Operator::NOT_EQUAL: return lhs != rhs;
    case Operator::LESS: return lhs < rhs;
    case Operator::LESS_EQ: return lhs <= rhs;
    case Operator::GREATER: return lhs > rhs;
    case Operator::GREATER_EQ: return lhs >= rhs;
    }
    return false;
}

// Exact for any mix of signed and unsigned
template<typename L, typename R>
bool ApplyIntegral(Operator op, L lhs, R rhs)
{
    switch (op) {
    case Operator::EQUAL: return std::cmp_equal(lhs, rhs);
    case Operator::NOT_EQUAL: return std::cmp_not_equal(lhs, rhs);
    case Operator::LESS: return std::cmp_less(lhs, rhs);
    case Operator::LESS_EQ: return std::cmp_less_equal(lhs, rhs);
    case Operator::GREATER: return std::cmp_greater(lhs, rhs);
    case Operator::GREATER_EQ: return std::cmp_greater_equal(lhs, rhs);
    }
    return false;
}

Comparison CompareNumbers(const json& value, Operator op, const Literal& operand)
{
    if (const auto* rhs = std::get_if<int64_t>(&operand)) {
        if (value.is_number_unsigned())
            return FromBool(ApplyIntegral(op, value.get<uint64_t>(), *rhs));
        if (value.is_number_integer())
            return FromBool(ApplyIntegral(op, value.get<int64_t>(), *rhs));
        return FromBool(Apply(op, value.get<double>(), static_cast<double>(*rhs)));
    }

    return FromBool(Apply(op, value.get<double>(), std::get<double>(operand)));
}

std::string Lower(std::string_view s)
{
    std::string lower { s };
    std::ranges::transform(lower, lower.begin(), [] (unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

Comparison CompareStrings(const std::string& value, Operator op, const std::string& operand,
                          bool ignore_case)
{
    if (ignore_case) return FromBool(Apply(op, Lower(value), Lower(operand)));
    return FromBool(Apply(op, value, operand));
}

}

Comparison Compare(const json& value, Operator op, const Literal& operand, bool ignore_case)
{
    switch (value.type()) {
    case json::value_t::number_integer:
    case json::value_t::number_unsigned:
    case json::value_t::number_float:
        if (std::holds_alternative<int64_t>(operand) || std::holds_alternative<double>(operand))
            return CompareNumbers(value, op, operand);
        break;
    case json::value_t::string:
        if (const auto* s = std::get_if<std::string>(&operand)) {
            return CompareStrings(value.get_ref<const std::string&>(), op, *s,
                                  ignore_case);
        }
        break;
    case json::value_t::boolean:
        if (const auto* b = std::get_if<bool>(&operand)) {
            if (!IsEquality(op)) return Comparison::MISMATCH;
            return FromBool(Apply(op, value.get<bool>(), *b));
        }
        break;
    case json::value_t::null:
    case json::value_t::object:
    case json::value_t::array:
    case json::value_t::binary:
    case json::value_t::discarded:
        break;
    }

    if (!IsEquality(op)) return Comparison::MISMATCH;
    return FromBool(op == Operator::NOT_EQUAL);
}

}

namespace
{

using LabelCounts = std::unordered_map<std::string, int64_t>;

bool FlagSet(const json& flags, const std::string& name)
{
    auto it = flags.find(name);
    return it != flags.end() && it->is_boolean() && it->get<bool>();
}

tb::result<LabelCounts, EvalError> CountLabels(const json& element, size_t index)
{
    auto shapes = element.find(std::string { ANNOTATION_SHAPES });
    if (shapes == element.end() || !shapes->is_array()) {
        return EvalError {
            .type = EvalErrorType::NOT_AN_ANNOTATION, .element = index,
            .detail = fmt::format("no \"{}\" array", ANNOTATION_SHAPES)
        };
    }

    LabelCounts counts;
    for (const json& shape : *shapes) {
        auto label = shape.is_object() ? shape.find(std::string { ANNOTATION_LABEL })
                                       : shape.end();
        if (label == shape.end() || !label->is_string()) {
            return EvalError {
                .type = EvalErrorType::NOT_AN_ANNOTATION, .element = index,
                .detail = fmt::format("shape without a \"{}\" string", ANNOTATION_LABEL)
            };
        }
        ++counts[label->get<std::string>()];
    }

    return counts;
}

tb::error<EvalError> EvaluateElement(const json& element, size_t index,
    std::span<const Rule> rules, const Options& options, ValidationReport& report)
{
    ++report.elements;

    if (!element.is_object()) {
        return EvalError {
            .type = EvalErrorType::NOT_AN_OBJECT, .element = index,
            .detail = element.type_name()
        };
    }

    if (IsSkipped(element, options)) {
        logger(LogLevel::DEBUG, fmt::format("Skipping element {}", index));
        ++report.skipped;
        return tb::ok;
    }

    LabelCounts counts;
    if (options.count_labels) {
        auto result = CountLabels(element, index);
        if (result.is_error()) return result.get_error();
        counts = std::move(result.get_mut_unchecked());
    }

    for (const Rule& rule : rules) {
        if (options.Ignored(rule.field)) continue;

        json count;
        const json* value = nullptr;
        if (options.count_labels) {
            // Labels that never occur count as zero
            auto it = counts.find(rule.field);
            count = it == counts.end() ? 0 : it->second;
            value = &count;
        } else if (auto it = element.find(rule.field); it != element.end()) {
            value = &*it;
        }

        if (!value) {
            switch (options.missing) {
            case MissingFieldPolicy::RAISE:
                return EvalError {
                    .type = EvalErrorType::FIELD_NOT_FOUND, .rule = rule.ToString(),
                    .field = rule.field, .element = index
                };
            case MissingFieldPolicy::PASS:
                break;
            case MissingFieldPolicy::FAIL:
                report.violations.push_back({
                    rule.ToString(), index, std::string { MISSING_VALUE }
                });
                break;
            }
            continue;
        }

        switch (predicates::Compare(*value, rule.op, rule.operand, options.ignore_case)) {
        case predicates::Comparison::SATISFIED:
            break;
        case predicates::Comparison::UNSATISFIED:
            report.violations.push_back({ rule.ToString(), index, value->dump() });
            break;
        case predicates::Comparison::MISMATCH:
            return EvalError {
                .type = EvalErrorType::TYPE_MISMATCH, .rule = rule.ToString(),
                .field = rule.field, .element = index,
                .detail = fmt::format("cannot order {} \"{}\" against {} {}",
                    value->type_name(), rule.field, LiteralTypeName(rule.operand),
                    LiteralToString(rule.operand))
            };
        }
    }

    return tb::ok;
}

}

bool IsSkipped(const json& element, const Options& options)
{
    auto flags = element.find(std::string { ANNOTATION_FLAGS });
    if (flags == element.end() || !flags->is_object()) return !options.selected.empty();

    auto is_set = [&flags] (const std::string& name) { return FlagSet(*flags, name); };

    if (!options.selected.empty() && std::ranges::none_of(options.selected, is_set))
        return true;

    return std::ranges::any_of(options.ignores, is_set);
}

tb::result<ValidationReport, EvalError>
Evaluate(const json& document, std::span<const Rule> rules, const Options& options)
{
    ValidationReport report;

    if (document.is_array()) {
        for (size_t i = 0; i < document.size(); ++i) {
            auto result = EvaluateElement(document[i], i, rules, options, report);
            if (result.is_error()) return result.get_error();
        }
    } else {
        auto result = EvaluateElement(document, 0, rules, options, report);
        if (result.is_error()) return result.get_error();
    }

    if (!report.violations.empty()) report.outcome = Outcome::FAILED;
    else if (report.skipped > 0) report.outcome = Outcome::SKIPPED;

    return report;
}

}
