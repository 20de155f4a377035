#include "rule.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <limits>
#include <optional>
#include <type_traits>
#include <utility>

namespace labelcheck
{

namespace
{

// Longest tokens first so that "<=" is never read as "<"
constexpr std::array<std::pair<std::string_view, Operator>, 6> OPERATORS = {{
    { "==", Operator::EQUAL },
    { "!=", Operator::NOT_EQUAL },
    { "<=", Operator::LESS_EQ },
    { ">=", Operator::GREATER_EQ },
    { "<", Operator::LESS },
    { ">", Operator::GREATER }
}};

constexpr std::array<std::pair<std::string_view, Flag>, 4> FLAGS = {{
    { FLAG_MISSING_AS_PASS, Flag::MISSING_AS_PASS },
    { FLAG_MISSING_AS_FAIL, Flag::MISSING_AS_FAIL },
    { FLAG_IGNORE_CASE, Flag::IGNORE_CASE },
    { FLAG_COUNT_LABELS, Flag::COUNT_LABELS }
}};

bool IsIdentifierChar(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool IsOperatorChar(char c) { return c == '=' || c == '!' || c == '<' || c == '>'; }

bool IsSpace(char c) { return std::isspace(static_cast<unsigned char>(c)); }

// JSON numbers and booleans keep their type, anything else is taken verbatim
Literal ParseLiteral(std::string_view text)
{
    json value = json::parse(text.begin(), text.end(), nullptr, false);
    switch (value.type()) {
    case json::value_t::number_integer:
        return value.get<int64_t>();
    case json::value_t::number_unsigned:
        if (value.get<uint64_t>() >
            static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return value.get<double>();
        }
        return value.get<int64_t>();
    case json::value_t::number_float:
        return value.get<double>();
    case json::value_t::boolean:
        return value.get<bool>();
    default:
        return std::string { text };
    }
}

std::optional<Flag> FlagFromToken(std::string_view token)
{
    if (token.starts_with(FLAG_SELECT_PREFIX)) return Flag::SELECT;

    auto it = std::ranges::find_if(FLAGS, [token] (const auto& entry) {
        return entry.first == token;
    });
    if (it == FLAGS.end()) return std::nullopt;
    return it->second;
}

}

std::string_view Trim(std::string_view s)
{
    while (!s.empty() && IsSpace(s.front())) s.remove_prefix(1);
    while (!s.empty() && IsSpace(s.back())) s.remove_suffix(1);
    return s;
}

std::string_view OperatorToken(Operator op)
{
    for (const auto& [token, value] : OPERATORS)
        if (value == op) return token;
    return "?";
}

std::string LiteralToString(const Literal& literal)
{
    return std::visit([] (const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, double>) {
            // fmt drops the fraction of integral doubles, which would read back
            // as an integer
            std::string s = fmt::format("{}", value);
            if (s.find_first_of(".e") == std::string::npos) s += ".0";
            return s;
        } else {
            return fmt::format("{}", value);
        }
    }, literal);
}

std::string_view LiteralTypeName(const Literal& literal)
{
    constexpr static std::string_view TYPE_NAMES[] = {
        "integer", "number", "boolean", "string"
    };
    return TYPE_NAMES[literal.index()];
}

std::string Rule::ToString() const
{
    return fmt::format("{}{}{}", field, OperatorToken(op), LiteralToString(operand));
}

tb::result<Rule, ParseError> ParseRule(std::string_view expression)
{
    std::string_view text = Trim(expression);
    auto fail = [text] (ParseErrorType type, std::string reason) {
        return ParseError {
            .type = type, .expression = std::string { text }, .reason = std::move(reason)
        };
    };

    size_t pos = 0;
    while (pos < text.size() && IsIdentifierChar(text[pos])) ++pos;
    std::string_view field = text.substr(0, pos);

    while (pos < text.size() && IsSpace(text[pos])) ++pos;

    if (pos == text.size()) {
        if (field.empty()) return fail(ParseErrorType::MALFORMED_IDENTIFIER, "empty expression");
        return fail(ParseErrorType::UNRECOGNIZED_OPERATOR, "missing comparison operator");
    }

    if (!IsOperatorChar(text[pos])) {
        return fail(ParseErrorType::MALFORMED_IDENTIFIER,
            fmt::format("unexpected character '{}' at position {}", text[pos], pos));
    }

    if (field.empty())
        return fail(ParseErrorType::MALFORMED_IDENTIFIER, "missing field name");

    std::string_view rest = text.substr(pos);
    auto op = std::ranges::find_if(OPERATORS, [rest] (const auto& entry) {
        return rest.starts_with(entry.first);
    });

    if (op == OPERATORS.end()) {
        size_t end = pos;
        while (end < text.size() && IsOperatorChar(text[end])) ++end;
        return fail(ParseErrorType::UNRECOGNIZED_OPERATOR,
            fmt::format("unknown operator \"{}\"", text.substr(pos, end - pos)));
    }

    std::string_view after = rest.substr(op->first.size());
    std::string_view literal = Trim(after);
    if (literal.empty()) {
        return fail(ParseErrorType::EMPTY_LITERAL,
            fmt::format("nothing to compare with after \"{}\"", op->first));
    }

    // "a< =1" is a split operator, not "<" against "=1"
    if (IsOperatorChar(literal.front()) && IsSpace(after.front())) {
        return fail(ParseErrorType::UNRECOGNIZED_OPERATOR,
            fmt::format("operator \"{}\" followed by a separated '{}'", op->first,
                        literal.front()));
    }

    return Rule {
        .field = std::string { field },
        .op = op->second,
        .operand = ParseLiteral(literal),
        .expression = std::string { text }
    };
}

tb::result<std::vector<Rule>, ParseError>
ParseRules(const std::vector<std::string>& expressions)
{
    std::vector<Rule> rules;
    rules.reserve(expressions.size());

    for (size_t i = 0; i < expressions.size(); ++i) {
        auto rule = ParseRule(expressions[i]);
        if (rule.is_error()) {
            ParseError err = rule.get_error();
            err.index = i;
            return err;
        }
        rules.emplace_back(std::move(rule.get_mut_unchecked()));
    }

    return rules;
}

tb::result<Options, ParseError> ParseFlags(const std::vector<std::string>& flags)
{
    Options options;

    for (size_t i = 0; i < flags.size(); ++i) {
        std::string_view token = Trim(flags[i]);
        auto fail = [token, i] (ParseErrorType type, std::string reason) {
            return ParseError {
                .type = type, .expression = std::string { token },
                .reason = std::move(reason), .index = i
            };
        };

        std::optional<Flag> flag = FlagFromToken(token);
        if (!flag) return fail(ParseErrorType::UNRECOGNIZED_FLAG, "unknown flag");

        switch (*flag) {
        case Flag::MISSING_AS_PASS:
            if (options.missing == MissingFieldPolicy::FAIL) {
                return fail(ParseErrorType::CONFLICTING_FLAGS,
                    fmt::format("cannot be combined with {}", FLAG_MISSING_AS_FAIL));
            }
            options.missing = MissingFieldPolicy::PASS;
            break;
        case Flag::MISSING_AS_FAIL:
            if (options.missing == MissingFieldPolicy::PASS) {
                return fail(ParseErrorType::CONFLICTING_FLAGS,
                    fmt::format("cannot be combined with {}", FLAG_MISSING_AS_PASS));
            }
            options.missing = MissingFieldPolicy::FAIL;
            break;
        case Flag::IGNORE_CASE:
            options.ignore_case = true;
            break;
        case Flag::COUNT_LABELS:
            options.count_labels = true;
            break;
        case Flag::SELECT: {
            std::string_view name = Trim(token.substr(FLAG_SELECT_PREFIX.size()));
            if (name.empty())
                return fail(ParseErrorType::UNRECOGNIZED_FLAG, "no annotation flag to select");
            options.selected.emplace_back(name);
            break;
        }
        }

        options.tokens.emplace_back(token);
    }

    return options;
}

}
