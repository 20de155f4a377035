#pragma once

#include "core.hpp"
#include "tb.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace labelcheck
{

enum class Operator
{
    EQUAL, NOT_EQUAL, LESS, LESS_EQ, GREATER, GREATER_EQ
};

using Literal = std::variant<int64_t, double, bool, std::string>;

// <identifier><operator><literal>, e.g. "TL==1"
struct Rule
{
    std::string field;
    Operator op;
    Literal operand;
    std::string expression; // As written

    // Canonical form, parses back to an equal Rule
    std::string ToString() const;

    // Source expression is not compared
    bool operator==(const Rule& other) const
    {
        return field == other.field && op == other.op && operand == other.operand;
    }
};

std::string_view OperatorToken(Operator op);
std::string LiteralToString(const Literal& literal);
std::string_view LiteralTypeName(const Literal& literal);

tb::result<Rule, ParseError> ParseRule(std::string_view expression);

// Stops at the first malformed expression
tb::result<std::vector<Rule>, ParseError>
ParseRules(const std::vector<std::string>& expressions);

tb::result<Options, ParseError> ParseFlags(const std::vector<std::string>& flags);

std::string_view Trim(std::string_view s);

}
