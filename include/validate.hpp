#pragma once

#include "core.hpp"
#include "rule.hpp"
#include "tb.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace labelcheck
{

using nlohmann::json;

struct Violation
{
    std::string rule;
    size_t element;
    std::string actual; // JSON text of the value, or MISSING_VALUE
};

struct ValidationReport
{
    Outcome outcome = Outcome::PASSED;
    size_t elements = 0;
    size_t skipped = 0;
    std::vector<Violation> violations;

    bool Passed() const { return outcome == Outcome::PASSED; }
};

// Applies every rule to the document, or to each element if it is an array.
// A failed rule is recorded in the report, a rule that cannot be applied is
// an error.
tb::result<ValidationReport, EvalError>
Evaluate(const json& document, std::span<const Rule> rules, const Options& options);

// True if the element's annotation flags exclude it from evaluation
bool IsSkipped(const json& element, const Options& options);

namespace predicates
{

enum class Comparison { SATISFIED, UNSATISFIED, MISMATCH };

// Ordering needs two numbers or two strings. Equality takes any pair of
// values, values of different kinds are never equal.
Comparison Compare(const json& value, Operator op, const Literal& operand,
                   bool ignore_case = false);

}

}
