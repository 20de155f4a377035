#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace labelcheck
{

constexpr std::string_view FLAG_MISSING_AS_PASS = "missing-as-pass";
constexpr std::string_view FLAG_MISSING_AS_FAIL = "missing-as-fail";
constexpr std::string_view FLAG_IGNORE_CASE     = "ignore-case";
constexpr std::string_view FLAG_COUNT_LABELS    = "count-labels";
constexpr std::string_view FLAG_SELECT_PREFIX   = "select:";

// Members of a labelme annotation
constexpr std::string_view ANNOTATION_FLAGS  = "flags";
constexpr std::string_view ANNOTATION_SHAPES = "shapes";
constexpr std::string_view ANNOTATION_LABEL  = "label";

constexpr std::string_view MISSING_VALUE = "<missing>";

using nlohmann::json;

enum LogLevel { DEBUG = 0, INFO = 1, WARNING = 2, SEVERE = 3 };

using LogCallback = void (*)(LogLevel, std::string_view);

void DefaultLog(LogLevel l, std::string_view message);

// Installs the log callback; the default callback drops messages below min_level
void Initialise(LogCallback cb = nullptr, LogLevel min_level = LogLevel::INFO);

constinit inline LogCallback logger = DefaultLog;
constinit inline LogLevel min_log_level = LogLevel::INFO;

// Errors

enum class ParseErrorType
{
    MALFORMED_IDENTIFIER, UNRECOGNIZED_OPERATOR, EMPTY_LITERAL,
    UNRECOGNIZED_FLAG, CONFLICTING_FLAGS
};

struct ParseError
{
    ParseErrorType type;
    std::string expression;
    std::string reason;
    size_t index = 0; // Position of the expression in its list

    std::string Describe() const;
};

// A Validator is only ever built whole; the first ParseError aborts construction
using ConstructionError = ParseError;

enum class EvalErrorType
{
    FIELD_NOT_FOUND, TYPE_MISMATCH, NOT_AN_OBJECT, NOT_AN_ANNOTATION
};

struct EvalError
{
    EvalErrorType type;
    std::string rule;
    std::string field;
    size_t element = 0;
    std::string detail;

    std::string Describe() const;
};

enum class DocumentErrorType
{
    FILE_NOT_FOUND, READ_ERROR, INVALID_JSON
};

struct DocumentError
{
    DocumentErrorType type;
    std::string source;
    std::string detail;

    std::string Describe() const;
};

using ValidateError = std::variant<DocumentError, EvalError>;

std::string Describe(const ValidateError& error);

// Evaluation policy

enum class Flag
{
    MISSING_AS_PASS, MISSING_AS_FAIL, IGNORE_CASE, COUNT_LABELS, SELECT
};

enum class MissingFieldPolicy { RAISE, PASS, FAIL };

enum class Outcome { PASSED, FAILED, SKIPPED };

std::string_view OutcomeName(Outcome o);

struct Options
{
    MissingFieldPolicy missing = MissingFieldPolicy::RAISE;
    bool ignore_case = false;
    bool count_labels = false;

    // Annotation flags; an element is only checked if one of them is set
    std::vector<std::string> selected;
    std::vector<std::string> ignores;

    // Flag tokens as given
    std::vector<std::string> tokens;

    bool Ignored(std::string_view name) const;
};

}
