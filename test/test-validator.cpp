#include "validator.hpp"

#include <gtest/gtest.h>

#include <fmt/core.h>

#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace labelcheck;

namespace
{

const std::string TEST_DATA = fmt::format("{}/data", LABELCHECK_TEST_DIR);

Validator Make(const std::vector<std::string>& rules,
               const std::vector<std::string>& flags = {},
               const std::vector<std::string>& ignores = {})
{
    auto validator = Validator::Create(rules, flags, ignores);
    if (validator.is_error()) {
        ADD_FAILURE() << validator.get_error().Describe();
        return Validator::Create(std::vector<std::string> {}).get_unchecked();
    }
    return validator.get_unchecked();
}

bool IsEvalError(const ValidateError& error)
{
    return std::holds_alternative<EvalError>(error);
}

DocumentErrorType DocumentFailure(const tb::result<bool, ValidateError>& result)
{
    EXPECT_TRUE(result.is_error());
    if (!result.is_error() || IsEvalError(result.get_error())) {
        ADD_FAILURE() << "Expected a document error";
        return DocumentErrorType::READ_ERROR;
    }
    return std::get<DocumentError>(result.get_error()).type;
}

}

class ValidatorTest : public ::testing::Test {
protected:
    void SetUp() override { Initialise(nullptr, LogLevel::SEVERE); }
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(ValidatorTest, ConstructionParsesEverything)
{
    auto validator = Validator::Create({ "TL==1", "TL > 0" }, { "ignore-case" }, { "f1" });
    ASSERT_TRUE(validator.is_ok());
    EXPECT_EQ(validator.get_unchecked().Rules().size(), 2u);
    EXPECT_TRUE(validator.get_unchecked().GetOptions().ignore_case);
    EXPECT_EQ(validator.get_unchecked().ToString(),
              "Validator(['TL==1', 'TL > 0'], ['ignore-case'], ['f1'])");
}

TEST_F(ValidatorTest, MalformedRuleAbortsConstruction)
{
    auto validator = Validator::Create({ "TL==1", "TL = 1" });
    ASSERT_TRUE(validator.is_error());
    EXPECT_EQ(validator.get_error().type, ParseErrorType::UNRECOGNIZED_OPERATOR);
    EXPECT_EQ(validator.get_error().index, 1u);
}

TEST_F(ValidatorTest, UnknownFlagAbortsConstruction)
{
    auto validator = Validator::Create({ "TL==1" }, { "missing-as-pas" });
    ASSERT_TRUE(validator.is_error());
    EXPECT_EQ(validator.get_error().type, ParseErrorType::UNRECOGNIZED_FLAG);
}

TEST_F(ValidatorTest, ConstructionFromConfig)
{
    ValidatorConfig config { .rules = { "TL==1" }, .flags = { "count-labels" } };
    auto validator = Validator::Create(config);
    ASSERT_TRUE(validator.is_ok());
    EXPECT_TRUE(validator.get_unchecked().GetOptions().count_labels);
}

// ============================================================================
// Reference scenarios on {"TL": 1}
// ============================================================================

TEST_F(ValidatorTest, RulesHold)
{
    Validator validator = Make({ "TL==1", "TL>0" });
    auto result = validator.Validate({ { "TL", 1 } });
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.get_unchecked());
}

TEST_F(ValidatorTest, IgnoredRulesHoldVacuously)
{
    Validator validator = Make({ "TL==1", "TL>0" }, {}, { "TL" });
    auto result = validator.Validate({ { "TL", 1 } });
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.get_unchecked());
}

TEST_F(ValidatorTest, UnsatisfiedRuleIsFalse)
{
    Validator validator = Make({ "TL==2" });
    auto result = validator.Validate({ { "TL", 1 } });
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.get_unchecked());
}

TEST_F(ValidatorTest, AbsentFieldIsAnError)
{
    Validator validator = Make({ "TL==2" });
    auto result = validator.Validate({ { "TR", 1 } });
    ASSERT_TRUE(result.is_error());
    ASSERT_TRUE(IsEvalError(result.get_error()));
    EXPECT_EQ(std::get<EvalError>(result.get_error()).type, EvalErrorType::FIELD_NOT_FOUND);
}

// ============================================================================
// Annotation files
// ============================================================================

TEST_F(ValidatorTest, AnnotationFile)
{
    const std::string path = TEST_DATA + "/annotation.json";

    Validator counting = Make({ "TL==1", "TL>0" }, { "count-labels" });
    auto result = counting.ValidateFile(path);
    ASSERT_TRUE(result.is_ok()) << Describe(result.get_error());
    EXPECT_TRUE(result.get_unchecked());

    // f1 is set in the annotation, ignoring it skips the document
    Validator ignoring = Make({ "TL==1", "TL>0" }, { "count-labels" }, { "f1" });
    result = ignoring.ValidateFile(path);
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.get_unchecked());

    // f2 is not set
    Validator ignoring_unset = Make({ "TL==1" }, { "count-labels" }, { "f2" });
    result = ignoring_unset.ValidateFile(path);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.get_unchecked());
}

TEST_F(ValidatorTest, AnnotationFileDetailedReport)
{
    Validator validator = Make({ "TL==0", "TR==1", "BL==2", "BR==0" }, { "count-labels" });
    auto report = validator.EvaluateFile(TEST_DATA + "/annotation.json");
    ASSERT_TRUE(report.is_ok());
    const ValidationReport& r = report.get_unchecked();
    EXPECT_EQ(r.outcome, Outcome::FAILED);
    ASSERT_EQ(r.violations.size(), 2u);
    EXPECT_EQ(r.violations[0].rule, "TL==0");
    EXPECT_EQ(r.violations[0].actual, "1");
    EXPECT_EQ(r.violations[1].rule, "BL==2");
}

TEST_F(ValidatorTest, AnnotationSelection)
{
    const std::string path = TEST_DATA + "/annotation.json";

    auto selected = Make({ "TL==1" }, { "count-labels", "select:f1" }).ValidateFile(path);
    ASSERT_TRUE(selected.is_ok());
    EXPECT_TRUE(selected.get_unchecked());

    auto unselected = Make({ "TL==1" }, { "count-labels", "select:f2" }).ValidateFile(path);
    ASSERT_TRUE(unselected.is_ok());
    EXPECT_FALSE(unselected.get_unchecked());

    auto either = Make({ "TL==1" }, { "count-labels", "select:fx", "select:f1" })
        .ValidateFile(path);
    ASSERT_TRUE(either.is_ok());
    EXPECT_TRUE(either.get_unchecked());
}

// ============================================================================
// Document acquisition
// ============================================================================

TEST_F(ValidatorTest, ValidateString)
{
    Validator validator = Make({ "TL==1" });

    auto passed = validator.ValidateString(R"({"TL": 1})");
    ASSERT_TRUE(passed.is_ok());
    EXPECT_TRUE(passed.get_unchecked());

    auto failed = validator.ValidateString(R"([{"TL": 1}, {"TL": 2}])");
    ASSERT_TRUE(failed.is_ok());
    EXPECT_FALSE(failed.get_unchecked());

    EXPECT_EQ(DocumentFailure(validator.ValidateString(R"({"TL": )")),
              DocumentErrorType::INVALID_JSON);
}

TEST_F(ValidatorTest, ValidateFileErrors)
{
    Validator validator = Make({ "TL==1" });
    EXPECT_EQ(DocumentFailure(validator.ValidateFile(TEST_DATA + "/no-such-file.json")),
              DocumentErrorType::FILE_NOT_FOUND);
    EXPECT_EQ(DocumentFailure(validator.ValidateFile(TEST_DATA + "/tree/broken.json")),
              DocumentErrorType::INVALID_JSON);
    EXPECT_EQ(DocumentFailure(validator.ValidateFile(TEST_DATA + "/tree")),
              DocumentErrorType::READ_ERROR);
}

TEST_F(ValidatorTest, ValidateLines)
{
    Validator validator = Make({ "TL>0" });
    std::istringstream passing("{\"TL\": 1}\n\n{\"TL\": 2}\n");
    auto result = validator.ValidateLines(passing);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.get_unchecked());

    std::istringstream failing("{\"TL\": 1}\n{\"TL\": 0}\n");
    result = validator.ValidateLines(failing);
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.get_unchecked());

    std::istringstream erroring("{\"TL\": 0}\n{\"TR\": 1}\n");
    result = validator.ValidateLines(erroring);
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(IsEvalError(result.get_error()));

    std::istringstream invalid("{\"TL\": 1}\nnot json\n");
    result = validator.ValidateLines(invalid);
    ASSERT_TRUE(result.is_error());
    ASSERT_FALSE(IsEvalError(result.get_error()));
    EXPECT_EQ(std::get<DocumentError>(result.get_error()).source, "line 2");
}

TEST_F(ValidatorTest, FilterLines)
{
    Validator validator = Make({ "TL==1" }, {}, { "f1" });
    std::ifstream lines(TEST_DATA + "/lines.jsonl");
    ASSERT_TRUE(lines.is_open());

    std::ostringstream out;
    auto copied = validator.FilterLines(lines, out);
    ASSERT_TRUE(copied.is_ok());
    EXPECT_EQ(copied.get_unchecked(), 1u);
    EXPECT_NE(out.str().find("first"), std::string::npos);
    EXPECT_EQ(out.str().find("second"), std::string::npos);
    EXPECT_EQ(out.str().find("third"), std::string::npos);
}

TEST_F(ValidatorTest, FilterLinesInverted)
{
    Validator validator = Make({ "TL==1" }, {}, { "f1" });
    std::istringstream lines(
        "{\"name\": \"first\", \"TL\": 1}\n"
        "{\"name\": \"second\", \"TL\": 2}\n"
        "{\"name\": \"third\", \"TL\": 1, \"flags\": {\"f1\": true}}\n"
        "{\"name\": \"fourth\"}\n");

    std::ostringstream out;
    auto copied = validator.FilterLines(lines, out, true);
    ASSERT_TRUE(copied.is_ok());
    EXPECT_EQ(copied.get_unchecked(), 2u);
    EXPECT_EQ(out.str().find("first"), std::string::npos);
    EXPECT_NE(out.str().find("second"), std::string::npos);
    EXPECT_EQ(out.str().find("third"), std::string::npos);
    EXPECT_NE(out.str().find("fourth"), std::string::npos);
}

TEST_F(ValidatorTest, FilterLinesRejectsInvalidJson)
{
    Validator validator = Make({ "TL==1" });
    std::istringstream lines("{\"TL\": 1}\n{oops\n");
    std::ostringstream out;
    auto copied = validator.FilterLines(lines, out);
    ASSERT_TRUE(copied.is_error());
    EXPECT_EQ(copied.get_error().type, DocumentErrorType::INVALID_JSON);
}

// ============================================================================
// Sharing
// ============================================================================

TEST_F(ValidatorTest, SharedBetweenThreads)
{
    const Validator validator = Make({ "TL>0", "TL<100" });

    std::vector<int> passed(8, 0);
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&validator, &passed, t] {
            for (int i = 0; i < 200; ++i) {
                auto result = validator.Validate({ { "TL", (i + t) % 120 } });
                if (result.is_ok() && result.get_unchecked()) ++passed[t];
            }
        });
    }
    for (std::thread& thread : threads) thread.join();

    for (int t = 0; t < 8; ++t) {
        int expected = 0;
        for (int i = 0; i < 200; ++i) {
            int value = (i + t) % 120;
            if (value > 0 && value < 100) ++expected;
        }
        EXPECT_EQ(passed[t], expected) << "thread " << t;
    }
}
