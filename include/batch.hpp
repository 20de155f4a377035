#pragma once

#include "core.hpp"
#include "tb.hpp"
#include "validator.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace labelcheck
{

struct FileResult
{
    std::filesystem::path path; // Relative to the validated root
    std::optional<Outcome> outcome; // Empty if the file could not be checked
    std::string error;
};

struct BatchReport
{
    std::vector<FileResult> files; // Sorted by path
    size_t checked = 0; // Passed, failed or errored
    size_t valid = 0;

    std::string Summary() const;
};

// Validates every *.json file below root. threads == 0 uses one thread per core.
tb::result<BatchReport, DocumentError> ValidateTree(const Validator& validator,
    const std::filesystem::path& root, unsigned threads = 0);

}
