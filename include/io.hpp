#pragma once

#include "core.hpp"
#include "tb.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <istream>
#include <string>
#include <string_view>

namespace labelcheck
{

using nlohmann::json;

constexpr std::string_view STRING_SOURCE = "<string>";

tb::result<json, DocumentError> ParseDocument(std::string_view text,
                                              std::string_view source = STRING_SOURCE);

tb::result<json, DocumentError> ReadDocument(const std::filesystem::path& path);

tb::result<std::string, DocumentError> ReadText(const std::filesystem::path& path);

// Called with the line number (from 1) and the trimmed text of every
// non-blank line. Returning false stops the iteration.
using LineCallback = std::function<bool(size_t, std::string_view)>;

void ForEachLine(std::istream& in, const LineCallback& cb);

}
