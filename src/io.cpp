#include "io.hpp"

#include "rule.hpp"

#include <fmt/core.h>

#include <fstream>
#include <iterator>
#include <system_error>

namespace labelcheck
{

namespace
{

tb::error<DocumentError> CheckReadable(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return DocumentError {
            .type = DocumentErrorType::FILE_NOT_FOUND, .source = path.string()
        };
    }

    if (std::filesystem::is_directory(path, ec)) {
        return DocumentError {
            .type = DocumentErrorType::READ_ERROR, .source = path.string(),
            .detail = "is a directory"
        };
    }

    return tb::ok;
}

}

tb::result<json, DocumentError> ParseDocument(std::string_view text, std::string_view source)
{
    try {
        return json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        return DocumentError {
            .type = DocumentErrorType::INVALID_JSON, .source = std::string { source },
            .detail = e.what()
        };
    }
}

tb::result<json, DocumentError> ReadDocument(const std::filesystem::path& path)
{
    if (auto readable = CheckReadable(path); readable.is_error())
        return readable.get_error();

    std::ifstream file(path);
    if (!file) {
        return DocumentError {
            .type = DocumentErrorType::READ_ERROR, .source = path.string(),
            .detail = "cannot open file"
        };
    }

    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        return DocumentError {
            .type = DocumentErrorType::INVALID_JSON, .source = path.string(),
            .detail = e.what()
        };
    }
}

tb::result<std::string, DocumentError> ReadText(const std::filesystem::path& path)
{
    if (auto readable = CheckReadable(path); readable.is_error())
        return readable.get_error();

    std::ifstream file(path);
    if (!file) {
        return DocumentError {
            .type = DocumentErrorType::READ_ERROR, .source = path.string(),
            .detail = "cannot open file"
        };
    }

    std::string text { std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>() };
    if (file.bad()) {
        return DocumentError {
            .type = DocumentErrorType::READ_ERROR, .source = path.string(),
            .detail = "read failed"
        };
    }

    return text;
}

void ForEachLine(std::istream& in, const LineCallback& cb)
{
    std::string line;
    for (size_t number = 1; std::getline(in, line); ++number) {
        std::string_view text = Trim(line);
        if (text.empty()) continue;
        if (!cb(number, text)) return;
    }
}

}
