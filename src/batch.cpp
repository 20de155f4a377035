#include "batch.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>

namespace labelcheck
{

namespace
{

tb::result<std::vector<std::filesystem::path>, DocumentError>
CollectFiles(const std::filesystem::path& root)
{
    std::error_code ec;
    std::vector<std::filesystem::path> files;

    for (auto it = std::filesystem::recursive_directory_iterator(root, ec);
         !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == ".json")
            files.push_back(it->path());
    }

    if (ec) {
        return DocumentError {
            .type = DocumentErrorType::READ_ERROR, .source = root.string(),
            .detail = ec.message()
        };
    }

    std::sort(files.begin(), files.end());
    return files;
}

}

std::string BatchReport::Summary() const
{
    return fmt::format("{} / {} annotations are valid.", valid, checked);
}

tb::result<BatchReport, DocumentError> ValidateTree(const Validator& validator,
    const std::filesystem::path& root, unsigned threads)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return DocumentError {
            .type = DocumentErrorType::FILE_NOT_FOUND, .source = root.string()
        };
    }

    auto collected = CollectFiles(root);
    if (collected.is_error()) return collected.get_error();
    const std::vector<std::filesystem::path>& paths = collected.get_unchecked();

    if (threads == 0) threads = std::max(1u, std::thread::hardware_concurrency());
    threads = std::min<size_t>(threads, std::max<size_t>(paths.size(), 1));

    BatchReport report;
    report.files.resize(paths.size());
    std::atomic<size_t> checked = 0, valid = 0;

    // Each worker takes every n-th file and only writes its own slots
    auto work = [&] (size_t first) {
        for (size_t i = first; i < paths.size(); i += threads) {
            FileResult& result = report.files[i];
            result.path = paths[i].lexically_relative(root);

            auto file_report = validator.EvaluateFile(paths[i]);
            if (file_report.is_error()) {
                result.error = Describe(file_report.get_error());
                logger(LogLevel::WARNING, result.error);
                ++checked;
                continue;
            }

            result.outcome = file_report.get_unchecked().outcome;
            logger(LogLevel::DEBUG, fmt::format("{}: {}", result.path.string(),
                                                OutcomeName(*result.outcome)));
            switch (*result.outcome) {
            case Outcome::PASSED:
                ++valid;
                ++checked;
                break;
            case Outcome::FAILED:
                ++checked;
                break;
            case Outcome::SKIPPED:
                break;
            }
        }
    };

    // The calling thread takes the first stripe, and every stripe whose
    // thread could not be started
    std::vector<std::thread> workers;
    workers.reserve(threads - 1);
    size_t started = 1;
    try {
        for (; started < threads; ++started) workers.emplace_back(work, started);
    } catch (const std::system_error& e) {
        logger(LogLevel::WARNING, fmt::format("Started {} of {} worker threads: {}",
                                              started - 1, threads - 1, e.what()));
    }

    work(0);
    for (size_t i = started; i < threads; ++i) work(i);
    for (std::thread& t : workers) t.join();

    report.checked = checked;
    report.valid = valid;

    logger(LogLevel::INFO, fmt::format("{}: {}", root.string(), report.Summary()));
    return report;
}

}
