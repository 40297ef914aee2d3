#include "discovery.hpp"
#include "work_queue.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <thread>

namespace fs = std::filesystem;

std::vector<FileRecord> scan_source_tree(const fs::path& root) {
    std::vector<std::pair<std::string, FileRecord>> found;

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        log_error(fmt::format("Cannot read directory {}: {}", root.string(), ec.message()));
        return {};
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            log_error(fmt::format("Directory walk under {} stopped early: {}",
                                  root.string(), ec.message()));
            break;
        }

        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) continue;

        // Empty files error when stored remotely
        auto size = it->file_size(entry_ec);
        if (entry_ec) {
            log_warning(fmt::format("Cannot stat {}: {}", it->path().string(), entry_ec.message()));
            continue;
        }
        if (size < 1) continue;

        FileRecord record;
        record.full_path = it->path();
        record.source_dir = it->path().parent_path();
        record.original_name = it->path().filename().string();
        record.computed_name = record.original_name;
        found.emplace_back(fs::relative(it->path(), root, entry_ec).generic_string(), std::move(record));
    }

    std::sort(found.begin(), found.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<FileRecord> records;
    records.reserve(found.size());
    for (auto& [rel, record] : found) {
        records.push_back(std::move(record));
    }
    return records;
}

DiscoveryPool::DiscoveryPool(const MetadataExtractor& extractor, size_t thread_count,
                             CancellationToken& token)
    : extractor_(extractor), thread_count_(thread_count), token_(token) {}

std::vector<FileRecord> DiscoveryPool::run(const fs::path& root) {
    auto records = scan_source_tree(root);
    if (records.empty()) return records;

    // Each index is handed to exactly one worker, so records need no locking.
    WorkQueue<size_t> queue;
    for (size_t i = 0; i < records.size(); ++i) {
        queue.push(i);
    }
    queue.close();

    ScopedCancelListener stop(token_, [&queue] { queue.abort(); });

    size_t workers = std::min(thread_count_, records.size());
    if (workers == 0) workers = 1;
    log_debug(fmt::format("Metadata threads: {}", workers));

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        threads.emplace_back([&] {
            size_t remaining = 0;
            while (auto idx = queue.pop(&remaining)) {
                if (token_.is_canceled()) break;
                if (remaining % EXTRACT_PROGRESS_EVERY == 0 && remaining > 0) {
                    log_info(fmt::format("{} files remaining...", remaining));
                }
                extractor_.extract(records[*idx]);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    if (token_.is_canceled()) {
        throw CancellationRequested();
    }
    return records;
}
