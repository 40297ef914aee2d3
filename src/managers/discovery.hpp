#pragma once

#include <filesystem>
#include <vector>
#include <core/types.hpp>
#include <core/cancellation.hpp>
#include <extract/metadata_extractor.hpp>

namespace fs = std::filesystem;

// Every non-empty regular file under root, one record each, ordered by path
// relative to root. computed_name starts as the file name. Unreadable
// directories are skipped; directory symlinks are not followed.
std::vector<FileRecord> scan_source_tree(const fs::path& root);

// Phase 1 of a run: scan the tree, then extract metadata for every record on
// min(thread_count, file count) workers. run() returns only after every
// record has been processed.
class DiscoveryPool {
public:
    DiscoveryPool(const MetadataExtractor& extractor, size_t thread_count,
                  CancellationToken& token);

    // Throws CancellationRequested if the token fires before the phase ends.
    std::vector<FileRecord> run(const fs::path& root);

private:
    const MetadataExtractor& extractor_;
    size_t thread_count_;
    CancellationToken& token_;
};
