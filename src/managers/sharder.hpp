#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

// Contiguous, capacity-bounded slice of the file list; one remote container.
struct Shard {
    size_t number = 1;          // 1-based
    std::string folder_name;    // empty when there is only one shard
    std::vector<FileRecord> files;
};

// Split records, in order, into ceil(N / max_capacity) shards of at most
// max_capacity files. With more than one shard each gets a zero-padded
// folder name ("01", "02", ...). No records -> no shards.
// Throws ConfigurationError if max_capacity is 0 or above the service limit.
std::vector<Shard> make_shards(std::vector<FileRecord> records, size_t max_capacity);

// Padding width for shard folder names: max(2, digits of shard_count).
int shard_name_width(size_t shard_count);

// Remote path of a shard relative to the project: prefix / folder_name.
std::string shard_remote_path(const std::optional<std::string>& remote_prefix,
                              const Shard& shard);
