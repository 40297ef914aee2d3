#include "sharder.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <iterator>

std::vector<Shard> make_shards(std::vector<FileRecord> records, size_t max_capacity) {
    if (max_capacity == 0 || max_capacity > MAX_CONTAINER_CAPACITY) {
        throw ConfigurationError(fmt::format(
            "Shard capacity must be between 1 and {}, got {}", MAX_CONTAINER_CAPACITY, max_capacity));
    }

    std::vector<Shard> shards;
    size_t total = records.size();
    size_t count = (total + max_capacity - 1) / max_capacity;
    shards.reserve(count);

    int width = shard_name_width(count);
    for (size_t start = 0; start < total; start += max_capacity) {
        size_t end = std::min(start + max_capacity, total);
        Shard shard;
        shard.number = shards.size() + 1;
        if (count > 1) {
            shard.folder_name = zero_pad(shard.number, width);
        }
        shard.files.assign(std::make_move_iterator(records.begin() + start),
                           std::make_move_iterator(records.begin() + end));
        shards.push_back(std::move(shard));
    }
    return shards;
}

int shard_name_width(size_t shard_count) {
    int digits = static_cast<int>(std::to_string(shard_count).size());
    return std::max(MIN_SHARD_NAME_WIDTH, digits);
}

std::string shard_remote_path(const std::optional<std::string>& remote_prefix,
                              const Shard& shard) {
    return join_remote_path({remote_prefix.value_or(""), shard.folder_name});
}
