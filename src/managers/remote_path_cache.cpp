#include "remote_path_cache.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <mutex>
#include <stdexcept>

std::string remote_dirname(const std::string& path) {
    auto slash = path.rfind('/');
    if (slash == std::string::npos) return "";
    return path.substr(0, slash);
}

RemotePathCache::RemotePathCache(std::string root_key, EntityHandle root)
    : root_key_(std::move(root_key)) {
    entries_.emplace(root_key_, std::move(root));
}

std::string RemotePathCache::full_path(const std::string& relative) const {
    auto segments = split_nonempty(relative, '/');
    segments.insert(segments.begin(), root_key_);
    return join_remote_path(segments);
}

EntityHandle RemotePathCache::ensure(const std::string& relative, const FolderCreator& creator) {
    std::string path = root_key_;
    EntityHandle parent = *find(root_key_);

    for (const auto& segment : split_nonempty(relative, '/')) {
        path += "/" + segment;

        if (auto cached = find(path)) {
            parent = *cached;
            continue;
        }

        log_info(fmt::format("Processing Folder: {}\n  -> {}",
                             path.substr(root_key_.size() + 1), path));

        EntityHandle created;
        try {
            created = creator(segment, parent);
        } catch (const CancellationRequested&) {
            throw;
        } catch (const std::exception& e) {
            throw FolderCreationError(path, e.what());
        }
        insert(path, created);
        parent = created;
    }
    return parent;
}

std::optional<EntityHandle> RemotePathCache::find(const std::string& full_path) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(full_path);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void RemotePathCache::insert(const std::string& full_path, EntityHandle handle) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (entries_.count(full_path) > 0) {
        throw std::logic_error("Remote path already cached: " + full_path);
    }
    if (entries_.count(remote_dirname(full_path)) == 0) {
        throw std::logic_error("Parent of remote path not cached: " + full_path);
    }
    entries_.emplace(full_path, std::move(handle));
}
