#pragma once

#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <core/types.hpp>

// Creates one folder under parent and returns its handle.
using FolderCreator = std::function<EntityHandle(const std::string& name,
                                                 const EntityHandle& parent)>;

// Memo of remote containers by logical path ("syn123/prefix/01").
//
// The root (the project) is present from construction. A path is inserted at
// most once and only after its parent; entries never change. Writes come from
// the coordinator thread only, lookups may come from any thread.
class RemotePathCache {
public:
    RemotePathCache(std::string root_key, EntityHandle root);

    const std::string& root_key() const { return root_key_; }

    // "root_key/relative" with empty segments dropped, or root_key for an
    // empty relative path. This is the key ensure() caches under.
    std::string full_path(const std::string& relative) const;

    // Create every missing segment of `relative`, parents first, and return
    // the handle of the last one. Cached segments are not created again.
    // Throws FolderCreationError if the creator fails.
    EntityHandle ensure(const std::string& relative, const FolderCreator& creator);

    std::optional<EntityHandle> find(const std::string& full_path) const;

    // Throws std::logic_error if full_path is present or its parent is not.
    void insert(const std::string& full_path, EntityHandle handle);

private:
    std::string root_key_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, EntityHandle> entries_;
};

// "a/b/c" -> "a/b"; "a" -> "".
std::string remote_dirname(const std::string& path);
