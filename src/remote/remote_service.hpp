#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <core/types.hpp>

struct StoreOptions {
    bool force_version = false;     // create a new version when the entity exists
};

// One authenticated connection to the storage service. Not thread-safe: a
// session belongs to exactly one thread for its whole lifetime.
// All calls throw RemoteError on failure.
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    virtual EntityHandle get_project(const std::string& project_id) = 0;

    // Create a folder under parent. If a child of that name already exists
    // it is returned instead (reruns do not duplicate containers).
    virtual EntityHandle create_folder(const std::string& name, const EntityHandle& parent) = 0;

    // Upload a file under parent; the entity is named after the file's name.
    virtual EntityHandle store_file(const std::filesystem::path& path,
                                    const EntityHandle& parent,
                                    const Annotations& annotations,
                                    const StoreOptions& options) = 0;
};

// Session factory. authenticate() may be called concurrently from worker
// threads; each call yields an independent session.
class RemoteService {
public:
    virtual ~RemoteService() = default;

    // Throws RemoteError if the credentials are rejected.
    virtual std::unique_ptr<RemoteSession> authenticate(const std::string& username,
                                                        const std::string& password) = 0;
};
