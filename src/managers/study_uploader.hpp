#pragma once

#include <filesystem>
#include <memory>
#include <core/config.hpp>
#include <core/cancellation.hpp>
#include <remote/remote_service.hpp>
#include "sharder.hpp"
#include "upload_pool.hpp"

struct RunSummary {
    bool dry_run = false;
    bool manifest_only = false;
    size_t files = 0;
    size_t shards = 0;
    size_t renamed = 0;             // files given a "{n}_" prefix to stay unique
    size_t folders_created = 0;     // simulated ones included in a dry run
    size_t manifest_rows = 0;
    std::filesystem::path manifest_path;
    UploadSummary uploads;
};

// Runs one upload (or manifest) job end to end:
// login -> discover -> deduplicate -> shard -> create folders -> upload/manifest.
//
// Throws ConfigurationError before any remote call if the config is invalid,
// RemoteError if login or the project lookup fails, FolderCreationError if a
// container cannot be created and CancellationRequested if the token fires.
// Failed file uploads do not throw; they are reported in the summary.
class StudyUploader {
public:
    StudyUploader(UploaderConfig config, RemoteService& service, CancellationToken& token);

    void set_retry_policy(const RetryPolicy& policy) { retry_ = policy; }

    RunSummary run();

private:
    EntityHandle create_folder(const std::string& name, const EntityHandle& parent);
    void write_manifest(const std::vector<Shard>& shards, RemotePathCache& cache,
                        RunSummary& summary);
    void upload(const std::vector<Shard>& shards, RemotePathCache& cache,
                RunSummary& summary);
    void check_canceled() const;

    UploaderConfig config_;
    RemoteService& service_;
    CancellationToken& token_;
    RetryPolicy retry_;

    std::unique_ptr<RemoteSession> session_;   // coordinator thread only
    size_t folders_created_ = 0;
};
