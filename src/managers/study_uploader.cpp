#include "study_uploader.hpp"
#include "discovery.hpp"
#include "manifest_writer.hpp"
#include "name_dedup.hpp"
#include "remote_path_cache.hpp"
#include "sharder.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <extract/metadata_extractor.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace {

// Run-private directory for staged copies. Removed with everything in it.
class StagingDir {
public:
    StagingDir() : path_(platform::make_temp_dir("studyup-")) {}

    ~StagingDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            log_warning(fmt::format("Could not remove staging directory {}: {}",
                                    path_.string(), ec.message()));
        }
    }

    StagingDir(const StagingDir&) = delete;
    StagingDir& operator=(const StagingDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

} // namespace

StudyUploader::StudyUploader(UploaderConfig config, RemoteService& service,
                             CancellationToken& token)
    : config_(std::move(config)), service_(service), token_(token) {}

RunSummary StudyUploader::run() {
    auto valid = config_.validate();
    if (valid.is_err()) {
        throw ConfigurationError(valid.error);
    }

    RunSummary summary;
    summary.dry_run = config_.dry_run;
    summary.manifest_only = config_.manifest_only;

    if (config_.dry_run) {
        log_info("~~ Dry Run ~~");
    }

    log_info("Logging into Synapse...");
    session_ = service_.authenticate(config_.username, config_.password);

    EntityHandle project = session_->get_project(config_.project_id);
    RemotePathCache cache(config_.project_id, project);

    log_info(fmt::format("Upload to Project: {} ({})", project.name, project.id));
    log_info(fmt::format("Upload Directory: {}", config_.local_path.string()));
    log_info(fmt::format("Upload To: {}", cache.full_path(config_.remote_path.value_or(""))));
    log_info(fmt::format("Max Threads: {}", config_.thread_count));

    log_info("Loading Files...");
    MetadataExtractor extractor;
    DiscoveryPool discovery(extractor, config_.thread_count, token_);
    auto records = discovery.run(config_.local_path);

    summary.files = records.size();
    summary.renamed = deduplicate_names(records);
    auto shards = make_shards(std::move(records), config_.max_capacity);
    summary.shards = shards.size();

    log_info(fmt::format("Total Synapse Folders: {}", shards.size()));
    log_info(fmt::format("Total Files: {}", summary.files));
    if (summary.renamed > 0) {
        log_debug(fmt::format("Renamed {} files with duplicate names", summary.renamed));
    }

    check_canceled();

    if (config_.manifest_only) {
        log_info("Generating Manifest File...");
        write_manifest(shards, cache, summary);
    } else {
        log_info("Uploading Files...");
        upload(shards, cache, summary);
    }

    summary.folders_created = folders_created_;
    return summary;
}

EntityHandle StudyUploader::create_folder(const std::string& name, const EntityHandle& parent) {
    ++folders_created_;
    if (config_.dry_run) {
        return EntityHandle{name, DRY_RUN_PLACEHOLDER_ID};
    }
    return session_->create_folder(name, parent);
}

void StudyUploader::write_manifest(const std::vector<Shard>& shards, RemotePathCache& cache,
                                   RunSummary& summary) {
    auto creator = [this](const std::string& name, const EntityHandle& parent) {
        return create_folder(name, parent);
    };

    if (config_.remote_path) {
        cache.ensure(*config_.remote_path, creator);
    }

    ManifestWriter writer(config_.manifest_path);
    for (const auto& shard : shards) {
        check_canceled();

        std::string folder = shard_remote_path(config_.remote_path, shard);
        EntityHandle parent = cache.ensure(folder, creator);

        for (const auto& file : shard.files) {
            log_info(fmt::format("{} -> {}", file.full_path.string(),
                                 cache.full_path(join_remote_path({folder, file.computed_name}))));
            writer.write_row(file, parent);
        }
    }
    writer.close();

    summary.manifest_rows = writer.rows();
    summary.manifest_path = writer.path();
    log_info(fmt::format("Manifest written to: {}", writer.path().string()));
}

void StudyUploader::upload(const std::vector<Shard>& shards, RemotePathCache& cache,
                           RunSummary& summary) {
    auto creator = [this](const std::string& name, const EntityHandle& parent) {
        return create_folder(name, parent);
    };

    if (summary.files == 0) {
        if (config_.remote_path) {
            cache.ensure(*config_.remote_path, creator);
        }
        log_info("No files to upload.");
        return;
    }

    StagingDir staging;

    UploadSettings settings;
    settings.username = config_.username;
    settings.password = config_.password;
    settings.staging_dir = staging.path();
    settings.dry_run = config_.dry_run;
    settings.verbose = config_.verbose;
    settings.retry = retry_;

    UploadPool pool(service_, cache, settings, token_);
    pool.start(std::min(config_.thread_count, summary.files));
    log_info(fmt::format("Total Threads: {}", pool.worker_count()));

    if (config_.remote_path) {
        cache.ensure(*config_.remote_path, creator);
    }

    for (const auto& shard : shards) {
        if (token_.is_canceled()) break;

        std::string folder = shard_remote_path(config_.remote_path, shard);
        cache.ensure(folder, creator);

        for (const auto& file : shard.files) {
            if (!pool.submit(UploadJob{folder, file})) break;
        }
    }

    summary.uploads = pool.finish();
    check_canceled();

    const auto& u = summary.uploads;
    if (config_.dry_run) {
        log_info(fmt::format("Dry Run Completed. {} files checked.", u.skipped));
    } else {
        log_info(fmt::format("Upload Completed. {} uploaded, {} failed, {} retries.",
                             u.succeeded, u.failed, u.retries));
    }
    for (const auto& path : u.failed_files) {
        log_error(fmt::format("Not uploaded: {}", path.string()));
    }
}

void StudyUploader::check_canceled() const {
    if (token_.is_canceled()) {
        throw CancellationRequested();
    }
}
