#include "upload_pool.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <extract/metadata_extractor.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace {

// Copy of a source file under its upload name. Removed on destruction.
class StagedFile {
public:
    StagedFile(const fs::path& source, const fs::path& staged) : path_(staged) {
        fs::copy_file(source, path_, fs::copy_options::overwrite_existing);
    }

    ~StagedFile() {
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            log_warning(fmt::format("Could not remove staged file {}: {}",
                                    path_.string(), ec.message()));
        }
    }

    StagedFile(const StagedFile&) = delete;
    StagedFile& operator=(const StagedFile&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

} // namespace

UploadPool::UploadPool(RemoteService& service, const RemotePathCache& cache,
                       UploadSettings settings, CancellationToken& token)
    : service_(service), cache_(cache), settings_(std::move(settings)), token_(token) {}

UploadPool::~UploadPool() {
    if (!threads_.empty()) {
        queue_.abort();
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
    }
}

void UploadPool::start(size_t workers) {
    workers = std::max<size_t>(workers, 1);
    cancel_listener_ = std::make_unique<ScopedCancelListener>(token_, [this] { queue_.abort(); });

    live_workers_ = workers;
    threads_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        threads_.emplace_back(&UploadPool::worker_loop, this, i + 1);
    }
}

bool UploadPool::submit(UploadJob job) {
    if (token_.is_canceled()) return false;
    pending_.add();
    if (!queue_.push(std::move(job))) {
        pending_.done();
        return false;
    }
    ++submitted_;
    return true;
}

UploadSummary UploadPool::finish() {
    queue_.close();
    bool completed = pending_.wait(token_);
    if (!completed) {
        size_t dropped = queue_.abort();
        log_debug(fmt::format("Dropped {} queued uploads", dropped));
    }

    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
    cancel_listener_.reset();

    std::lock_guard<std::mutex> lock(summary_mutex_);
    size_t accounted = summary_.succeeded + summary_.failed + summary_.skipped + summary_.canceled;
    if (submitted_ > accounted) {
        summary_.canceled += submitted_ - accounted;
    }
    return summary_;
}

void UploadPool::worker_loop(size_t worker_id) {
    std::unique_ptr<RemoteSession> session;
    try {
        session = service_.authenticate(settings_.username, settings_.password);
    } catch (const std::exception& e) {
        log_error(fmt::format("Upload worker {} could not log in: {}", worker_id, e.what()));
    }

    if (!session) {
        // The last worker standing keeps draining so the run can finish; the
        // jobs it takes fail without a session.
        if (--live_workers_ > 0) return;
    }

    while (auto job = queue_.pop()) {
        Outcome outcome = session ? process(session.get(), *job) : Outcome::Failed;
        if (!session) {
            log_error(fmt::format("Failed to upload file: {}", job->file.full_path.string()));
        }
        record(outcome, *job);
        pending_.done();
    }
}

UploadPool::Outcome UploadPool::process(RemoteSession* session, const UploadJob& job) {
    if (token_.is_canceled()) return Outcome::Canceled;

    const FileRecord& file = job.file;
    std::string folder = cache_.full_path(job.shard_path);
    std::string remote = join_remote_path({folder, file.computed_name});

    auto parent = cache_.find(folder);
    if (!parent) {
        log_error(fmt::format("No remote folder for {} ({})", file.full_path.string(), folder));
        return Outcome::Failed;
    }

    std::unique_ptr<StagedFile> staged;
    try {
        staged = std::make_unique<StagedFile>(file.full_path, settings_.staging_dir / file.computed_name);
    } catch (const fs::filesystem_error& e) {
        log_error(fmt::format("Could not stage {}: {}", file.full_path.string(), e.what()));
        return Outcome::Failed;
    }

    log_info(fmt::format("Processing File: {}\n  -> {}", file.full_path.string(), remote));
    if (settings_.verbose) {
        for (const auto& [key, value] : file.annotations) {
            log_info(fmt::format("    -> {}: {}", key, format_typed_value(value)));
        }
    }

    if (settings_.dry_run) return Outcome::Skipped;

    return store_with_retry(*session, staged->path(), *parent, job);
}

UploadPool::Outcome UploadPool::store_with_retry(RemoteSession& session, const fs::path& staged,
                                                 const EntityHandle& parent, const UploadJob& job) {
    const std::string source = job.file.full_path.string();
    const int max_attempts = std::max(settings_.retry.max_attempts, 1);

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (token_.is_canceled()) return Outcome::Canceled;

        try {
            session.store_file(staged, parent, job.file.annotations, StoreOptions{});
            return Outcome::Uploaded;
        } catch (const std::exception& e) {
            log_error(fmt::format("Error uploading file: {} ({}/{}): {}",
                                  source, attempt, max_attempts, e.what()));
        }

        if (attempt == max_attempts) break;

        log_info(fmt::format("Retrying: {}", source));
        {
            std::lock_guard<std::mutex> lock(summary_mutex_);
            ++summary_.retries;
        }
        if (token_.wait_for(settings_.retry.delay)) return Outcome::Canceled;
    }

    log_error(fmt::format("Failed to upload file: {}", source));
    return Outcome::Failed;
}

void UploadPool::record(Outcome outcome, const UploadJob& job) {
    std::lock_guard<std::mutex> lock(summary_mutex_);
    switch (outcome) {
        case Outcome::Uploaded: ++summary_.succeeded; break;
        case Outcome::Skipped:  ++summary_.skipped; break;
        case Outcome::Canceled: ++summary_.canceled; break;
        case Outcome::Failed:
            ++summary_.failed;
            summary_.failed_files.push_back(job.file.full_path);
            break;
    }
}
