#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <core/cancellation.hpp>
#include <remote/remote_service.hpp>
#include "remote_path_cache.hpp"
#include "work_queue.hpp"

namespace fs = std::filesystem;

struct RetryPolicy {
    int max_attempts = UPLOAD_MAX_ATTEMPTS;
    std::chrono::milliseconds delay{UPLOAD_RETRY_DELAY_SECS * 1000};
};

struct UploadSettings {
    std::string username;
    std::string password;
    fs::path staging_dir;           // must exist; files are copied here under computed_name
    bool dry_run = false;
    bool verbose = false;           // log annotations with each file
    RetryPolicy retry;
};

struct UploadSummary {
    size_t succeeded = 0;
    size_t failed = 0;
    size_t canceled = 0;
    size_t skipped = 0;             // dry run: staged and logged, not stored
    size_t retries = 0;             // store attempts repeated after a failure
    std::vector<fs::path> failed_files;
};

// Phase 2 of an upload run: workers drain a shared queue of UploadJobs.
//
// Every worker authenticates its own session when it starts; the session is a
// local of the worker thread and dies with it. A job's staging copy is removed
// whatever happens to the job. A job that exhausts its attempts is recorded as
// failed and the worker moves on.
class UploadPool {
public:
    UploadPool(RemoteService& service, const RemotePathCache& cache,
               UploadSettings settings, CancellationToken& token);
    ~UploadPool();

    UploadPool(const UploadPool&) = delete;
    UploadPool& operator=(const UploadPool&) = delete;

    // Spawn `workers` threads (at least one).
    void start(size_t workers);

    // Queue one job. Returns false once the pool is finishing or canceled.
    bool submit(UploadJob job);

    // No more jobs: wait until every submitted job is done (or the token
    // fires), then join all workers.
    UploadSummary finish();

    size_t worker_count() const { return threads_.size(); }

private:
    enum class Outcome { Uploaded, Failed, Canceled, Skipped };

    void worker_loop(size_t worker_id);
    Outcome process(RemoteSession* session, const UploadJob& job);
    Outcome store_with_retry(RemoteSession& session, const fs::path& staged,
                             const EntityHandle& parent, const UploadJob& job);
    void record(Outcome outcome, const UploadJob& job);

    RemoteService& service_;
    const RemotePathCache& cache_;
    UploadSettings settings_;
    CancellationToken& token_;

    WorkQueue<UploadJob> queue_;
    WaitGroup pending_;
    std::vector<std::thread> threads_;
    std::unique_ptr<ScopedCancelListener> cancel_listener_;
    std::atomic<size_t> live_workers_{0};
    size_t submitted_ = 0;

    std::mutex summary_mutex_;
    UploadSummary summary_;
};
