#pragma once

#include <cstddef>

// ── Service limits ──────────────────────────────────────────
// Maximum number of children under one Synapse project/folder.
constexpr size_t MAX_CONTAINER_CAPACITY  = 10000;

// ── Upload retry ────────────────────────────────────────────
constexpr int UPLOAD_MAX_ATTEMPTS        = 5;
constexpr int UPLOAD_RETRY_DELAY_SECS    = 3;     // Pause between failed store attempts

// ── Dry run ─────────────────────────────────────────────────
// Id given to simulated folders so they can still be used as parents.
constexpr const char* DRY_RUN_PLACEHOLDER_ID = "syn0";

// ── Progress ────────────────────────────────────────────────
constexpr size_t EXTRACT_PROGRESS_EVERY  = 1000;  // Log remaining count at multiples of this

// ── Shard folder names ──────────────────────────────────────
constexpr int MIN_SHARD_NAME_WIDTH       = 2;     // "01", "02", ...

// ── Defaults ────────────────────────────────────────────────
constexpr const char* DEFAULT_LOG_FILE      = "log.txt";
constexpr const char* DEFAULT_MANIFEST_FILE = "manifest.tsv";
constexpr const char* ANNOTATED_EXTENSION   = ".dcm";

// ── Synapse endpoints ───────────────────────────────────────
constexpr const char* DEFAULT_AUTH_ENDPOINT = "https://auth-prod.prod.sagebase.org/auth/v1";
constexpr const char* DEFAULT_REPO_ENDPOINT = "https://repo-prod.prod.sagebase.org/repo/v1";
constexpr const char* DEFAULT_FILE_ENDPOINT = "https://repo-prod.prod.sagebase.org/file/v1";

// ── HTTP ────────────────────────────────────────────────────
constexpr long HTTP_CONNECT_TIMEOUT_SECS = 30;
constexpr long HTTP_REQUEST_TIMEOUT_SECS = 300;   // Per call; upload retry wraps whole calls
constexpr size_t MULTIPART_MIN_PART_BYTES = 5 * 1024 * 1024;
constexpr size_t MULTIPART_MAX_PARTS      = 10000;

// ── Process exit codes ──────────────────────────────────────
constexpr int EXIT_CANCELED = 130;   // 128 + SIGINT
