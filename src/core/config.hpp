#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"
#include "log.hpp"

namespace fs = std::filesystem;

struct EndpointConfig {
    std::string auth;
    std::string repo;
    std::string file;
};

// Everything one run needs. Built from defaults, then the YAML defaults file,
// then the command line (later sources win).
struct UploaderConfig {
    std::string project_id;                      // e.g. "syn123456789"
    fs::path local_path;
    std::optional<std::string> remote_path;      // normalized: no leading/trailing '/'
    size_t max_capacity;                         // files per container
    size_t thread_count;
    bool manifest_only = false;
    bool dry_run = false;
    bool verbose = false;

    std::string username;
    std::string password;

    LogLevel log_level = LogLevel::Info;
    fs::path log_file;
    fs::path manifest_path;

    EndpointConfig endpoints;

    UploaderConfig();

    // Check required fields and limits. Does not touch the remote service.
    Result<void> validate() const;
};

// Overlay values from a YAML defaults file onto cfg.
// Recognized keys: threads, depth, log_level, log_file, username,
// endpoints.{auth,repo,file}. Unknown keys are ignored.
Result<void> load_config_file(const fs::path& path, UploaderConfig& cfg);

// Trim whitespace, drop empty '/' segments ("/a//b/" -> "a/b"). Returns
// nullopt if nothing is left.
std::optional<std::string> normalize_remote_path(const std::string& raw);

// Host core count (at least 1).
size_t default_thread_count();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
