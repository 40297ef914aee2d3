#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <thread>

namespace fs = std::filesystem;

UploaderConfig::UploaderConfig()
    : max_capacity(MAX_CONTAINER_CAPACITY),
      thread_count(default_thread_count()),
      log_file(DEFAULT_LOG_FILE),
      manifest_path(DEFAULT_MANIFEST_FILE) {
    endpoints.auth = DEFAULT_AUTH_ENDPOINT;
    endpoints.repo = DEFAULT_REPO_ENDPOINT;
    endpoints.file = DEFAULT_FILE_ENDPOINT;
}

Result<void> UploaderConfig::validate() const {
    if (project_id.empty()) {
        return Result<void>::Err("Project id is required");
    }
    if (local_path.empty()) {
        return Result<void>::Err("Local folder path is required");
    }
    std::error_code ec;
    if (!fs::is_directory(local_path, ec)) {
        return Result<void>::Err(fmt::format("Local folder does not exist: {}", local_path.string()));
    }
    if (max_capacity > MAX_CONTAINER_CAPACITY) {
        return Result<void>::Err(fmt::format(
            "Maximum object depth cannot be more than {}", MAX_CONTAINER_CAPACITY));
    }
    if (max_capacity < 1) {
        return Result<void>::Err("Maximum object depth must be at least 1");
    }
    if (thread_count < 1) {
        return Result<void>::Err("Thread count must be at least 1");
    }
    return Result<void>::Ok();
}

Result<void> load_config_file(const fs::path& path, UploaderConfig& cfg) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const std::exception& e) {
        return Result<void>::Err(fmt::format("Failed to read {}: {}", path.string(), e.what()));
    }

    try {
        if (root["threads"]) {
            int threads = root["threads"].as<int>();
            if (threads < 1) {
                return Result<void>::Err("threads must be at least 1");
            }
            cfg.thread_count = static_cast<size_t>(threads);
        }
        if (root["depth"]) {
            int depth = root["depth"].as<int>();
            if (depth < 1) {
                return Result<void>::Err("depth must be at least 1");
            }
            cfg.max_capacity = static_cast<size_t>(depth);
        }
        if (root["log_level"]) {
            auto level = parse_log_level(root["log_level"].as<std::string>());
            if (!level) {
                return Result<void>::Err("Unknown log_level: " + root["log_level"].as<std::string>());
            }
            cfg.log_level = *level;
        }
        if (root["log_file"]) {
            cfg.log_file = root["log_file"].as<std::string>();
        }
        if (root["username"]) {
            cfg.username = root["username"].as<std::string>("");
        }

        auto endpoints = root["endpoints"];
        if (endpoints && endpoints.IsMap()) {
            cfg.endpoints.auth = endpoints["auth"].as<std::string>(cfg.endpoints.auth);
            cfg.endpoints.repo = endpoints["repo"].as<std::string>(cfg.endpoints.repo);
            cfg.endpoints.file = endpoints["file"].as<std::string>(cfg.endpoints.file);
        }
    } catch (const YAML::Exception& e) {
        return Result<void>::Err(fmt::format("Invalid value in {}: {}", path.string(), e.what()));
    }

    return Result<void>::Ok();
}

std::optional<std::string> normalize_remote_path(const std::string& raw) {
    std::string s = raw;
    trim(s);
    s = join_remote_path(split_nonempty(s, '/'));
    if (s.empty()) return std::nullopt;
    return s;
}

size_t default_thread_count() {
    unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".studyup";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}
