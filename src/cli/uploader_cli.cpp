#include "uploader_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/terminal.hpp>
#include <fmt/format.h>
#include <unistd.h>
#include <iostream>
#include <optional>

namespace fs = std::filesystem;

static constexpr const char* STUDYUP_VERSION = "1.0.0";

// ── Option parsing ──────────────────────────────────────

namespace {

// Strict positive integer: the whole string must be digits.
std::optional<size_t> parse_count(const std::string& s) {
    if (s.empty() || s.size() > 9) return std::nullopt;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    return static_cast<size_t>(std::stoul(s));
}

// Splits "--name=value"; the value is empty when there is no '='.
std::pair<std::string, std::optional<std::string>> split_option(const std::string& arg) {
    auto eq = arg.find('=');
    if (arg.rfind("--", 0) != 0 || eq == std::string::npos) return {arg, std::nullopt};
    return {arg.substr(0, eq), arg.substr(eq + 1)};
}

// Location of the defaults file: --config wins over the global default.
std::optional<fs::path> find_config_file(const std::vector<std::string>& args, bool& explicit_path) {
    explicit_path = false;
    for (size_t i = 0; i < args.size(); ++i) {
        auto [name, inline_value] = split_option(args[i]);
        if (name != "--config") continue;
        explicit_path = true;
        if (inline_value) return fs::path(*inline_value);
        if (i + 1 < args.size()) return fs::path(args[i + 1]);
        return std::nullopt;
    }
    std::error_code ec;
    fs::path global = get_global_config_path();
    if (fs::exists(global, ec)) return global;
    return std::nullopt;
}

} // namespace

Result<CliOptions> parse_command_line(const std::vector<std::string>& args) {
    CliOptions opts;

    for (const auto& a : args) {
        if (a == "-h" || a == "--help") {
            opts.action = CliAction::Help;
            return Result<CliOptions>::Ok(opts);
        }
        if (a == "--version") {
            opts.action = CliAction::Version;
            return Result<CliOptions>::Ok(opts);
        }
    }

    UploaderConfig& cfg = opts.config;

    bool explicit_config = false;
    auto config_file = find_config_file(args, explicit_config);
    if (explicit_config && !config_file) {
        return Result<CliOptions>::Err("--config requires a value");
    }
    if (config_file) {
        std::error_code ec;
        if (!fs::exists(*config_file, ec)) {
            return Result<CliOptions>::Err("Config file not found: " + config_file->string());
        }
        auto loaded = load_config_file(*config_file, cfg);
        if (loaded.is_err()) return Result<CliOptions>::Err(loaded.error);
        opts.config_file = *config_file;
    }

    std::vector<std::string> positional;
    for (size_t i = 0; i < args.size(); ++i) {
        auto [name, inline_value] = split_option(args[i]);

        auto value = [&](std::string& out) -> bool {
            if (inline_value) { out = *inline_value; return true; }
            if (i + 1 >= args.size()) return false;
            out = args[++i];
            return true;
        };
        auto missing = [&] {
            return Result<CliOptions>::Err(fmt::format("{} requires a value", name));
        };

        std::string v;
        if (name == "-r" || name == "--remote-folder-path") {
            if (!value(v)) return missing();
            cfg.remote_path = normalize_remote_path(v);
        } else if (name == "-u" || name == "--username") {
            if (!value(v)) return missing();
            cfg.username = v;
        } else if (name == "-p" || name == "--password") {
            if (!value(v)) return missing();
            cfg.password = v;
        } else if (name == "-d" || name == "--depth") {
            if (!value(v)) return missing();
            auto n = parse_count(v);
            if (!n) return Result<CliOptions>::Err("Invalid depth: " + v);
            cfg.max_capacity = *n;
        } else if (name == "-t" || name == "--threads") {
            if (!value(v)) return missing();
            auto n = parse_count(v);
            if (!n) return Result<CliOptions>::Err("Invalid thread count: " + v);
            cfg.thread_count = *n;
        } else if (name == "-cmo" || name == "--create-manifest-only") {
            cfg.manifest_only = true;
        } else if (name == "-dr" || name == "--dry-run") {
            cfg.dry_run = true;
        } else if (name == "-v" || name == "--verbose") {
            cfg.verbose = true;
        } else if (name == "-l" || name == "--log-level") {
            if (!value(v)) return missing();
            auto level = parse_log_level(v);
            if (!level) return Result<CliOptions>::Err("Unknown log level: " + v);
            cfg.log_level = *level;
        } else if (name == "--log-file") {
            if (!value(v)) return missing();
            cfg.log_file = v;
        } else if (name == "--manifest") {
            if (!value(v)) return missing();
            cfg.manifest_path = v;
        } else if (name == "--config") {
            if (!inline_value) ++i;     // already loaded above
        } else if (!name.empty() && name[0] == '-' && name.size() > 1) {
            return Result<CliOptions>::Err("Unknown option: " + name);
        } else {
            positional.push_back(args[i]);
        }
    }

    if (positional.size() < 2) {
        return Result<CliOptions>::Err("Expected <project-id> <local-folder-path>");
    }
    if (positional.size() > 2) {
        return Result<CliOptions>::Err("Unexpected argument: " + positional[2]);
    }

    cfg.project_id = positional[0];
    trim(cfg.project_id);
    cfg.local_path = fs::absolute(positional[1]).lexically_normal();
    if (!cfg.local_path.has_filename() && cfg.local_path.has_parent_path()) {
        cfg.local_path = cfg.local_path.parent_path();
    }
    return Result<CliOptions>::Ok(opts);
}

// ── Usage ───────────────────────────────────────────────

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    studyup " << theme::color::RESET
              << theme::color::BROWN << "<project-id> <local-folder-path>" << theme::color::RESET
              << theme::color::DIM << " [options]" << theme::color::RESET << "\n";

    std::cout << theme::section("Options");
    std::cout << theme::usage_row("-r, --remote-folder-path <path>", "Folder in the project to upload into");
    std::cout << theme::usage_row("-u, --username <name>", "Synapse username");
    std::cout << theme::usage_row("-p, --password <password>", "Synapse password");
    std::cout << theme::usage_row("-d, --depth <n>",
                                  fmt::format("Max files per folder (default {})", MAX_CONTAINER_CAPACITY));
    std::cout << theme::usage_row("-t, --threads <n>",
                                  fmt::format("Worker threads (default {})", default_thread_count()));
    std::cout << theme::usage_row("-cmo, --create-manifest-only", "Write a manifest instead of uploading");
    std::cout << theme::usage_row("-dr, --dry-run", "Log what would happen, change nothing");
    std::cout << theme::usage_row("-v, --verbose", "Log annotations for each file");
    std::cout << theme::usage_row("-l, --log-level <level>", "debug, info, warning or error");
    std::cout << theme::usage_row("--log-file <path>", fmt::format("Log file (default {})", DEFAULT_LOG_FILE));
    std::cout << theme::usage_row("--manifest <path>",
                                  fmt::format("Manifest file (default {})", DEFAULT_MANIFEST_FILE));
    std::cout << theme::usage_row("--config <path>", "YAML defaults (default ~/.studyup/config.yaml)");
    std::cout << theme::usage_row("-h, --help", "Show this help");
    std::cout << theme::usage_row("--version", "Show version");
    std::cout << "\n";
}

void print_version() {
    std::cout << theme::color::BROWN << theme::color::BOLD << "studyup"
              << theme::color::RESET << theme::color::DIM
              << " version " << STUDYUP_VERSION << theme::color::RESET << "\n";
}

// ── Prompts ─────────────────────────────────────────────

static std::string read_password(const std::string& prompt) {
    std::cout << prompt;
    std::cout.flush();

    platform::NoEchoGuard guard;

    std::string password;
    if (!platform::stdin_is_tty()) {
        std::getline(std::cin, password);
        return password;
    }

    // Read character by character (no echo, no canonical)
    while (true) {
        if (!platform::poll_stdin(60000)) break;
        char c;
        if (read(STDIN_FILENO, &c, 1) != 1) break;
        if (c == '\n' || c == '\r') break;
        if (c == 127 || c == 8) {  // backspace
            if (!password.empty()) password.pop_back();
            continue;
        }
        if (c >= 32) password += c;
    }

    std::cout << "\n";
    return password;
}

std::string prompt_user(const std::string& label, bool secret) {
    std::string prompt = theme::color::BROWN + "    " + label + ": " + theme::color::RESET;
    if (secret) return read_password(prompt);

    std::cout << prompt;
    std::cout.flush();
    std::string answer;
    if (!std::getline(std::cin, answer)) return "";
    trim(answer);
    return answer;
}
