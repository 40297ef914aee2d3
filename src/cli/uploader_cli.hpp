#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/config.hpp>
#include <core/types.hpp>

enum class CliAction { Run, Help, Version };

struct CliOptions {
    CliAction action = CliAction::Run;
    UploaderConfig config;
    std::filesystem::path config_file;     // empty if none was loaded
};

// Parse `studyup <project-id> <local-folder-path> [options]` (args excludes
// argv[0]). Defaults are overlaid with the YAML defaults file, then with the
// command line. Range checks on the result are left to
// UploaderConfig::validate().
Result<CliOptions> parse_command_line(const std::vector<std::string>& args);

void print_usage();
void print_version();

// Interactive prompt on the terminal; secret input is not echoed.
std::string prompt_user(const std::string& label, bool secret);
