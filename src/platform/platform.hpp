#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory (honours TMPDIR).
std::filesystem::path temp_dir();

// Creates a fresh, private (0700) directory under temp_dir() whose name
// starts with prefix. Throws std::runtime_error on failure.
std::filesystem::path make_temp_dir(const std::string& prefix);

} // namespace platform
