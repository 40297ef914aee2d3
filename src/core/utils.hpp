#pragma once

#include <string>
#include <vector>

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

std::string to_lower(std::string s);

// Case-insensitive suffix test ("scan.DCM" ends with ".dcm").
bool ends_with_ci(const std::string& s, const std::string& suffix);

// Replace every occurrence of `from` with `to`.
std::string replace_all(std::string s, const std::string& from, const std::string& to);

// Left-pad a number with zeros to at least `width` digits.
std::string zero_pad(size_t n, int width);

// Split on a delimiter, dropping empty segments ("a//b/" -> {"a","b"}).
std::vector<std::string> split_nonempty(const std::string& s, char delimiter);

// Join remote path segments with '/', skipping empty ones.
std::string join_remote_path(const std::vector<std::string>& segments);
