#include "utils.hpp"
#include <algorithm>
#include <cctype>

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool ends_with_ci(const std::string& s, const std::string& suffix) {
    if (suffix.size() > s.size()) return false;
    return to_lower(s.substr(s.size() - suffix.size())) == to_lower(suffix);
}

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    std::string::size_type pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

std::string zero_pad(size_t n, int width) {
    std::string digits = std::to_string(n);
    if (static_cast<int>(digits.size()) >= width) return digits;
    return std::string(width - digits.size(), '0') + digits;
}

std::vector<std::string> split_nonempty(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (c == delimiter) {
            if (!current.empty()) parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) parts.push_back(current);
    return parts;
}

std::string join_remote_path(const std::vector<std::string>& segments) {
    std::string out;
    for (const auto& seg : segments) {
        if (seg.empty()) continue;
        if (!out.empty()) out += '/';
        out += seg;
    }
    return out;
}
