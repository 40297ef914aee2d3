#include "platform.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <vector>
#include <stdlib.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path make_temp_dir(const std::string& prefix) {
    std::string templ = (temp_dir() / (prefix + "_XXXXXX")).string();
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        throw std::runtime_error("Cannot create temporary directory " + templ + ": "
                                 + std::strerror(errno));
    }
    return fs::path(buf.data());
}

} // namespace platform
