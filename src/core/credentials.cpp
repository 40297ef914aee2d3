#include "credentials.hpp"
#include "config.hpp"
#include "log.hpp"
#include <cstdlib>
#include <fstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

CredentialStore::CredentialStore(fs::path path) : path_(std::move(path)) {}

fs::path CredentialStore::default_path() {
    return get_global_config_dir() / "credentials";
}

// Read all key=value pairs from the credentials file
std::map<std::string, std::string> CredentialStore::read_all() const {
    std::map<std::string, std::string> m;
    std::ifstream f(path_);
    if (!f) return m;

    struct stat st;
    if (stat(path_.c_str(), &st) == 0 && (st.st_mode & (S_IRWXG | S_IRWXO)) != 0) {
        log_warning("Credentials file " + path_.string() + " is readable by others (chmod 600 it)");
    }

    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        auto eq = line.find('=');
        if (eq != std::string::npos) {
            m[line.substr(0, eq)] = line.substr(eq + 1);
        }
    }
    return m;
}

Result<std::string> CredentialStore::get(const std::string& key) const {
    auto m = read_all();
    auto it = m.find(key);
    if (it == m.end() || it->second.empty()) {
        return Result<std::string>::Err("Credential not found");
    }
    return Result<std::string>::Ok(it->second);
}

static std::string resolve_one(const std::string& explicit_value,
                               const char* env_name,
                               const std::string& store_key,
                               const CredentialStore& store,
                               const PromptFn& prompt,
                               const std::string& label,
                               bool secret) {
    if (!explicit_value.empty()) return explicit_value;

    const char* env = std::getenv(env_name);
    if (env && *env) return env;

    auto stored = store.get(store_key);
    if (stored.is_ok()) return stored.value;

    if (prompt) return prompt(label, secret);
    return "";
}

Credentials resolve_credentials(const std::string& username,
                                const std::string& password,
                                const CredentialStore& store,
                                const PromptFn& prompt) {
    Credentials c;
    c.username = resolve_one(username, "SYNAPSE_USER", "username", store, prompt,
                             "Synapse username", false);
    c.password = resolve_one(password, "SYNAPSE_PASSWORD", "password", store, prompt,
                             "Synapse password", true);
    return c;
}
