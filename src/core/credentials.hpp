#pragma once

#include <string>
#include <map>
#include <functional>
#include <filesystem>
#include "types.hpp"

struct Credentials {
    std::string username;
    std::string password;
};

// Credentials stored as key=value lines (keys: username, password).
// The file is expected to be chmod 600; a warning is logged otherwise.
class CredentialStore {
public:
    explicit CredentialStore(std::filesystem::path path = default_path());

    // Get credential by key
    Result<std::string> get(const std::string& key) const;

    const std::filesystem::path& path() const { return path_; }

    // ~/.studyup/credentials
    static std::filesystem::path default_path();

private:
    std::filesystem::path path_;

    std::map<std::string, std::string> read_all() const;
};

// Asks the user for a value. secret=true means the input must not be echoed.
using PromptFn = std::function<std::string(const std::string& label, bool secret)>;

// Resolve username and password, each independently, from (in order):
// the given explicit values, SYNAPSE_USER / SYNAPSE_PASSWORD, the credential
// store, then the prompt (skipped if prompt is empty).
Credentials resolve_credentials(const std::string& username,
                                const std::string& password,
                                const CredentialStore& store,
                                const PromptFn& prompt);
