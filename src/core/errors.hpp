#pragma once

#include <stdexcept>
#include <string>

// Base for every error raised by the upload pipeline.
class StudyupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Invalid configuration (e.g. shard capacity above the service ceiling).
// Raised before any work starts.
class ConfigurationError : public StudyupError {
public:
    using StudyupError::StudyupError;
};

// An annotated file could not be opened or parsed. Recovered per file.
class ExtractionError : public StudyupError {
public:
    using StudyupError::StudyupError;
};

// A remote container could not be created. Fatal to the run.
class FolderCreationError : public StudyupError {
public:
    FolderCreationError(const std::string& path, const std::string& reason)
        : StudyupError("Could not create folder " + path + ": " + reason), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Any failed call to the remote service. http_status is 0 for transport errors.
class RemoteError : public StudyupError {
public:
    explicit RemoteError(const std::string& msg, int http_status = 0)
        : StudyupError(msg), http_status_(http_status) {}

    int http_status() const { return http_status_; }
    bool is_conflict() const { return http_status_ == 409; }

private:
    int http_status_;
};

// The run was interrupted. Not a real failure; main exits non-zero.
class CancellationRequested : public StudyupError {
public:
    CancellationRequested() : StudyupError("Canceled") {}
};
