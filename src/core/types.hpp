#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <variant>
#include <filesystem>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Calendar date parsed from a DICOM DA value (YYYYMMDD)
struct Date {
    int year = 0;
    int month = 0;
    int day = 0;

    bool operator==(const Date& o) const {
        return year == o.year && month == o.month && day == o.day;
    }
    bool operator!=(const Date& o) const { return !(*this == o); }
};

// Annotation value: String, Integer or Date
using TypedValue = std::variant<std::string, int64_t, Date>;

// Field name -> value. Absent fields are simply not present.
using Annotations = std::map<std::string, TypedValue>;

// One discovered local file.
struct FileRecord {
    std::filesystem::path source_dir;
    std::string original_name;
    std::filesystem::path full_path;
    std::string computed_name;      // display/upload name (deduplicated)
    Annotations annotations;
};

// Remote entity reference (project, folder or file)
struct EntityHandle {
    std::string name;
    std::string id;
};

// Unit of upload work: which shard container the file goes into
struct UploadJob {
    std::string shard_path;         // remote path relative to the project
    FileRecord file;
};
