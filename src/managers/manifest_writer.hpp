#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <core/types.hpp>

// Tab-separated bulk-load manifest: one row per file, columns
// path, parent, name, forceVersion, then every annotation field.
class ManifestWriter {
public:
    // Truncates `path` and writes the header. Throws StudyupError if the file
    // cannot be opened.
    explicit ManifestWriter(const std::filesystem::path& path);

    ManifestWriter(const ManifestWriter&) = delete;
    ManifestWriter& operator=(const ManifestWriter&) = delete;

    // Absent annotations are written as empty cells.
    void write_row(const FileRecord& file, const EntityHandle& parent);

    // Flush and close. Throws StudyupError if anything failed to write.
    void close();

    size_t rows() const { return rows_; }
    const std::filesystem::path& path() const { return path_; }

private:
    void write_line(const std::vector<std::string>& cells);

    std::filesystem::path path_;
    std::ofstream out_;
    size_t rows_ = 0;
};

std::vector<std::string> manifest_columns();

// Quote a cell if it holds a tab, quote, CR or LF; inner quotes are doubled.
std::string escape_manifest_cell(const std::string& cell);
