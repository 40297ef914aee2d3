#include "manifest_writer.hpp"
#include <core/errors.hpp>
#include <extract/metadata_extractor.hpp>
#include <fmt/format.h>

std::vector<std::string> manifest_columns() {
    std::vector<std::string> columns = {"path", "parent", "name", "forceVersion"};
    for (const auto& field : annotation_schema()) {
        columns.emplace_back(field.name);
    }
    return columns;
}

std::string escape_manifest_cell(const std::string& cell) {
    if (cell.find_first_of("\t\"\r\n") == std::string::npos) return cell;

    std::string out = "\"";
    for (char c : cell) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

ManifestWriter::ManifestWriter(const std::filesystem::path& path)
    : path_(path), out_(path, std::ios::out | std::ios::trunc | std::ios::binary) {
    if (!out_) {
        throw StudyupError(fmt::format("Cannot write manifest {}", path.string()));
    }
    write_line(manifest_columns());
}

void ManifestWriter::write_row(const FileRecord& file, const EntityHandle& parent) {
    std::vector<std::string> cells = {
        file.full_path.string(), parent.id, file.computed_name, "True"};

    for (const auto& field : annotation_schema()) {
        auto it = file.annotations.find(field.name);
        cells.push_back(it == file.annotations.end() ? "" : format_typed_value(it->second));
    }
    write_line(cells);
    ++rows_;
}

void ManifestWriter::close() {
    if (!out_.is_open()) return;
    out_.flush();
    bool ok = out_.good();
    out_.close();
    if (!ok) {
        throw StudyupError(fmt::format("Error writing manifest {}", path_.string()));
    }
}

void ManifestWriter::write_line(const std::vector<std::string>& cells) {
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) out_ << '\t';
        out_ << escape_manifest_cell(cells[i]);
    }
    out_ << "\r\n";
}
