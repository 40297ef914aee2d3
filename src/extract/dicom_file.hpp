#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

class DcmFileFormat;

// Read-only view of a DICOM Part 10 file, loaded with DCMTK.
//
// Large element values (pixel data, overlays) are not read into memory.
// Every transfer syntax the installed dcmdata supports can be opened.
class DicomFile {
public:
    // Throws ExtractionError if the file cannot be read or has no Part 10
    // meta header.
    static std::unique_ptr<DicomFile> open(const std::filesystem::path& path);

    ~DicomFile();

    DicomFile(const DicomFile&) = delete;
    DicomFile& operator=(const DicomFile&) = delete;

    // Top-level value with padding removed; multiple values stay joined by
    // '\'. nullopt if the keyword is not an annotation field or the element
    // is absent. An element present with an empty value yields "".
    std::optional<std::string> field(const std::string& keyword) const;

private:
    explicit DicomFile(std::unique_ptr<DcmFileFormat> format);

    std::unique_ptr<DcmFileFormat> format_;
};
