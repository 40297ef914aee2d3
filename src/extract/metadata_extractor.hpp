#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "dicom_file.hpp"

enum class FieldType { String, Integer, Date };

struct AnnotationField {
    const char* name;
    FieldType type;
};

// The fixed annotation schema, in manifest column order.
const std::vector<AnnotationField>& annotation_schema();

const char* field_type_name(FieldType type);

// Coerce a raw DICOM value. On failure returns nullopt and sets *error.
std::optional<TypedValue> coerce_value(const std::string& raw, FieldType type,
                                       std::string* error = nullptr);

// "YYYYMMDD" -> Date, validating month and day ranges.
std::optional<Date> parse_dicom_date(const std::string& raw);

// Strings as-is, integers base 10, dates "YYYY-MM-DD".
std::string format_typed_value(const TypedValue& value);

// True for names with the annotated-image extension (".dcm", any case).
bool is_annotated_file(const std::string& name);

// "{PatientID}_{StudyDate}_{original}" with every '-' replaced by '_'. Path
// separators become '_' too, so the result is always a single file name.
std::string make_computed_name(const std::string& patient_id,
                               const std::string& study_date,
                               const std::string& original_name);

// Fills computed_name and annotations of one record.
//
// Non-annotated files are left untouched. A field that is missing or does not
// coerce is skipped with a warning. If the file cannot be opened or parsed,
// the error is logged and the record keeps its original name and no
// annotations. Never throws.
class MetadataExtractor {
public:
    virtual ~MetadataExtractor() = default;

    void extract(FileRecord& record) const;

protected:
    virtual std::unique_ptr<DicomFile> open(const std::filesystem::path& path) const;
};
