#include "metadata_extractor.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cctype>

const std::vector<AnnotationField>& annotation_schema() {
    static const std::vector<AnnotationField> schema = {
        {"ContentDate",                     FieldType::Date},
        {"ContentTime",                     FieldType::Integer},
        {"DeviceSerialNumber",              FieldType::String},
        {"InstanceNumber",                  FieldType::Integer},
        {"InstitutionName",                 FieldType::String},
        {"Manufacturer",                    FieldType::String},
        {"Modality",                        FieldType::String},
        {"PatientBirthDate",                FieldType::Date},
        {"PatientID",                       FieldType::String},
        {"PerformedProcedureStepID",        FieldType::String},
        {"PerformedProcedureStepStartDate", FieldType::Date},
        {"PerformedProcedureStepStartTime", FieldType::String},
        {"SOPClassUID",                     FieldType::String},
        {"SOPInstanceUID",                  FieldType::String},
        {"SeriesDate",                      FieldType::Date},
        {"SeriesInstanceUID",               FieldType::String},
        {"SeriesNumber",                    FieldType::Integer},
        {"SeriesTime",                      FieldType::Integer},
        {"SoftwareVersions",                FieldType::String},
        {"StudyDate",                       FieldType::Date},
        {"StudyID",                         FieldType::String},
        {"StudyInstanceUID",                FieldType::String},
        {"StudyTime",                       FieldType::Integer},
    };
    return schema;
}

const char* field_type_name(FieldType type) {
    switch (type) {
        case FieldType::String:  return "str";
        case FieldType::Integer: return "int";
        case FieldType::Date:    return "date";
    }
    return "str";
}

std::optional<Date> parse_dicom_date(const std::string& raw) {
    if (raw.size() != 8) return std::nullopt;
    for (char c : raw) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    Date d;
    d.year = std::stoi(raw.substr(0, 4));
    d.month = std::stoi(raw.substr(4, 2));
    d.day = std::stoi(raw.substr(6, 2));

    static const int kDaysInMonth[] = {31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (d.month < 1 || d.month > 12) return std::nullopt;
    if (d.day < 1 || d.day > kDaysInMonth[d.month - 1]) return std::nullopt;
    bool leap = (d.year % 4 == 0 && d.year % 100 != 0) || d.year % 400 == 0;
    if (d.month == 2 && d.day == 29 && !leap) return std::nullopt;
    return d;
}

std::optional<TypedValue> coerce_value(const std::string& raw, FieldType type,
                                       std::string* error) {
    switch (type) {
        case FieldType::String:
            return TypedValue{raw};

        case FieldType::Integer: {
            size_t pos = 0;
            try {
                long long v = std::stoll(raw, &pos, 10);
                if (pos == raw.size()) return TypedValue{static_cast<int64_t>(v)};
            } catch (const std::exception&) {
            }
            if (error) *error = "invalid literal for int: '" + raw + "'";
            return std::nullopt;
        }

        case FieldType::Date: {
            auto d = parse_dicom_date(raw);
            if (d) return TypedValue{*d};
            if (error) *error = "does not match format YYYYMMDD: '" + raw + "'";
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::string format_typed_value(const TypedValue& value) {
    if (auto s = std::get_if<std::string>(&value)) return *s;
    if (auto i = std::get_if<int64_t>(&value)) return std::to_string(*i);
    const auto& d = std::get<Date>(value);
    return fmt::format("{:04d}-{:02d}-{:02d}", d.year, d.month, d.day);
}

bool is_annotated_file(const std::string& name) {
    return ends_with_ci(name, ANNOTATED_EXTENSION);
}

std::string make_computed_name(const std::string& patient_id,
                               const std::string& study_date,
                               const std::string& original_name) {
    std::string name = fmt::format("{}_{}_{}", patient_id, study_date, original_name);
    for (const char* sep : {"-", "/", "\\"}) {
        name = replace_all(std::move(name), sep, "_");
    }
    return name;
}

std::unique_ptr<DicomFile> MetadataExtractor::open(const std::filesystem::path& path) const {
    return DicomFile::open(path);
}

void MetadataExtractor::extract(FileRecord& record) const {
    if (!is_annotated_file(record.original_name)) return;

    std::unique_ptr<DicomFile> file;
    try {
        file = open(record.full_path);
    } catch (const ExtractionError& e) {
        log_error(fmt::format("Could not read DICOM file: {} - {}", record.full_path.string(), e.what()));
        return;
    } catch (const std::exception& e) {
        log_error(fmt::format("Could not read DICOM file: {} - unexpected error: {}",
                              record.full_path.string(), e.what()));
        return;
    }

    Annotations annotations;
    for (const auto& f : annotation_schema()) {
        auto raw = file->field(f.name);
        if (!raw) {
            log_warning(fmt::format("Field not found: {} ({})", f.name, record.full_path.string()));
            continue;
        }
        if (raw->empty()) {
            log_debug(fmt::format("Field empty: {} ({})", f.name, record.full_path.string()));
            continue;
        }
        std::string err;
        auto value = coerce_value(*raw, f.type, &err);
        if (!value) {
            log_warning(fmt::format("Could not parse: {}, {} - {} ({})",
                                    field_type_name(f.type), f.name, err, record.full_path.string()));
            continue;
        }
        annotations.emplace(f.name, std::move(*value));
    }

    auto patient_id = file->field("PatientID");
    auto study_date = file->field("StudyDate");
    if (patient_id && !patient_id->empty() && study_date && !study_date->empty()) {
        record.computed_name = make_computed_name(*patient_id, *study_date, record.original_name);
    } else {
        log_warning(fmt::format("Missing PatientID or StudyDate, keeping original name: {}",
                                record.full_path.string()));
    }
    record.annotations = std::move(annotations);
}
