#include "dicom_file.hpp"
#include <core/errors.hpp>
#include <fmt/format.h>
#include <mutex>

#include <dcmtk/config/osconfig.h>
#include <dcmtk/dcmdata/dctk.h>
#include <dcmtk/oflog/oflog.h>

namespace fs = std::filesystem;

namespace {

struct KeywordEntry {
    const char* keyword;
    DcmTagKey tag;
};

// Annotation fields looked up by keyword.
const KeywordEntry kKeywords[] = {
    {"ContentDate",                     DCM_ContentDate},
    {"ContentTime",                     DCM_ContentTime},
    {"DeviceSerialNumber",              DCM_DeviceSerialNumber},
    {"InstanceNumber",                  DCM_InstanceNumber},
    {"InstitutionName",                 DCM_InstitutionName},
    {"Manufacturer",                    DCM_Manufacturer},
    {"Modality",                        DCM_Modality},
    {"PatientBirthDate",                DCM_PatientBirthDate},
    {"PatientID",                       DCM_PatientID},
    {"PerformedProcedureStepID",        DCM_PerformedProcedureStepID},
    {"PerformedProcedureStepStartDate", DCM_PerformedProcedureStepStartDate},
    {"PerformedProcedureStepStartTime", DCM_PerformedProcedureStepStartTime},
    {"SOPClassUID",                     DCM_SOPClassUID},
    {"SOPInstanceUID",                  DCM_SOPInstanceUID},
    {"SeriesDate",                      DCM_SeriesDate},
    {"SeriesInstanceUID",               DCM_SeriesInstanceUID},
    {"SeriesNumber",                    DCM_SeriesNumber},
    {"SeriesTime",                      DCM_SeriesTime},
    {"SoftwareVersions",                DCM_SoftwareVersions},
    {"StudyDate",                       DCM_StudyDate},
    {"StudyID",                         DCM_StudyID},
    {"StudyInstanceUID",                DCM_StudyInstanceUID},
    {"StudyTime",                       DCM_StudyTime},
};

// Values longer than this are left on disk.
constexpr Uint32 kMaxLoadedValueBytes = 64 * 1024;

const DcmTagKey* find_keyword(const std::string& keyword) {
    for (const auto& e : kKeywords) {
        if (keyword == e.keyword) return &e.tag;
    }
    return nullptr;
}

// dcmdata logs parser warnings on its own; failures reach our log as
// ExtractionError instead.
void quiet_dcmtk_logging() {
    static std::once_flag once;
    std::call_once(once, [] { OFLog::configure(OFLogger::ERROR_LOG_LEVEL); });
}

} // namespace

DicomFile::DicomFile(std::unique_ptr<DcmFileFormat> format) : format_(std::move(format)) {}

DicomFile::~DicomFile() = default;

std::unique_ptr<DicomFile> DicomFile::open(const fs::path& path) {
    quiet_dcmtk_logging();

    auto format = std::make_unique<DcmFileFormat>();
    OFCondition status = format->loadFile(path.c_str(), EXS_Unknown, EGL_noChange,
                                          kMaxLoadedValueBytes, ERM_fileOnly);
    if (status.bad()) {
        throw ExtractionError(fmt::format("{}: {}", path.string(), status.text()));
    }
    return std::unique_ptr<DicomFile>(new DicomFile(std::move(format)));
}

std::optional<std::string> DicomFile::field(const std::string& keyword) const {
    const DcmTagKey* tag = find_keyword(keyword);
    if (!tag) return std::nullopt;

    DcmDataset* dataset = format_->getDataset();
    if (!dataset->tagExists(*tag)) return std::nullopt;

    OFString value;
    if (dataset->findAndGetOFStringArray(*tag, value).bad()) {
        return std::string();
    }
    return std::string(value.c_str(), value.length());
}
