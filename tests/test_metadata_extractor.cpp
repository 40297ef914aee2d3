#include "test_support.hpp"
#include <extract/dicom_file.hpp>
#include <extract/metadata_extractor.hpp>

// ── DicomFile ───────────────────────────────────────────────

class DicomFileTest : public ::testing::Test {
protected:
    ScratchDir dir;
};

TEST_F(DicomFileTest, ReadsExplicitLittleEndian) {
    auto path = dir.path() / "a.dcm";
    DicomBuilder()
        .set(DCM_PatientID, "P-01")
        .set(DCM_Modality, "MR")
        .set(DCM_StudyInstanceUID, "1.2.3")
        .write(path);

    auto file = DicomFile::open(path);
    EXPECT_EQ(file->field("PatientID").value(), "P-01");
    EXPECT_EQ(file->field("Modality").value(), "MR");          // padding stripped
    EXPECT_EQ(file->field("StudyInstanceUID").value(), "1.2.3");
    EXPECT_FALSE(file->field("StudyDate").has_value());
    EXPECT_FALSE(file->field("NotAKeyword").has_value());
}

TEST_F(DicomFileTest, ReadsImplicitLittleEndian) {
    auto path = dir.path() / "b.dcm";
    DicomBuilder()
        .transfer_syntax(EXS_LittleEndianImplicit)
        .set(DCM_PatientID, "P02")
        .set(DCM_SeriesNumber, "7")
        .write(path);

    auto file = DicomFile::open(path);
    EXPECT_EQ(file->field("PatientID").value(), "P02");
    EXPECT_EQ(file->field("SeriesNumber").value(), "7");
}

TEST_F(DicomFileTest, ReadsExplicitBigEndian) {
    auto path = dir.path() / "be.dcm";
    DicomBuilder()
        .transfer_syntax(EXS_BigEndianExplicit)
        .set(DCM_PatientID, "BE1")
        .set(DCM_InstanceNumber, "12")
        .write(path);

    auto file = DicomFile::open(path);
    EXPECT_EQ(file->field("PatientID").value(), "BE1");
    EXPECT_EQ(file->field("InstanceNumber").value(), "12");
}

TEST_F(DicomFileTest, ReadsPastUndefinedLengthSequences) {
    for (E_TransferSyntax xfer : {EXS_LittleEndianExplicit, EXS_LittleEndianImplicit}) {
        auto path = dir.path() / "seq.dcm";
        DicomBuilder()
            .transfer_syntax(xfer)
            .with_sequence()
            .set(DCM_PatientID, "P03")
            .set(DCM_StudyDate, "20200101")
            .with_pixel_data()
            .write(path);

        auto file = DicomFile::open(path);
        EXPECT_EQ(file->field("PatientID").value(), "P03") << xfer;
        EXPECT_EQ(file->field("StudyDate").value(), "20200101") << xfer;
    }
}

TEST_F(DicomFileTest, EmptyValueIsPresentButEmpty) {
    auto path = dir.path() / "empty.dcm";
    DicomBuilder().set(DCM_InstitutionName, "").set(DCM_PatientID, "P").write(path);

    auto file = DicomFile::open(path);
    ASSERT_TRUE(file->field("InstitutionName").has_value());
    EXPECT_EQ(file->field("InstitutionName").value(), "");
}

TEST_F(DicomFileTest, KeepsMultipleValues) {
    auto path = dir.path() / "multi.dcm";
    DicomBuilder().set(DCM_SoftwareVersions, "VE11\\2.0").write(path);

    auto file = DicomFile::open(path);
    EXPECT_EQ(file->field("SoftwareVersions").value(), "VE11\\2.0");
}

TEST_F(DicomFileTest, RejectsNonDicom) {
    auto path = dir.write("plain.dcm", std::string(200, 'z'));
    EXPECT_THROW(DicomFile::open(path), ExtractionError);
}

TEST_F(DicomFileTest, RejectsShortFile) {
    auto path = dir.write("short.dcm", "DICM");
    EXPECT_THROW(DicomFile::open(path), ExtractionError);
}

TEST_F(DicomFileTest, MissingFileThrows) {
    EXPECT_THROW(DicomFile::open(dir.path() / "missing.dcm"), ExtractionError);
}

TEST_F(DicomFileTest, EverySchemaFieldIsReadable) {
    auto path = dir.path() / "full.dcm";
    DicomBuilder b;
    b.set(DCM_ContentDate, "20200101").set(DCM_ContentTime, "101530")
     .set(DCM_DeviceSerialNumber, "SN1").set(DCM_InstanceNumber, "1")
     .set(DCM_InstitutionName, "Clinic").set(DCM_Manufacturer, "Acme")
     .set(DCM_Modality, "CT").set(DCM_PatientBirthDate, "19700101")
     .set(DCM_PatientID, "P").set(DCM_PerformedProcedureStepID, "PS1")
     .set(DCM_PerformedProcedureStepStartDate, "20200101")
     .set(DCM_PerformedProcedureStepStartTime, "101530")
     .set(DCM_SOPClassUID, "1.2.840.10008.5.1.4.1.1.7").set(DCM_SOPInstanceUID, "1.2.3.4")
     .set(DCM_SeriesDate, "20200101").set(DCM_SeriesInstanceUID, "1.2.3.5")
     .set(DCM_SeriesNumber, "2").set(DCM_SeriesTime, "101530")
     .set(DCM_SoftwareVersions, "1.0").set(DCM_StudyDate, "20200101")
     .set(DCM_StudyID, "S1").set(DCM_StudyInstanceUID, "1.2.3.6")
     .set(DCM_StudyTime, "101530");
    b.write(path);

    auto file = DicomFile::open(path);
    for (const auto& f : annotation_schema()) {
        auto value = file->field(f.name);
        ASSERT_TRUE(value.has_value()) << f.name;
        EXPECT_FALSE(value->empty()) << f.name;
    }
}

// ── Coercion ────────────────────────────────────────────────

TEST(Coercion, Integer) {
    auto v = coerce_value("42", FieldType::Integer);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(std::get<int64_t>(*v), 42);
}

TEST(Coercion, IntegerMustConsumeWholeValue) {
    std::string err;
    EXPECT_FALSE(coerce_value("101530.5", FieldType::Integer, &err).has_value());
    EXPECT_FALSE(err.empty());
    EXPECT_FALSE(coerce_value("12ab", FieldType::Integer).has_value());
    EXPECT_FALSE(coerce_value("", FieldType::Integer).has_value());
}

TEST(Coercion, Date) {
    auto v = coerce_value("20200131", FieldType::Date);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(std::get<Date>(*v), (Date{2020, 1, 31}));
}

TEST(Coercion, InvalidDates) {
    EXPECT_FALSE(parse_dicom_date("2020-01-31").has_value());
    EXPECT_FALSE(parse_dicom_date("20201301").has_value());
    EXPECT_FALSE(parse_dicom_date("20200431").has_value());
    EXPECT_FALSE(parse_dicom_date("20190229").has_value());
    EXPECT_TRUE(parse_dicom_date("20000229").has_value());
    EXPECT_FALSE(parse_dicom_date("19000229").has_value());
}

TEST(Coercion, StringIsVerbatim) {
    auto v = coerce_value("  odd value ", FieldType::String);
    EXPECT_EQ(std::get<std::string>(*v), "  odd value ");
}

TEST(Coercion, FormatTypedValue) {
    EXPECT_EQ(format_typed_value(TypedValue{std::string("abc")}), "abc");
    EXPECT_EQ(format_typed_value(TypedValue{int64_t{-5}}), "-5");
    EXPECT_EQ(format_typed_value(TypedValue{Date{2021, 3, 4}}), "2021-03-04");
}

TEST(ComputedName, ReplacesHyphens) {
    EXPECT_EQ(make_computed_name("P-1", "20200101", "scan-a.dcm"), "P_1_20200101_scan_a.dcm");
}

TEST(ComputedName, ReplacesPathSeparators) {
    EXPECT_EQ(make_computed_name("AB/123", "20200101", "a.dcm"), "AB_123_20200101_a.dcm");
    EXPECT_EQ(make_computed_name("..\\..\\x", "20200101", "a.dcm"), ".._.._x_20200101_a.dcm");
    EXPECT_EQ(make_computed_name("../../x", "20200101", "a.dcm").find('/'), std::string::npos);
}

TEST(ComputedName, AnnotatedExtension) {
    EXPECT_TRUE(is_annotated_file("x.dcm"));
    EXPECT_TRUE(is_annotated_file("X.DCM"));
    EXPECT_FALSE(is_annotated_file("x.dcm.bak"));
    EXPECT_FALSE(is_annotated_file("dcm"));
}

TEST(Schema, FixedOrderAndTypes) {
    const auto& schema = annotation_schema();
    ASSERT_EQ(schema.size(), 23u);
    EXPECT_STREQ(schema.front().name, "ContentDate");
    EXPECT_STREQ(schema.back().name, "StudyTime");
    for (size_t i = 1; i < schema.size(); ++i) {
        EXPECT_LT(std::string(schema[i - 1].name), std::string(schema[i].name));
    }
}

// ── MetadataExtractor ───────────────────────────────────────

class ExtractorTest : public ::testing::Test {
protected:
    ScratchDir dir;
    MetadataExtractor extractor;
};

TEST_F(ExtractorTest, AnnotatesAndRenames) {
    auto path = dir.path() / "scan.dcm";
    DicomBuilder()
        .set(DCM_PatientID, "P-7")
        .set(DCM_StudyDate, "20200101")
        .set(DCM_SeriesNumber, "3")
        .set(DCM_StudyTime, "101530.5")
        .set(DCM_Modality, "CT")
        .write(path);

    auto record = make_record(path);
    CapturedLog log(dir.path() / "log.txt");
    extractor.extract(record);

    EXPECT_EQ(record.computed_name, "P_7_20200101_scan.dcm");
    EXPECT_EQ(std::get<std::string>(record.annotations.at("PatientID")), "P-7");
    EXPECT_EQ(std::get<Date>(record.annotations.at("StudyDate")), (Date{2020, 1, 1}));
    EXPECT_EQ(std::get<int64_t>(record.annotations.at("SeriesNumber")), 3);
    EXPECT_EQ(std::get<std::string>(record.annotations.at("Modality")), "CT");
    // Fractional time does not coerce to an integer
    EXPECT_EQ(record.annotations.count("StudyTime"), 0u);
    // Absent fields are omitted
    EXPECT_EQ(record.annotations.count("InstitutionName"), 0u);

    auto text = log.text();
    EXPECT_NE(text.find("Could not parse: int, StudyTime"), std::string::npos);
    EXPECT_NE(text.find("Field not found: InstitutionName"), std::string::npos);
}

TEST_F(ExtractorTest, NonDicomUntouched) {
    auto path = dir.write("notes.txt", "hello");
    auto record = make_record(path);
    extractor.extract(record);
    EXPECT_EQ(record.computed_name, "notes.txt");
    EXPECT_TRUE(record.annotations.empty());
}

TEST_F(ExtractorTest, CorruptFileKeepsOriginalName) {
    auto path = dir.write("broken.dcm", "this is not dicom at all");
    auto record = make_record(path);
    CapturedLog log(dir.path() / "log.txt");
    extractor.extract(record);

    EXPECT_EQ(record.computed_name, "broken.dcm");
    EXPECT_TRUE(record.annotations.empty());
    EXPECT_NE(log.text().find("ERROR: Could not read DICOM file: " + path.string()), std::string::npos);
}

// Opener that fails the way an allocation or library bug would.
class ThrowingExtractor : public MetadataExtractor {
protected:
    std::unique_ptr<DicomFile> open(const fs::path&) const override {
        throw std::runtime_error("decoder exploded");
    }
};

TEST_F(ExtractorTest, UnexpectedErrorIsLoggedNotThrown) {
    auto path = dir.path() / "odd.dcm";
    DicomBuilder::patient("P1", "20200101").write(path);
    auto record = make_record(path);
    CapturedLog log(dir.path() / "log.txt");

    ThrowingExtractor throwing;
    EXPECT_NO_THROW(throwing.extract(record));
    EXPECT_EQ(record.computed_name, "odd.dcm");
    EXPECT_TRUE(record.annotations.empty());
    EXPECT_NE(log.text().find("decoder exploded"), std::string::npos);
}

TEST_F(ExtractorTest, MissingPatientIdKeepsNameButAnnotates) {
    auto path = dir.path() / "anon.dcm";
    DicomBuilder().set(DCM_StudyDate, "20200101").set(DCM_Modality, "MR").write(path);

    auto record = make_record(path);
    extractor.extract(record);

    EXPECT_EQ(record.computed_name, "anon.dcm");
    EXPECT_EQ(std::get<std::string>(record.annotations.at("Modality")), "MR");
}

TEST_F(ExtractorTest, UppercaseExtensionIsAnnotated) {
    auto path = dir.path() / "SCAN.DCM";
    DicomBuilder::patient("P1", "20211231").write(path);

    auto record = make_record(path);
    extractor.extract(record);
    EXPECT_EQ(record.computed_name, "P1_20211231_SCAN.DCM");
}
