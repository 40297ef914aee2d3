#include "test_support.hpp"
#include <managers/discovery.hpp>
#include <core/cancellation.hpp>

class DiscoveryTest : public ::testing::Test {
protected:
    ScratchDir dir;
    MetadataExtractor extractor;
    CancellationToken token;

    std::vector<std::string> names(const std::vector<FileRecord>& records) {
        std::vector<std::string> out;
        for (const auto& r : records) out.push_back(r.computed_name);
        return out;
    }
};

TEST_F(DiscoveryTest, SkipsEmptyFiles) {
    dir.write("a.txt", "data");
    dir.write("empty.txt", "");
    dir.write("sub/b.txt", "data");
    dir.write("sub/empty2.txt", "");

    auto records = scan_source_tree(dir.path());
    EXPECT_EQ(names(records), (std::vector<std::string>{"a.txt", "b.txt"}));
}

TEST_F(DiscoveryTest, OrderedByRelativePath) {
    dir.write("z/1.txt");
    dir.write("a/2.txt");
    dir.write("m.txt");
    dir.write("a/b/3.txt");

    auto records = scan_source_tree(dir.path());
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[0].full_path, dir.path() / "a/2.txt");
    EXPECT_EQ(records[1].full_path, dir.path() / "a/b/3.txt");
    EXPECT_EQ(records[2].full_path, dir.path() / "m.txt");
    EXPECT_EQ(records[3].full_path, dir.path() / "z/1.txt");
}

TEST_F(DiscoveryTest, RecordFields) {
    auto path = dir.write("x/y/file.bin", "123");
    auto records = scan_source_tree(dir.path());
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].full_path, path);
    EXPECT_EQ(records[0].source_dir, dir.path() / "x/y");
    EXPECT_EQ(records[0].original_name, "file.bin");
    EXPECT_EQ(records[0].computed_name, "file.bin");
    EXPECT_TRUE(records[0].annotations.empty());
}

TEST_F(DiscoveryTest, MissingRootYieldsNothing) {
    EXPECT_TRUE(scan_source_tree(dir.path() / "absent").empty());
}

TEST_F(DiscoveryTest, PoolExtractsEveryRecord) {
    for (int i = 0; i < 40; ++i) {
        DicomBuilder::patient("P" + std::to_string(i), "20200101")
            .write(dir.path() / ("s" + std::to_string(i / 10)) / ("img" + std::to_string(i) + ".dcm"));
    }
    dir.write("readme.txt", "notes");

    DiscoveryPool pool(extractor, 4, token);
    auto records = pool.run(dir.path());

    ASSERT_EQ(records.size(), 41u);
    size_t annotated = 0;
    for (const auto& r : records) {
        if (r.original_name == "readme.txt") {
            EXPECT_EQ(r.computed_name, "readme.txt");
            continue;
        }
        EXPECT_EQ(r.computed_name.rfind("P", 0), 0u) << r.computed_name;
        EXPECT_EQ(r.annotations.count("PatientID"), 1u);
        ++annotated;
    }
    EXPECT_EQ(annotated, 40u);
}

namespace {

class FailOnNameExtractor : public MetadataExtractor {
public:
    explicit FailOnNameExtractor(std::string name) : name_(std::move(name)) {}

protected:
    std::unique_ptr<DicomFile> open(const fs::path& path) const override {
        if (path.filename() == name_) throw std::runtime_error("unexpected");
        return MetadataExtractor::open(path);
    }

private:
    std::string name_;
};

} // namespace

TEST_F(DiscoveryTest, OneFailingFileDoesNotStopThePool) {
    DicomBuilder::patient("P1", "20200101").write(dir.path() / "a.dcm");
    DicomBuilder::patient("P2", "20200101").write(dir.path() / "b.dcm");
    DicomBuilder::patient("P3", "20200101").write(dir.path() / "c.dcm");

    FailOnNameExtractor failing("b.dcm");
    DiscoveryPool pool(failing, 3, token);
    auto records = pool.run(dir.path());

    ASSERT_EQ(records.size(), 3u);
    EXPECT_EQ(records[0].computed_name, "P1_20200101_a.dcm");
    EXPECT_EQ(records[1].computed_name, "b.dcm");
    EXPECT_TRUE(records[1].annotations.empty());
    EXPECT_EQ(records[2].computed_name, "P3_20200101_c.dcm");
}

TEST_F(DiscoveryTest, PoolMoreThreadsThanFiles) {
    dir.write("one.txt");
    DiscoveryPool pool(extractor, 16, token);
    EXPECT_EQ(pool.run(dir.path()).size(), 1u);
}

TEST_F(DiscoveryTest, CanceledRunThrows) {
    dir.write("a.txt");
    dir.write("b.txt");
    token.cancel();
    DiscoveryPool pool(extractor, 2, token);
    EXPECT_THROW(pool.run(dir.path()), CancellationRequested);
}
