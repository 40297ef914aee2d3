#include "test_support.hpp"
#include <managers/name_dedup.hpp>
#include <set>

namespace {

std::vector<FileRecord> records_named(const std::vector<std::string>& names) {
    std::vector<FileRecord> out;
    for (size_t i = 0; i < names.size(); ++i) {
        out.push_back(make_record(fs::path("/src") / std::to_string(i) / "f", names[i]));
    }
    return out;
}

std::vector<std::string> names_of(const std::vector<FileRecord>& records) {
    std::vector<std::string> out;
    for (const auto& r : records) out.push_back(r.computed_name);
    return out;
}

} // namespace

TEST(NameDedup, UniqueNamesUntouched) {
    auto records = records_named({"a", "b", "c"});
    EXPECT_EQ(deduplicate_names(records), 0u);
    EXPECT_EQ(names_of(records), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(NameDedup, DuplicatesGetCounterPrefix) {
    auto records = records_named({"P_20200101_scan.dat", "P_20200101_scan.dat"});
    EXPECT_EQ(deduplicate_names(records), 2u);
    EXPECT_EQ(names_of(records),
              (std::vector<std::string>{"1_P_20200101_scan.dat", "2_P_20200101_scan.dat"}));
}

TEST(NameDedup, CounterRestartsPerGroup) {
    auto records = records_named({"x", "y", "x", "y", "x", "z"});
    deduplicate_names(records);
    EXPECT_EQ(names_of(records),
              (std::vector<std::string>{"1_x", "1_y", "2_x", "2_y", "3_x", "z"}));
}

TEST(NameDedup, SkipsNamesAlreadyTaken) {
    auto records = records_named({"x", "1_x", "x"});
    deduplicate_names(records);
    EXPECT_EQ(names_of(records), (std::vector<std::string>{"2_x", "1_x", "3_x"}));
}

TEST(NameDedup, ResultAlwaysDistinct) {
    auto records = records_named({"a", "a", "1_a", "2_a", "a", "1_a", "b"});
    deduplicate_names(records);
    auto names = names_of(records);
    std::set<std::string> unique(names.begin(), names.end());
    EXPECT_EQ(unique.size(), names.size());
}

TEST(NameDedup, Empty) {
    std::vector<FileRecord> records;
    EXPECT_EQ(deduplicate_names(records), 0u);
}
