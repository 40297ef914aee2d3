#include "test_support.hpp"
#include <managers/sharder.hpp>

namespace {

std::vector<FileRecord> n_records(size_t n) {
    std::vector<FileRecord> out;
    for (size_t i = 0; i < n; ++i) {
        out.push_back(make_record(fs::path("/src") / ("f" + std::to_string(i))));
    }
    return out;
}

} // namespace

TEST(Sharder, FiveFilesCapacityTwo) {
    auto shards = make_shards(n_records(5), 2);
    ASSERT_EQ(shards.size(), 3u);
    EXPECT_EQ(shards[0].files.size(), 2u);
    EXPECT_EQ(shards[1].files.size(), 2u);
    EXPECT_EQ(shards[2].files.size(), 1u);
    EXPECT_EQ(shards[0].folder_name, "01");
    EXPECT_EQ(shards[1].folder_name, "02");
    EXPECT_EQ(shards[2].folder_name, "03");
}

TEST(Sharder, PreservesOrder) {
    auto shards = make_shards(n_records(5), 2);
    std::vector<std::string> names;
    for (const auto& s : shards)
        for (const auto& f : s.files) names.push_back(f.computed_name);
    EXPECT_EQ(names, (std::vector<std::string>{"f0", "f1", "f2", "f3", "f4"}));
}

TEST(Sharder, SingleShardHasNoFolder) {
    auto shards = make_shards(n_records(3), 10000);
    ASSERT_EQ(shards.size(), 1u);
    EXPECT_EQ(shards[0].folder_name, "");
    EXPECT_EQ(shards[0].number, 1u);
}

TEST(Sharder, ExactMultiple) {
    auto shards = make_shards(n_records(4), 2);
    ASSERT_EQ(shards.size(), 2u);
    EXPECT_EQ(shards[1].files.size(), 2u);
}

TEST(Sharder, NoFilesNoShards) {
    EXPECT_TRUE(make_shards({}, 10).empty());
}

TEST(Sharder, WideNumbering) {
    auto shards = make_shards(n_records(150), 1);
    ASSERT_EQ(shards.size(), 150u);
    EXPECT_EQ(shards[0].folder_name, "001");
    EXPECT_EQ(shards[149].folder_name, "150");
}

TEST(Sharder, InvalidCapacity) {
    EXPECT_THROW(make_shards(n_records(1), 0), ConfigurationError);
    EXPECT_THROW(make_shards(n_records(1), 10001), ConfigurationError);
}

TEST(Sharder, NameWidth) {
    EXPECT_EQ(shard_name_width(1), 2);
    EXPECT_EQ(shard_name_width(99), 2);
    EXPECT_EQ(shard_name_width(100), 3);
}

TEST(Sharder, RemotePath) {
    Shard s;
    s.folder_name = "02";
    EXPECT_EQ(shard_remote_path(std::string("a/b"), s), "a/b/02");
    EXPECT_EQ(shard_remote_path(std::nullopt, s), "02");
    s.folder_name.clear();
    EXPECT_EQ(shard_remote_path(std::string("a/b"), s), "a/b");
    EXPECT_EQ(shard_remote_path(std::nullopt, s), "");
}
