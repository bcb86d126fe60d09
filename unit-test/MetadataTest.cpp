#include <filesystem>
#include <nlohmann/json.hpp>
#include "gtest/gtest.h"
#include "localjudge/problem/metadata.hpp"
#include "test/problem_dir.hpp"

using namespace std;
using namespace std::filesystem;
using namespace localjudge;
using namespace nlohmann;

class MetadataTest : public ::testing::Test {
protected:
    static json catalog;

    static void SetUpTestCase() {
        catalog = json::parse(R"({
            "P1001": {
                "pid": "P1001",
                "directory": "P1001-A+B Problem",
                "time_limit_ms": 1000,
                "memory_limit_kb": 131072,
                "time_limit_human": "1.00s",
                "memory_limit_human": "128.00MB"
            },
            "alias": {
                "pid": "P1002",
                "directory": "problems/P1002-Knight",
                "time_limit_ms": "fast",
                "memory_limit_kb": 262144.0
            },
            "P1003": {
                "pid": "P1003"
            },
            "broken": 5,
            "empty": {}
        })");
    }

    static void TearDownTestCase() {
    }
};

json MetadataTest::catalog;

TEST_F(MetadataTest, ParseRecordTest) {
    problem_record record = parse_problem_record(catalog["P1001"]);
    EXPECT_EQ(record.pid, "P1001");
    EXPECT_EQ(record.directory, "P1001-A+B Problem");
    ASSERT_TRUE(record.limits.time_limit_ms);
    EXPECT_DOUBLE_EQ(*record.limits.time_limit_ms, 1000);
    ASSERT_TRUE(record.limits.memory_limit_kb);
    EXPECT_EQ(*record.limits.memory_limit_kb, 131072);
    EXPECT_EQ(record.time_limit_human, "1.00s");
    EXPECT_EQ(record.memory_limit_human, "128.00MB");
}

TEST_F(MetadataTest, NonNumericLimitTest) {
    problem_record record = parse_problem_record(catalog["alias"]);
    EXPECT_FALSE(record.limits.time_limit_ms);
    ASSERT_TRUE(record.limits.memory_limit_kb);
    EXPECT_EQ(*record.limits.memory_limit_kb, 262144);
    EXPECT_TRUE(record.time_limit_human.empty());
}

TEST_F(MetadataTest, SkipInvalidRecordTest) {
    metadata_store store = metadata_store::from_json(catalog);
    EXPECT_EQ(store.size(), 3u);
    EXPECT_FALSE(store.find_by_pid("broken"));
    EXPECT_FALSE(store.find_by_pid("empty"));
}

TEST_F(MetadataTest, FindByPidTest) {
    metadata_store store = metadata_store::from_json(catalog);
    auto record = store.find_by_pid("P1001");
    ASSERT_TRUE(record);
    EXPECT_EQ(record->directory, "P1001-A+B Problem");

    // 键与 pid 不同时按 pid 字段查找
    record = store.find_by_pid("P1002");
    ASSERT_TRUE(record);
    EXPECT_EQ(record->directory, "problems/P1002-Knight");

    EXPECT_FALSE(store.find_by_pid("P9999"));
}

TEST_F(MetadataTest, FindByDirectoryTest) {
    metadata_store store = metadata_store::from_json(catalog);
    auto record = store.find_by_directory("/home/user/problem/P1001-A+B Problem");
    ASSERT_TRUE(record);
    EXPECT_EQ(record->pid, "P1001");

    record = store.find_by_directory("/home/user/problem/P1001-A+B Problem/");
    ASSERT_TRUE(record);
    EXPECT_EQ(record->pid, "P1001");

    record = store.find_by_directory("other/P1002-Knight");
    ASSERT_TRUE(record);
    EXPECT_EQ(record->pid, "P1002");

    // 键为文件夹名且没有 directory 字段
    record = store.find_by_directory("P1003");
    ASSERT_TRUE(record);
    EXPECT_EQ(record->pid, "P1003");

    EXPECT_FALSE(store.find_by_directory("P1001"));
}

TEST_F(MetadataTest, LoadTest) {
    test::problem_dir dir;
    EXPECT_EQ(metadata_store::load(dir.path() / "missing.json").size(), 0u);

    path malformed = dir.write("malformed.json", "{\"P1001\": ");
    EXPECT_EQ(metadata_store::load(malformed).size(), 0u);

    path file = dir.write("problems.json", catalog.dump());
    metadata_store store = metadata_store::load(file);
    EXPECT_EQ(store.size(), 3u);
    EXPECT_TRUE(store.find_by_pid("P1001"));
}

TEST_F(MetadataTest, ResolveProblemDirectoryTest) {
    metadata_store store = metadata_store::from_json(catalog);
    test::problem_dir base;
    create_directory(base.path() / "P1001-A+B Problem");

    problem_location location = resolve_problem_directory("P1001", base.path(), store);
    EXPECT_EQ(location.dir, base.path() / "P1001-A+B Problem");
    ASSERT_TRUE(location.record);
    EXPECT_EQ(location.record->pid, "P1001");

    // 元数据中的文件夹不存在时使用题号作为文件夹名
    location = resolve_problem_directory("P1002", base.path(), store);
    EXPECT_EQ(location.dir, base.path() / "P1002");
    EXPECT_TRUE(location.record);

    location = resolve_problem_directory("P9999", base.path(), store);
    EXPECT_EQ(location.dir, base.path() / "P9999");
    EXPECT_FALSE(location.record);
}
