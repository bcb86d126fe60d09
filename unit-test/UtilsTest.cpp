#include <filesystem>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "localjudge/common/exceptions.hpp"
#include "localjudge/common/io_utils.hpp"
#include "localjudge/common/utils.hpp"
#include "test/problem_dir.hpp"

using namespace std;
using namespace std::filesystem;
using namespace localjudge;
using ::testing::ElementsAre;

TEST(UtilsTest, MakeCommandTest) {
    vector<string> flags = {"-O2", "-Wall"};
    EXPECT_THAT(make_command("g++", path("main.cpp"), flags, 1),
                ElementsAre("g++", "main.cpp", "-O2", "-Wall", "1"));
}

TEST(UtilsTest, EnvTest) {
    set_env("LOCALJUDGE_TEST_ENV", "value");
    EXPECT_EQ(get_env("LOCALJUDGE_TEST_ENV", "default"), "value");
    set_env("LOCALJUDGE_TEST_ENV", "other", false);
    EXPECT_EQ(get_env("LOCALJUDGE_TEST_ENV", "default"), "value");
    EXPECT_EQ(get_env("LOCALJUDGE_TEST_ENV_MISSING", "default"), "default");
}

TEST(UtilsTest, ReadFileContentTest) {
    test::problem_dir dir;
    path file = dir.write("1.out", "hello\r\nworld");
    EXPECT_EQ(read_file_content(file), "hello\r\nworld");
    EXPECT_EQ(read_file_content(dir.path() / "missing", "def"), "def");
    EXPECT_THROW(read_file_content(dir.path() / "missing"), system_error);
}

TEST(UtilsTest, SanitizeUtf8Test) {
    EXPECT_EQ(sanitize_utf8("hello 你好"), "hello 你好");
    EXPECT_EQ(sanitize_utf8("a\xff" "b"), "a\xef\xbf\xbd" "b");
    // 截断的多字节序列
    EXPECT_EQ(sanitize_utf8("a\xe4\xbd"), "a\xef\xbf\xbd");
    // 过长编码
    EXPECT_EQ(sanitize_utf8("\xc0\xaf"), "\xef\xbf\xbd\xef\xbf\xbd");
}

TEST(UtilsTest, ScopedTempFileTest) {
    path file;
    {
        scoped_temp_file temp("judge_time_");
        file = temp.path();
        EXPECT_TRUE(is_regular_file(file));
        EXPECT_EQ(file.filename().string().rfind("judge_time_", 0), 0u);
    }
    EXPECT_FALSE(exists(file));
}

TEST(UtilsTest, ScopedTempDirectoryTest) {
    path dir;
    {
        scoped_temp_directory temp("judge_build_");
        dir = temp.path();
        EXPECT_TRUE(is_directory(dir));
        test::write_script(dir / "run.sh", "exit 0");
    }
    EXPECT_FALSE(exists(dir));

    {
        scoped_temp_directory temp("judge_build_");
        dir = temp.path();
        temp.keep();
    }
    EXPECT_TRUE(is_directory(dir));
    remove_all(dir);
}

TEST(UtilsTest, ExceptionMessageTest) {
    try {
        throw resolution_error("No C++ source file found");
    } catch (judge_exception &e) {
        EXPECT_STREQ(e.what(), "No C++ source file found");
    }
}
