#include <filesystem>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "localjudge/common/exceptions.hpp"
#include "localjudge/judge/compiler.hpp"
#include "test/problem_dir.hpp"

using namespace std;
using namespace std::filesystem;
using namespace localjudge;
using ::testing::HasSubstr;

class CompilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!test::has_compiler()) GTEST_SKIP() << "g++ is not available";
    }
};

TEST_F(CompilerTest, CompilationSucceededTest) {
    test::problem_dir dir;
    path source = dir.write("main.cpp", R"(#include <iostream>
int main() {
#ifdef LOCAL
    std::cout << "local" << std::endl;
#endif
    return 0;
})");
    compile_result result = compile_source("g++", source, dir.path() / "solution", "c++17", {});
    EXPECT_TRUE(result.success) << result.stderr_text;
    EXPECT_EQ(result.message, "Compilation succeeded");
    ASSERT_TRUE(result.artifact);
    EXPECT_EQ(*result.artifact, dir.path() / "solution");
    EXPECT_TRUE(is_regular_file(*result.artifact));
    EXPECT_GE(result.elapsed, 0);
}

TEST_F(CompilerTest, CompilationFailedTest) {
    test::problem_dir dir;
    path source = dir.write("main.cpp", R"(int main() {
    return undefined_variable;
})");
    compile_result result = compile_source("g++", source, dir.path() / "solution", "c++17", {});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Compilation failed");
    EXPECT_FALSE(result.artifact);
    EXPECT_THAT(result.stderr_text, HasSubstr("undefined_variable"));
}

TEST_F(CompilerTest, ExtraFlagsTest) {
    test::problem_dir dir;
    path source = dir.write("main.cpp", R"(int main() {
    return VALUE;
})");
    compile_result result = compile_source("g++", source, dir.path() / "solution", "c++17", {"-DVALUE=0"});
    EXPECT_TRUE(result.success) << result.stderr_text;
}

TEST_F(CompilerTest, WarningsEnabledTest) {
    test::problem_dir dir;
    path source = dir.write("main.cpp", R"(int main() {
    int unused = 0;
    return 0;
})");
    compile_result result = compile_source("g++", source, dir.path() / "solution", "c++17", {});
    EXPECT_TRUE(result.success);
    EXPECT_THAT(result.stderr_text, HasSubstr("unused"));
}

TEST(CompilerMissingTest, MissingCompilerTest) {
    test::problem_dir dir;
    path source = dir.write("main.cpp", "int main() {}");
    EXPECT_THROW(compile_source("/nonexistent/g++", source, dir.path() / "solution", "c++17", {}), internal_error);
}
