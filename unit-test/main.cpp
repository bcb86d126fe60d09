#include <glog/logging.h>
#include <filesystem>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/problem_dir.hpp"

/**
 * @brief 检查测试环境
 * 评测相关的测试需要 g++，找不到时这些测试会被跳过
 */
class GlobalEnv : public ::testing::Environment {
public:
    void SetUp() override {
        LOG(INFO) << "Temporary files are created in " << std::filesystem::temp_directory_path();
        if (!localjudge::test::has_compiler())
            LOG(WARNING) << "g++ is not available, compilation and judging tests will be skipped";
    }
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    ::testing::AddGlobalTestEnvironment(new GlobalEnv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
