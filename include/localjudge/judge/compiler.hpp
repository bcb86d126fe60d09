#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace localjudge {

/**
 * @brief 表示一次编译的结果
 * 编译失败（编译器返回非 0）是正常的结果，不会抛出异常
 */
struct compile_result {
    bool success = false;

    /**
     * @brief 编译概要，比如 Compilation succeeded
     */
    std::string message;

    std::string stdout_text;

    /**
     * @brief 编译器的标准错误输出，编译错误信息都在这里
     */
    std::string stderr_text;

    /**
     * @brief 编译用时
     * 单位为秒
     */
    double elapsed = 0;

    /**
     * @brief 编译产物的路径，编译失败时为空
     */
    std::optional<std::filesystem::path> artifact;
};

/**
 * @brief 编译选手程序
 * 调用 compiler <source> -std=<standard> -O2 -pipe -Wall -Wextra -Wshadow -Wconversion -DLOCAL=1 -o <output> <extra_flags...>
 * @param compiler 编译器，比如 g++
 * @param source 源代码路径
 * @param output 可执行文件的输出路径
 * @param standard 语言标准，比如 c++17
 * @param extra_flags 附加在最后的编译选项
 * @throw internal_error 编译器无法启动
 */
compile_result compile_source(const std::string &compiler,
                              const std::filesystem::path &source,
                              const std::filesystem::path &output,
                              const std::string &standard,
                              const std::vector<std::string> &extra_flags);

}  // namespace localjudge
