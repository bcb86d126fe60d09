#pragma once

#include <filesystem>
#include <string>

namespace localjudge {

/**
 * @brief 评测程序的返回值
 */
enum error_codes {
    /**
     * @brief 所有测试点都通过
     */
    E_ACCEPTED = 0,

    /**
     * @brief 无法确定题目文件夹或者源代码，或者编译失败，没有运行任何测试点
     */
    E_FAILURE = 1,

    /**
     * @brief 编译成功，但至少有一个测试点没有通过
     */
    E_NOT_ACCEPTED = 2
};

/**
 * @brief 外部测量程序的路径
 * 存在时通过它测量时间和内存，否则使用 getrusage
 * @defaultValue /usr/bin/time，可以通过环境变量 TIMEBINARY 指定
 */
extern std::filesystem::path TIME_BINARY;

/**
 * @brief 编译器
 * @defaultValue g++，可以通过环境变量 CXX 指定
 */
extern std::string COMPILER;

/**
 * @brief 默认的源代码文件名，文件不存在时查找题目文件夹内唯一的 .cpp 文件
 */
extern std::string DEFAULT_SOURCE;

/**
 * @brief 默认的语言标准
 */
extern std::string DEFAULT_STANDARD;

/**
 * @brief 题目元数据文件的路径
 * 假设程序运行在项目根目录下的 bin 文件夹，默认为 ../script/luogu_problems.json，
 * 可以通过环境变量 METADATA 指定
 */
extern std::filesystem::path METADATA_PATH;

/**
 * @brief 存放所有题目文件夹的根目录
 * 通过题号评测时在这里查找题目文件夹
 *
 * PROBLEM_DIR
 * ├── P1001-A+B Problem // 元数据中的 directory
 * │   ├── main.cpp // 选手程序
 * │   ├── 1.in // 第一个测试点的输入
 * │   ├── 1.out // 第一个测试点的标准输出
 * │   └── 2.in // 没有标准输出的测试点，结果为 NO_EXPECTED
 * └── ...
 */
extern std::filesystem::path PROBLEM_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，日志会同时输出到 stderr，
 * 并且不会删除编译产生的临时文件夹，以便手动检查编译产物。
 */
extern bool DEBUG;

}  // namespace localjudge
