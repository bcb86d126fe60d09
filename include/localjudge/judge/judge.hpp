#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>
#include "localjudge/common/status.hpp"
#include "localjudge/judge/compiler.hpp"
#include "localjudge/judge/test_case.hpp"
#include "localjudge/problem/metadata.hpp"
#include "localjudge/run/measurer.hpp"

/**
 * 这个头文件包含评测一道题的完整流程：
 * 确定源代码 → 编译 → 查找测试点 → 逐个运行并判定 → 汇总
 */
namespace localjudge {

/**
 * @brief 一个测试点的评测结果
 */
struct test_result {
    /**
     * @brief 测试点的名字，即输入文件名
     */
    std::string name;

    localjudge::status status;

    /**
     * @brief 运行时间
     * 单位为秒，超时时为时间限制
     */
    std::optional<double> time_seconds;

    /**
     * @brief 峰值内存
     * 单位为 KB，无法测量时为空
     */
    std::optional<long> memory_kb;

    std::string stdout_text;

    std::string stderr_text;

    /**
     * @brief 评测信息，第一行会显示在评测结果行中
     */
    std::string message;
};

/**
 * @brief 评测一道题需要的信息
 */
struct judge_request {
    /**
     * @brief 题目文件夹，必须存在
     */
    std::filesystem::path problem_dir;

    /**
     * @brief 显示用的题目名字，一般为题号
     */
    std::string label;

    /**
     * @brief 题目的元数据，可能没有
     */
    std::optional<problem_record> record;

    /**
     * @brief 源代码文件名，相对于题目文件夹
     */
    std::string source;

    std::string compiler;

    std::string standard;

    /**
     * @brief 手动指定的每个测试点的时间限制
     * 单位为秒，为空时使用元数据中的时间限制，都没有时不限制
     */
    std::optional<double> timeout;

    std::vector<std::string> extra_flags;

    /**
     * @brief 为真时保留编译产生的临时文件夹
     */
    bool keep_build = false;
};

struct judge_report {
    /**
     * @brief 编译结果，每次评测有且只有一个
     */
    compile_result compilation;

    /**
     * @brief 每个测试点的结果，按测试点名字排序。编译失败时为空
     */
    std::vector<test_result> results;

    /**
     * @brief 评测程序的返回值，见 error_codes
     */
    int exitcode;
};

/**
 * @brief 查找题目的源代码
 * @param problem_dir 题目文件夹
 * @param preferred 优先使用的文件名，存在时直接返回
 * @return 源代码路径
 * @throw resolution_error 文件夹内没有或者有多个 .cpp 文件
 */
std::filesystem::path find_source(const std::filesystem::path &problem_dir, const std::string &preferred);

/**
 * @brief 运行一个测试点并判定结果
 * 运行时间为测量值，测量值缺失或者不为正时使用评测系统自己测量的时钟时间
 * @param measurer 资源测量方式
 * @param executable 选手程序
 * @param tc 测试点
 * @param timeout 时间限制，单位为秒
 * @throw internal_error 选手程序不存在
 */
test_result run_single_test(resource_measurer &measurer,
                            const std::filesystem::path &executable,
                            const test_case &tc,
                            const std::optional<double> &timeout);

/**
 * @brief 生成测试点的评测结果行
 * 比如 [1.in] AC | time 1.52 ms | limit 1000 ms | mem 3.20 MB | mem limit 128.00 MB | Accepted
 */
std::string format_result(const test_result &result, const problem_limits &limits);

/**
 * @brief 评测一道题
 * 编译到临时文件夹中，评测结束后删除该文件夹。
 * 评测过程和每个测试点的结果输出到 out，编译错误信息和选手程序的 stderr 输出到 err
 * @param request 评测信息
 * @param measurer 资源测量方式，所有测试点共用
 * @throw resolution_error 无法确定源代码
 * @throw internal_error 编译器无法启动
 */
judge_report judge_problem(const judge_request &request,
                           resource_measurer &measurer,
                           std::ostream &out,
                           std::ostream &err);

}  // namespace localjudge
