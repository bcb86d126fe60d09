#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "localjudge/run/process.hpp"

namespace localjudge {

struct time_measurement {
    /**
     * @brief 时钟时间
     * 单位为秒，无法得知时为空
     */
    std::optional<double> time_seconds;

    /**
     * @brief 峰值常驻内存
     * 单位为 KB，无法得知时为空
     */
    std::optional<long> memory_kb;
};

struct measured_run {
    process_result process;

    /**
     * @brief 测量到的运行时间与内存
     * 超时的时候不保证有值
     */
    time_measurement usage;
};

/**
 * @brief 测量子进程运行时间和内存使用的方式
 * 不是所有的系统都能精确得到单个子进程的内存使用，因此有多种实现，
 * 评测开始时只选择一次，之后所有测试点都使用同一个实现。
 */
struct resource_measurer {
    virtual ~resource_measurer();

    /**
     * @brief 测量方式的名字，用于日志
     */
    virtual std::string name() const = 0;

    /**
     * @brief 运行程序并测量资源使用
     * 测量失败不会抛出异常，对应的值为空
     * @throw std::system_error 同 run_process
     */
    virtual measured_run run(const process_options &opt) = 0;
};

/**
 * @brief 通过外部的 /usr/bin/time 测量
 * 命令会被包装成 time -f "%e %M" -o <临时文件> <command>，
 * 运行结束后解析临时文件，并保证删除临时文件
 */
struct external_time_measurer : resource_measurer {
    explicit external_time_measurer(const std::filesystem::path &time_binary);

    std::string name() const override;

    measured_run run(const process_options &opt) override;

private:
    std::filesystem::path time_binary;
};

/**
 * @brief 通过 getrusage(RUSAGE_CHILDREN) 估计内存使用
 * 时间为评测系统自己测量的时钟时间。
 * RUSAGE_CHILDREN 统计的是所有已回收子进程的最大值，因此内存只是近似：
 * 取运行前后 ru_maxrss 的差，差不为正时取运行后的值。
 */
struct rusage_measurer : resource_measurer {
    std::string name() const override;

    measured_run run(const process_options &opt) override;
};

/**
 * @brief 读入并解析 /usr/bin/time 产生的输出文件
 * 文件的最后一个非空行应当为 "<秒数> <KB>"，GNU time 会在前面附加
 * "Command exited with non-zero status" 之类的信息，这些行会被忽略
 * @return 解析结果，任何一项解析失败时为空
 */
time_measurement read_time_output(const std::filesystem::path &file);

/**
 * @brief 检查外部测量程序是否存在，并选择测量方式
 * @param time_binary 外部测量程序的路径，一般为 /usr/bin/time
 */
std::unique_ptr<resource_measurer> make_resource_measurer(const std::filesystem::path &time_binary);

}  // namespace localjudge
