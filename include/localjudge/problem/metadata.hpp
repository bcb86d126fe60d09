#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

/**
 * 这个头文件包含题目元数据的读取
 * 元数据由题目抓取工具生成，是一个以题号为键的 JSON 对象：
 * {
 *     "P1001": {
 *         "pid": "P1001",
 *         "directory": "P1001-A+B Problem",
 *         "time_limit_ms": 1000,
 *         "memory_limit_kb": 131072,
 *         "time_limit_human": "1.00s",
 *         "memory_limit_human": "128.00MB"
 *     }
 * }
 * 评测系统只读取元数据，不会修改
 */
namespace localjudge {

/**
 * @brief 题目的时间、内存限制
 * 只用于显示和作为默认的超时时间，内存限制不会被强制执行
 */
struct problem_limits {
    /**
     * @brief 时间限制，单位为毫秒
     */
    std::optional<double> time_limit_ms;

    /**
     * @brief 内存限制，单位为 KB
     */
    std::optional<long> memory_limit_kb;
};

struct problem_record {
    std::string pid;

    /**
     * @brief 题目文件夹相对于题目根目录的路径
     */
    std::string directory;

    problem_limits limits;

    /**
     * @brief 便于阅读的时间限制，比如 1.00s，可能为空
     */
    std::string time_limit_human;

    /**
     * @brief 便于阅读的内存限制，比如 128.00MB，可能为空
     */
    std::string memory_limit_human;
};

/**
 * @brief 从 JSON 对象中读取一条元数据
 * 类型不正确的字段被视为不存在
 */
problem_record parse_problem_record(const nlohmann::json &j);

/**
 * @brief 题目元数据，评测开始时读取一次，之后只读
 */
struct metadata_store {
    metadata_store();
    explicit metadata_store(std::map<std::string, problem_record> records);

    /**
     * @brief 读取元数据文件
     * 文件不存在时返回空的元数据，格式错误时输出警告并返回空的元数据
     */
    static metadata_store load(const std::filesystem::path &path);

    /**
     * @brief 从 JSON 对象构造元数据，值不是对象的项会被忽略
     */
    static metadata_store from_json(const nlohmann::json &catalog);

    /**
     * @brief 根据题号查找元数据
     * 先按键查找，找不到时再查找 pid 字段与之相等的项
     */
    std::optional<problem_record> find_by_pid(const std::string &pid) const;

    /**
     * @brief 根据题目文件夹查找元数据
     * 先查找键为文件夹名的项（要求其 directory 为空或者最后一级同名），
     * 找不到时再查找 directory 最后一级与文件夹名相同的项
     */
    std::optional<problem_record> find_by_directory(const std::filesystem::path &dir) const;

    std::size_t size() const;

private:
    std::map<std::string, problem_record> records;
};

struct problem_location {
    std::filesystem::path dir;
    std::optional<problem_record> record;
};

/**
 * @brief 根据题号确定题目文件夹
 * 若元数据中有该题且 base_dir / directory 存在，使用该文件夹，否则使用 base_dir / pid
 * @note 不检查返回的文件夹是否存在
 */
problem_location resolve_problem_directory(const std::string &pid,
                                           const std::filesystem::path &base_dir,
                                           const metadata_store &metadata);

}  // namespace localjudge
