#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace localjudge {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是编译器无法启动，或者评测系统自身的 IO 错误，出现时本次评测直接终止
 */
struct internal_error : public judge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示无法确定要评测的题目
 * 比如题目文件夹不存在、文件夹内没有源代码或者存在多个源代码
 */
struct resolution_error : public judge_exception {
    resolution_error();
    explicit resolution_error(const std::string &message);
};

}  // namespace localjudge
