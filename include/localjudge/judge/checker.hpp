#pragma once

#include <string>
#include <vector>
#include "localjudge/common/status.hpp"

namespace localjudge {

/**
 * @brief diff 最多显示多少行
 */
const std::size_t MAX_DIFF_LINES = 20;

struct verdict {
    localjudge::status status;

    /**
     * @brief 评测信息，第一行为概要，WA 时后面跟着 diff
     */
    std::string message;
};

/**
 * @brief 将输出转换为以空白字符分隔的记号序列
 * 忽略行末空格、文末空行、换行符风格以及记号之间空白字符的数量。
 * 不换行空格 U+00A0、全角空格 U+3000 等 Unicode 空白字符也作为分隔符
 * @param text 合法的 UTF-8 文本
 */
std::vector<std::string> normalize_output(const std::string &text);

/**
 * @brief 比较两个输出的记号序列是否相同
 */
bool outputs_match(const std::string &expected, const std::string &actual);

/**
 * @brief 判定一个正常结束（没有超时）的测试点的结果
 * 按以下顺序判定：
 * 1. 返回值非 0：RE，即使输出正确
 * 2. 没有标准输出文件：NO_EXPECTED
 * 3. 记号序列相同：AC
 * 4. 否则为 WA，并附带标准输出与程序输出的 unified diff 的前 20 行
 * @param exitcode 程序的返回值
 * @param expected_available 是否存在标准输出文件
 * @param expected_text 标准输出的内容
 * @param actual_text 程序的输出
 * @param expected_name diff 中标准输出显示的名字
 */
verdict classify(int exitcode,
                 bool expected_available,
                 const std::string &expected_text,
                 const std::string &actual_text,
                 const std::string &expected_name = "expected");

/**
 * @brief 超时的测试点的结果，总是 TLE
 * @param timeout 时间限制，单位为秒
 */
verdict classify_timeout(double timeout);

}  // namespace localjudge
