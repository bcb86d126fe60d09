#pragma once

#include <string>
#include <vector>

/**
 * 这个头文件提供按行比较两段文本的工具，用于在答案错误时告诉选手差异在哪里
 */
namespace localjudge {

struct diff_opcode {
    enum class kind { EQUAL, REPLACE, DELETE, INSERT };

    kind tag;

    // a 中的区间 [a_begin, a_end)，b 中的区间 [b_begin, b_end)
    std::size_t a_begin, a_end, b_begin, b_end;
};

/**
 * @brief 按行分割文本
 * 支持 \n、\r\n、\r 三种换行，结尾的换行不会产生空行
 */
std::vector<std::string> split_lines(const std::string &text);

/**
 * @brief 计算将 a 变成 b 的编辑操作序列
 * 首尾相同的行会先被去掉，剩下的部分若不太大则用 LCS 对齐，
 * 否则整体视为替换，避免大输出时耗费过多内存
 */
std::vector<diff_opcode> diff_lines(const std::vector<std::string> &a, const std::vector<std::string> &b);

/**
 * @brief 生成 unified diff 格式的差异
 * @param a 原文本的所有行
 * @param b 新文本的所有行
 * @param fromfile 原文本在 --- 行显示的名字
 * @param tofile 新文本在 +++ 行显示的名字
 * @param context 每个差异块前后保留的相同行数
 * @return diff 的每一行（不含换行符），两段文本相同时返回空
 */
std::vector<std::string> unified_diff(const std::vector<std::string> &a,
                                      const std::vector<std::string> &b,
                                      const std::string &fromfile,
                                      const std::string &tofile,
                                      std::size_t context = 3);

}  // namespace localjudge
