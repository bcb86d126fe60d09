#pragma once

#include <string>

namespace localjudge {

/**
 * @brief 表示数据点的评测结果
 * 判定顺序为 TLE、RE、NO_EXPECTED、AC、WA
 */
enum class status {
    /**
     * @brief 用户程序本测试点评测通过
     * 比较时忽略所有空白字符的差异，只比较以空白字符分隔的记号序列
     */
    ACCEPTED = 0,

    /**
     * @brief 答案错误
     * 记号序列与标准输出不一致
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 用户程序出现运行时错误
     * 返回值非 0，或者因为信号崩溃。即使输出正确也返回 RE
     */
    RUNTIME_ERROR = 2,

    /**
     * @brief 用户程序运行时间超出限制
     * 这里只比较时钟时间，超时后进程组会被杀死
     */
    TIME_LIMIT_EXCEEDED = 3,

    /**
     * @brief 没有标准输出文件，无法比较
     * 不算通过，但也不是错误
     */
    NO_EXPECTED = 4
};

/**
 * @brief 获得评测结果的缩写，比如 AC、WA
 */
const char *get_status_code(status);

}  // namespace localjudge
