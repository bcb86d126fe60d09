#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace localjudge {

struct process_options {
    /**
     * @brief 要运行的命令，command[0] 为程序路径，会在 PATH 中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 重定向到子进程标准输入的文件，为空时使用 /dev/null
     */
    std::filesystem::path stdin_filename;

    /**
     * @brief 时钟时间限制
     * 单位为秒，为空时不限制
     */
    std::optional<double> wall_limit;
};

struct process_result {
    enum class outcome {
        EXITED,    // 子进程正常退出
        SIGNALED,  // 子进程因为信号终止
        TIMEOUT    // 超出时钟时间限制，进程组已被杀死
    };

    outcome kind = outcome::EXITED;

    /**
     * @brief 子进程的返回值
     * 因为信号终止时为 128 + signal，超时时为 -1
     */
    int exitcode = -1;

    /**
     * @brief 终止子进程的信号，没有时为 -1
     */
    int signal = -1;

    /**
     * @brief 子进程的标准输出，不合法的 UTF-8 字节已被替换
     * 超时时保存超时前已经读到的内容
     */
    std::string stdout_text;

    /**
     * @brief 子进程的标准错误输出
     */
    std::string stderr_text;

    /**
     * @brief 从启动子进程到回收子进程的时钟时间
     * 单位为秒
     */
    double wall_time = 0;

    bool timed_out() const;
};

/**
 * @brief 运行指定的程序并等待其结束
 * 1. 打开标准输入文件，创建连接子进程 stdout、stderr 的管道
 * 2. 调用 fork 创建子进程
 *    1. 对于子进程，将其分离到一个独立的进程组，以便我们可以杀死进程组内所有进程，
 *       并重定向输入输出后 exec
 *    2. 对于父进程，通过 poll 读取子进程的输出，直到子进程结束或者超出时间限制
 * 3. 超出时间限制时先向进程组发送 SIGTERM，0.1 秒后再发送 SIGKILL，并返回 TIMEOUT
 * 4. 子进程结束后杀死进程组内残留的进程，读取管道内剩余的数据
 *
 * 超时、非零返回值、信号终止都是正常的运行结果，不会抛出异常。
 * @throw std::system_error 当无法打开标准输入文件、无法 fork、或者 exec 失败（比如程序不存在）
 */
process_result run_process(const process_options &opt);

}  // namespace localjudge
