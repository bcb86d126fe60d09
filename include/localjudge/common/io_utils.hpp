#pragma once

#include <filesystem>
#include <string>

namespace localjudge {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将字符串中不合法的 UTF-8 字节序列替换为 U+FFFD
 * 选手程序的输出可能是任意字节，我们只按文本处理，替换不合法的部分而不是报错
 * @param text 原始字节
 * @return 合法的 UTF-8 文本
 */
std::string sanitize_utf8(const std::string &text);

/**
 * @brief 临时文件，析构时删除
 * 用来存放 /usr/bin/time 等外部程序写出的测量结果
 */
struct scoped_temp_file {
    /**
     * @brief 在系统临时文件夹内创建一个空文件
     * @param prefix 文件名前缀
     */
    explicit scoped_temp_file(const std::string &prefix);
    scoped_temp_file(scoped_temp_file &&);
    ~scoped_temp_file();

    scoped_temp_file &operator=(scoped_temp_file &&);

    const std::filesystem::path &path() const;

    void release();

private:
    bool valid;
    std::filesystem::path file;
};

/**
 * @brief 临时文件夹，析构时递归删除
 * 评测时编译出来的可执行文件放在这里
 */
struct scoped_temp_directory {
    explicit scoped_temp_directory(const std::string &prefix);
    scoped_temp_directory(scoped_temp_directory &&);
    ~scoped_temp_directory();

    scoped_temp_directory &operator=(scoped_temp_directory &&);

    const std::filesystem::path &path() const;

    /**
     * @brief 放弃对文件夹的所有权，之后析构时不再删除
     * 调试模式下用来保留编译产物
     */
    void keep();

    void release();

private:
    bool valid;
    std::filesystem::path dir;
};

}  // namespace localjudge
