#pragma once

#include <filesystem>
#include <string>

namespace sandbox {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 将字符串按 UTF-8 解码为 Unicode 码点序列
 * 若字符串不是合法的 UTF-8，则每个字节作为一个码点，保证比较结果始终有定义
 */
std::u32string utf8_decode(const std::string &string);

/**
 * @brief 截取字符串的前 count 个字符（按 UTF-8 码点计数）
 * 不会从多字节字符的中间截断
 */
std::string utf8_prefix(const std::string &string, std::size_t count);

/**
 * @brief 统计字符串的字符数（按 UTF-8 码点计数）
 */
std::size_t utf8_length(const std::string &string);

/**
 * @brief 将字符串截断到至多 limit 个字节
 * 截断位置落在多字节字符中间时向前退到该字符的起始位置，因此合法的 UTF-8 截断后仍然合法
 */
void utf8_truncate(std::string &string, std::size_t limit);

/**
 * @brief 自动关闭的文件描述符
 */
struct unique_fd {
    unique_fd();
    explicit unique_fd(int fd);
    unique_fd(unique_fd &&);
    ~unique_fd();

    unique_fd &operator=(unique_fd &&);

    int get() const;

    /**
     * @brief 放弃所有权，返回文件描述符，之后不再负责关闭
     */
    int release();

    /**
     * @brief 关闭当前文件描述符
     * @throw std::system_error 如果 close 失败
     */
    void reset();

    explicit operator bool() const;

private:
    int fd;
};

/**
 * @brief 创建一对 O_CLOEXEC 的管道
 * @param read_end 管道读端
 * @param write_end 管道写端
 */
void make_pipe(unique_fd &read_end, unique_fd &write_end);

void set_nonblocking(int fd);

/**
 * @brief 将数据全部写入文件描述符，自动处理 EINTR 和部分写入
 */
void write_fully(int fd, const std::string &data);

/**
 * @brief 读取文件描述符直到 EOF
 */
std::string read_fully(int fd);

}  // namespace sandbox
