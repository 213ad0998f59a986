#pragma once

#include <filesystem>
#include <string>

namespace arbiter {

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @return 文件的内容(没有指定编码)
 * @throw std::system_error 如果文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文件的全部内容
 * @param path 文件路径
 * @param def 若文件不存在，返回 def
 * @return 文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 写入文件，文件存在时覆盖
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 这里用于确保计算目录时不会出现目录遍历攻击，如果拿到的文件名包含 ".."，
 * 是绝对路径，或者包含控制字符，那么抛出异常。
 * 空的路径段和 "." 会被去掉，比如 "./a//b" 会变为 "a/b"。
 * @param subpath 被检查的文件名
 * @return 规范化之后的相对路径
 * @throw std::invalid_argument 如果路径不安全
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 判断 path 在词法上是否位于 root 之内
 */
bool is_within(const std::filesystem::path &root, const std::filesystem::path &path);

/**
 * @brief 将 from 目录下的所有普通文件（保留权限）复制到 to 目录中
 * 不跟随符号链接，遇到符号链接或者特殊文件时抛出异常
 * @throw std::runtime_error 遇到符号链接或者特殊文件
 */
void copy_directory(const std::filesystem::path &from, const std::filesystem::path &to);

/**
 * @brief 在 parent 下创建一个随机命名的目录，析构时递归删除
 */
struct scoped_directory {
    scoped_directory();
    explicit scoped_directory(const std::filesystem::path &parent, const std::string &prefix = "");
    scoped_directory(scoped_directory &&);
    scoped_directory(const scoped_directory &) = delete;
    ~scoped_directory();

    scoped_directory &operator=(scoped_directory &&);

    const std::filesystem::path &path() const;

    /**
     * @brief 立即删除目录
     */
    void remove();

    /**
     * @brief 放弃目录的所有权，目录不会被删除
     */
    std::filesystem::path release();

private:
    std::filesystem::path dir;
};

}  // namespace arbiter
