#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace arbiter {

/**
 * @brief 压缩包中的一个文件
 */
struct archive_file {
    /**
     * @brief 相对路径，以 '/' 分隔，不包含 ".." 和空路径段
     */
    std::string path;

    std::string content;

    /**
     * @brief 权限位，只保留低 9 位
     */
    unsigned mode = 0644;

    bool operator==(const archive_file &other) const;
};

/**
 * @brief 打包好的 tar 字节流和它的 SHA-256 摘要
 */
struct packed_archive {
    std::string bytes;
    std::string digest;
};

struct archive_limits {
    /**
     * @brief 所有文件解压后的总字节数上限
     */
    std::size_t max_total_size;

    /**
     * @brief 文件个数上限
     */
    std::size_t max_entries;
};

/**
 * @brief 根据 MAX_ARCHIVE_SIZE 和 MAX_ARCHIVE_ENTRIES 构造限制
 */
archive_limits default_archive_limits();

/**
 * @brief 将文件按给定顺序打包成 tar 并计算摘要
 * 打包结果是规范形式：文件顺序即创建顺序，不会重新排序；修改时间、
 * 属主等字段全部固定为 0，因此相同的文件序列总是得到相同的摘要，
 * 而调整文件顺序会改变摘要。
 * @throw archive_error 路径不安全或者重复
 */
packed_archive pack_archive(const std::vector<archive_file> &files);

/**
 * @brief 递归读取目录下的所有普通文件，按相对路径字典序排列
 * @throw archive_error 目录中存在符号链接或者特殊文件
 */
std::vector<archive_file> read_directory(const std::filesystem::path &dir);

/**
 * @brief 相当于 pack_archive(read_directory(dir))
 */
packed_archive pack_directory(const std::filesystem::path &dir);

/**
 * @brief 在内存中解析 tar 字节流，不写磁盘
 * 目录项会被跳过；符号链接、硬链接和设备文件等都会导致失败。
 * @throw archive_error tar 格式错误、路径越界、路径冲突、超出大小或个数限制
 */
std::vector<archive_file> unpack_archive(std::string_view bytes, const archive_limits &limits);

/**
 * @brief 将文件写入 root 目录下
 * 只创建普通文件和目录，打开文件时不跟随符号链接；失败时删除 root 下已写入的全部内容。
 * @throw archive_error 路径越界或者写入失败
 */
void extract_archive(const std::vector<archive_file> &files, const std::filesystem::path &root);

}  // namespace arbiter
