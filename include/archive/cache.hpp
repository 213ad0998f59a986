#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "archive/archive.hpp"

namespace arbiter {

/**
 * @brief 缓存中的一份解压后的提交
 * 只要还有任务持有 cached_archive，缓存就不会淘汰它。
 */
class cached_archive {
public:
    const std::string &digest() const;

    const std::filesystem::path &path() const;

private:
    friend class archive_cache;

    cached_archive(std::string digest, std::filesystem::path path);

    std::string archive_digest;
    std::filesystem::path archive_path;
};

typedef std::shared_ptr<const cached_archive> cache_handle;

/**
 * @brief 按摘要缓存解压后的提交
 * 同一份提交再次提交时可以不再携带压缩包内容。
 * 解压先写入临时目录，完成后原子地重命名为摘要，所以缓存中的目录总是完整的。
 * 条目数或者总大小超过上限时，在 store 中按最近最少使用的顺序淘汰没有被持有的条目。
 * 可以在多个线程中同时使用。
 */
class archive_cache {
public:
    /**
     * @brief 打开缓存目录，接管上次运行留下的条目并删除未完成的临时目录
     * @param max_entries 最多缓存的提交数
     * @param max_size 所有提交解压后的总字节数上限
     */
    archive_cache(std::filesystem::path root, std::size_t max_entries, std::uintmax_t max_size);

    archive_cache(const archive_cache &) = delete;
    archive_cache &operator=(const archive_cache &) = delete;

    /**
     * @brief 查找已经解压的提交
     * @return 解压目录的句柄，不存在时返回 nullptr
     * @throw archive_error 摘要格式错误
     */
    cache_handle lookup(const std::string &digest);

    /**
     * @brief 将文件解压到缓存中，已经存在时直接返回已有条目
     * @throw archive_error 摘要格式错误或解压失败
     */
    cache_handle store(const std::string &digest, const std::vector<archive_file> &files);

    const std::filesystem::path &root() const;

    /**
     * @brief 当前缓存的提交数
     */
    std::size_t entries() const;

    /**
     * @brief 当前缓存的总字节数
     */
    std::uintmax_t size() const;

private:
    struct entry {
        std::weak_ptr<const cached_archive> user;
        std::uint64_t last_used = 0;
        std::uintmax_t bytes = 0;
    };

    cache_handle acquire(const std::string &digest, entry &e);

    /**
     * @brief 选出需要淘汰的条目并移动到临时目录，调用时已持有 entries_mutex
     * @return 需要删除的临时目录
     */
    std::vector<std::filesystem::path> evict_locked(const std::string &keep);

    std::filesystem::path staging_path() const;

    std::filesystem::path cache_root;
    std::size_t max_entries;
    std::uintmax_t max_size;

    mutable std::mutex entries_mutex;
    std::map<std::string, entry> cached;
    std::uint64_t clock = 0;
    std::uintmax_t total = 0;
};

}  // namespace arbiter
