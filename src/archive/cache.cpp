#include "archive/cache.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <tuple>
#include "archive/digest.hpp"
#include "common/exceptions.hpp"

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

static uintmax_t directory_size(const fs::path &dir) {
    uintmax_t bytes = 0;
    for (auto &item : fs::recursive_directory_iterator(dir))
        if (item.is_regular_file() && !item.is_symlink())
            bytes += item.file_size();
    return bytes;
}

static void remove_quietly(const fs::path &path) {
    error_code ec;
    fs::remove_all(path, ec);
    if (ec)
        LOG(WARNING) << "Unable to remove " << path << ": " << ec.message();
}

cached_archive::cached_archive(string digest, fs::path path)
    : archive_digest(move(digest)), archive_path(move(path)) {}

const string &cached_archive::digest() const {
    return archive_digest;
}

const fs::path &cached_archive::path() const {
    return archive_path;
}

archive_cache::archive_cache(fs::path root, size_t max_entries, uintmax_t max_size)
    : cache_root(move(root)), max_entries(max_entries), max_size(max_size) {
    fs::create_directories(cache_root);

    // 按修改时间从旧到新接管已有的条目
    vector<tuple<fs::file_time_type, string, uintmax_t>> found;
    for (auto &item : fs::directory_iterator(cache_root)) {
        string name = item.path().filename().string();
        if (!item.is_directory() || !is_valid_digest(name)) {
            LOG(INFO) << "Removing stale cache entry " << item.path();
            remove_quietly(item.path());
            continue;
        }
        found.emplace_back(item.last_write_time(), name, directory_size(item.path()));
    }
    sort(found.begin(), found.end());
    for (auto &[mtime, digest, bytes] : found) {
        entry &e = cached[digest];
        e.last_used = ++clock;
        e.bytes = bytes;
        total += bytes;
    }

    vector<fs::path> evicted;
    {
        lock_guard<std::mutex> lock(entries_mutex);
        evicted = evict_locked("");
    }
    for (auto &path : evicted) remove_quietly(path);
    LOG(INFO) << "Archive cache " << cache_root << " holds " << cached.size() << " archives, " << total << " bytes";
}

cache_handle archive_cache::acquire(const string &digest, entry &e) {
    e.last_used = ++clock;
    if (auto user = e.user.lock()) return user;
    shared_ptr<const cached_archive> handle(new cached_archive(digest, cache_root / digest));
    e.user = handle;
    return handle;
}

cache_handle archive_cache::lookup(const string &digest) {
    if (!is_valid_digest(digest))
        throw archive_error("malformed digest " + digest);
    lock_guard<std::mutex> lock(entries_mutex);
    auto it = cached.find(digest);
    if (it == cached.end()) return nullptr;
    return acquire(digest, it->second);
}

cache_handle archive_cache::store(const string &digest, const vector<archive_file> &files) {
    if (auto existing = lookup(digest))
        return existing;

    fs::path staging = staging_path();
    extract_archive(files, staging);
    uintmax_t bytes = directory_size(staging);

    cache_handle handle;
    vector<fs::path> evicted;
    {
        lock_guard<std::mutex> lock(entries_mutex);
        auto it = cached.find(digest);
        if (it != cached.end()) {
            // 另一个任务已经解压了同样的提交
            evicted.push_back(staging);
            handle = acquire(digest, it->second);
        } else {
            error_code ec;
            fs::rename(staging, cache_root / digest, ec);
            if (ec) {
                remove_quietly(staging);
                throw archive_error("unable to store archive " + digest + " in cache: " + ec.message());
            }
            entry &e = cached[digest];
            e.bytes = bytes;
            total += bytes;
            handle = acquire(digest, e);
            evicted = evict_locked(digest);
            LOG(INFO) << "Cached archive " << digest << " with " << files.size() << " files, " << bytes << " bytes";
        }
    }
    for (auto &path : evicted) remove_quietly(path);
    return handle;
}

vector<fs::path> archive_cache::evict_locked(const string &keep) {
    vector<fs::path> evicted;
    while (cached.size() > max_entries || total > max_size) {
        auto victim = cached.end();
        for (auto it = cached.begin(); it != cached.end(); ++it) {
            if (it->first == keep || !it->second.user.expired()) continue;
            if (victim == cached.end() || it->second.last_used < victim->second.last_used)
                victim = it;
        }
        if (victim == cached.end()) {
            LOG(WARNING) << "Archive cache is over its limit but every archive is in use";
            break;
        }

        // 先改名，目录的删除在锁外进行
        fs::path doomed = staging_path();
        error_code ec;
        fs::rename(cache_root / victim->first, doomed, ec);
        if (ec) {
            LOG(WARNING) << "Unable to move evicted archive " << victim->first << ": " << ec.message();
            doomed = cache_root / victim->first;
        }
        LOG(INFO) << "Evicting archive " << victim->first << " from cache";
        evicted.push_back(doomed);
        total -= victim->second.bytes;
        cached.erase(victim);
    }
    return evicted;
}

fs::path archive_cache::staging_path() const {
    return cache_root / ("tmp-" + boost::uuids::to_string(boost::uuids::random_generator()()));
}

const fs::path &archive_cache::root() const {
    return cache_root;
}

size_t archive_cache::entries() const {
    lock_guard<std::mutex> lock(entries_mutex);
    return cached.size();
}

uintmax_t archive_cache::size() const {
    lock_guard<std::mutex> lock(entries_mutex);
    return total;
}

}  // namespace arbiter
