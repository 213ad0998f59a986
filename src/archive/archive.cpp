#include "archive/archive.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <set>
#include <stdexcept>
#include "archive/digest.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

bool archive_file::operator==(const archive_file &other) const {
    return path == other.path && content == other.content && (mode & 0777) == (other.mode & 0777);
}

archive_limits default_archive_limits() {
    return {MAX_ARCHIVE_SIZE, MAX_ARCHIVE_ENTRIES};
}

/**
 * @brief 记录已经出现过的文件和目录，检查路径冲突
 * "a" 作为文件出现后，"a/b" 会被认为是冲突，反之亦然
 */
struct path_registry {
    set<string> files;
    set<string> directories;

    void add(const string &path) {
        if (files.count(path) || directories.count(path))
            throw archive_error("duplicate path " + path);
        for (size_t pos = path.find('/'); pos != string::npos; pos = path.find('/', pos + 1)) {
            string prefix = path.substr(0, pos);
            if (files.count(prefix))
                throw archive_error(fmt::format("path {} collides with file {}", path, prefix));
            directories.insert(prefix);
        }
        files.insert(path);
    }
};

static string safe_path(const string &path) {
    try {
        return assert_safe_path(path);
    } catch (invalid_argument &e) {
        throw archive_error(e.what());
    }
}

static string error_string(struct archive *a) {
    const char *message = archive_error_string(a);
    return message ? message : "unknown error";
}

static la_ssize_t append_to_string(struct archive *, void *client_data, const void *buffer, size_t length) {
    static_cast<string *>(client_data)->append(static_cast<const char *>(buffer), length);
    return static_cast<la_ssize_t>(length);
}

packed_archive pack_archive(const vector<archive_file> &files) {
    path_registry registry;
    for (auto &file : files) {
        if (safe_path(file.path) != file.path)
            throw archive_error("path is not in canonical form " + file.path);
        registry.add(file.path);
    }

    packed_archive result;
    struct archive *out = archive_write_new();
    if (!out) throw internal_error("archive_write_new failed");
    defer { archive_write_free(out); };

    if (archive_write_set_format_pax_restricted(out) != ARCHIVE_OK)
        throw archive_error(fmt::format("archive_write_set_format - {}", error_string(out)));
    if (archive_write_open(out, &result.bytes, nullptr, append_to_string, nullptr) != ARCHIVE_OK)
        throw archive_error(fmt::format("archive_write_open - {}", error_string(out)));

    for (auto &file : files) {
        struct archive_entry *entry = archive_entry_new();
        if (!entry) throw internal_error("archive_entry_new failed");
        defer { archive_entry_free(entry); };

        // 固定所有可变字段，摘要只取决于路径、内容、权限和顺序
        archive_entry_set_pathname(entry, file.path.c_str());
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, file.mode & 0777);
        archive_entry_set_size(entry, file.content.size());
        archive_entry_set_mtime(entry, 0, 0);
        archive_entry_set_uid(entry, 0);
        archive_entry_set_gid(entry, 0);

        if (archive_write_header(out, entry) != ARCHIVE_OK)
            throw archive_error(fmt::format("archive_write_header - {}", error_string(out)));
        if (!file.content.empty()) {
            la_ssize_t written = archive_write_data(out, file.content.data(), file.content.size());
            if (written < 0 || static_cast<size_t>(written) != file.content.size())
                throw archive_error(fmt::format("archive_write_data - {}", error_string(out)));
        }
        if (archive_write_finish_entry(out) != ARCHIVE_OK)
            throw archive_error(fmt::format("archive_write_finish_entry - {}", error_string(out)));
    }

    if (archive_write_close(out) != ARCHIVE_OK)
        throw archive_error(fmt::format("archive_write_close - {}", error_string(out)));

    result.digest = sha256_hex(result.bytes);
    return result;
}

static void collect_directory(const fs::path &root, const fs::path &dir, vector<archive_file> &files) {
    for (auto &entry : fs::directory_iterator(dir)) {
        auto status = entry.symlink_status();
        if (fs::is_symlink(status)) {
            throw archive_error("symbolic links are not allowed: " + entry.path().string());
        } else if (fs::is_directory(status)) {
            collect_directory(root, entry.path(), files);
        } else if (fs::is_regular_file(status)) {
            archive_file file;
            file.path = entry.path().lexically_relative(root).generic_string();
            file.content = read_file_content(entry.path());
            file.mode = static_cast<unsigned>(status.permissions()) & 0777;
            files.push_back(move(file));
        } else {
            throw archive_error("special files are not allowed: " + entry.path().string());
        }
    }
}

vector<archive_file> read_directory(const fs::path &dir) {
    if (!fs::is_directory(dir))
        throw archive_error("submission directory " + dir.string() + " does not exist");

    vector<archive_file> files;
    try {
        collect_directory(dir, dir, files);
    } catch (fs::filesystem_error &e) {
        throw archive_error(e.what());
    } catch (system_error &e) {
        throw archive_error(e.what());
    }

    sort(files.begin(), files.end(), [](const archive_file &a, const archive_file &b) {
        return a.path < b.path;
    });
    return files;
}

packed_archive pack_directory(const fs::path &dir) {
    return pack_archive(read_directory(dir));
}

vector<archive_file> unpack_archive(string_view bytes, const archive_limits &limits) {
    struct archive *in = archive_read_new();
    if (!in) throw internal_error("archive_read_new failed");
    defer { archive_read_free(in); };

    archive_read_support_format_tar(in);
    if (archive_read_open_memory(in, bytes.data(), bytes.size()) != ARCHIVE_OK)
        throw archive_error(fmt::format("malformed archive: {}", error_string(in)));

    vector<archive_file> files;
    path_registry registry;
    size_t total_size = 0;

    for (;;) {
        struct archive_entry *entry;
        int r = archive_read_next_header(in, &entry);
        if (r == ARCHIVE_EOF)
            break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN)
            throw archive_error(fmt::format("malformed archive: {}", error_string(in)));

        const char *pathname = archive_entry_pathname(entry);
        if (!pathname)
            throw archive_error("archive entry without a path");
        string path = safe_path(pathname);

        if (archive_entry_hardlink(entry))
            throw archive_error("hard links are not allowed: " + path);

        auto type = archive_entry_filetype(entry);
        if (type == AE_IFDIR)
            continue;
        if (type != AE_IFREG)
            throw archive_error("only regular files are allowed: " + path);

        if (files.size() >= limits.max_entries)
            throw archive_error(fmt::format("archive has more than {} entries", limits.max_entries));
        registry.add(path);

        archive_file file;
        file.path = path;
        file.mode = archive_entry_perm(entry) & 0777;

        char buffer[1 << 16];
        for (;;) {
            la_ssize_t n = archive_read_data(in, buffer, sizeof(buffer));
            if (n == 0) break;
            if (n < 0)
                throw archive_error(fmt::format("malformed archive: {}", error_string(in)));
            total_size += static_cast<size_t>(n);
            if (total_size > limits.max_total_size)
                throw archive_error(fmt::format("archive exceeds the size limit of {} bytes", limits.max_total_size));
            file.content.append(buffer, static_cast<size_t>(n));
        }
        files.push_back(move(file));
    }

    return files;
}

static void write_file(const fs::path &target, const archive_file &file) {
    int fd = open(target.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0600);
    if (fd < 0)
        throw system_error(errno, system_category(), "unable to create " + target.string());
    defer { close(fd); };

    size_t offset = 0;
    while (offset < file.content.size()) {
        ssize_t n = write(fd, file.content.data() + offset, file.content.size() - offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "unable to write " + target.string());
        }
        offset += static_cast<size_t>(n);
    }

    if (fchmod(fd, file.mode & 0777) != 0)
        throw system_error(errno, system_category(), "unable to chmod " + target.string());
}

void extract_archive(const vector<archive_file> &files, const fs::path &root) {
    if (fs::exists(root) && !fs::is_empty(root))
        throw archive_error("extraction root " + root.string() + " is not empty");

    auto cleanup = [&root] {
        error_code ec;
        fs::remove_all(root, ec);
        if (ec) LOG(WARNING) << "Unable to clean up extraction root " << root << ": " << ec.message();
    };

    try {
        fs::create_directories(root);
        path_registry registry;
        for (auto &file : files) {
            string path = safe_path(file.path);
            registry.add(path);

            fs::path target = root / path;
            if (!is_within(root, target))
                throw archive_error("path escapes the extraction root: " + path);

            fs::create_directories(target.parent_path());
            write_file(target, file);
        }
    } catch (archive_error &) {
        cleanup();
        throw;
    } catch (std::exception &e) {
        cleanup();
        throw archive_error(e.what());
    }
}

}  // namespace arbiter
