#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(fs::path const &path) {
    ifstream fin(path.string(), ios::binary);
    if (!fin)
        throw system_error(errno, system_category(), "unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(fs::path const &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to write file " + path.string());
    fout.write(content.data(), content.size());
    if (!fout)
        throw system_error(errno, system_category(), "unable to write file " + path.string());
}

string assert_safe_path(const string &subpath) {
    if (subpath.empty())
        throw invalid_argument("empty path");
    if (subpath.front() == '/')
        throw invalid_argument("absolute path " + subpath);

    vector<string> segments;
    boost::split(segments, subpath, boost::is_any_of("/"));

    string result;
    for (auto &segment : segments) {
        if (segment.empty() || segment == ".") continue;
        if (segment == "..")
            throw invalid_argument("subpath is not safe " + subpath);
        for (unsigned char c : segment)
            if (c < 0x20 || c == 0x7f || c == '\\')
                throw invalid_argument("path contains illegal character " + subpath);
        if (!result.empty()) result += '/';
        result += segment;
    }

    if (result.empty())
        throw invalid_argument("path " + subpath + " names no file");
    return result;
}

bool is_within(const fs::path &root, const fs::path &path) {
    auto r = root.lexically_normal();
    auto p = path.lexically_normal();
    auto rel = p.lexically_relative(r);
    return !rel.empty() && *rel.begin() != "..";
}

void copy_directory(const fs::path &from, const fs::path &to) {
    fs::create_directories(to);
    for (auto &entry : fs::directory_iterator(from)) {
        auto status = entry.symlink_status();
        fs::path target = to / entry.path().filename();
        if (fs::is_symlink(status)) {
            throw runtime_error("refusing to copy symbolic link " + entry.path().string());
        } else if (fs::is_directory(status)) {
            copy_directory(entry.path(), target);
        } else if (fs::is_regular_file(status)) {
            fs::copy_file(entry.path(), target, fs::copy_options::overwrite_existing);
            fs::permissions(target, status.permissions());
        } else {
            throw runtime_error("refusing to copy special file " + entry.path().string());
        }
    }
}

scoped_directory::scoped_directory() {}

scoped_directory::scoped_directory(const fs::path &parent, const string &prefix) {
    fs::create_directories(parent);
    boost::uuids::random_generator generator;
    for (int attempt = 0; attempt < 8; ++attempt) {
        fs::path candidate = parent / (prefix + boost::uuids::to_string(generator()));
        if (fs::create_directory(candidate)) {
            dir = candidate;
            return;
        }
    }
    throw runtime_error("unable to create a unique directory in " + parent.string());
}

scoped_directory::scoped_directory(scoped_directory &&other) {
    *this = move(other);
}

scoped_directory::~scoped_directory() {
    remove();
}

scoped_directory &scoped_directory::operator=(scoped_directory &&other) {
    if (this != &other) {
        remove();
        dir = other.release();
    }
    return *this;
}

const fs::path &scoped_directory::path() const {
    return dir;
}

void scoped_directory::remove() {
    if (dir.empty()) return;
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) LOG(WARNING) << "Unable to remove directory " << dir << ": " << ec.message();
    dir.clear();
}

fs::path scoped_directory::release() {
    fs::path result = dir;
    dir.clear();
    return result;
}

}  // namespace arbiter
