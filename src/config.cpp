#include "config.hpp"
#include <glog/logging.h>
#include <thread>
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace arbiter {
using namespace std;

static unsigned default_slots() {
    unsigned cores = thread::hardware_concurrency();
    return cores == 0 ? 1 : cores;
}

resource_limits DEFAULT_LIMITS;
resource_limits COMPILE_LIMITS{10, 30, 1 << 19, 64, 1 << 18};  // 10s, 512M
resource_limits CHECKER_LIMITS{10, 20, 1 << 18, 16, 1 << 16};  // 10s, 256M
int64_t MEMORY_RESERVE = 1 << 16;                              // 64M
size_t STDOUT_LIMIT = 1 << 24;                                 // 16M
size_t STDERR_LIMIT = 1 << 16;                                 // 64K
size_t MAX_ARCHIVE_SIZE = 1 << 28;                             // 256M
size_t MAX_ARCHIVE_ENTRIES = 4096;
size_t MAX_MESSAGE_SIZE = 1 << 29;                             // 512M
size_t CACHE_MAX_ENTRIES = 256;
uintmax_t CACHE_MAX_SIZE = uintmax_t(1) << 32;                 // 4G
string ISOLATION = "auto";
string CGROUP_ROOT;
unsigned SANDBOX_SLOTS = default_slots();
unsigned MAX_PARALLEL_CASES = 4;
chrono::seconds IDLE_TIMEOUT(60);
chrono::milliseconds KILL_DELAY(100);

filesystem::path RUN_DIR;
filesystem::path CACHE_DIR;
bool DEBUG = false;

static void load_limits(const nlohmann::json &j, resource_limits &limits) {
    if (j.is_null()) return;
    limits.time_limit = nlohmann::get_value_def(j, limits.time_limit, "time");
    limits.wall_time_limit = nlohmann::get_value_def(j, limits.wall_time_limit, "wall_time");
    limits.memory_limit = nlohmann::get_value_def(j, limits.memory_limit, "memory");
    limits.proc_limit = nlohmann::get_value_def(j, limits.proc_limit, "processes");
    limits.file_limit = nlohmann::get_value_def(j, limits.file_limit, "output");
}

void load_config_file(const filesystem::path &path) {
    nlohmann::json j = nlohmann::json::parse(read_file_content(path));
    if (!j.is_object())
        throw invalid_argument("configuration file " + path.string() + " is not a JSON object");

    if (auto run_dir = nlohmann::get_optional<string>(j, "run_dir")) RUN_DIR = *run_dir;
    if (auto cache_dir = nlohmann::get_optional<string>(j, "cache_dir")) CACHE_DIR = *cache_dir;
    SANDBOX_SLOTS = nlohmann::get_value_def(j, SANDBOX_SLOTS, "sandbox_slots");
    MAX_PARALLEL_CASES = nlohmann::get_value_def(j, MAX_PARALLEL_CASES, "parallel_cases");
    IDLE_TIMEOUT = chrono::seconds(nlohmann::get_value_def<int64_t>(j, IDLE_TIMEOUT.count(), "idle_timeout"));
    STDOUT_LIMIT = nlohmann::get_value_def(j, STDOUT_LIMIT, "stdout_limit");
    STDERR_LIMIT = nlohmann::get_value_def(j, STDERR_LIMIT, "stderr_limit");
    MAX_ARCHIVE_SIZE = nlohmann::get_value_def(j, MAX_ARCHIVE_SIZE, "max_archive_size");
    MAX_ARCHIVE_ENTRIES = nlohmann::get_value_def(j, MAX_ARCHIVE_ENTRIES, "max_archive_entries");
    MAX_MESSAGE_SIZE = nlohmann::get_value_def(j, MAX_MESSAGE_SIZE, "max_message_size");
    MEMORY_RESERVE = nlohmann::get_value_def(j, MEMORY_RESERVE, "memory_reserve");
    CACHE_MAX_ENTRIES = nlohmann::get_value_def(j, CACHE_MAX_ENTRIES, "cache_max_entries");
    CACHE_MAX_SIZE = nlohmann::get_value_def(j, CACHE_MAX_SIZE, "cache_max_size");
    ISOLATION = nlohmann::get_value_def(j, ISOLATION, "isolation");
    CGROUP_ROOT = nlohmann::get_value_def(j, CGROUP_ROOT, "cgroup_root");
    DEBUG = nlohmann::get_value_def(j, DEBUG, "debug");

    load_limits(nlohmann::access_optional(j, "limits"), DEFAULT_LIMITS);
    load_limits(nlohmann::access_optional(j, "compile_limits"), COMPILE_LIMITS);
    load_limits(nlohmann::access_optional(j, "checker_limits"), CHECKER_LIMITS);

    LOG(INFO) << "Loaded configuration file " << path;
}

}  // namespace arbiter
