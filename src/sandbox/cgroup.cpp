#include "sandbox/cgroup.hpp"
#include <errno.h>
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <libcgroup.h>
#include <signal.h>
#include <stdlib.h>
#include <unistd.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <chrono>
#include <fstream>
#include <map>
#include <mutex>
#include <thread>

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

static string cgroup_message(const string &cgroup_op, int err) {
    if (err == ECGOTHER)
        return fmt::format("libcgroup: {}: {}", cgroup_op, cgroup_strerror(cgroup_get_last_errno()));
    return fmt::format("{}: {}", cgroup_op, cgroup_strerror(err));
}

cgroup_error::cgroup_error(const string &cgroup_op, int err)
    : sandbox_error(cgroup_message(cgroup_op, err)) {}

void cgroup_error::ensure(const string &cgroup_op, int err) {
    if (err != 0) {
        throw cgroup_error(cgroup_op, err);
    }
}

void cgroup_ctrl::add_value(const string &name, int64_t value) {
    cgroup_error::ensure(
        fmt::format("cgroup_add_value_int64({}, {})", name, value),
        cgroup_add_value_int64(ctrl, name.c_str(), value));
}

void cgroup_ctrl::add_value(const string &name, const string &value) {
    cgroup_error::ensure(
        fmt::format("cgroup_add_value_string({}, {})", name, value),
        cgroup_add_value_string(ctrl, name.c_str(), value.c_str()));
}

int64_t cgroup_ctrl::get_value_int64(const string &name) {
    int64_t value;
    cgroup_error::ensure(
        fmt::format("cgroup_get_value_int64({})", name),
        cgroup_get_value_int64(ctrl, name.c_str(), &value));
    return value;
}

cgroup_guard::cgroup_guard(const string &cgroup_name) {
    cg = cgroup_new_cgroup(cgroup_name.c_str());
    if (!cg)
        throw cgroup_error(
            fmt::format("cgroup_new_cgroup({})", cgroup_name),
            cgroup_get_last_errno());
}

cgroup_guard::~cgroup_guard() {
    cgroup_free(&cg);
}

void cgroup_guard::create_cgroup(int ignore_ownership) {
    cgroup_error::ensure(
        fmt::format("cgroup_create_cgroup({})", ignore_ownership),
        cgroup_create_cgroup(cg, ignore_ownership));
}

cgroup_ctrl cgroup_guard::add_controller(const string &name) {
    struct cgroup_controller *cg_controller = cgroup_add_controller(cg, name.c_str());
    if (cg_controller == nullptr)
        throw cgroup_error(
            fmt::format("cgroup_add_controller({})", name),
            cgroup_get_last_errno());
    return {cg_controller};
}

cgroup_ctrl cgroup_guard::get_controller(const string &name) {
    struct cgroup_controller *cg_controller = cgroup_get_controller(cg, name.c_str());
    if (cg_controller == nullptr)
        throw cgroup_error(
            fmt::format("cgroup_get_controller({})", name),
            cgroup_get_last_errno());
    return {cg_controller};
}

void cgroup_guard::get_cgroup() {
    cgroup_error::ensure(
        "cgroup_get_cgroup",
        cgroup_get_cgroup(cg));
}

void cgroup_guard::delete_cgroup() {
    cgroup_error::ensure(
        "cgroup_delete_cgroup",
        cgroup_delete_cgroup_ext(cg, CGFLAG_DELETE_IGNORE_MIGRATION | CGFLAG_DELETE_RECURSIVE));
}

void cgroup_guard::init() {
    static once_flag initialized;
    static int result = 0;
    // cgroup_init 会重新扫描挂载点，不能与其他 libcgroup 调用并发
    call_once(initialized, [] { result = cgroup_init(); });
    cgroup_error::ensure("cgroup_init", result);
}

/**
 * @brief 读取 "key value" 形式的控制文件，比如 memory.events
 */
static map<string, int64_t> read_keyed(const fs::path &file) {
    ifstream fin(file);
    if (!fin)
        throw sandbox_error(fmt::format("unable to read {}", file.string()));
    map<string, int64_t> values;
    string key;
    int64_t value;
    while (fin >> key >> value) values[key] = value;
    return values;
}

static string unique_name(const string &prefix) {
    return prefix + boost::uuids::to_string(boost::uuids::random_generator()());
}

/**
 * @brief 杀死 cgroup 中的所有进程
 * @return 是否找到了进程
 */
static bool kill_members(const string &group) {
    void *handle = nullptr;
    pid_t pid;
    bool found = false;
    int ret = cgroup_get_task_begin(group.c_str(), "memory", &handle, &pid);
    while (ret == 0) {
        kill(pid, SIGKILL);
        found = true;
        ret = cgroup_get_task_next(&handle, &pid);
    }
    cgroup_get_task_end(&handle);
    if (ret != ECGEOF)
        throw cgroup_error("cgroup_get_task", ret);
    return found;
}

class cgroup_scope : public isolation_scope {
public:
    cgroup_scope(cgroup_isolation::hierarchy version, const string &parent, const fs::path &parent_dir,
                 const resource_limits &limits)
        : version(version), limits(limits) {
        string name = unique_name("run-");
        group = parent + "/" + name;
        path = parent_dir / name;

        cgroup_guard cg(group);
        cgroup_ctrl ctrl = cg.add_controller("memory");
        if (limits.memory_limit > 0) {
            int64_t bytes = limits.memory_limit * 1024;
            if (version == cgroup_isolation::hierarchy::V2) {
                ctrl.add_value("memory.max", bytes);
                if (fs::exists(parent_dir / "memory.swap.max"))
                    ctrl.add_value("memory.swap.max", (int64_t)0);
            } else {
                // 将 RAM 和 RAM+交换 的大小限制设为一样可以强制不发生交换
                ctrl.add_value("memory.limit_in_bytes", bytes);
                if (fs::exists(parent_dir / "memory.memsw.limit_in_bytes"))
                    ctrl.add_value("memory.memsw.limit_in_bytes", bytes);
            }
        }
        cg.create_cgroup(0);

        procs_file = (path / "cgroup.procs").string();
        if (version == cgroup_isolation::hierarchy::V2 && fs::exists(path / "cgroup.kill"))
            kill_file = (path / "cgroup.kill").string();
    }

    ~cgroup_scope() override {
        // 进程被杀死之后需要一点时间才会离开 cgroup
        for (int attempt = 0;; ++attempt) {
            try {
                if (!kill_members(group)) {
                    cgroup_guard cg(group);
                    cg.add_controller("memory");
                    cg.delete_cgroup();
                    return;
                }
            } catch (sandbox_error &e) {
                if (attempt >= 100) {
                    LOG(WARNING) << "Unable to remove cgroup " << group << ": " << e.what();
                    return;
                }
            }
            if (attempt >= 100) {
                LOG(WARNING) << "Processes in cgroup " << group << " did not exit";
                return;
            }
            this_thread::sleep_for(chrono::milliseconds(10));
        }
    }

    int enter() const noexcept override {
        // fork 之后不能再调用 libcgroup，直接写入 cgroup.procs
        int fd = open(procs_file.c_str(), O_WRONLY | O_CLOEXEC);
        if (fd < 0) return errno;
        ssize_t n = write(fd, "0", 1);
        int error = n == 1 ? 0 : (n < 0 ? errno : EIO);
        close(fd);
        if (error) return error;
        return restrict_process(limits, 0);
    }

    void kill_all(pid_t pid) const noexcept override {
        kill_process_group(pid);
        if (kill_file.empty()) return;
        int fd = open(kill_file.c_str(), O_WRONLY | O_CLOEXEC);
        if (fd < 0) return;
        ssize_t ignored = write(fd, "1", 1);
        (void)ignored;
        close(fd);
    }

    memory_usage memory() const override {
        memory_usage usage;
        cgroup_guard cg(group);
        cg.get_cgroup();
        cgroup_ctrl ctrl = cg.get_controller("memory");
        if (version == cgroup_isolation::hierarchy::V2) {
            auto events = read_keyed(path / "memory.events");
            usage.exceeded = events["oom"] > 0 || events["oom_kill"] > 0;
            if (fs::exists(path / "memory.peak"))
                usage.peak = ctrl.get_value_int64("memory.peak") / 1024;
        } else {
            auto oom = read_keyed(path / "memory.oom_control");
            if (oom.count("oom_kill"))
                usage.exceeded = oom["oom_kill"] > 0;
            else
                usage.exceeded = ctrl.get_value_int64("memory.failcnt") > 0;
            usage.peak = ctrl.get_value_int64("memory.max_usage_in_bytes") / 1024;
        }
        return usage;
    }

private:
    cgroup_isolation::hierarchy version;
    resource_limits limits;
    string group;
    fs::path path;
    string procs_file;
    string kill_file;
};

/**
 * @brief 去掉首尾的 /，libcgroup 的 cgroup 名称相对于层级的根
 */
static string trim_group(string group) {
    while (!group.empty() && group.front() == '/') group.erase(group.begin());
    while (!group.empty() && group.back() == '/') group.pop_back();
    return group;
}

unique_ptr<cgroup_isolation> cgroup_isolation::create(const string &parent) {
    cgroup_guard::init();

    char *mount = nullptr;
    cgroup_error::ensure("cgroup_get_subsys_mount_point(memory)", cgroup_get_subsys_mount_point("memory", &mount));
    fs::path mount_point = mount;
    free(mount);

    string parent_group = parent;
    if (parent_group.empty()) {
        char *current = nullptr;
        cgroup_error::ensure(
            "cgroup_get_current_controller_path(memory)",
            cgroup_get_current_controller_path(getpid(), "memory", &current));
        parent_group = current;
        free(current);
    }
    parent_group = trim_group(parent_group);

    hierarchy version = fs::exists(mount_point / "cgroup.controllers") ? hierarchy::V2 : hierarchy::V1;
    string group = parent_group.empty() ? unique_name("arbiter-") : parent_group + "/" + unique_name("arbiter-");

    cgroup_guard cg(group);
    cg.add_controller("memory");
    cg.create_cgroup(0);

    LOG(INFO) << "Using memory cgroup " << (version == hierarchy::V2 ? "v2" : "v1") << " at " << mount_point / group;
    return make_unique<cgroup_isolation>(version, group, mount_point);
}

cgroup_isolation::cgroup_isolation(hierarchy version, string group, const fs::path &mount_point)
    : cgroup_version(version), cgroup_group(move(group)), cgroup_root(mount_point / cgroup_group) {}

cgroup_isolation::~cgroup_isolation() {
    try {
        cgroup_guard cg(cgroup_group);
        cg.add_controller("memory");
        cg.delete_cgroup();
    } catch (sandbox_error &e) {
        LOG(WARNING) << "Unable to remove cgroup " << cgroup_group << ": " << e.what();
    }
}

const char *cgroup_isolation::name() const {
    return cgroup_version == hierarchy::V2 ? "linux-cgroup-v2" : "linux-cgroup-v1";
}

unique_ptr<isolation_scope> cgroup_isolation::create_scope(const resource_limits &limits) const {
    return make_unique<cgroup_scope>(cgroup_version, cgroup_group, cgroup_root, limits);
}

cgroup_isolation::hierarchy cgroup_isolation::version() const {
    return cgroup_version;
}

const string &cgroup_isolation::group() const {
    return cgroup_group;
}

const fs::path &cgroup_isolation::root() const {
    return cgroup_root;
}

}  // namespace arbiter
