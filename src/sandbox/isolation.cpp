#include "sandbox/isolation.hpp"
#include <errno.h>
#include <glog/logging.h>
#include <math.h>
#include <signal.h>
#include <sys/resource.h>
#include <unistd.h>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "sandbox/cgroup.hpp"

namespace arbiter {
using namespace std;

#ifdef __linux__

static int set_rlimit(int resource, rlim_t cur, rlim_t max) noexcept {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0)
        return errno;
    return 0;
}

int restrict_process(const resource_limits &limits, int64_t address_space) noexcept {
    // 让子进程及其所有后代处于同一个新的进程组，可以一次杀死
    if (setsid() == -1) return errno;

    rlim_t cputime_limit = (rlim_t)ceil(limits.time_limit);
    if (int err = set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1)) return err;

    if (address_space > 0) {
        rlim_t bytes = (rlim_t)address_space * 1024;
        if (int err = set_rlimit(RLIMIT_AS, bytes, bytes)) return err;
    }

    if (limits.file_limit > 0) {
        rlim_t bytes = (rlim_t)limits.file_limit * 1024;
        if (int err = set_rlimit(RLIMIT_FSIZE, bytes, bytes)) return err;
    }

    if (limits.proc_limit > 0)
        if (int err = set_rlimit(RLIMIT_NPROC, limits.proc_limit, limits.proc_limit)) return err;

    if (int err = set_rlimit(RLIMIT_CORE, 0, 0)) return err;
    return 0;
}

void kill_process_group(pid_t pid) noexcept {
    if (pid <= 0) return;
    // 子进程可能还没来得及 setsid，所以单独再杀一次
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
}

class rlimit_scope : public isolation_scope {
public:
    rlimit_scope(const resource_limits &limits, int64_t memory_reserve)
        : limits(limits),
          address_space(limits.memory_limit > 0 ? limits.memory_limit + memory_reserve : 0) {}

    int enter() const noexcept override {
        return restrict_process(limits, address_space);
    }

    void kill_all(pid_t pid) const noexcept override {
        kill_process_group(pid);
    }

    memory_usage memory() const override {
        // 超限的分配只会失败，内核不记录
        return {};
    }

private:
    resource_limits limits;
    int64_t address_space;
};

class rlimit_isolation : public platform_isolation {
public:
    explicit rlimit_isolation(int64_t memory_reserve) : memory_reserve(memory_reserve) {}

    const char *name() const override {
        return "linux-rlimit";
    }

    unique_ptr<isolation_scope> create_scope(const resource_limits &limits) const override {
        return make_unique<rlimit_scope>(limits, memory_reserve);
    }

private:
    int64_t memory_reserve;
};

unique_ptr<platform_isolation> make_rlimit_isolation(int64_t memory_reserve) {
    return make_unique<rlimit_isolation>(memory_reserve);
}

unique_ptr<platform_isolation> make_platform_isolation(const string &kind, int64_t memory_reserve) {
    if (kind == "rlimit")
        return make_rlimit_isolation(memory_reserve);
    if (kind != "cgroup" && kind != "auto")
        throw sandbox_error("unknown isolation " + kind + ", expected cgroup, rlimit or auto");

    try {
        return cgroup_isolation::create(CGROUP_ROOT);
    } catch (sandbox_error &e) {
        if (kind == "cgroup") throw;
        LOG(WARNING) << "Memory cgroup is not available, falling back to rlimit isolation: " << e.what();
        LOG(WARNING) << "Programs exceeding the memory limit may be reported as runtime errors";
        return make_rlimit_isolation(memory_reserve);
    }
}

#else

int restrict_process(const resource_limits &, int64_t) noexcept {
    return ENOSYS;
}

void kill_process_group(pid_t) noexcept {}

unique_ptr<platform_isolation> make_rlimit_isolation(int64_t) {
    throw sandbox_error("unsupported platform: sandboxing requires Linux process groups, rlimits and pidfd");
}

unique_ptr<platform_isolation> make_platform_isolation(const string &, int64_t) {
    throw sandbox_error("unsupported platform: sandboxing requires Linux process groups, rlimits and pidfd");
}

#endif

}  // namespace arbiter
