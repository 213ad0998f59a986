#include "sandbox/sandbox.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/asio/buffer.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>
#include <array>
#include <optional>
#include <system_error>
#include "common/blocking.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

#ifndef SYS_pidfd_open
#define SYS_pidfd_open 434
#endif

#ifndef SYS_close_range
#define SYS_close_range 436
#endif

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;
namespace asio = boost::asio;

const char *to_string(limit_violation limit) {
    switch (limit) {
        case limit_violation::NONE: return "none";
        case limit_violation::TIME: return "time";
        case limit_violation::MEMORY: return "memory";
        case limit_violation::OUTPUT: return "output";
    }
    return "none";
}

bool sandbox_result::succeeded() const {
    return exec_error.empty() && term_signal == 0 && exit_code == 0;
}

enum child_stage {
    STAGE_SETUP = 1,
    STAGE_EXEC = 2
};

/**
 * @brief 子进程通过 CLOEXEC 管道报告的失败原因，exec 成功时管道直接关闭
 */
struct child_failure {
    int stage;
    int error;
};

struct unique_fd {
    int fd = -1;

    unique_fd() = default;
    unique_fd(const unique_fd &) = delete;
    ~unique_fd() { reset(); }

    void reset() {
        if (fd >= 0) close(fd);
        fd = -1;
    }

    int release() {
        int result = fd;
        fd = -1;
        return result;
    }
};

static void make_pipe(unique_fd &read_end, unique_fd &write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw sandbox_error(fmt::format("unable to create pipe: {}", error_code(errno, system_category()).message()));
    read_end.fd = fds[0];
    write_end.fd = fds[1];
}

/**
 * @brief fork 之后在子进程中执行，只调用异步信号安全的函数
 */
[[noreturn]] static void run_child(int stdin_fd, int stdout_fd, int stderr_fd, int error_fd, int max_fd,
                                   const char *workdir, char *const *argv, char *const *envp,
                                   const isolation_scope &scope) noexcept {
    auto fail = [&error_fd](int stage, int err) {
        child_failure failure{stage, err};
        ssize_t ignored = write(error_fd, &failure, sizeof(failure));
        (void)ignored;
        _exit(127);
    };

    // 守护进程忽略了 SIGPIPE，被忽略的信号会跨 exec 继承
    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = SIG_DFL;
    for (int sig = 1; sig < NSIG; ++sig)
        sigaction(sig, &action, nullptr);
    sigset_t mask;
    sigemptyset(&mask);
    sigprocmask(SIG_SETMASK, &mask, nullptr);

    if (dup2(stdin_fd, STDIN_FILENO) < 0 ||
        dup2(stdout_fd, STDOUT_FILENO) < 0 ||
        dup2(stderr_fd, STDERR_FILENO) < 0)
        fail(STAGE_SETUP, errno);

    if (error_fd != 3) {
        if (dup2(error_fd, 3) < 0) fail(STAGE_SETUP, errno);
        error_fd = 3;
    }
    fcntl(error_fd, F_SETFD, FD_CLOEXEC);

    if (syscall(SYS_close_range, 4U, ~0U, 0U) != 0)
        for (int fd = 4; fd < max_fd; ++fd)
            close(fd);

    if (chdir(workdir) != 0)
        fail(STAGE_SETUP, errno);

    if (int err = scope.enter())
        fail(STAGE_SETUP, err);

    execvpe(argv[0], argv, envp);
    fail(STAGE_EXEC, errno);
    _exit(127);
}

/**
 * @brief 被捕获的一路输出，超出 limit 的部分只计数不保存
 */
struct captured_stream {
    std::array<char, 1 << 16> buffer;
    string data;
    size_t total = 0;
    size_t limit = 0;
    bool truncated = false;
    bool done = false;

    void append(size_t n) {
        total += n;
        if (data.size() < limit) {
            size_t keep = min(n, limit - data.size());
            data.append(buffer.data(), keep);
            if (keep < n) truncated = true;
        } else if (n > 0) {
            truncated = true;
        }
    }
};

static exception_ptr as_sandbox_error(exception_ptr error) {
    try {
        rethrow_exception(error);
    } catch (sandbox_error &) {
        return current_exception();
    } catch (std::exception &e) {
        return make_exception_ptr(sandbox_error(e.what()));
    }
}

class sandbox_execution : public enable_shared_from_this<sandbox_execution> {
public:
    sandbox_execution(sandbox_runner &runner, sandbox_request request, shared_ptr<cancellation> cancel, sandbox_runner::handler_type handler)
        : runner(runner),
          request(move(request)),
          cancel(move(cancel)),
          handler(move(handler)),
          stdin_stream(runner.ioc),
          stdout_stream(runner.ioc),
          stderr_stream(runner.ioc),
          status_stream(runner.ioc),
          exit_watch(runner.ioc),
          wall_timer(runner.ioc),
          drain_timer(runner.ioc) {
        out.limit = STDOUT_LIMIT;
        err.limit = STDERR_LIMIT;
    }

    void start() {
        ++runner.running;
        if (cancel) {
            if (cancel->cancelled()) {
                result.cancelled = true;
                cleanup();
                return;
            }
            cancel_id = cancel->subscribe([weak = weak_from_this()] {
                if (auto self = weak.lock()) self->on_cancel();
            });
        }

        auto self = shared_from_this();
        runner.slots.async_acquire([self](slot_pool::slot s) {
            self->on_slot(move(s));
        });
    }

private:
    bool is_cancelled() const {
        return cancel && cancel->cancelled();
    }

    void on_slot(slot_pool::slot s) {
        slot = move(s);
        if (is_cancelled()) {
            result.cancelled = true;
            cleanup();
            return;
        }

        auto self = shared_from_this();
        run_blocking(
            runner.blocking, runner.ioc,
            [self]() {
                prepared_run prepared{scoped_directory(self->runner.root, "run-"), nullptr};
                auto &dir = prepared.dir;
                if (!self->request.populate_from.empty())
                    copy_directory(self->request.populate_from, dir.path());
                for (auto &[name, content] : self->request.files) {
                    fs::path target = dir.path() / assert_safe_path(name);
                    fs::create_directories(target.parent_path());
                    write_file_content(target, content);
                }
                prepared.scope = self->runner.isolation->create_scope(self->request.limits);
                return prepared;
            },
            [self](exception_ptr error, optional<prepared_run> prepared) {
                self->on_prepared(error, move(prepared));
            });
    }

    struct prepared_run {
        scoped_directory dir;
        unique_ptr<isolation_scope> scope;
    };

    void on_prepared(exception_ptr error, optional<prepared_run> prepared) {
        if (error) {
            fail(as_sandbox_error(error));
            return;
        }
        workdir = move(prepared->dir);
        scope = move(prepared->scope);

        if (is_cancelled()) {
            result.cancelled = true;
            cleanup();
            return;
        }

        try {
            spawn();
        } catch (std::exception &) {
            fail(as_sandbox_error(current_exception()));
        }
    }

    void spawn() {
        if (request.command.empty())
            throw sandbox_error("empty command");

        unique_fd in_r, in_w, out_r, out_w, err_r, err_w, status_r, status_w;
        make_pipe(in_r, in_w);
        make_pipe(out_r, out_w);
        make_pipe(err_r, err_w);
        make_pipe(status_r, status_w);

        // fork 之后子进程不能分配内存，所有参数提前准备好
        vector<string> args = request.command;
        vector<char *> argv;
        for (auto &arg : args) argv.push_back(arg.data());
        argv.push_back(nullptr);

        auto env = request.env;
        env["HOME"] = workdir.path().string();
        env["TMPDIR"] = workdir.path().string();
        vector<string> env_strings = to_environ(env);
        vector<char *> envp;
        for (auto &entry : env_strings) envp.push_back(entry.data());
        envp.push_back(nullptr);

        string dir = workdir.path().string();
        long open_max = sysconf(_SC_OPEN_MAX);
        int max_fd = open_max > 0 && open_max < 65536 ? (int)open_max : 65536;

        pid_t child = fork();
        if (child < 0)
            throw sandbox_error(fmt::format("fork failed: {}", error_code(errno, system_category()).message()));
        if (child == 0)
            run_child(in_r.fd, out_w.fd, err_w.fd, status_w.fd, max_fd, dir.c_str(), argv.data(), envp.data(), *scope);

        in_r.reset();
        out_w.reset();
        err_w.reset();
        status_w.reset();

        int pidfd = (int)syscall(SYS_pidfd_open, child, 0);
        if (pidfd < 0) {
            int error = errno;
            scope->kill_all(child);
            waitpid(child, nullptr, 0);
            throw sandbox_error(fmt::format("pidfd_open failed: {}", error_code(error, system_category()).message()));
        }

        pid = child;
        clock = elapsed_time();
        exit_watch.assign(pidfd);
        status_stream.assign(status_r.release());
        stdin_stream.assign(in_w.release());
        stdout_stream.assign(out_r.release());
        stderr_stream.assign(err_r.release());

        DLOG(INFO) << "Spawned " << request.command[0] << " as pid " << pid << " in " << workdir.path()
                   << " with " << describe(request.limits);

        auto self = shared_from_this();

        wall_timer.expires_after(chrono::duration_cast<chrono::steady_clock::duration>(
            chrono::duration<double>(request.limits.wall_time_limit)));
        wall_timer.async_wait([self](const boost::system::error_code &ec) {
            if (ec || self->reaped) return;
            self->wall_expired = true;
            self->scope->kill_all(self->pid);
        });

        // exec 成功时管道因为 CLOEXEC 被关闭，这里读到 EOF
        asio::async_read(status_stream, asio::buffer(&reported, sizeof(reported)),
                         [self](const boost::system::error_code &, size_t n) {
                             if (n == sizeof(child_failure)) self->start_failed = true;
                             boost::system::error_code ignored;
                             self->status_stream.close(ignored);
                             self->status_done = true;
                             self->maybe_finish();
                         });

        if (request.input.empty()) {
            close_stdin();
        } else {
            asio::async_write(stdin_stream, asio::buffer(request.input),
                              [self](const boost::system::error_code &, size_t) {
                                  // 程序不读取输入就退出时这里会得到 EPIPE，不是错误
                                  self->close_stdin();
                                  self->maybe_finish();
                              });
        }

        read_stream(stdout_stream, out);
        read_stream(stderr_stream, err);
        wait_exit();
    }

    void close_stdin() {
        boost::system::error_code ignored;
        stdin_stream.close(ignored);
        stdin_done = true;
    }

    void read_stream(asio::posix::stream_descriptor &stream, captured_stream &cap) {
        auto self = shared_from_this();
        stream.async_read_some(asio::buffer(cap.buffer), [self, &stream, &cap](const boost::system::error_code &ec, size_t n) {
            if (n > 0) cap.append(n);
            if (ec) {
                boost::system::error_code ignored;
                stream.close(ignored);
                cap.done = true;
                self->maybe_finish();
                return;
            }
            self->read_stream(stream, cap);
        });
    }

    void wait_exit() {
        auto self = shared_from_this();
        exit_watch.async_wait(asio::posix::stream_descriptor::wait_read, [self](const boost::system::error_code &ec) {
            if (ec) return;
            self->on_exit();
        });
    }

    void on_exit() {
        // 进程还是僵尸进程，进程组号不会被复用，先清理留在进程组中的后代进程
        scope->kill_all(pid);

        int status = 0;
        struct rusage usage;
        memset(&usage, 0, sizeof(usage));
        pid_t r;
        do {
            r = wait4(pid, &status, WNOHANG, &usage);
        } while (r < 0 && errno == EINTR);

        if (r == 0) {
            wait_exit();
            return;
        }

        reaped = true;
        result.wall_time = clock.seconds();
        if (r < 0) {
            failure = make_exception_ptr(sandbox_error(fmt::format("wait4 failed: {}", error_code(errno, system_category()).message())));
        } else {
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.term_signal = WTERMSIG(status);
            }
            result.cpu_time = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec / 1e6 +
                              usage.ru_stime.tv_sec + usage.ru_stime.tv_usec / 1e6;
            result.memory = usage.ru_maxrss;
        }

        wall_timer.cancel();
        boost::system::error_code ignored;
        exit_watch.close(ignored);
        if (cancel) cancel->unsubscribe(cancel_id);

        auto self = shared_from_this();
        drain_timer.expires_after(KILL_DELAY);
        drain_timer.async_wait([self](const boost::system::error_code &ec) {
            if (ec) return;
            // 逃出进程组的后代进程可能还持有管道，不再等待
            boost::system::error_code ignored;
            self->status_stream.close(ignored);
            self->stdin_stream.close(ignored);
            self->stdout_stream.close(ignored);
            self->stderr_stream.close(ignored);
        });

        maybe_finish();
    }

    void on_cancel() {
        if (finished) return;
        killed_by_cancel = true;
        if (pid > 0 && !reaped) {
            LOG(INFO) << "Killing pid " << pid << " because the job was cancelled";
            scope->kill_all(pid);
        }
    }

    void maybe_finish() {
        if (finished || !reaped || !out.done || !err.done || !stdin_done || !status_done) return;
        finished = true;
        drain_timer.cancel();

        // cgroup 的统计在线程池中读取
        auto self = shared_from_this();
        run_blocking(
            runner.blocking, runner.ioc,
            [self]() {
                return self->scope->memory();
            },
            [self](exception_ptr error, optional<memory_usage> usage) {
                if (error) {
                    self->fail(as_sandbox_error(error));
                    return;
                }
                self->finalize(*usage);
            });
    }

    static bool is_user_fault(const child_failure &failure) {
        return failure.stage == STAGE_EXEC &&
               (failure.error == ENOENT || failure.error == EACCES || failure.error == ENOEXEC || failure.error == ENOTDIR);
    }

    void finalize(const memory_usage &usage) {
        if (start_failed) {
            string reason = error_code(reported.error, system_category()).message();
            if (!is_user_fault(reported)) {
                fail(make_exception_ptr(sandbox_error(fmt::format("unable to start {}: {}", request.command[0], reason))));
                return;
            }
            result = sandbox_result{};
            result.exec_error = fmt::format("unable to execute {}: {}", request.command[0], reason);
            cleanup();
            return;
        }

        result.memory = max(result.memory, usage.peak);
        result.output = move(out.data);
        result.output_truncated = out.truncated;
        result.output_size = out.total;
        result.error_output = move(err.data);
        result.error_truncated = err.truncated;
        result.error_size = err.total;

        if (killed_by_cancel) {
            result.cancelled = true;
        } else if (wall_expired || result.term_signal == SIGXCPU || result.cpu_time > request.limits.time_limit) {
            result.limit = limit_violation::TIME;
        } else if (usage.exceeded || (request.limits.memory_limit > 0 && result.memory > request.limits.memory_limit)) {
            result.limit = limit_violation::MEMORY;
        } else if (result.term_signal == SIGXFSZ) {
            result.limit = limit_violation::OUTPUT;
        }

        cleanup();
    }

    void fail(exception_ptr error) {
        finished = true;
        failure = error;
        cleanup();
    }

    /**
     * @brief 在线程池中收集构建结果并删除工作目录，然后归还名额并调用回调
     */
    void cleanup() {
        finished = true;
        auto self = shared_from_this();
        run_blocking(
            runner.blocking, runner.ioc,
            [self, scope = move(scope)]() mutable {
                // 先杀死并移除 cgroup 中残留的进程
                scope.reset();
                if (!self->failure && !self->result.cancelled && !self->request.harvest_to.empty() && !self->workdir.path().empty()) {
                    try {
                        copy_directory(self->workdir.path(), self->request.harvest_to);
                    } catch (std::exception &e) {
                        self->workdir.remove();
                        throw sandbox_error(fmt::format("unable to collect files from {}: {}", self->workdir.path(), e.what()));
                    }
                }
                self->workdir.remove();
            },
            [self](exception_ptr error) {
                self->complete(self->failure ? self->failure : error);
            });
    }

    void complete(exception_ptr error) {
        if (cancel) cancel->unsubscribe(cancel_id);
        slot.release();
        --runner.running;
        auto callback = move(handler);
        handler = nullptr;
        if (error)
            LOG(WARNING) << "Sandbox run of " << (request.command.empty() ? "" : request.command[0]) << " failed";
        callback(error, move(result));
    }

    sandbox_runner &runner;
    sandbox_request request;
    shared_ptr<cancellation> cancel;
    size_t cancel_id = 0;
    sandbox_runner::handler_type handler;

    slot_pool::slot slot;
    scoped_directory workdir;

    asio::posix::stream_descriptor stdin_stream;
    asio::posix::stream_descriptor stdout_stream;
    asio::posix::stream_descriptor stderr_stream;
    asio::posix::stream_descriptor status_stream;
    asio::posix::stream_descriptor exit_watch;
    asio::steady_timer wall_timer;
    asio::steady_timer drain_timer;

    captured_stream out;
    captured_stream err;

    unique_ptr<isolation_scope> scope;
    child_failure reported{0, 0};

    pid_t pid = -1;
    elapsed_time clock;
    bool stdin_done = false;
    bool status_done = false;
    bool start_failed = false;
    bool reaped = false;
    bool wall_expired = false;
    bool killed_by_cancel = false;
    bool finished = false;

    exception_ptr failure;
    sandbox_result result;
};

sandbox_runner::sandbox_runner(asio::io_context &ioc,
                               asio::thread_pool &blocking,
                               slot_pool &slots,
                               unique_ptr<platform_isolation> isolation,
                               fs::path work_root)
    : ioc(ioc), blocking(blocking), slots(slots), isolation(move(isolation)), root(move(work_root)) {
    fs::create_directories(root);
}

void sandbox_runner::async_run(sandbox_request request, shared_ptr<cancellation> cancel, handler_type handler) {
    auto execution = make_shared<sandbox_execution>(*this, move(request), move(cancel), move(handler));
    execution->start();
}

size_t sandbox_runner::active() const {
    return running;
}

const fs::path &sandbox_runner::work_root() const {
    return root;
}

const platform_isolation &sandbox_runner::platform() const {
    return *isolation;
}

asio::io_context &sandbox_runner::context() {
    return ioc;
}

asio::thread_pool &sandbox_runner::blocking_pool() {
    return blocking;
}

}  // namespace arbiter
