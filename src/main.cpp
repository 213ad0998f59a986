#include <glog/logging.h>
#include <signal.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <functional>
#include <iostream>
#include "archive/cache.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/job.hpp"
#include "sandbox/isolation.hpp"
#include "sandbox/sandbox.hpp"
#include "sandbox/slot_pool.hpp"
#include "server/listener.hpp"
using namespace std;

/**
 * @brief 命令行参数优先，其次是环境变量，都没有时保持默认值
 */
template <typename T>
static void resolve_option(const boost::program_options::variables_map &vm, const char *option, const char *env, T &target) {
    if (vm.count(option)) {
        target = vm.at(option).as<T>();
    } else if (getenv(env)) {
        try {
            target = boost::lexical_cast<T>(getenv(env));
        } catch (boost::bad_lexical_cast &) {
            LOG(FATAL) << "Environment variable " << env << " has an invalid value: " << getenv(env);
        }
    }
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    // 对端关闭的连接和提前退出的程序会让写操作触发 SIGPIPE，统一改为返回 EPIPE
    signal(SIGPIPE, SIG_IGN);

    namespace po = boost::program_options;
    po::options_description desc("arbiterd options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("bind", po::value<string>(), "set the address to listen on, in the form host:port. You can either pass it from environ BIND")
        ("config", po::value<string>(), "load settings from a JSON configuration file, command line options and environment variables take precedence")
        ("run-dir", po::value<string>(), "set the directory to run submissions and store compiled programs. You can either pass it from environ RUNDIR")
        ("cache-dir", po::value<string>(), "set the directory to store extracted archives by digest. You can either pass it from environ CACHEDIR")
        ("cache-entries", po::value<size_t>(), "set the maximum number of archives kept in the cache, default to 256. You can either pass it from environ CACHEENTRIES")
        ("cache-size", po::value<uintmax_t>(), "set the maximum total extracted size of cached archives in bytes, default to 4294967296(4GB). You can either pass it from environ CACHESIZE")
        ("isolation", po::value<string>(), "set how memory limits are enforced: cgroup, rlimit or auto, default to auto. You can either pass it from environ ISOLATION")
        ("cgroup-root", po::value<string>(), "set the memory cgroup (path inside the hierarchy) under which sandboxes are created, default to the cgroup of this process. You can either pass it from environ CGROUPROOT")
        ("slots", po::value<unsigned>(), "set the maximum number of sandboxed processes running at the same time, default to the number of cores. You can either pass it from environ SANDBOXSLOTS")
        ("parallel-cases", po::value<unsigned>(), "set the maximum number of cases of one job running at the same time, default to 4. You can either pass it from environ PARALLELCASES")
        ("time-limit", po::value<double>(), "set the default cpu time limit in seconds, default to 1. You can either pass it from environ TIMELIMIT")
        ("memory-limit", po::value<int64_t>(), "set the default memory limit in KB, default to 262144(256MB). You can either pass it from environ MEMLIMIT")
        ("process-limit", po::value<int>(), "set the default process limit, default to 64. You can either pass it from environ PROCLIMIT")
        ("idle-timeout", po::value<int64_t>(), "set the idle timeout of connections in seconds, default to 60. You can either pass it from environ IDLETIMEOUT")
        ("max-archive-size", po::value<size_t>(), "set the maximum extracted size of an archive in bytes, default to 268435456(256MB). You can either pass it from environ MAXARCHIVESIZE")
        ("debug", "turn on the debug mode to log every message sent and received")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "arbiterd: run submissions in sandboxes and stream verdicts over WebSocket" << endl
             << "Usage: " << argv[0] << " --bind host:port [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "arbiterd 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("config")) {
        try {
            arbiter::load_config_file(vm.at("config").as<string>());
        } catch (std::exception &e) {
            cerr << "Unable to load configuration file " << vm.at("config").as<string>() << ": " << e.what() << endl;
            return EXIT_FAILURE;
        }
    }

    string bind = "127.0.0.1:8787";
    resolve_option(vm, "bind", "BIND", bind);

    string run_dir, cache_dir;
    resolve_option(vm, "run-dir", "RUNDIR", run_dir);
    resolve_option(vm, "cache-dir", "CACHEDIR", cache_dir);
    if (!run_dir.empty()) arbiter::RUN_DIR = run_dir;
    if (!cache_dir.empty()) arbiter::CACHE_DIR = cache_dir;
    if (arbiter::RUN_DIR.empty()) arbiter::RUN_DIR = filesystem::temp_directory_path() / "arbiter" / "run";
    if (arbiter::CACHE_DIR.empty()) arbiter::CACHE_DIR = filesystem::temp_directory_path() / "arbiter" / "cache";

    resolve_option(vm, "cache-entries", "CACHEENTRIES", arbiter::CACHE_MAX_ENTRIES);
    resolve_option(vm, "cache-size", "CACHESIZE", arbiter::CACHE_MAX_SIZE);
    resolve_option(vm, "isolation", "ISOLATION", arbiter::ISOLATION);
    resolve_option(vm, "cgroup-root", "CGROUPROOT", arbiter::CGROUP_ROOT);

    resolve_option(vm, "slots", "SANDBOXSLOTS", arbiter::SANDBOX_SLOTS);
    resolve_option(vm, "parallel-cases", "PARALLELCASES", arbiter::MAX_PARALLEL_CASES);
    resolve_option(vm, "time-limit", "TIMELIMIT", arbiter::DEFAULT_LIMITS.time_limit);
    resolve_option(vm, "memory-limit", "MEMLIMIT", arbiter::DEFAULT_LIMITS.memory_limit);
    resolve_option(vm, "process-limit", "PROCLIMIT", arbiter::DEFAULT_LIMITS.proc_limit);
    resolve_option(vm, "max-archive-size", "MAXARCHIVESIZE", arbiter::MAX_ARCHIVE_SIZE);

    int64_t idle_timeout = arbiter::IDLE_TIMEOUT.count();
    resolve_option(vm, "idle-timeout", "IDLETIMEOUT", idle_timeout);
    arbiter::IDLE_TIMEOUT = chrono::seconds(idle_timeout);

    if (vm.count("debug") || getenv("DEBUG")) {
        arbiter::DEBUG = true;
    }

    CHECK(arbiter::SANDBOX_SLOTS > 0) << "Number of sandbox slots must be positive";
    CHECK(arbiter::MAX_PARALLEL_CASES > 0) << "Number of parallel cases must be positive";
    CHECK(arbiter::DEFAULT_LIMITS.time_limit > 0) << "Time limit must be positive";
    CHECK(arbiter::IDLE_TIMEOUT.count() > 0) << "Idle timeout must be positive";
    CHECK(arbiter::CACHE_MAX_ENTRIES > 0) << "Cache must hold at least one archive";

    filesystem::create_directories(arbiter::RUN_DIR / "sandbox");
    filesystem::create_directories(arbiter::RUN_DIR / "jobs");
    filesystem::create_directories(arbiter::CACHE_DIR);
    CHECK(filesystem::is_directory(arbiter::RUN_DIR))
        << "Run directory " << arbiter::RUN_DIR << " does not exist";
    CHECK(filesystem::is_directory(arbiter::CACHE_DIR))
        << "Cache directory " << arbiter::CACHE_DIR << " does not exist";

    boost::asio::io_context ioc;
    boost::asio::thread_pool blocking(2);

    try {
        arbiter::slot_pool slots(ioc, arbiter::SANDBOX_SLOTS);
        arbiter::sandbox_runner runner(ioc, blocking, slots,
                                       arbiter::make_platform_isolation(arbiter::ISOLATION, arbiter::MEMORY_RESERVE),
                                       arbiter::RUN_DIR / "sandbox");
        arbiter::archive_cache cache(arbiter::CACHE_DIR, arbiter::CACHE_MAX_ENTRIES, arbiter::CACHE_MAX_SIZE);
        arbiter::job_services services{ioc, blocking, runner, cache, arbiter::RUN_DIR / "jobs"};

        auto server = make_shared<arbiter::server::listener>(ioc, arbiter::server::parse_endpoint(bind), services);

        LOG(INFO) << "Sandbox: " << arbiter::SANDBOX_SLOTS << " slots, default limits " << arbiter::describe(arbiter::DEFAULT_LIMITS);
        LOG(INFO) << "Run directory " << arbiter::RUN_DIR << ", cache directory " << arbiter::CACHE_DIR;

        // 第一次收到信号时停止接受连接并取消所有任务，全部清理完毕后 ioc.run() 返回；
        // 第二次收到信号时直接退出
        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        boost::asio::steady_timer drain_timer(ioc);
        function<void()> wait_drained = [&]() {
            if (runner.active() == 0 && server->connection_count() == 0) {
                signals.cancel();
                return;
            }
            drain_timer.expires_after(chrono::milliseconds(100));
            drain_timer.async_wait([&](const boost::system::error_code &ec) {
                if (!ec) wait_drained();
            });
        };
        function<void(const boost::system::error_code &, int)> on_signal;
        bool stopping = false;
        on_signal = [&](const boost::system::error_code &ec, int signum) {
            if (ec) return;
            if (stopping) {
                LOG(ERROR) << "Received signal " << signum << " again, " << runner.active() << " sandbox runs still active, exiting";
                exit(EXIT_FAILURE);
            }
            LOG(ERROR) << "Received signal " << signum << ", stopping";
            stopping = true;
            server->stop();
            signals.async_wait(on_signal);
            wait_drained();
        };
        signals.async_wait(on_signal);

        server->run();
        ioc.run();
    } catch (std::exception &e) {
        LOG(ERROR) << "arbiterd failed: " << boost::diagnostic_information(e);
        blocking.join();
        return EXIT_FAILURE;
    }

    blocking.join();
    return EXIT_SUCCESS;
}
