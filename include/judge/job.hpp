#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "archive/cache.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/status.hpp"
#include "judge/verifier.hpp"
#include "sandbox/cancellation.hpp"
#include "sandbox/sandbox.hpp"
#include "spec/test_spec.hpp"

/**
 * 这个头文件包含评测任务
 * 一个任务是一份提交对一份测试配置的一次完整评测，状态转移如下：
 *
 * PENDING → UNPACKING → (COMPILING) → RUNNING → AGGREGATING → COMPLETED
 *                ↓            ↓           ↓
 *              FAILED     CANCELLED   CANCELLED
 *
 * 任务只在 io_context 线程中修改，解压等阻塞操作在线程池中完成。
 */
namespace arbiter {

enum class job_phase {
    PENDING,
    UNPACKING,
    COMPILING,
    RUNNING,
    AGGREGATING,
    COMPLETED,
    CANCELLED,
    FAILED
};

const char *to_string(job_phase phase);

/**
 * @throw std::invalid_argument 如果 name 不是已知的阶段
 */
job_phase parse_job_phase(const std::string &name);

bool is_terminal(job_phase phase);

/**
 * @brief 一个数据点的评测结果
 */
struct case_result {
    std::string case_id;
    verdict result = verdict::INTERNAL_ERROR;
    std::string detail;

    /**
     * @brief CPU 时间，单位为秒
     */
    double time = 0;

    /**
     * @brief 峰值内存，单位为 KB
     */
    int64_t memory = 0;
};

/**
 * @brief 任务结束时的汇总
 */
struct job_summary {
    std::string job;
    job_phase phase = job_phase::COMPLETED;

    /**
     * @brief 所有已完成数据点中最严重的结果，任务失败时为 INTERNAL_ERROR
     */
    verdict result = verdict::ACCEPTED;

    /**
     * @brief 已完成的数据点，按测试配置中的顺序排列
     */
    std::vector<case_result> cases;
};

/**
 * @brief 接收任务进度的对象，通常是任务所属的连接
 * 所有回调都在 io_context 线程中调用，on_job_complete 总是最后一个。
 */
class job_observer {
public:
    virtual ~job_observer() = default;

    virtual void on_case_result(const std::string &job, const case_result &result) = 0;

    virtual void on_job_complete(const job_summary &summary) = 0;

    /**
     * @brief 任务失败的原因，之后还会调用 on_job_complete
     */
    virtual void on_job_error(const std::string &job, error_kind kind, const std::string &message) = 0;
};

/**
 * @brief 一份提交
 */
struct job_submission {
    /**
     * @brief 压缩包的 SHA-256
     */
    std::string digest;

    /**
     * @brief 压缩包内容，已经缓存过的提交可以省略
     */
    std::optional<std::string> archive;

    /**
     * @brief 直接提交的测试配置
     */
    std::optional<std::string> spec_text;

    /**
     * @brief 测试配置在压缩包中的路径，与 spec_text 二选一
     */
    std::optional<std::string> spec_path;
};

/**
 * @brief 任务运行需要的共享设施，所有任务共用
 */
struct job_services {
    boost::asio::io_context &ioc;
    boost::asio::thread_pool &blocking;
    sandbox_runner &runner;
    archive_cache &cache;

    /**
     * @brief 编译结果的存放目录
     */
    std::filesystem::path build_root;
};

/**
 * @brief 生成任务编号：摘要的前 16 位加上进程内递增的计数
 */
std::string make_job_id(const std::string &digest);

class job : public std::enable_shared_from_this<job> {
public:
    job(job_services services, std::string id, job_submission submission, std::weak_ptr<job_observer> observer);

    /**
     * @brief 开始评测，只能调用一次
     */
    void start();

    /**
     * @brief 取消任务
     * 不再启动新的数据点，正在运行的程序立即被杀死，已经在汇总或者已经结束的任务忽略取消。
     * 正在运行的程序全部退出并清理完毕之后才会通知 on_job_complete。
     */
    void cancel();

    const std::string &id() const;

    job_phase phase() const;

    /**
     * @brief 正在沙箱中运行的数据点数
     */
    std::size_t in_flight() const;

private:
    struct prepared_submission {
        cache_handle archive;
        std::filesystem::path root;
        test_spec spec;
    };

    static prepared_submission prepare(const job_submission &submission, archive_cache &cache);

    void on_prepared(std::exception_ptr error, std::optional<prepared_submission> prepared);

    void compile();

    void on_compiled(std::exception_ptr error, const sandbox_result &result);

    void run_cases();

    void launch_case(std::size_t index);

    void on_case_done(std::size_t index, case_result result);

    /**
     * @brief 运行一次沙箱，sandbox_error 时重试一次
     */
    void run_sandboxed(sandbox_request request, sandbox_runner::handler_type handler, int attempt = 1);

    void record(std::size_t index, case_result result);

    void check_completion();

    void fail(std::exception_ptr error);

    void finish(job_phase final_phase);

    /**
     * @brief 调用 action，捕获的异常会让任务失败
     */
    template <typename F>
    void guarded(F &&action);

    job_services services;
    std::string job_id;
    job_submission submission;
    std::weak_ptr<job_observer> observer;

    job_phase current = job_phase::PENDING;
    std::shared_ptr<cancellation> cancel_token;
    std::exception_ptr failure;
    bool finishing = false;

    test_spec spec;

    /**
     * @brief 任务结束前一直持有，缓存不会淘汰正在使用的提交
     */
    cache_handle archive;
    std::filesystem::path exec_dir;
    std::optional<scoped_directory> build_dir;

    std::vector<std::optional<case_result>> results;
    std::size_t next_case = 0;
    std::size_t running = 0;
    std::size_t completed = 0;
    std::size_t max_parallel = 1;
};

}  // namespace arbiter
