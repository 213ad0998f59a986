#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "sandbox/cancellation.hpp"
#include "sandbox/isolation.hpp"
#include "sandbox/limits.hpp"
#include "sandbox/slot_pool.hpp"

namespace arbiter {

/**
 * @brief 一次沙箱运行的参数
 */
struct sandbox_request {
    /**
     * @brief 运行的命令，command[0] 不含 '/' 时在 PATH 中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 程序的标准输入
     */
    std::string input;

    resource_limits limits;

    /**
     * @brief 非空时，该目录下的文件会被复制到工作目录
     */
    std::filesystem::path populate_from;

    /**
     * @brief 复制完成后额外写入工作目录的文件，键为相对路径
     */
    std::map<std::string, std::string> files;

    /**
     * @brief 非空时，运行结束后工作目录的全部内容会被复制到该目录
     */
    std::filesystem::path harvest_to;

    /**
     * @brief 程序的环境变量
     */
    std::map<std::string, std::string> env;
};

enum class limit_violation {
    NONE,
    TIME,
    MEMORY,
    OUTPUT
};

const char *to_string(limit_violation limit);

/**
 * @brief 一次沙箱运行的原始结果
 */
struct sandbox_result {
    /**
     * @brief 正常退出时的退出码，被信号终止时为 -1
     */
    int exit_code = -1;

    /**
     * @brief 终止进程的信号，正常退出时为 0
     */
    int term_signal = 0;

    std::string output;
    bool output_truncated = false;

    /**
     * @brief 程序写出的标准输出总字节数，包括被丢弃的部分
     */
    std::size_t output_size = 0;

    std::string error_output;
    bool error_truncated = false;
    std::size_t error_size = 0;

    /**
     * @brief 墙上时间，单位为秒
     */
    double wall_time = 0;

    /**
     * @brief 用户态与内核态 CPU 时间之和，单位为秒
     */
    double cpu_time = 0;

    /**
     * @brief 峰值常驻内存，单位为 KB
     */
    int64_t memory = 0;

    limit_violation limit = limit_violation::NONE;

    /**
     * @brief 运行被取消，子进程已被杀死
     */
    bool cancelled = false;

    /**
     * @brief 非空表示程序无法执行（文件不存在、没有执行权限），这是用户程序的问题
     */
    std::string exec_error;

    /**
     * @brief 正常退出且退出码为 0
     */
    bool succeeded() const;
};

/**
 * @brief 在沙箱中运行程序
 * 每次运行使用 work_root 下新建的工作目录，无论成功、超限、崩溃还是取消，
 * 结束后都会被删除。同时运行的进程数受 slot_pool 限制。
 * 子进程的退出通过 pidfd 异步通知，不会阻塞 io_context。
 */
class sandbox_runner {
public:
    /**
     * @brief error 为空时 result 有效；error 只会是 sandbox_error
     */
    using handler_type = std::function<void(std::exception_ptr error, sandbox_result result)>;

    sandbox_runner(boost::asio::io_context &ioc,
                   boost::asio::thread_pool &blocking,
                   slot_pool &slots,
                   std::unique_ptr<platform_isolation> isolation,
                   std::filesystem::path work_root);

    /**
     * @brief 异步运行，handler 在 io_context 线程中恰好调用一次
     * @param cancel 可以为空；触发后子进程立即被杀死，结果的 cancelled 为真
     */
    void async_run(sandbox_request request, std::shared_ptr<cancellation> cancel, handler_type handler);

    /**
     * @brief 还没有调用 handler 的运行数
     */
    std::size_t active() const;

    const std::filesystem::path &work_root() const;

    const platform_isolation &platform() const;

    boost::asio::io_context &context();

    /**
     * @brief 执行文件操作等阻塞任务的线程池
     */
    boost::asio::thread_pool &blocking_pool();

private:
    friend class sandbox_execution;

    boost::asio::io_context &ioc;
    boost::asio::thread_pool &blocking;
    slot_pool &slots;
    std::unique_ptr<platform_isolation> isolation;
    std::filesystem::path root;
    std::size_t running = 0;
};

}  // namespace arbiter
