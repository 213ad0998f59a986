#pragma once

#include <sys/types.h>
#include <cstdint>
#include <memory>
#include <string>
#include "sandbox/limits.hpp"

namespace arbiter {

/**
 * @brief 一次运行结束后的内存统计
 */
struct memory_usage {
    /**
     * @brief 峰值内存，单位为 KB，无法统计时为 0
     */
    int64_t peak = 0;

    /**
     * @brief 内核因为超出内存限制拒绝分配或者杀死了程序
     */
    bool exceeded = false;
};

/**
 * @brief 一次沙箱运行的隔离环境
 * 由 platform_isolation::create_scope 在线程池中创建，析构时杀死残留进程并释放资源，
 * 析构可能阻塞，也应当在线程池中进行。
 */
class isolation_scope {
public:
    virtual ~isolation_scope() = default;

    /**
     * @brief 在 fork 出的子进程中、exec 之前调用
     * 只能使用异步信号安全的函数，不能抛出异常，不能分配内存
     * @return 成功返回 0，失败返回 errno
     */
    virtual int enter() const noexcept = 0;

    /**
     * @brief 强制杀死子进程及其所有后代，在 io_context 线程中调用，不能阻塞
     */
    virtual void kill_all(pid_t pid) const noexcept = 0;

    /**
     * @brief 子进程退出后读取内存统计
     * @throw sandbox_error 统计信息无法读取
     */
    virtual memory_usage memory() const = 0;
};

/**
 * @brief 与操作系统相关的隔离手段
 * 资源限制必须在子进程开始执行用户程序之前由内核设置好，
 * 而不是由父进程轮询检查。每个平台提供一个实现。
 */
class platform_isolation {
public:
    virtual ~platform_isolation() = default;

    virtual const char *name() const = 0;

    /**
     * @brief 为一次运行准备隔离环境，可能阻塞
     * @throw sandbox_error 无法创建
     */
    virtual std::unique_ptr<isolation_scope> create_scope(const resource_limits &limits) const = 0;
};

/**
 * @brief 在子进程中设置 setsid 和各项 rlimit
 * CPU 时间软限制向上取整，硬限制再多 1 秒：到达软限制时内核发送 SIGXCPU，
 * 这样可以可靠地判断是否超时。
 * @param address_space 地址空间限制，单位为 KB，不大于 0 时不限制
 * @return 成功返回 0，失败返回 errno
 */
int restrict_process(const resource_limits &limits, int64_t address_space) noexcept;

/**
 * @brief 杀死进程组以及进程本身
 */
void kill_process_group(pid_t pid) noexcept;

/**
 * @brief 只依赖 setrlimit 和进程组的隔离
 * 内存通过 RLIMIT_AS 限制，超出时分配失败，程序通常以运行错误结束，
 * 峰值内存只能由父进程通过 rusage 检查。
 */
std::unique_ptr<platform_isolation> make_rlimit_isolation(int64_t memory_reserve);

/**
 * @brief 创建当前平台的隔离实现
 * @param kind "cgroup"、"rlimit" 或者 "auto"，auto 在 cgroup 不可用时退回 rlimit
 * @param memory_reserve rlimit 模式下地址空间限制比内存限制多出的部分，单位为 KB
 * @throw sandbox_error 当前平台不支持或者指定的方式不可用
 */
std::unique_ptr<platform_isolation> make_platform_isolation(const std::string &kind, int64_t memory_reserve);

}  // namespace arbiter
