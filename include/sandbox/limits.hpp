#pragma once

#include <cstdint>
#include <string>

namespace arbiter {

/**
 * @brief 一次沙箱运行的资源限制
 */
struct resource_limits {
    /**
     * @brief CPU 时间限制，单位为秒
     */
    double time_limit = 1;

    /**
     * @brief 墙上时间限制，单位为秒，由父进程的计时器保证
     */
    double wall_time_limit = 3;

    /**
     * @brief 内存限制，单位为 KB
     */
    int64_t memory_limit = 262144;

    /**
     * @brief 进程数限制
     */
    int proc_limit = 64;

    /**
     * @brief 写文件大小限制，单位为 KB
     */
    int64_t file_limit = 65536;
};

std::string describe(const resource_limits &limits);

}  // namespace arbiter
