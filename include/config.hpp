#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include "sandbox/limits.hpp"

namespace arbiter {

/**
 * @brief 比较程序的退出码约定
 * 会作为环境变量传给比较程序
 */
enum error_codes {
    E_SUCCESS = 0,
    E_INTERNAL_ERROR = 2,

    E_ACCEPTED = 42,
    E_WRONG_ANSWER = 43
};

/**
 * @brief 测试配置文件和数据点都没有指定资源限制时使用的限制
 */
extern resource_limits DEFAULT_LIMITS;

/**
 * @brief 编译命令的资源限制
 */
extern resource_limits COMPILE_LIMITS;

/**
 * @brief 比较程序的资源限制
 */
extern resource_limits CHECKER_LIMITS;

/**
 * @brief 为了让程序能够加载动态库，地址空间限制比内存限制多出的部分，单位为 KB
 */
extern int64_t MEMORY_RESERVE;

/**
 * @brief 捕获的标准输出的最大字节数，超出部分丢弃但计数
 */
extern std::size_t STDOUT_LIMIT;

/**
 * @brief 捕获的标准错误输出的最大字节数
 */
extern std::size_t STDERR_LIMIT;

/**
 * @brief 解压后所有文件的总大小上限，单位为字节
 */
extern std::size_t MAX_ARCHIVE_SIZE;

/**
 * @brief 压缩包中的文件个数上限
 */
extern std::size_t MAX_ARCHIVE_ENTRIES;

/**
 * @brief 单条 WebSocket 消息的最大字节数
 */
extern std::size_t MAX_MESSAGE_SIZE;

/**
 * @brief 缓存的提交数上限，超出时淘汰最久没有使用的提交
 */
extern std::size_t CACHE_MAX_ENTRIES;

/**
 * @brief 缓存的提交解压后的总字节数上限
 */
extern std::uintmax_t CACHE_MAX_SIZE;

/**
 * @brief 内存限制的实现方式
 * "cgroup" 按 memory cgroup 统计峰值并在超限时杀死程序；
 * "rlimit" 只限制地址空间，超限的分配失败；
 * "auto" 优先使用 cgroup，不可用时退回 rlimit。
 */
extern std::string ISOLATION;

/**
 * @brief 创建沙箱 cgroup 的父 cgroup 在 memory 层级中的路径，为空时使用本进程所在的 cgroup
 */
extern std::string CGROUP_ROOT;

/**
 * @brief 同时运行的沙箱进程数，默认为 CPU 核心数
 */
extern unsigned SANDBOX_SLOTS;

/**
 * @brief 每个任务同时评测的数据点数
 * 与 SANDBOX_SLOTS 无关，保证一个大任务不会占满所有沙箱
 */
extern unsigned MAX_PARALLEL_CASES;

/**
 * @brief 连接在这段时间内没有收发任何消息则被关闭
 */
extern std::chrono::seconds IDLE_TIMEOUT;

/**
 * @brief 进程退出后等待输出管道读完的时间
 */
extern std::chrono::milliseconds KILL_DELAY;

/**
 * @brief 沙箱运行目录和任务构建目录的根目录
 *
 * RUN_DIR
 * ├── sandbox // 每次沙箱运行的临时工作目录，运行结束后删除
 * │   └── run-[uuid]
 * └── jobs // 需要编译的任务的构建结果，任务结束后删除
 *     └── build-[uuid]
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 按摘要缓存的解压后的提交
 *
 * CACHE_DIR
 * ├── [sha256] // 解压完成的提交，内容不再修改
 * └── tmp-[uuid] // 正在解压的提交，完成后重命名
 */
extern std::filesystem::path CACHE_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，会打印每条收发的消息
 */
extern bool DEBUG;

/**
 * @brief 从 JSON 配置文件中读取配置，文件中没有的项保持不变
 * @throw std::invalid_argument 配置项的类型不对
 */
void load_config_file(const std::filesystem::path &path);

}  // namespace arbiter
