#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include "common/exceptions.hpp"
#include "sandbox/isolation.hpp"

struct cgroup;
struct cgroup_controller;

namespace arbiter {

/**
 * @brief libcgroup 调用失败
 */
struct cgroup_error : public sandbox_error {
    cgroup_error(const std::string &cgroup_op, int err);

    static void ensure(const std::string &cgroup_op, int err);
};

/**
 * @brief 表示一个 cgroup 的 controller，生命周期由所属的 cgroup_guard 管理
 */
struct cgroup_ctrl {
    struct cgroup_controller *ctrl;

    void add_value(const std::string &name, int64_t value);

    void add_value(const std::string &name, const std::string &value);

    int64_t get_value_int64(const std::string &name);
};

/**
 * @brief 创建指定 cgroup 的管理器
 * 在析构时释放内存，不会修改内核中的 cgroup
 */
struct cgroup_guard {
    /**
     * @param cgroup_name cgroup 在层级中的路径
     */
    explicit cgroup_guard(const std::string &cgroup_name);

    ~cgroup_guard();

    cgroup_guard(const cgroup_guard &) = delete;
    cgroup_guard &operator=(const cgroup_guard &) = delete;

    /**
     * @brief 在内核中创建这个 cgroup，并写入 add_value 添加的设定
     */
    void create_cgroup(int ignore_ownership);

    cgroup_ctrl add_controller(const std::string &name);

    /**
     * @brief 需要先调用 get_cgroup 从内核读取数据
     */
    cgroup_ctrl get_controller(const std::string &name);

    void get_cgroup();

    /**
     * @brief 删除 cgroup 及其子 cgroup，其中的进程需要已经退出
     */
    void delete_cgroup();

    /**
     * @brief 初始化 libcgroup，只在第一次调用时生效
     */
    static void init();

private:
    struct cgroup *cg;
};

/**
 * @brief 基于 memory cgroup 的隔离
 * 启动时在父 cgroup 下创建 arbiter-<uuid>，每次运行在其中再创建 run-<uuid>，
 * 子进程在 exec 之前把自己加入该 cgroup。内存超限时由内核 OOM killer 杀死程序，
 * 并在 memory.events（v2）或 memory.oom_control（v1）中留下记录，
 * 峰值内存取自 memory.peak 或 memory.max_usage_in_bytes。
 * 其余限制与 rlimit 隔离相同，但不再限制地址空间。
 */
class cgroup_isolation : public platform_isolation {
public:
    enum class hierarchy {
        V1,
        V2
    };

    /**
     * @brief 创建本进程专用的 cgroup
     * @param parent 父 cgroup 在 memory 层级中的路径，为空时使用本进程所在的 cgroup
     * @throw sandbox_error 没有可写的 memory cgroup
     */
    static std::unique_ptr<cgroup_isolation> create(const std::string &parent);

    /**
     * @param group 已经创建好的专用 cgroup 在层级中的路径，析构时删除
     * @param mount_point memory 层级的挂载点
     */
    cgroup_isolation(hierarchy version, std::string group, const std::filesystem::path &mount_point);

    ~cgroup_isolation() override;

    const char *name() const override;

    std::unique_ptr<isolation_scope> create_scope(const resource_limits &limits) const override;

    hierarchy version() const;

    /**
     * @brief 专用 cgroup 在层级中的路径
     */
    const std::string &group() const;

    /**
     * @brief 专用 cgroup 在文件系统中的目录
     */
    const std::filesystem::path &root() const;

private:
    hierarchy cgroup_version;
    std::string cgroup_group;
    std::filesystem::path cgroup_root;
};

}  // namespace arbiter
