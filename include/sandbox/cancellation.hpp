#pragma once

#include <cstddef>
#include <functional>
#include <map>

namespace arbiter {

/**
 * @brief 取消信号
 * 任务取消时触发，正在运行的沙箱通过订阅这个信号立即杀死子进程。
 * 只能在 io_context 线程中使用。
 */
class cancellation {
public:
    using callback = std::function<void()>;

    /**
     * @brief 设置取消标志并依次调用所有订阅者，重复调用没有效果
     */
    void cancel();

    bool cancelled() const;

    /**
     * @brief 订阅取消信号，已经取消时不会调用 cb
     * @return 用于取消订阅的编号
     */
    std::size_t subscribe(callback cb);

    void unsubscribe(std::size_t id);

private:
    bool flag = false;
    std::size_t next_id = 1;
    std::map<std::size_t, callback> callbacks;
};

}  // namespace arbiter
