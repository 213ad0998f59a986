#pragma once

#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <deque>
#include <functional>

namespace arbiter {

/**
 * @brief 全局的沙箱并发数限制，所有连接的所有任务共享
 * 超出容量的请求按先来先服务排队。只能在 io_context 线程中使用。
 */
class slot_pool {
public:
    /**
     * @brief 占用的一个名额，析构时自动归还
     */
    class slot {
    public:
        slot();
        slot(slot &&other);
        slot(const slot &) = delete;
        ~slot();

        slot &operator=(slot &&other);

        explicit operator bool() const;

        void release();

    private:
        friend class slot_pool;
        explicit slot(slot_pool *pool);

        slot_pool *pool;
    };

    slot_pool(boost::asio::io_context &ioc, std::size_t capacity);

    /**
     * @brief 申请一个名额，拿到名额后在 io_context 中调用 handler
     */
    void async_acquire(std::function<void(slot)> handler);

    std::size_t capacity() const;

    std::size_t in_use() const;

    std::size_t waiting() const;

private:
    void give_back();

    boost::asio::io_context &ioc;
    std::size_t cap;
    std::size_t used = 0;
    std::deque<std::function<void(slot)>> waiters;
};

}  // namespace arbiter
