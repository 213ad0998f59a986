#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

namespace arbiter {

/**
 * @brief 在线程池中执行会阻塞的操作（文件读写、解压），完成后回到 io_context 线程调用 done
 * work 抛出的异常会被捕获并作为 done 的第一个参数传回。
 * 若 work 返回 void，则 done 的形式为 done(std::exception_ptr)；
 * 否则为 done(std::exception_ptr, std::optional<R>)。
 * 在 done 被调用之前 io_context 不会因为没有任务而退出。
 */
template <typename Work, typename Done>
void run_blocking(boost::asio::thread_pool &pool, boost::asio::io_context &ioc, Work &&work, Done &&done) {
    using result_type = std::invoke_result_t<std::decay_t<Work>>;
    auto guard = boost::asio::make_work_guard(ioc);
    boost::asio::post(pool, [&ioc, guard = std::move(guard), work = std::forward<Work>(work), done = std::forward<Done>(done)]() mutable {
        std::exception_ptr error;
        if constexpr (std::is_void_v<result_type>) {
            try {
                work();
            } catch (...) {
                error = std::current_exception();
            }
            boost::asio::post(ioc, [error, done = std::move(done)]() mutable {
                done(error);
            });
        } else {
            std::optional<result_type> result;
            try {
                result.emplace(work());
            } catch (...) {
                error = std::current_exception();
            }
            boost::asio::post(ioc, [error, result = std::move(result), done = std::move(done)]() mutable {
                done(error, std::move(result));
            });
        }
    });
}

}  // namespace arbiter
