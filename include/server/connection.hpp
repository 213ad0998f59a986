#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include "judge/job.hpp"
#include "server/protocol.hpp"

namespace arbiter::server {

/**
 * @brief 一个 WebSocket 连接
 * 连接拥有通过它提交的所有任务，连接关闭时取消所有未结束的任务。
 * 状态：CONNECTING → OPEN → CLOSING → CLOSED，握手失败的连接直接关闭。
 * 只在 io_context 线程中使用。
 */
class connection : public job_observer, public std::enable_shared_from_this<connection> {
public:
    enum class state {
        CONNECTING,
        OPEN,
        CLOSING,
        CLOSED
    };

    using closed_handler = std::function<void(connection *)>;

    connection(boost::asio::ip::tcp::socket socket, job_services services, closed_handler on_closed);

    /**
     * @brief 开始 WebSocket 握手
     */
    void start();

    /**
     * @brief 正常关闭连接，服务停止时调用
     */
    void close(const std::string &reason);

    state current_state() const;

    std::size_t job_count() const;

    const std::string &peer() const;

    void on_case_result(const std::string &job, const case_result &result) override;

    void on_job_complete(const job_summary &summary) override;

    void on_job_error(const std::string &job, error_kind kind, const std::string &message) override;

private:
    void on_handshake(boost::beast::error_code ec);

    void do_read();

    void on_read(boost::beast::error_code ec, std::size_t bytes);

    void handle(const std::string &text);

    void handle_submit(submit_message &message);

    void handle_cancel(const cancel_message &message);

    void send(server_message message);

    void do_write();

    void on_write(boost::beast::error_code ec, std::size_t bytes);

    void touch();

    void arm_idle_timer();

    void on_idle(boost::beast::error_code ec);

    /**
     * @brief 取消所有任务，之后收到的任务结果不再发送
     */
    void cancel_jobs();

    /**
     * @brief 不经过 WebSocket 关闭握手直接关闭 TCP 连接
     */
    void drop(const std::string &reason);

    void closed();

    boost::beast::websocket::stream<boost::beast::tcp_stream> ws;
    boost::beast::flat_buffer buffer;
    std::string remote;

    job_services services;
    closed_handler on_closed;

    state current = state::CONNECTING;
    std::deque<std::string> outbox;
    bool writing = false;

    boost::asio::steady_timer idle_timer;
    std::chrono::steady_clock::time_point last_activity;

    std::map<std::string, std::shared_ptr<job>> jobs;
};

}  // namespace arbiter::server
