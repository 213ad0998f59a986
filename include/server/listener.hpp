#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <map>
#include <memory>
#include <string>
#include "judge/job.hpp"
#include "server/connection.hpp"

namespace arbiter::server {

/**
 * @brief 解析 host:port 形式的监听地址，host 为空时监听所有地址
 * @throw std::invalid_argument 地址格式错误
 */
boost::asio::ip::tcp::endpoint parse_endpoint(const std::string &address);

/**
 * @brief 接受 WebSocket 连接
 * 持有所有连接，连接关闭后从表中移除。
 */
class listener : public std::enable_shared_from_this<listener> {
public:
    /**
     * @throw boost::system::system_error 无法监听该地址
     */
    listener(boost::asio::io_context &ioc, const boost::asio::ip::tcp::endpoint &endpoint, job_services services);

    void run();

    /**
     * @brief 停止接受新连接并关闭所有连接
     */
    void stop();

    boost::asio::ip::tcp::endpoint local_endpoint() const;

    std::size_t connection_count() const;

private:
    void do_accept();

    void on_accept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);

    boost::asio::ip::tcp::acceptor acceptor;
    job_services services;
    bool stopped = false;

    std::map<connection *, std::shared_ptr<connection>> connections;
};

}  // namespace arbiter::server
