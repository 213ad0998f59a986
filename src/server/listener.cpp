#include "server/listener.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <stdexcept>

namespace arbiter::server {
using namespace std;
namespace asio = boost::asio;
namespace beast = boost::beast;
using asio::ip::tcp;

tcp::endpoint parse_endpoint(const string &address) {
    size_t colon = address.rfind(':');
    if (colon == string::npos)
        throw invalid_argument("address must be host:port, got " + address);

    string host = address.substr(0, colon);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
        host = host.substr(1, host.size() - 2);

    unsigned short port;
    try {
        port = boost::lexical_cast<unsigned short>(address.substr(colon + 1));
    } catch (boost::bad_lexical_cast &) {
        throw invalid_argument("invalid port in " + address);
    }

    if (host.empty() || host == "*")
        return tcp::endpoint(tcp::v4(), port);

    boost::system::error_code ec;
    auto ip = asio::ip::make_address(host, ec);
    if (ec)
        throw invalid_argument("invalid host in " + address + ": " + ec.message());
    return tcp::endpoint(ip, port);
}

listener::listener(asio::io_context &ioc, const tcp::endpoint &endpoint, job_services services)
    : acceptor(ioc), services(move(services)) {
    acceptor.open(endpoint.protocol());
    acceptor.set_option(asio::socket_base::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen(asio::socket_base::max_listen_connections);
}

void listener::run() {
    LOG(INFO) << "Listening on " << acceptor.local_endpoint();
    do_accept();
}

void listener::do_accept() {
    acceptor.async_accept(beast::bind_front_handler(&listener::on_accept, shared_from_this()));
}

void listener::on_accept(beast::error_code ec, tcp::socket socket) {
    if (stopped) return;
    if (ec) {
        LOG(WARNING) << "Unable to accept connection: " << ec.message();
    } else {
        weak_ptr<listener> weak = shared_from_this();
        auto conn = make_shared<connection>(move(socket), services, [weak](connection *closed) {
            if (auto self = weak.lock()) self->connections.erase(closed);
        });
        connections[conn.get()] = conn;
        conn->start();
    }
    do_accept();
}

void listener::stop() {
    if (stopped) return;
    stopped = true;
    beast::error_code ec;
    acceptor.close(ec);

    // 关闭连接时会从表中删除自己，先复制一份
    auto snapshot = connections;
    for (auto &[ptr, conn] : snapshot)
        conn->close("server shutting down");
    LOG(INFO) << "Stopped listening, closing " << snapshot.size() << " connections";
}

tcp::endpoint listener::local_endpoint() const {
    return acceptor.local_endpoint();
}

size_t listener::connection_count() const {
    return connections.size();
}

}  // namespace arbiter::server
