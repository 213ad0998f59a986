#include "client/client.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <openssl/ssl.h>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/regex.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/exceptions.hpp"
#include "common/stl_utils.hpp"
#include "config.hpp"

namespace arbiter::client {
using namespace std;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace ssl = boost::asio::ssl;
using asio::ip::tcp;

server_url parse_url(const string &url) {
    static const boost::regex matcher(R"((wss?)://(\[[^\]]+\]|[^:/\[\]]+)(:([0-9]{1,5}))?(/.*)?)", boost::regex::perl | boost::regex::no_mod_s);
    boost::smatch matches;
    if (!boost::regex_match(url, matches, matcher))
        throw invalid_argument("invalid server address " + url + ", expected ws://host:port or wss://host:port");

    server_url result;
    result.secure = matches[1].str() == "wss";
    result.host = matches[2].str();
    if (result.host.front() == '[')
        result.host = result.host.substr(1, result.host.size() - 2);
    result.port = matches[4].matched ? matches[4].str() : (result.secure ? "443" : "80");
    if (matches[5].matched) result.target = matches[5].str();
    return result;
}

/**
 * @brief 连接建立之后的消息收发，对 ws 和 wss 通用
 */
template <typename Stream>
class submit_session {
public:
    submit_session(Stream &ws, asio::io_context &ioc, const submit_options &options,
                   const submit_callbacks &callbacks, submit_outcome &outcome)
        : ws(ws), options(options), callbacks(callbacks), outcome(outcome), deadline(ioc), pinger(ioc) {
        token = boost::uuids::to_string(boost::uuids::random_generator()());
    }

    void run(asio::io_context &ioc) {
        ws.read_message_max(MAX_MESSAGE_SIZE);

        server::submit_message submit;
        submit.token = token;
        submit.digest = options.archive.digest;
        if (options.send_archive) submit.archive = options.archive.bytes;
        submit.spec = options.spec_text;
        submit.spec_path = options.spec_path;
        ws.text(true);
        ws.write(asio::buffer(server::encode(server::client_message(submit))));

        if (options.timeout.count() > 0) {
            deadline.expires_after(options.timeout);
            deadline.async_wait([this](const beast::error_code &ec) {
                if (ec || finished) return;
                outcome.timed_out = true;
                stop();
            });
        }
        schedule_ping();
        read_next();
        ioc.run();

        if (finished) {
            beast::error_code ec;
            ws.close(websocket::close_code::normal, ec);
        }
    }

private:
    void stop() {
        finished = true;
        deadline.cancel();
        pinger.cancel();
        beast::get_lowest_layer(ws).close();
    }

    void complete() {
        finished = true;
        deadline.cancel();
        pinger.cancel();
    }

    void schedule_ping() {
        if (finished || options.ping_interval.count() <= 0) return;
        pinger.expires_after(options.ping_interval);
        pinger.async_wait([this](const beast::error_code &ec) {
            if (ec || finished) return;
            // 只有一个写操作在进行：ping 和 close 之外，客户端不再发送消息
            outgoing = server::encode(server::client_message(server::ping_message{}));
            ws.async_write(asio::buffer(outgoing), [this](const beast::error_code &ec, size_t) {
                if (ec) return;
                schedule_ping();
            });
        });
    }

    void read_next() {
        ws.async_read(buffer, [this](const beast::error_code &ec, size_t) {
            if (ec) {
                if (!finished && !outcome.timed_out)
                    outcome.connection_error = ec.message();
                complete();
                return;
            }

            string text = beast::buffers_to_string(buffer.data());
            buffer.consume(buffer.size());
            if (callbacks.on_message) callbacks.on_message(text);

            try {
                handle(server::decode_server_message(text));
            } catch (protocol_error &e) {
                outcome.connection_error = fmt::format("malformed message from server: {}", e.what());
                stop();
                return;
            }

            if (finished) {
                complete();
                return;
            }
            read_next();
        });
    }

    void handle(const server::server_message &message) {
        visit(overloaded{
                  [this](const server::accepted_message &m) {
                      if (m.token != token) return;
                      outcome.job = m.job;
                      if (callbacks.on_accepted) callbacks.on_accepted(m.job);
                  },
                  [this](const server::case_result_message &m) {
                      if (m.job != outcome.job) return;
                      if (callbacks.on_case_result) callbacks.on_case_result(m.result);
                  },
                  [this](const server::job_complete_message &m) {
                      if (m.summary.job != outcome.job) return;
                      outcome.summary = m.summary;
                      finished = true;
                  },
                  [this](const server::error_message &m) {
                      if (m.job && *m.job != outcome.job) return;
                      outcome.errors.push_back(m);
                      if (callbacks.on_error) callbacks.on_error(m);
                      // 还没有被接受时出现连接级别的错误，说明提交本身被拒绝了
                      if (!m.job && outcome.job.empty()) finished = true;
                  },
                  [](const server::pong_message &) {}},
              message);
    }

    Stream &ws;
    const submit_options &options;
    const submit_callbacks &callbacks;
    submit_outcome &outcome;

    string token;
    string outgoing;
    beast::flat_buffer buffer;
    asio::steady_timer deadline;
    asio::steady_timer pinger;
    bool finished = false;
};

submit_outcome submit_job(const submit_options &options, const submit_callbacks &callbacks) {
    server_url url = parse_url(options.url);
    string host_header = url.host + ":" + url.port;
    submit_outcome outcome;

    asio::io_context ioc;
    try {
        tcp::resolver resolver(ioc);
        auto endpoints = resolver.resolve(url.host, url.port);

        if (url.secure) {
            ssl::context ctx(ssl::context::tls_client);
            ctx.set_default_verify_paths();
            ctx.set_verify_mode(ssl::verify_peer);

            websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws(ioc, ctx);
            beast::get_lowest_layer(ws).connect(endpoints);
            if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), url.host.c_str()))
                throw protocol_error("unable to set TLS server name " + url.host);
            ws.next_layer().set_verify_callback(ssl::host_name_verification(url.host));
            ws.next_layer().handshake(ssl::stream_base::client);
            ws.handshake(host_header, url.target);

            submit_session<decltype(ws)> session(ws, ioc, options, callbacks, outcome);
            session.run(ioc);
        } else {
            websocket::stream<beast::tcp_stream> ws(ioc);
            beast::get_lowest_layer(ws).connect(endpoints);
            ws.handshake(host_header, url.target);

            submit_session<decltype(ws)> session(ws, ioc, options, callbacks, outcome);
            session.run(ioc);
        }
    } catch (boost::system::system_error &e) {
        if (outcome.job.empty())
            throw protocol_error(fmt::format("unable to talk to {}: {}", options.url, e.code().message()));
        outcome.connection_error = e.code().message();
    }
    return outcome;
}

int exit_code_for(const submit_outcome &outcome) {
    if (!outcome.summary || outcome.summary->phase != job_phase::COMPLETED)
        return 2;
    return outcome.summary->result == verdict::ACCEPTED ? 0 : 1;
}

}  // namespace arbiter::client
