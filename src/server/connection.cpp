#include "server/connection.hpp"
#include <glog/logging.h>
#include <boost/asio/buffer.hpp>
#include <boost/lexical_cast.hpp>
#include "common/stl_utils.hpp"
#include "config.hpp"

namespace arbiter::server {
using namespace std;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace asio = boost::asio;

connection::connection(asio::ip::tcp::socket socket, job_services services, closed_handler on_closed)
    : ws(move(socket)),
      services(move(services)),
      on_closed(move(on_closed)),
      idle_timer(ws.get_executor()) {
    beast::error_code ec;
    auto endpoint = beast::get_lowest_layer(ws).socket().remote_endpoint(ec);
    remote = ec ? "unknown" : boost::lexical_cast<string>(endpoint);
}

void connection::start() {
    websocket::stream_base::timeout opt{};
    opt.handshake_timeout = chrono::seconds(30);
    opt.idle_timeout = websocket::stream_base::none();
    opt.keep_alive_pings = false;
    ws.set_option(opt);
    ws.read_message_max(MAX_MESSAGE_SIZE);
    ws.set_option(websocket::stream_base::decorator([](websocket::response_type &res) {
        res.set(beast::http::field::server, "arbiterd");
    }));

    ws.async_accept(beast::bind_front_handler(&connection::on_handshake, shared_from_this()));
}

void connection::on_handshake(beast::error_code ec) {
    if (ec) {
        LOG(WARNING) << "Handshake with " << remote << " failed: " << ec.message();
        drop("handshake failed");
        return;
    }

    current = state::OPEN;
    LOG(INFO) << "Connection from " << remote << " opened";
    touch();
    arm_idle_timer();
    do_read();
}

void connection::do_read() {
    ws.async_read(buffer, beast::bind_front_handler(&connection::on_read, shared_from_this()));
}

void connection::on_read(beast::error_code ec, size_t) {
    if (ec == websocket::error::closed) {
        LOG(INFO) << "Connection from " << remote << " closed by peer";
        cancel_jobs();
        closed();
        return;
    }
    if (ec) {
        if (current == state::OPEN)
            LOG(WARNING) << "Connection from " << remote << " broken: " << ec.message();
        drop(ec.message());
        return;
    }

    touch();
    string text = beast::buffers_to_string(buffer.data());
    buffer.consume(buffer.size());

    if (!ws.got_text()) {
        send(error_message{nullopt, error_kind::PROTOCOL, "binary frames are not supported"});
    } else {
        handle(text);
    }

    if (current == state::OPEN)
        do_read();
}

void connection::handle(const string &text) {
    client_message message;
    try {
        message = decode_client_message(text);
    } catch (protocol_error &e) {
        LOG(WARNING) << "Protocol error from " << remote << ": " << e.what();
        send(error_message{nullopt, error_kind::PROTOCOL, e.what()});
        return;
    }

    if (DEBUG)
        LOG(INFO) << "Received " << type_name(message) << " from " << remote;

    visit(overloaded{
              [this](submit_message &m) { handle_submit(m); },
              [this](cancel_message &m) { handle_cancel(m); },
              [this](ping_message &m) { send(pong_message{m.nonce}); }},
          message);
}

void connection::handle_submit(submit_message &message) {
    string id = make_job_id(message.digest);

    job_submission submission;
    submission.digest = message.digest;
    submission.archive = move(message.archive);
    submission.spec_text = move(message.spec);
    submission.spec_path = move(message.spec_path);

    weak_ptr<job_observer> observer = static_pointer_cast<job_observer>(shared_from_this());
    auto j = make_shared<job>(services, id, move(submission), observer);
    jobs[id] = j;

    send(accepted_message{message.token, id});
    j->start();
}

void connection::handle_cancel(const cancel_message &message) {
    auto it = jobs.find(message.job);
    if (it == jobs.end()) {
        send(error_message{message.job, error_kind::PROTOCOL, "unknown job " + message.job});
        return;
    }
    it->second->cancel();
}

void connection::on_case_result(const string &job, const case_result &result) {
    send(case_result_message{job, result});
}

void connection::on_job_complete(const job_summary &summary) {
    jobs.erase(summary.job);
    send(job_complete_message{summary});
}

void connection::on_job_error(const string &job, error_kind kind, const string &message) {
    send(error_message{job, kind, message});
}

void connection::send(server_message message) {
    if (current != state::OPEN) return;
    if (DEBUG)
        LOG(INFO) << "Sending " << type_name(message) << " to " << remote;
    outbox.push_back(encode(message));
    if (!writing) do_write();
}

void connection::do_write() {
    writing = true;
    ws.text(true);
    ws.async_write(asio::buffer(outbox.front()), beast::bind_front_handler(&connection::on_write, shared_from_this()));
}

void connection::on_write(beast::error_code ec, size_t) {
    writing = false;
    if (ec) {
        if (current == state::OPEN)
            LOG(WARNING) << "Unable to write to " << remote << ": " << ec.message();
        drop(ec.message());
        return;
    }

    outbox.pop_front();
    touch();
    if (!outbox.empty() && current == state::OPEN)
        do_write();
}

void connection::touch() {
    last_activity = chrono::steady_clock::now();
}

void connection::arm_idle_timer() {
    idle_timer.expires_at(last_activity + IDLE_TIMEOUT);
    idle_timer.async_wait(beast::bind_front_handler(&connection::on_idle, shared_from_this()));
}

void connection::on_idle(beast::error_code ec) {
    if (ec || current != state::OPEN) return;

    if (chrono::steady_clock::now() < last_activity + IDLE_TIMEOUT) {
        arm_idle_timer();
        return;
    }

    LOG(INFO) << "Connection from " << remote << " idle for " << IDLE_TIMEOUT.count() << "s, closing";
    close("idle timeout");
}

void connection::close(const string &reason) {
    if (current == state::CLOSING || current == state::CLOSED) return;
    if (current == state::CONNECTING) {
        drop(reason);
        return;
    }

    current = state::CLOSING;
    cancel_jobs();
    idle_timer.cancel();

    websocket::close_reason cr(websocket::close_code::normal);
    cr.reason = reason;
    auto self = shared_from_this();
    ws.async_close(cr, [self](beast::error_code ec) {
        if (ec && ec != asio::error::operation_aborted)
            DLOG(INFO) << "Close handshake with " << self->remote << " failed: " << ec.message();
        self->drop("closed");
    });
}

void connection::cancel_jobs() {
    for (auto &[id, j] : jobs)
        j->cancel();
    // 任务自己持有自己直到运行结束，这里只是不再关心它们的结果
    jobs.clear();
}

void connection::drop(const string &reason) {
    if (current == state::CLOSED) return;
    cancel_jobs();
    beast::error_code ec;
    beast::get_lowest_layer(ws).socket().shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    beast::get_lowest_layer(ws).close();
    DLOG(INFO) << "Dropped connection from " << remote << ": " << reason;
    closed();
}

void connection::closed() {
    if (current == state::CLOSED) return;
    current = state::CLOSED;
    idle_timer.cancel();
    outbox.clear();
    if (on_closed) on_closed(this);
}

connection::state connection::current_state() const {
    return current;
}

size_t connection::job_count() const {
    return jobs.size();
}

const string &connection::peer() const {
    return remote;
}

}  // namespace arbiter::server
