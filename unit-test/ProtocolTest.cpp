#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <thread>
#include "client/client.hpp"
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "server/listener.hpp"
#include "server/protocol.hpp"
#include "test/assertions.hpp"
#include "test/harness.hpp"

using namespace std;
using namespace arbiter;
using namespace arbiter::server;
using namespace arbiter::test;
using nlohmann::json;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using boost::asio::ip::tcp;

TEST(ProtocolTest, EncodesSubmitWithBase64Archive) {
    submit_message submit;
    submit.token = "t1";
    submit.digest = string(64, 'a');
    submit.archive = string("\0\1binary\xff", 9);
    submit.spec_path = "spec.json";

    json j = json::parse(encode(client_message(submit)));
    EXPECT_EQ(j["type"], "submit");
    EXPECT_EQ(j["archive"], "AAFiaW5hcnn/");
    EXPECT_FALSE(j.contains("spec"));

    auto decoded = get<submit_message>(decode_client_message(j.dump()));
    EXPECT_EQ(decoded.archive, submit.archive);
    EXPECT_EQ(decoded.spec_path, submit.spec_path);
    EXPECT_FALSE(decoded.spec);
}

TEST(ProtocolTest, EncodesCaseResult) {
    case_result result{"three", verdict::TIME_LIMIT_EXCEEDED, "cpu time 1.010s", 1.01, 2048};
    json j = json::parse(encode(server_message(case_result_message{"job-1", result})));
    EXPECT_JSON_EQ(j, json({{"type", "case_result"},
                            {"job", "job-1"},
                            {"case", "three"},
                            {"verdict", "time_limit_exceeded"},
                            {"detail", "cpu time 1.010s"},
                            {"time", 1.01},
                            {"memory", 2048}}));
}

TEST(ProtocolTest, DecodesJobComplete) {
    auto message = decode_server_message(R"({
        "type": "job_complete", "job": "j", "phase": "completed", "verdict": "wrong_answer",
        "cases": [{"case": "1", "verdict": "accepted"}, {"case": "2", "verdict": "wrong_answer", "detail": "differs"}]
    })");
    auto &summary = get<job_complete_message>(message).summary;
    EXPECT_EQ(summary.phase, job_phase::COMPLETED);
    EXPECT_EQ(summary.result, verdict::WRONG_ANSWER);
    ASSERT_EQ(summary.cases.size(), 2);
    EXPECT_EQ(summary.cases[1].detail, "differs");
    EXPECT_STREQ(type_name(message), "job_complete");
}

TEST(ProtocolTest, ErrorsKeepTheirJob) {
    json j = json::parse(encode(server_message(error_message{string("j-1"), error_kind::ARCHIVE, "not cached"})));
    EXPECT_EQ(j["job"], "j-1");
    EXPECT_EQ(j["kind"], "archive");

    j = json::parse(encode(server_message(error_message{nullopt, error_kind::PROTOCOL, "bad"})));
    EXPECT_FALSE(j.contains("job"));
}

TEST(ProtocolTest, InvalidUtf8IsReplaced) {
    case_result result{"1", verdict::WRONG_ANSWER, "bad \xff\xfe bytes"};
    EXPECT_NO_THROW(json::parse(encode(server_message(case_result_message{"j", result}))));
}

TEST(ProtocolTest, RejectsMalformedMessages) {
    EXPECT_THROW(decode_client_message("not json"), protocol_error);
    EXPECT_THROW(decode_client_message("[1, 2]"), protocol_error);
    EXPECT_THROW(decode_client_message(R"({"job": "x"})"), protocol_error);
    EXPECT_THROW(decode_client_message(R"({"type": "launch"})"), protocol_error);
    EXPECT_THROW(decode_client_message(R"({"type": "cancel"})"), protocol_error);
    EXPECT_THROW(decode_client_message(R"({"type": "submit", "token": "t", "digest": "d"})"), protocol_error);
    EXPECT_THROW(decode_client_message(R"({"type": "submit", "token": "t", "digest": "d", "spec": "{}", "spec_path": "s"})"), protocol_error);
    EXPECT_THROW(decode_client_message(R"({"type": "submit", "token": "t", "digest": "d", "spec": "{}", "archive": "***"})"), protocol_error);
    EXPECT_THROW(decode_server_message(R"({"type": "case_result", "job": "j", "case": "1", "verdict": "great"})"), protocol_error);
}

TEST(ProtocolTest, ParsesEndpointsAndUrls) {
    EXPECT_EQ(parse_endpoint("127.0.0.1:8787").port(), 8787);
    EXPECT_TRUE(parse_endpoint("*:80").address().is_unspecified());
    EXPECT_TRUE(parse_endpoint("[::1]:80").address().is_v6());
    EXPECT_THROW(parse_endpoint("localhost"), invalid_argument);
    EXPECT_THROW(parse_endpoint("1.2.3.4:99999"), invalid_argument);

    auto url = client::parse_url("wss://judge.example.com/api");
    EXPECT_TRUE(url.secure);
    EXPECT_EQ(url.host, "judge.example.com");
    EXPECT_EQ(url.port, "443");
    EXPECT_EQ(url.target, "/api");
    EXPECT_EQ(client::parse_url("ws://[::1]:9000").host, "::1");
    EXPECT_THROW(client::parse_url("http://host"), invalid_argument);
}

TEST(ProtocolTest, ExitCodes) {
    client::submit_outcome outcome;
    EXPECT_EQ(client::exit_code_for(outcome), 2);
    outcome.summary = job_summary{"j", job_phase::COMPLETED, verdict::ACCEPTED, {}};
    EXPECT_EQ(client::exit_code_for(outcome), 0);
    outcome.summary->result = verdict::WRONG_ANSWER;
    EXPECT_EQ(client::exit_code_for(outcome), 1);
    outcome.summary->phase = job_phase::CANCELLED;
    EXPECT_EQ(client::exit_code_for(outcome), 2);
}

/**
 * @brief 在 io_context 线程中运行服务端，在另一个线程中运行客户端
 */
class LoopbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = make_shared<listener>(h.ioc, parse_endpoint("127.0.0.1:0"), h.services);
        server->run();
        url = "ws://127.0.0.1:" + std::to_string(server->local_endpoint().port());
    }

    void TearDown() override {
        server->stop();
        h.run_until([this] { return server->connection_count() == 0 && h.runner.active() == 0; });
    }

    /**
     * @brief 在另一个线程中执行 action，同时运行服务端直到 action 结束
     */
    void with_client(function<void()> action) {
        atomic<bool> done{false};
        thread client_thread([&] {
            try {
                action();
            } catch (std::exception &e) {
                ADD_FAILURE() << "client failed: " << e.what();
            }
            done = true;
        });
        EXPECT_TRUE(h.run_until([&] { return done.load(); }, chrono::seconds(30)));
        client_thread.join();
    }

    test_harness h;
    shared_ptr<listener> server;
    string url;
};

TEST_F(LoopbackTest, SubmitsAndReceivesVerdicts) {
    client::submit_options options;
    options.url = url;
    options.archive = pack_archive({script("solution", "#!/bin/sh\nread n\necho $((n * n))\n")});
    options.spec_text = R"({"cases": [
        {"id": "a", "input": "3", "expected": {"exact": "9"}},
        {"id": "b", "input": "4", "expected": {"exact": "17"}}
    ]})";
    options.timeout = chrono::seconds(20);

    vector<case_result> streamed;
    string accepted;
    client::submit_callbacks callbacks;
    callbacks.on_accepted = [&](const string &job) { accepted = job; };
    callbacks.on_case_result = [&](const case_result &result) { streamed.push_back(result); };

    client::submit_outcome outcome;
    with_client([&] { outcome = client::submit_job(options, callbacks); });

    EXPECT_FALSE(outcome.timed_out);
    EXPECT_EQ(outcome.job, accepted);
    ASSERT_TRUE(outcome.summary);
    EXPECT_EQ(outcome.summary->phase, job_phase::COMPLETED);
    EXPECT_EQ(outcome.summary->result, verdict::WRONG_ANSWER);
    EXPECT_EQ(streamed.size(), 2);
    EXPECT_EQ(client::exit_code_for(outcome), 1);
}

TEST_F(LoopbackTest, UncachedDigestWithoutArchiveIsRejected) {
    client::submit_options options;
    options.url = url;
    options.archive = pack_archive({text("never-sent", "x")});
    options.send_archive = false;
    options.spec_text = R"({"cases": [{"id": "a", "expected": {"exact": ""}}]})";
    options.timeout = chrono::seconds(20);

    client::submit_outcome outcome;
    with_client([&] { outcome = client::submit_job(options); });

    ASSERT_TRUE(outcome.summary);
    EXPECT_EQ(outcome.summary->phase, job_phase::FAILED);
    ASSERT_EQ(outcome.errors.size(), 1);
    EXPECT_EQ(outcome.errors[0].kind, error_kind::ARCHIVE);
    EXPECT_EQ(outcome.errors[0].job, outcome.job);
    EXPECT_EQ(client::exit_code_for(outcome), 2);
}

TEST_F(LoopbackTest, AnswersPingsAndReportsProtocolErrors) {
    vector<json> replies;
    with_client([&] {
        boost::asio::io_context ioc;
        tcp::resolver resolver(ioc);
        websocket::stream<tcp::socket> ws(ioc);
        boost::asio::connect(ws.next_layer(), resolver.resolve("127.0.0.1", std::to_string(server->local_endpoint().port())));
        ws.handshake("127.0.0.1", "/");
        ws.text(true);

        for (string request : {R"({"type": "ping", "nonce": "n1"})",
                               "{ this is not json",
                               R"({"type": "cancel", "job": "nope"})"}) {
            ws.write(boost::asio::buffer(request));
            beast::flat_buffer buffer;
            ws.read(buffer);
            replies.push_back(json::parse(beast::buffers_to_string(buffer.data())));
        }
        ws.close(websocket::close_code::normal);
    });

    ASSERT_EQ(replies.size(), 3);
    EXPECT_JSON_EQ(replies[0], json({{"type", "pong"}, {"nonce", "n1"}}));
    EXPECT_EQ(replies[1]["type"], "error");
    EXPECT_EQ(replies[1]["kind"], "protocol");
    EXPECT_FALSE(replies[1].contains("job"));
    EXPECT_EQ(replies[2]["kind"], "protocol");
    EXPECT_EQ(replies[2]["job"], "nope");
}

TEST_F(LoopbackTest, DisconnectCancelsJobs) {
    with_client([&] {
        boost::asio::io_context ioc;
        tcp::resolver resolver(ioc);
        websocket::stream<tcp::socket> ws(ioc);
        boost::asio::connect(ws.next_layer(), resolver.resolve("127.0.0.1", std::to_string(server->local_endpoint().port())));
        ws.handshake("127.0.0.1", "/");
        ws.text(true);

        packed_archive archive = pack_archive({script("solution", "#!/bin/sh\nsleep 30\n")});
        submit_message submit;
        submit.token = "slow";
        submit.digest = archive.digest;
        submit.archive = archive.bytes;
        submit.spec = R"({"limits": {"time": 60, "wall_time": 60}, "cases": [{"id": "a", "expected": {"exact": ""}}]})";
        ws.write(boost::asio::buffer(encode(client_message(submit))));

        beast::flat_buffer buffer;
        ws.read(buffer);
        auto accepted = get<accepted_message>(decode_server_message(beast::buffers_to_string(buffer.data())));
        EXPECT_EQ(accepted.token, "slow");

        // 等待程序启动后直接断开
        this_thread::sleep_for(chrono::milliseconds(500));
        ws.next_layer().close();
    });

    auto start = chrono::steady_clock::now();
    EXPECT_TRUE(h.run_until([&] { return server->connection_count() == 0 && h.runner.active() == 0; }));
    EXPECT_LT(chrono::steady_clock::now() - start, chrono::seconds(10));
    EXPECT_EQ(h.leftover_runs(), 0);
}
