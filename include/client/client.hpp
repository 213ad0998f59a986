#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "archive/archive.hpp"
#include "judge/job.hpp"
#include "server/protocol.hpp"

/**
 * 这个头文件包含评测服务的客户端
 * 客户端打包提交、建立连接、发送 submit 消息，然后等待该任务的所有结果。
 * 支持 ws:// 和 wss://，wss:// 使用系统默认的证书校验。
 */
namespace arbiter::client {

struct server_url {
    bool secure = false;
    std::string host;
    std::string port;
    std::string target = "/";
};

/**
 * @brief 解析 ws://host:port/path 或 wss://host:port/path
 * @throw std::invalid_argument 地址格式错误
 */
server_url parse_url(const std::string &url);

struct submit_options {
    std::string url;

    packed_archive archive;

    /**
     * @brief 为假时只发送摘要，服务端必须已经缓存了该提交
     */
    bool send_archive = true;

    std::optional<std::string> spec_text;
    std::optional<std::string> spec_path;

    /**
     * @brief 等待结果的最长时间，0 表示不限制
     */
    std::chrono::seconds timeout{0};

    /**
     * @brief 发送 ping 的间隔，避免连接因为长时间没有消息被服务端关闭
     */
    std::chrono::seconds ping_interval{20};
};

struct submit_callbacks {
    std::function<void(const std::string &job)> on_accepted;
    std::function<void(const case_result &result)> on_case_result;
    std::function<void(const server::error_message &error)> on_error;

    /**
     * @brief 收到的每一条原始消息
     */
    std::function<void(const std::string &text)> on_message;
};

struct submit_outcome {
    std::string job;

    /**
     * @brief 收到 job_complete 时有值
     */
    std::optional<job_summary> summary;

    std::vector<server::error_message> errors;

    bool timed_out = false;

    /**
     * @brief 连接异常断开的原因
     */
    std::string connection_error;
};

/**
 * @brief 提交任务并等待结束，回调在调用线程中执行
 * @throw protocol_error 无法连接或者握手失败
 */
submit_outcome submit_job(const submit_options &options, const submit_callbacks &callbacks = {});

/**
 * @brief 命令行的退出码：全部通过为 0，其他评测结果为 1，任务失败、被取消或者连接断开为 2
 */
int exit_code_for(const submit_outcome &outcome);

}  // namespace arbiter::client
