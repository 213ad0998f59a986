#pragma once

#include <optional>
#include <string>
#include <variant>
#include "common/exceptions.hpp"
#include "judge/job.hpp"

/**
 * 这个头文件包含客户端与评测服务之间的消息
 * 每条 WebSocket 文本消息是一个 JSON 对象，type 字段表示消息类型：
 *
 * 客户端 → 服务端：
 *   submit    {token, digest, archive?, spec?, spec_path?}
 *   cancel    {job}
 *   ping      {nonce?}
 *
 * 服务端 → 客户端：
 *   accepted      {token, job}
 *   case_result   {job, case, verdict, detail, time, memory}
 *   job_complete  {job, phase, verdict, cases}
 *   error         {job?, kind, message}
 *   pong          {nonce?}
 *
 * archive 是 base64 编码的压缩包。
 */
namespace arbiter::server {

/**
 * @brief 提交一个任务
 * token 由客户端生成，accepted 消息会带回同样的 token，用于对应提交与任务编号
 */
struct submit_message {
    std::string token;
    std::string digest;

    /**
     * @brief 已经解码的压缩包内容
     */
    std::optional<std::string> archive;

    std::optional<std::string> spec;
    std::optional<std::string> spec_path;
};

struct cancel_message {
    std::string job;
};

struct ping_message {
    std::optional<std::string> nonce;
};

using client_message = std::variant<submit_message, cancel_message, ping_message>;

struct accepted_message {
    std::string token;
    std::string job;
};

struct case_result_message {
    std::string job;
    case_result result;
};

struct job_complete_message {
    job_summary summary;
};

struct error_message {
    /**
     * @brief 为空表示错误属于整个连接
     */
    std::optional<std::string> job;
    error_kind kind = error_kind::PROTOCOL;
    std::string message;
};

struct pong_message {
    std::optional<std::string> nonce;
};

using server_message = std::variant<accepted_message, case_result_message, job_complete_message, error_message, pong_message>;

std::string encode(const client_message &message);

std::string encode(const server_message &message);

/**
 * @throw protocol_error JSON 格式错误、未知的消息类型或者字段错误
 */
client_message decode_client_message(const std::string &text);

/**
 * @throw protocol_error JSON 格式错误、未知的消息类型或者字段错误
 */
server_message decode_server_message(const std::string &text);

/**
 * @brief 消息的类型名，用于日志
 */
const char *type_name(const client_message &message);

const char *type_name(const server_message &message);

}  // namespace arbiter::server
