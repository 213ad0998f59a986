#include "server/protocol.hpp"
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include "common/json_utils.hpp"
#include "common/status.hpp"
#include "common/stl_utils.hpp"
#include "common/utils.hpp"

namespace arbiter::server {
using namespace std;
using nlohmann::json;

static void put_optional(json &j, const char *key, const optional<string> &value) {
    if (value) j[key] = *value;
}

static json case_to_json(const case_result &result) {
    return {{"case", result.case_id},
            {"verdict", to_string(result.result)},
            {"detail", result.detail},
            {"time", result.time},
            {"memory", result.memory}};
}

static case_result case_from_json(const json &j) {
    case_result result;
    result.case_id = nlohmann::get_value<string>(j, "case");
    result.result = parse_verdict(nlohmann::get_value<string>(j, "verdict"));
    result.detail = nlohmann::get_value_def<string>(j, "", "detail");
    result.time = nlohmann::get_value_def<double>(j, 0, "time");
    result.memory = nlohmann::get_value_def<int64_t>(j, 0, "memory");
    return result;
}

string encode(const client_message &message) {
    json j = visit(overloaded{
                       [](const submit_message &m) {
                           json j = {{"type", "submit"}, {"token", m.token}, {"digest", m.digest}};
                           if (m.archive) j["archive"] = base64_encode(*m.archive);
                           put_optional(j, "spec", m.spec);
                           put_optional(j, "spec_path", m.spec_path);
                           return j;
                       },
                       [](const cancel_message &m) {
                           return json{{"type", "cancel"}, {"job", m.job}};
                       },
                       [](const ping_message &m) {
                           json j = {{"type", "ping"}};
                           put_optional(j, "nonce", m.nonce);
                           return j;
                       }},
                   message);
    return j.dump();
}

string encode(const server_message &message) {
    json j = visit(overloaded{
                       [](const accepted_message &m) {
                           return json{{"type", "accepted"}, {"token", m.token}, {"job", m.job}};
                       },
                       [](const case_result_message &m) {
                           json j = case_to_json(m.result);
                           j["type"] = "case_result";
                           j["job"] = m.job;
                           return j;
                       },
                       [](const job_complete_message &m) {
                           json cases = json::array();
                           for (auto &result : m.summary.cases)
                               cases.push_back(case_to_json(result));
                           return json{{"type", "job_complete"},
                                       {"job", m.summary.job},
                                       {"phase", to_string(m.summary.phase)},
                                       {"verdict", to_string(m.summary.result)},
                                       {"cases", cases}};
                       },
                       [](const error_message &m) {
                           json j = {{"type", "error"}, {"kind", to_string(m.kind)}, {"message", m.message}};
                           put_optional(j, "job", m.job);
                           return j;
                       },
                       [](const pong_message &m) {
                           json j = {{"type", "pong"}};
                           put_optional(j, "nonce", m.nonce);
                           return j;
                       }},
                   message);
    // 错误信息和程序输出可能不是合法的 UTF-8
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

static json parse_message(const string &text) {
    json j;
    try {
        j = json::parse(text);
    } catch (json::parse_error &e) {
        throw protocol_error(fmt::format("malformed JSON: {}", e.what()));
    }
    if (!j.is_object())
        throw protocol_error("message must be a JSON object");
    if (!j.contains("type") || !j["type"].is_string())
        throw protocol_error("message has no type");
    return j;
}

client_message decode_client_message(const string &text) {
    json j = parse_message(text);
    string type = j["type"].get<string>();
    try {
        if (type == "submit") {
            submit_message m;
            m.token = nlohmann::get_value<string>(j, "token");
            m.digest = nlohmann::get_value<string>(j, "digest");
            if (auto archive = nlohmann::get_optional<string>(j, "archive"))
                m.archive = base64_decode(*archive);
            m.spec = nlohmann::get_optional<string>(j, "spec");
            m.spec_path = nlohmann::get_optional<string>(j, "spec_path");
            if (m.spec.has_value() == m.spec_path.has_value())
                throw protocol_error("submit needs exactly one of spec and spec_path");
            return m;
        } else if (type == "cancel") {
            return cancel_message{nlohmann::get_value<string>(j, "job")};
        } else if (type == "ping") {
            return ping_message{nlohmann::get_optional<string>(j, "nonce")};
        }
    } catch (invalid_argument &e) {
        throw protocol_error(fmt::format("malformed {} message: {}", type, e.what()));
    }
    throw protocol_error("unknown message type " + type);
}

server_message decode_server_message(const string &text) {
    json j = parse_message(text);
    string type = j["type"].get<string>();
    try {
        if (type == "accepted") {
            return accepted_message{nlohmann::get_value<string>(j, "token"), nlohmann::get_value<string>(j, "job")};
        } else if (type == "case_result") {
            return case_result_message{nlohmann::get_value<string>(j, "job"), case_from_json(j)};
        } else if (type == "job_complete") {
            job_complete_message m;
            m.summary.job = nlohmann::get_value<string>(j, "job");
            m.summary.phase = parse_job_phase(nlohmann::get_value<string>(j, "phase"));
            m.summary.result = parse_verdict(nlohmann::get_value<string>(j, "verdict"));
            for (auto &item : nlohmann::access_optional(j, "cases"))
                m.summary.cases.push_back(case_from_json(item));
            return m;
        } else if (type == "error") {
            error_message m;
            m.job = nlohmann::get_optional<string>(j, "job");
            m.kind = parse_error_kind(nlohmann::get_value<string>(j, "kind"));
            m.message = nlohmann::get_value_def<string>(j, "", "message");
            return m;
        } else if (type == "pong") {
            return pong_message{nlohmann::get_optional<string>(j, "nonce")};
        }
    } catch (invalid_argument &e) {
        throw protocol_error(fmt::format("malformed {} message: {}", type, e.what()));
    }
    throw protocol_error("unknown message type " + type);
}

const char *type_name(const client_message &message) {
    return visit(overloaded{
                     [](const submit_message &) { return "submit"; },
                     [](const cancel_message &) { return "cancel"; },
                     [](const ping_message &) { return "ping"; }},
                 message);
}

const char *type_name(const server_message &message) {
    return visit(overloaded{
                     [](const accepted_message &) { return "accepted"; },
                     [](const case_result_message &) { return "case_result"; },
                     [](const job_complete_message &) { return "job_complete"; },
                     [](const error_message &) { return "error"; },
                     [](const pong_message &) { return "pong"; }},
                 message);
}

}  // namespace arbiter::server
