#include "judge/verifier.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <string.h>
#include <boost/asio/post.hpp>
#include <boost/regex.hpp>
#include <vector>
#include "common/blocking.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "env.hpp"

namespace arbiter {
using namespace std;

const char *CHECKER_INPUT_FILE = ".arbiter-check/input";
const char *CHECKER_OUTPUT_FILE = ".arbiter-check/output";
const char *CHECKER_ANSWER_FILE = ".arbiter-check/expected";

static vector<string_view> normalized_lines(const string &text) {
    vector<string_view> lines;
    string_view rest(text);
    while (true) {
        size_t pos = rest.find('\n');
        string_view line = rest.substr(0, pos);
        size_t end = line.find_last_not_of(" \t\r");
        lines.push_back(end == string_view::npos ? string_view() : line.substr(0, end + 1));
        if (pos == string_view::npos) break;
        rest.remove_prefix(pos + 1);
    }
    while (!lines.empty() && lines.back().empty())
        lines.pop_back();
    return lines;
}

bool exact_match(const string &output, const string &expected) {
    return normalized_lines(output) == normalized_lines(expected);
}

static string describe_signal(int sig) {
    const char *name = strsignal(sig);
    return fmt::format("killed by signal {} ({})", sig, name ? name : "unknown");
}

/**
 * @brief 标准错误输出的末尾部分，附在运行时错误的说明后面
 */
static string error_tail(const sandbox_result &result) {
    const size_t max_length = 512;
    if (result.error_output.empty()) return "";
    if (result.error_output.size() <= max_length) return "\n" + result.error_output;
    return "\n..." + result.error_output.substr(result.error_output.size() - max_length);
}

/**
 * @brief 比较程序的标准输出作为说明，只保留开头部分
 */
static string checker_message(const sandbox_result &checker) {
    const size_t max_length = 1024;
    if (checker.output.size() <= max_length) return checker.output;
    return checker.output.substr(0, max_length) + "...";
}

static optional<verification> check_limits(const sandbox_result &result) {
    switch (result.limit) {
        case limit_violation::NONE:
            return nullopt;
        case limit_violation::TIME:
            return verification{verdict::TIME_LIMIT_EXCEEDED,
                                fmt::format("cpu time {:.3f}s, wall time {:.3f}s", result.cpu_time, result.wall_time)};
        case limit_violation::MEMORY:
            return verification{verdict::MEMORY_LIMIT_EXCEEDED, fmt::format("peak memory {}KB", result.memory)};
        case limit_violation::OUTPUT:
            return verification{verdict::RUNTIME_ERROR, "file size limit exceeded"};
    }
    return nullopt;
}

static optional<verification> check_termination(const sandbox_result &result) {
    if (!result.exec_error.empty())
        return verification{verdict::RUNTIME_ERROR, result.exec_error};
    if (result.term_signal != 0)
        return verification{verdict::RUNTIME_ERROR, describe_signal(result.term_signal) + error_tail(result)};
    if (result.exit_code != 0)
        return verification{verdict::RUNTIME_ERROR, fmt::format("exit code {}", result.exit_code) + error_tail(result)};
    return nullopt;
}

/**
 * @brief 超出资源限制或者异常退出时的判定，不需要比较输出
 */
static optional<verification> check_outcome(const sandbox_result &result) {
    // 超时优先于一切，哪怕程序最后正常退出并且输出正确
    if (auto limited = check_limits(result))
        return limited;
    return check_termination(result);
}

/**
 * @brief 按精确比较或者正则表达式规则比较输出，比较程序规则返回 nullopt
 */
static optional<verification> match_output(const sandbox_result &result, const expected_rule &expected) {
    string suffix = result.output_truncated
                        ? fmt::format(" (output truncated at {} of {} bytes)", result.output.size(), result.output_size)
                        : "";

    return visit([&](auto &&rule) -> optional<verification> {
        using T = decay_t<decltype(rule)>;
        if constexpr (is_same_v<T, exact_rule>) {
            if (exact_match(result.output, rule.expected))
                return verification{verdict::ACCEPTED, ""};
            return verification{verdict::WRONG_ANSWER, "output differs from the expected output" + suffix};
        } else if constexpr (is_same_v<T, pattern_rule>) {
            try {
                if (boost::regex_match(result.output, rule.pattern))
                    return verification{verdict::ACCEPTED, ""};
            } catch (std::runtime_error &e) {
                // 回溯次数超过 boost::regex 的上限
                return verification{verdict::CHECKER_ERROR,
                                    fmt::format("output could not be matched against /{}/: {}", rule.source, e.what())};
            }
            return verification{verdict::WRONG_ANSWER, fmt::format("output does not match /{}/", rule.source) + suffix};
        } else {
            return nullopt;
        }
    }, expected);
}

optional<verification> verify(const sandbox_result &result, const test_case &test) {
    if (auto verified = check_outcome(result))
        return verified;
    return match_output(result, test.expected);
}

sandbox_request make_checker_request(const test_case &test, const checker_rule &rule,
                                     const sandbox_result &result, const filesystem::path &exec_dir) {
    sandbox_request request;
    string program = rule.program.find('/') == string::npos ? "./" + rule.program : rule.program;
    request.command = {program, CHECKER_INPUT_FILE, CHECKER_OUTPUT_FILE, CHECKER_ANSWER_FILE};
    request.limits = CHECKER_LIMITS;
    request.populate_from = exec_dir;
    request.files[CHECKER_INPUT_FILE] = test.input;
    request.files[CHECKER_OUTPUT_FILE] = result.output;
    request.files[CHECKER_ANSWER_FILE] = rule.answer;
    request.env = checker_environment();
    return request;
}

verification interpret_checker(exception_ptr error, const sandbox_result &checker) {
    if (error) {
        try {
            rethrow_exception(error);
        } catch (std::exception &e) {
            return {verdict::CHECKER_ERROR, fmt::format("checker could not be run: {}", e.what())};
        }
    }

    if (checker.cancelled)
        return {verdict::CHECKER_ERROR, "checker was cancelled"};
    if (!checker.exec_error.empty())
        return {verdict::CHECKER_ERROR, checker.exec_error};
    if (checker.limit != limit_violation::NONE)
        return {verdict::CHECKER_ERROR, fmt::format("checker exceeded its {} limit", to_string(checker.limit))};
    if (checker.term_signal != 0)
        return {verdict::CHECKER_ERROR, "checker " + describe_signal(checker.term_signal)};

    switch (checker.exit_code) {
        case E_ACCEPTED:
            return {verdict::ACCEPTED, checker_message(checker)};
        case E_WRONG_ANSWER:
            return {verdict::WRONG_ANSWER, checker_message(checker)};
        default:
            return {verdict::CHECKER_ERROR,
                    fmt::format("checker exited with unexpected code {}", checker.exit_code) + error_tail(checker)};
    }
}

void async_verify(sandbox_runner &runner, sandbox_result result, const test_case &test,
                  const filesystem::path &exec_dir, shared_ptr<cancellation> cancel,
                  function<void(verification)> done) {
    if (auto verified = check_outcome(result)) {
        boost::asio::post(runner.context(), [done = move(done), v = move(*verified)]() {
            done(v);
        });
        return;
    }

    if (!holds_alternative<checker_rule>(test.expected)) {
        // 标准输出最大有 STDOUT_LIMIT 字节，比较放在线程池中，不阻塞 io_context
        run_blocking(
            runner.blocking_pool(), runner.context(),
            [result = move(result), expected = test.expected]() {
                return *match_output(result, expected);
            },
            [done = move(done), id = test.id](exception_ptr error, optional<verification> v) {
                if (error) {
                    try {
                        rethrow_exception(error);
                    } catch (std::exception &e) {
                        LOG(ERROR) << "Unable to verify case " << id << ": " << e.what();
                        done({verdict::INTERNAL_ERROR, fmt::format("output could not be verified: {}", e.what())});
                    }
                    return;
                }
                done(move(*v));
            });
        return;
    }

    auto &rule = get<checker_rule>(test.expected);
    runner.async_run(make_checker_request(test, rule, result, exec_dir), move(cancel),
                     [done = move(done), id = test.id](exception_ptr error, sandbox_result checker) {
                         verification v = interpret_checker(error, checker);
                         if (v.result == verdict::CHECKER_ERROR)
                             LOG(WARNING) << "Checker failed on case " << id << ": " << v.detail;
                         done(v);
                     });
}

}  // namespace arbiter
