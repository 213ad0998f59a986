#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "common/status.hpp"
#include "sandbox/sandbox.hpp"
#include "spec/test_spec.hpp"

/**
 * 这个头文件包含评测结果的判定
 * 判定顺序：
 * 1. 是否超出资源限制（超时、超内存、输出超限）
 * 2. 是否异常退出（非零退出码、被信号终止、无法执行）
 * 3. 输出是否符合测试配置中的规则
 * 前面的检查成立时不会进行后面的检查。
 */
namespace arbiter {

/**
 * @brief 一个数据点的判定结果
 */
struct verification {
    verdict result = verdict::INTERNAL_ERROR;

    /**
     * @brief 给用户看的说明，比如超时的具体时间、程序的退出码
     */
    std::string detail;
};

/**
 * @brief 同步判定
 * 正则表达式回溯过多时得到 CHECKER_ERROR，不会抛出异常。
 * @return 规则是比较程序且前两步都没有得出结果时返回 nullopt，需要调用 async_verify
 */
std::optional<verification> verify(const sandbox_result &result, const test_case &test);

/**
 * @brief 忽略行末空白字符（空格、制表符、\r）和文末空行后比较
 * 行首空白字符和行内空白字符都会被比较
 */
bool exact_match(const std::string &output, const std::string &expected);

/**
 * @brief 比较程序运行时的文件，相对于比较程序的工作目录
 */
extern const char *CHECKER_INPUT_FILE;
extern const char *CHECKER_OUTPUT_FILE;
extern const char *CHECKER_ANSWER_FILE;

/**
 * @brief 构造运行比较程序的请求
 * 比较程序在一个新的工作目录中运行，目录内容从 exec_dir 复制，
 * 以 program input output answer 的形式调用。
 */
sandbox_request make_checker_request(const test_case &test, const checker_rule &rule,
                                     const sandbox_result &result, const std::filesystem::path &exec_dir);

/**
 * @brief 根据比较程序的运行结果得出判定
 * 只有退出码为 E_ACCEPTED 或者 E_WRONG_ANSWER 时才会得到 ACCEPTED 或 WRONG_ANSWER，
 * 其他所有情况（崩溃、超时、无法运行）都是 CHECKER_ERROR。
 */
verification interpret_checker(std::exception_ptr error, const sandbox_result &checker);

/**
 * @brief 完整的判定流程
 * 输出比较在线程池中进行，需要比较程序时在沙箱中运行比较程序。
 * done 在 io_context 线程中恰好调用一次
 */
void async_verify(sandbox_runner &runner, sandbox_result result, const test_case &test,
                  const std::filesystem::path &exec_dir, std::shared_ptr<cancellation> cancel,
                  std::function<void(verification)> done);

}  // namespace arbiter
