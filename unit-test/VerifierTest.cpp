#include <signal.h>
#include <optional>
#include "config.hpp"
#include "gtest/gtest.h"
#include "judge/verifier.hpp"
#include "test/harness.hpp"

using namespace std;
using namespace arbiter;
using namespace arbiter::test;
namespace fs = std::filesystem;

static test_case exact_case(const string &expected) {
    test_case test;
    test.id = "1";
    test.expected = exact_rule{expected, ""};
    return test;
}

static test_case checker_case(const string &program, const string &answer = "") {
    test_case test;
    test.id = "1";
    test.input = "3\n";
    checker_rule rule;
    rule.program = program;
    rule.answer = answer;
    test.expected = rule;
    return test;
}

static sandbox_result exited(const string &output, int code = 0) {
    sandbox_result result;
    result.exit_code = code;
    result.output = output;
    result.output_size = output.size();
    return result;
}

TEST(VerifierTest, ExactMatchIgnoresTrailingWhitespace) {
    EXPECT_TRUE(exact_match("9\n", "9"));
    EXPECT_TRUE(exact_match("9 \t\r\n\n\n", "9\n"));
    EXPECT_TRUE(exact_match("a b\nc\n", "a b  \nc"));
    EXPECT_TRUE(exact_match("", "\n\n"));
    EXPECT_FALSE(exact_match(" 9\n", "9\n"));
    EXPECT_FALSE(exact_match("a  b\n", "a b\n"));
    EXPECT_FALSE(exact_match("9\n\n10\n", "9\n10\n"));
    EXPECT_FALSE(exact_match("90\n", "9\n"));
}

TEST(VerifierTest, LimitsTakePrecedence) {
    sandbox_result result = exited("9\n");
    result.limit = limit_violation::TIME;
    EXPECT_EQ(verify(result, exact_case("9\n"))->result, verdict::TIME_LIMIT_EXCEEDED);

    result.limit = limit_violation::MEMORY;
    result.exit_code = 1;
    EXPECT_EQ(verify(result, exact_case("9\n"))->result, verdict::MEMORY_LIMIT_EXCEEDED);

    result.limit = limit_violation::OUTPUT;
    EXPECT_EQ(verify(result, exact_case("9\n"))->result, verdict::RUNTIME_ERROR);

    // 超时的比较程序规则同样不需要运行比较程序
    result.limit = limit_violation::TIME;
    auto verified = verify(result, checker_case("check.sh"));
    ASSERT_TRUE(verified);
    EXPECT_EQ(verified->result, verdict::TIME_LIMIT_EXCEEDED);
}

TEST(VerifierTest, AbnormalTerminationIsRuntimeError) {
    sandbox_result result = exited("9\n", 3);
    auto verified = verify(result, exact_case("9\n"));
    EXPECT_EQ(verified->result, verdict::RUNTIME_ERROR);
    EXPECT_NE(verified->detail.find("exit code 3"), string::npos);

    result = exited("9\n", -1);
    result.term_signal = SIGSEGV;
    result.error_output = "segfault at 0";
    verified = verify(result, exact_case("9\n"));
    EXPECT_EQ(verified->result, verdict::RUNTIME_ERROR);
    EXPECT_NE(verified->detail.find("segfault at 0"), string::npos);

    result = exited("", -1);
    result.exec_error = "./solution: No such file or directory";
    EXPECT_EQ(verify(result, exact_case(""))->result, verdict::RUNTIME_ERROR);
}

TEST(VerifierTest, OutputRules) {
    EXPECT_EQ(verify(exited("9\n"), exact_case("9\n"))->result, verdict::ACCEPTED);
    EXPECT_EQ(verify(exited("8\n"), exact_case("9\n"))->result, verdict::WRONG_ANSWER);

    test_case pattern;
    pattern.id = "p";
    pattern.expected = pattern_rule{"[0-9]+\\n", compile_pattern("[0-9]+\\n")};
    EXPECT_EQ(verify(exited("123\n"), pattern)->result, verdict::ACCEPTED);
    EXPECT_EQ(verify(exited("123\nextra\n"), pattern)->result, verdict::WRONG_ANSWER);

    sandbox_result truncated = exited("9\n");
    truncated.output_truncated = true;
    truncated.output_size = 1 << 30;
    auto verified = verify(truncated, exact_case("9\n10\n"));
    EXPECT_EQ(verified->result, verdict::WRONG_ANSWER);
    EXPECT_NE(verified->detail.find("truncated"), string::npos);

    EXPECT_FALSE(verify(exited("9\n"), checker_case("check.sh")));
}

static test_case pattern_case(const string &source) {
    test_case test;
    test.id = "p";
    test.expected = pattern_rule{source, compile_pattern(source)};
    return test;
}

TEST(VerifierTest, PatternMatchesLargeOutput) {
    // 4 MiB 的输出不能让匹配过程递归过深
    string output(4 << 20, 'a');
    output += "\n";
    EXPECT_EQ(verify(exited(output), pattern_case("a*\\n"))->result, verdict::ACCEPTED);
    EXPECT_EQ(verify(exited(output), pattern_case(".*\\n"))->result, verdict::ACCEPTED);
    EXPECT_EQ(verify(exited(output), pattern_case("(a|b)*\\n"))->result, verdict::ACCEPTED);
    EXPECT_EQ(verify(exited(output), pattern_case("b*\\n"))->result, verdict::WRONG_ANSWER);
}

TEST(VerifierTest, CatastrophicPatternIsCheckerError) {
    string output(64, 'a');
    auto verified = verify(exited(output), pattern_case("(a+)+b"));
    ASSERT_TRUE(verified);
    EXPECT_EQ(verified->result, verdict::CHECKER_ERROR);
    EXPECT_NE(verified->detail.find("(a+)+b"), string::npos);
}

TEST(VerifierTest, CheckerExitCodes) {
    sandbox_result checker = exited("looks good", E_ACCEPTED);
    EXPECT_EQ(interpret_checker(nullptr, checker).result, verdict::ACCEPTED);
    EXPECT_EQ(interpret_checker(nullptr, checker).detail, "looks good");

    checker.exit_code = E_WRONG_ANSWER;
    EXPECT_EQ(interpret_checker(nullptr, checker).result, verdict::WRONG_ANSWER);

    // 崩溃、超时或者其他退出码都不能当作 WA
    checker.exit_code = 1;
    EXPECT_EQ(interpret_checker(nullptr, checker).result, verdict::CHECKER_ERROR);
    checker.exit_code = -1;
    checker.term_signal = SIGABRT;
    EXPECT_EQ(interpret_checker(nullptr, checker).result, verdict::CHECKER_ERROR);
    checker = exited("", E_ACCEPTED);
    checker.limit = limit_violation::TIME;
    EXPECT_EQ(interpret_checker(nullptr, checker).result, verdict::CHECKER_ERROR);
    EXPECT_EQ(interpret_checker(make_exception_ptr(sandbox_error("fork failed")), sandbox_result{}).result, verdict::CHECKER_ERROR);
}

TEST(VerifierTest, CheckerRequestLayout) {
    test_case test = checker_case("check.sh", "9\n");
    sandbox_request request = make_checker_request(test, get<checker_rule>(test.expected), exited("9\n"), "/exec");
    EXPECT_EQ(request.command, (vector<string>{"./check.sh", CHECKER_INPUT_FILE, CHECKER_OUTPUT_FILE, CHECKER_ANSWER_FILE}));
    EXPECT_EQ(request.populate_from, fs::path("/exec"));
    EXPECT_EQ(request.files.at(CHECKER_INPUT_FILE), "3\n");
    EXPECT_EQ(request.files.at(CHECKER_OUTPUT_FILE), "9\n");
    EXPECT_EQ(request.files.at(CHECKER_ANSWER_FILE), "9\n");
    EXPECT_EQ(request.env.at("E_ACCEPTED"), "42");
}

class CheckerRunTest : public ::testing::Test {
protected:
    verification run_checker(const string &checker_script, const string &output) {
        fs::path exec_dir = h.root.path() / "exec";
        if (!fs::exists(exec_dir))
            extract_archive({script("check.sh", checker_script)}, exec_dir);

        optional<verification> result;
        async_verify(h.runner, exited(output), checker_case("check.sh", "9\n"), exec_dir, nullptr,
                     [&](verification v) { result = v; });
        EXPECT_TRUE(h.run_until([&] { return result.has_value(); }));
        return result.value_or(verification{});
    }

    test_harness h;
};

TEST_F(CheckerRunTest, PatternOnLargeOutputRunsOffLoop) {
    string output(2 << 20, '7');
    output += "\n";
    optional<verification> result;
    async_verify(h.runner, exited(output), pattern_case("[0-9]+\\s*"), h.root.path(), nullptr,
                 [&](verification v) { result = v; });
    // 匹配在线程池中进行，回调不会在 async_verify 中同步执行
    EXPECT_FALSE(result.has_value());
    ASSERT_TRUE(h.run_until([&] { return result.has_value(); }));
    EXPECT_EQ(result->result, verdict::ACCEPTED);

    result.reset();
    async_verify(h.runner, exited(string(64, '7')), pattern_case("(7+)+x"), h.root.path(), nullptr,
                 [&](verification v) { result = v; });
    ASSERT_TRUE(h.run_until([&] { return result.has_value(); }));
    EXPECT_EQ(result->result, verdict::CHECKER_ERROR);
}

TEST_F(CheckerRunTest, CheckerAccepts) {
    verification v = run_checker(R"SH(#!/bin/sh
if [ "$(cat "$2")" = "$(cat "$3")" ]; then echo same; exit $E_ACCEPTED; fi
echo different; exit $E_WRONG_ANSWER
)SH", "9\n");
    EXPECT_EQ(v.result, verdict::ACCEPTED);
    EXPECT_EQ(v.detail, "same\n");
}

TEST_F(CheckerRunTest, CheckerRejects) {
    verification v = run_checker(R"SH(#!/bin/sh
if [ "$(cat "$2")" = "$(cat "$3")" ]; then exit 42; fi
exit 43
)SH", "10\n");
    EXPECT_EQ(v.result, verdict::WRONG_ANSWER);
}

TEST_F(CheckerRunTest, CrashingCheckerIsCheckerError) {
    verification v = run_checker("#!/bin/sh\nkill -SEGV $$\n", "9\n");
    EXPECT_EQ(v.result, verdict::CHECKER_ERROR);
    EXPECT_TRUE(h.drain());
    EXPECT_EQ(h.leftover_runs(), 0);
}

TEST_F(CheckerRunTest, CheckerWithUnexpectedExitCodeIsCheckerError) {
    verification v = run_checker("#!/bin/sh\nexit 1\n", "9\n");
    EXPECT_EQ(v.result, verdict::CHECKER_ERROR);
}
