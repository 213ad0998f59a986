#include <filesystem>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "spec/test_spec.hpp"
#include "test/assertions.hpp"
#include "test/harness.hpp"

using namespace std;
using namespace arbiter;
using namespace arbiter::test;
namespace fs = std::filesystem;

static spec_error_reason reason_of(const string &text) {
    try {
        load_test_spec(text);
    } catch (spec_error &e) {
        return e.reason;
    }
    ADD_FAILURE() << "specification was accepted: " << text;
    return spec_error_reason::SYNTAX;
}

TEST(TestSpecTest, LoadsAllRuleKinds) {
    test_spec spec = load_test_spec(R"({
        "name": "squares",
        "compile": ["sh", "build.sh"],
        "run": ["./square"],
        "limits": {"time": 2, "memory": 65536},
        "cases": [
            {"id": "a", "input": "3\n", "expected": {"exact": "9\n"}},
            {"id": "b", "input_file": "data/b.in", "expected": {"exact_file": "data/b.out"}},
            {"id": "c", "input": "", "expected": {"pattern": "[0-9]+\\s*"}},
            {"id": "d", "input": "", "expected": {"checker": "check.sh", "answer": "42"}, "limits": {"time": 5}}
        ]
    })");

    EXPECT_EQ(spec.name, "squares");
    EXPECT_EQ(spec.compile, (vector<string>{"sh", "build.sh"}));
    EXPECT_EQ(spec.run, (vector<string>{"./square"}));
    ASSERT_EQ(spec.cases.size(), 4);
    EXPECT_TRUE(holds_alternative<exact_rule>(spec.cases[0].expected));
    EXPECT_EQ(get<exact_rule>(spec.cases[1].expected).file, "data/b.out");
    EXPECT_EQ(spec.cases[1].input_file, "data/b.in");
    EXPECT_TRUE(holds_alternative<pattern_rule>(spec.cases[2].expected));
    EXPECT_EQ(get<checker_rule>(spec.cases[3].expected).answer, "42");

    EXPECT_DOUBLE_EQ(spec.limits_for(spec.cases[0]).time_limit, 2);
    EXPECT_DOUBLE_EQ(spec.limits_for(spec.cases[3]).time_limit, 5);
    EXPECT_EQ(spec.limits_for(spec.cases[3]).memory_limit, 65536);
    EXPECT_EQ(referenced_files(spec), (vector<string>{"check.sh", "data/b.in", "data/b.out"}));
}

TEST(TestSpecTest, RunDefaultsToSolution) {
    test_spec spec = load_test_spec(R"({"cases": [{"id": "1", "expected": {"exact": ""}}]})");
    EXPECT_EQ(spec.run, (vector<string>{"./solution"}));
    EXPECT_TRUE(spec.compile.empty());
}

TEST(TestSpecTest, ReportsErrorReasons) {
    EXPECT_EQ(reason_of("{ not json"), spec_error_reason::SYNTAX);
    EXPECT_EQ(reason_of(R"({"cases": [{"id": "1", "expected": {"exact": ""}}], "colour": "red"})"), spec_error_reason::UNKNOWN_FIELD);
    EXPECT_EQ(reason_of(R"({"cases": [{"id": "1", "expected": {"exact": ""}, "weight": 2}]})"), spec_error_reason::UNKNOWN_FIELD);
    EXPECT_EQ(reason_of(R"({"cases": [{"id": "1", "expected": {"exact": ""}}, {"id": "1", "expected": {"exact": ""}}]})"), spec_error_reason::DUPLICATE_ID);
    EXPECT_EQ(reason_of(R"({"cases": [{"id": "1", "expected": {"pattern": "(unclosed"}}]})"), spec_error_reason::INVALID_PATTERN);
    EXPECT_EQ(reason_of(R"({"cases": []})"), spec_error_reason::INVALID_VALUE);
    EXPECT_EQ(reason_of(R"({"cases": [{"id": "1", "expected": {"exact": "", "pattern": "x"}}]})"), spec_error_reason::INVALID_VALUE);
    EXPECT_EQ(reason_of(R"({"cases": [{"id": "1", "expected": {"exact": ""}, "limits": {"time": -1}}]})"), spec_error_reason::INVALID_VALUE);
    EXPECT_EQ(reason_of(R"({"cases": [{"id": "1", "input_file": "../secret", "expected": {"exact": ""}}]})"), spec_error_reason::INVALID_VALUE);
    EXPECT_EQ(reason_of(R"({"run": [], "cases": [{"id": "1", "expected": {"exact": ""}}]})"), spec_error_reason::INVALID_VALUE);
    EXPECT_EQ(reason_of(R"({"cases": [{"id": "1", "expected": {"exact": 3}}]})"), spec_error_reason::INVALID_VALUE);
}

TEST(TestSpecTest, WallTimeFollowsCpuTime) {
    resource_limits system;
    system.time_limit = 1;
    system.wall_time_limit = 3;

    limit_override none;
    EXPECT_DOUBLE_EQ(resolve_limits(none, none, system).wall_time_limit, 3);

    limit_override slow;
    slow.time_limit = 10;
    EXPECT_DOUBLE_EQ(resolve_limits(slow, none, system).wall_time_limit, 21);

    limit_override explicit_wall;
    explicit_wall.wall_time_limit = 4;
    EXPECT_DOUBLE_EQ(resolve_limits(slow, explicit_wall, system).wall_time_limit, 4);
}

TEST(TestSpecTest, ResolvesReferencedFiles) {
    scoped_directory dir(fs::temp_directory_path(), "arbiter-spec-");
    extract_archive({text("data/b.in", "4\n"), text("data/b.out", "16\n"), script("check.sh", "exit 42\n")}, dir.path() / "sub");

    test_spec spec = load_test_spec(R"({"cases": [
        {"id": "b", "input_file": "data/b.in", "expected": {"exact_file": "data/b.out"}},
        {"id": "c", "expected": {"checker": "check.sh", "answer_file": "data/b.out"}}
    ]})");
    resolve_test_files(spec, dir.path() / "sub");
    EXPECT_EQ(spec.cases[0].input, "4\n");
    EXPECT_EQ(get<exact_rule>(spec.cases[0].expected).expected, "16\n");
    EXPECT_EQ(get<checker_rule>(spec.cases[1].expected).answer, "16\n");

    test_spec missing = load_test_spec(R"({"cases": [{"id": "x", "input_file": "nope.in", "expected": {"exact": ""}}]})");
    EXPECT_THROW(resolve_test_files(missing, dir.path() / "sub"), spec_error);

    test_spec no_checker = load_test_spec(R"({"cases": [{"id": "x", "expected": {"checker": "nope.sh"}}]})");
    EXPECT_THROW(resolve_test_files(no_checker, dir.path() / "sub"), spec_error);
}

TEST(TestSpecTest, DumpsResolvedLimits) {
    test_spec spec = load_test_spec(R"({"cases": [{"id": "1", "input": "x", "expected": {"pattern": "y"}, "limits": {"time": 3}}]})");
    nlohmann::json dumped = spec_to_json(spec);
    EXPECT_JSON_EQ(dumped["cases"][0]["expected"], nlohmann::json({{"pattern", "y"}}));
    EXPECT_EQ(dumped["cases"][0]["limits"]["time"], 3.0);
    EXPECT_EQ(dumped["cases"][0]["limits"]["wall_time"], 7.0);
    EXPECT_EQ(dumped["cases"][0]["limits"]["memory"], DEFAULT_LIMITS.memory_limit);
}
