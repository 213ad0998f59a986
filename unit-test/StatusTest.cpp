#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/status.hpp"
#include "gtest/gtest.h"
#include "judge/job.hpp"

using namespace std;
using namespace arbiter;

TEST(StatusTest, WorstVerdictWins) {
    EXPECT_EQ(worst_of(verdict::ACCEPTED, verdict::WRONG_ANSWER), verdict::WRONG_ANSWER);
    EXPECT_EQ(worst_of(verdict::RUNTIME_ERROR, verdict::TIME_LIMIT_EXCEEDED), verdict::RUNTIME_ERROR);
    EXPECT_EQ(worst_of(verdict::CHECKER_ERROR, verdict::INTERNAL_ERROR), verdict::INTERNAL_ERROR);
    EXPECT_EQ(worst_of({}), verdict::ACCEPTED);
    EXPECT_EQ(worst_of({verdict::ACCEPTED, verdict::MEMORY_LIMIT_EXCEEDED, verdict::WRONG_ANSWER}), verdict::MEMORY_LIMIT_EXCEEDED);
}

TEST(StatusTest, VerdictNames) {
    for (verdict v : {verdict::ACCEPTED, verdict::WRONG_ANSWER, verdict::TIME_LIMIT_EXCEEDED,
                      verdict::MEMORY_LIMIT_EXCEEDED, verdict::RUNTIME_ERROR, verdict::COMPILE_ERROR,
                      verdict::CHECKER_ERROR, verdict::INTERNAL_ERROR})
        EXPECT_EQ(parse_verdict(to_string(v)), v);
    EXPECT_STREQ(to_string(verdict::TIME_LIMIT_EXCEEDED), "time_limit_exceeded");
    EXPECT_STREQ(get_display_message(verdict::WRONG_ANSWER), "Wrong Answer");
    EXPECT_THROW(parse_verdict("partially_correct"), invalid_argument);
}

TEST(StatusTest, JobPhases) {
    EXPECT_EQ(parse_job_phase(to_string(job_phase::CANCELLED)), job_phase::CANCELLED);
    EXPECT_TRUE(is_terminal(job_phase::COMPLETED));
    EXPECT_TRUE(is_terminal(job_phase::FAILED));
    EXPECT_FALSE(is_terminal(job_phase::AGGREGATING));
    EXPECT_THROW(parse_job_phase("sleeping"), invalid_argument);
}

TEST(StatusTest, ErrorKinds) {
    EXPECT_EQ(archive_error("x").kind(), error_kind::ARCHIVE);
    EXPECT_EQ(spec_error(spec_error_reason::SYNTAX, "x").kind(), error_kind::SPEC);
    EXPECT_EQ(sandbox_error("x").kind(), error_kind::SANDBOX);
    EXPECT_EQ(protocol_error("x").kind(), error_kind::PROTOCOL);
    EXPECT_EQ(internal_error("x").kind(), error_kind::INTERNAL);
    EXPECT_EQ(kind_of(runtime_error("x")), error_kind::INTERNAL);
    EXPECT_EQ(kind_of(archive_error("x")), error_kind::ARCHIVE);
    EXPECT_EQ(parse_error_kind(to_string(error_kind::SANDBOX)), error_kind::SANDBOX);
    EXPECT_STREQ(archive_error("bad path").what(), "bad path");
}
