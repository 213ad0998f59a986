#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace arbiter {
using namespace std;

// clang-format off
static const unordered_map<verdict, const char *> verdict_display = boost::assign::map_list_of
    (verdict::ACCEPTED, "Accepted")
    (verdict::WRONG_ANSWER, "Wrong Answer")
    (verdict::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (verdict::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (verdict::RUNTIME_ERROR, "Runtime Error")
    (verdict::COMPILE_ERROR, "Compile Error")
    (verdict::CHECKER_ERROR, "Checker Error")
    (verdict::INTERNAL_ERROR, "Internal Error");

static const unordered_map<verdict, const char *> verdict_names = boost::assign::map_list_of
    (verdict::ACCEPTED, "accepted")
    (verdict::WRONG_ANSWER, "wrong_answer")
    (verdict::TIME_LIMIT_EXCEEDED, "time_limit_exceeded")
    (verdict::MEMORY_LIMIT_EXCEEDED, "memory_limit_exceeded")
    (verdict::RUNTIME_ERROR, "runtime_error")
    (verdict::COMPILE_ERROR, "compile_error")
    (verdict::CHECKER_ERROR, "checker_error")
    (verdict::INTERNAL_ERROR, "internal_error");
// clang-format on

const char *get_display_message(verdict v) {
    return verdict_display.at(v);
}

const char *to_string(verdict v) {
    return verdict_names.at(v);
}

verdict parse_verdict(const string &name) {
    for (auto &[v, n] : verdict_names)
        if (name == n) return v;
    throw invalid_argument("unknown verdict " + name);
}

verdict worst_of(verdict a, verdict b) {
    return static_cast<int>(a) >= static_cast<int>(b) ? a : b;
}

verdict worst_of(const vector<verdict> &verdicts) {
    verdict result = verdict::ACCEPTED;
    for (verdict v : verdicts)
        result = worst_of(result, v);
    return result;
}

}  // namespace arbiter
