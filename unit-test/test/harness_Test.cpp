#include "test/harness.hpp"
#include <glog/logging.h>
#include <gtest/gtest.h>
#include "config.hpp"
#include "sandbox/isolation.hpp"

namespace arbiter::test {
using namespace std;
namespace fs = std::filesystem;

void setup_test_environment() {
    if (getenv("DEBUG")) arbiter::DEBUG = true;
    arbiter::DEFAULT_LIMITS.proc_limit = 4096;
    arbiter::COMPILE_LIMITS.proc_limit = 4096;
    arbiter::CHECKER_LIMITS.proc_limit = 4096;
    arbiter::MAX_PARALLEL_CASES = 4;
}

test_harness::test_harness(size_t slot_count)
    : test_harness(slot_count, make_platform_isolation(ISOLATION, MEMORY_RESERVE)) {}

test_harness::test_harness(size_t slot_count, unique_ptr<platform_isolation> isolation)
    : root(fs::temp_directory_path(), "arbiter-test-"),
      blocking(2),
      slots(ioc, slot_count),
      runner(ioc, blocking, slots, move(isolation), root.path() / "sandbox"),
      cache(root.path() / "cache", CACHE_MAX_ENTRIES, CACHE_MAX_SIZE),
      services{ioc, blocking, runner, cache, root.path() / "jobs"} {
    setup_test_environment();
}

test_harness::~test_harness() {
    drain();
    blocking.join();
}

bool test_harness::run_until(const function<bool()> &done, chrono::seconds timeout) {
    auto deadline = chrono::steady_clock::now() + timeout;
    while (!done()) {
        if (chrono::steady_clock::now() > deadline) {
            LOG(ERROR) << "Timed out waiting for the test condition";
            return false;
        }
        if (ioc.stopped()) ioc.restart();
        ioc.run_for(chrono::milliseconds(10));
    }
    return true;
}

bool test_harness::drain() {
    return run_until([this] { return runner.active() == 0; });
}

size_t test_harness::leftover_runs() const {
    if (!fs::exists(runner.work_root())) return 0;
    size_t count = 0;
    for (auto &entry : fs::directory_iterator(runner.work_root())) {
        (void)entry;
        ++count;
    }
    return count;
}

archive_file script(const string &path, const string &content) {
    archive_file file;
    file.path = path;
    file.content = content;
    file.mode = 0755;
    return file;
}

archive_file text(const string &path, const string &content) {
    archive_file file;
    file.path = path;
    file.content = content;
    return file;
}

void recording_observer::on_case_result(const string &, const case_result &result) {
    results.push_back(result);
    events.push_back("case");
}

void recording_observer::on_job_complete(const job_summary &summary) {
    summaries.push_back(summary);
    events.push_back("complete");
}

void recording_observer::on_job_error(const string &, error_kind kind, const string &message) {
    errors.emplace_back(kind, message);
    events.push_back("error");
}

bool recording_observer::completed() const {
    return !summaries.empty();
}

}  // namespace arbiter::test
