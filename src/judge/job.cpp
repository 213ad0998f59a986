#include "judge/job.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include <atomic>
#include <map>
#include "archive/archive.hpp"
#include "archive/digest.hpp"
#include "common/blocking.hpp"
#include "config.hpp"
#include "env.hpp"

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;

// clang-format off
static const map<job_phase, const char *> phase_names = boost::assign::map_list_of
    (job_phase::PENDING, "pending")
    (job_phase::UNPACKING, "unpacking")
    (job_phase::COMPILING, "compiling")
    (job_phase::RUNNING, "running")
    (job_phase::AGGREGATING, "aggregating")
    (job_phase::COMPLETED, "completed")
    (job_phase::CANCELLED, "cancelled")
    (job_phase::FAILED, "failed");
// clang-format on

const char *to_string(job_phase phase) {
    return phase_names.at(phase);
}

job_phase parse_job_phase(const string &name) {
    for (auto &[phase, n] : phase_names)
        if (name == n) return phase;
    throw invalid_argument("unknown job phase " + name);
}

bool is_terminal(job_phase phase) {
    return phase == job_phase::COMPLETED || phase == job_phase::CANCELLED || phase == job_phase::FAILED;
}

string make_job_id(const string &digest) {
    static atomic<uint64_t> counter{0};
    return digest.substr(0, 16) + "-" + std::to_string(++counter);
}

/**
 * @brief 编译失败时附带的编译器输出，只保留开头部分
 */
static string compiler_message(const sandbox_result &result) {
    const size_t max_length = 4096;
    string message = result.error_output.empty() ? result.output : result.error_output;
    if (message.size() > max_length) message = message.substr(0, max_length) + "...";
    if (result.limit != limit_violation::NONE)
        return fmt::format("compiler exceeded its {} limit\n{}", to_string(result.limit), message);
    if (!result.exec_error.empty())
        return result.exec_error;
    if (result.term_signal != 0)
        return fmt::format("compiler killed by signal {}\n{}", result.term_signal, message);
    return fmt::format("compiler exited with code {}\n{}", result.exit_code, message);
}

static string error_message(exception_ptr error) {
    try {
        rethrow_exception(error);
    } catch (std::exception &e) {
        return e.what();
    }
}

static bool is_sandbox_error(exception_ptr error) {
    try {
        rethrow_exception(error);
    } catch (sandbox_error &) {
        return true;
    } catch (std::exception &) {
        return false;
    }
}

job::job(job_services services, string id, job_submission submission, weak_ptr<job_observer> observer)
    : services(move(services)),
      job_id(move(id)),
      submission(move(submission)),
      observer(move(observer)),
      cancel_token(make_shared<cancellation>()) {}

template <typename F>
void job::guarded(F &&action) {
    try {
        action();
    } catch (std::exception &e) {
        LOG(ERROR) << "Job " << job_id << " failed unexpectedly: " << boost::diagnostic_information(e);
        fail(make_exception_ptr(internal_error(e.what())));
    }
}

void job::start() {
    current = job_phase::UNPACKING;
    LOG(INFO) << "Job " << job_id << " started for archive " << submission.digest;

    auto self = shared_from_this();
    run_blocking(
        services.blocking, services.ioc,
        [self]() {
            return prepare(self->submission, self->services.cache);
        },
        [self](exception_ptr error, optional<prepared_submission> prepared) {
            self->guarded([&] { self->on_prepared(error, move(prepared)); });
        });
}

job::prepared_submission job::prepare(const job_submission &submission, archive_cache &cache) {
    if (!is_valid_digest(submission.digest))
        throw archive_error("malformed digest " + submission.digest);

    cache_handle archive = cache.lookup(submission.digest);
    if (!archive) {
        if (!submission.archive)
            throw archive_error("archive " + submission.digest + " is not cached and was not sent");
        verify_digest(*submission.archive, submission.digest);
        auto files = unpack_archive(*submission.archive, default_archive_limits());
        archive = cache.store(submission.digest, files);
    }

    prepared_submission prepared;
    prepared.archive = archive;
    prepared.root = archive->path();
    if (submission.spec_text) {
        prepared.spec = load_test_spec(*submission.spec_text);
    } else if (submission.spec_path) {
        string relative;
        try {
            relative = assert_safe_path(*submission.spec_path);
        } catch (invalid_argument &e) {
            throw spec_error(spec_error_reason::INVALID_VALUE, e.what());
        }
        fs::path path = prepared.root / relative;
        if (!fs::is_regular_file(path))
            throw spec_error(spec_error_reason::INVALID_VALUE, "test specification " + relative + " not found in archive");
        prepared.spec = load_test_spec_file(path);
    } else {
        throw spec_error(spec_error_reason::INVALID_VALUE, "no test specification given");
    }
    resolve_test_files(prepared.spec, prepared.root);
    return prepared;
}

void job::on_prepared(exception_ptr error, optional<prepared_submission> prepared) {
    if (error) {
        fail(error);
        return;
    }
    if (cancel_token->cancelled()) {
        finish(job_phase::CANCELLED);
        return;
    }

    spec = move(prepared->spec);
    archive = move(prepared->archive);
    exec_dir = prepared->root;
    results.resize(spec.cases.size());
    max_parallel = max(1U, MAX_PARALLEL_CASES);

    if (spec.compile.empty())
        run_cases();
    else
        compile();
}

void job::compile() {
    current = job_phase::COMPILING;
    auto self = shared_from_this();
    run_blocking(
        services.blocking, services.ioc,
        [self]() {
            return scoped_directory(self->services.build_root, "build-");
        },
        [self](exception_ptr error, optional<scoped_directory> dir) {
            self->guarded([&] {
                if (error) rethrow_exception(error);
                self->build_dir = move(dir);
                if (self->cancel_token->cancelled()) {
                    self->finish(job_phase::CANCELLED);
                    return;
                }

                sandbox_request request;
                request.command = self->spec.compile;
                request.limits = COMPILE_LIMITS;
                request.populate_from = self->exec_dir;
                request.harvest_to = self->build_dir->path();
                request.env = sandbox_environment();

                ++self->running;
                self->run_sandboxed(move(request), [self](exception_ptr error, sandbox_result result) {
                    --self->running;
                    self->guarded([&] { self->on_compiled(error, result); });
                });
            });
        });
}

void job::on_compiled(exception_ptr error, const sandbox_result &result) {
    if (finishing) {
        check_completion();
        return;
    }
    if (cancel_token->cancelled() || result.cancelled) {
        finish(job_phase::CANCELLED);
        return;
    }

    if (error) {
        string message = error_message(error);
        for (size_t i = 0; i < spec.cases.size(); ++i)
            record(i, {spec.cases[i].id, verdict::INTERNAL_ERROR, "compiler could not be run: " + message});
        check_completion();
        return;
    }

    if (!result.succeeded() || result.limit != limit_violation::NONE) {
        LOG(INFO) << "Job " << job_id << " failed to compile";
        string message = compiler_message(result);
        for (size_t i = 0; i < spec.cases.size(); ++i)
            record(i, {spec.cases[i].id, verdict::COMPILE_ERROR, message, result.cpu_time, result.memory});
        check_completion();
        return;
    }

    exec_dir = build_dir->path();
    run_cases();
}

void job::run_cases() {
    current = job_phase::RUNNING;
    DLOG(INFO) << "Job " << job_id << " running " << spec.cases.size() << " cases, " << max_parallel << " at a time";
    while (running < max_parallel && next_case < spec.cases.size() && !cancel_token->cancelled() && !finishing)
        launch_case(next_case++);
    check_completion();
}

void job::launch_case(size_t index) {
    const test_case &test = spec.cases[index];

    sandbox_request request;
    request.command = spec.run;
    request.input = test.input;
    request.limits = spec.limits_for(test);
    request.populate_from = exec_dir;
    request.env = sandbox_environment();

    ++running;
    auto self = shared_from_this();
    run_sandboxed(move(request), [self, index](exception_ptr error, sandbox_result result) {
        self->guarded([&] {
            const test_case &test = self->spec.cases[index];
            if (error) {
                self->on_case_done(index, {test.id, verdict::INTERNAL_ERROR, error_message(error)});
                return;
            }
            if (result.cancelled || self->cancel_token->cancelled() || self->finishing) {
                --self->running;
                self->check_completion();
                return;
            }

            double time = result.cpu_time;
            int64_t memory = result.memory;
            async_verify(self->services.runner, move(result), test, self->exec_dir, self->cancel_token,
                         [self, index, time, memory](verification v) {
                             self->guarded([&] {
                                 self->on_case_done(index, {self->spec.cases[index].id, v.result, v.detail, time, memory});
                             });
                         });
        });
    });
}

void job::on_case_done(size_t index, case_result result) {
    --running;
    // 取消之后完成的数据点不再报告
    if (!cancel_token->cancelled() && !finishing) {
        record(index, move(result));
        while (running < max_parallel && next_case < spec.cases.size() && !cancel_token->cancelled())
            launch_case(next_case++);
    }
    check_completion();
}

void job::run_sandboxed(sandbox_request request, sandbox_runner::handler_type handler, int attempt) {
    auto self = shared_from_this();
    auto retry_request = attempt == 1 ? make_optional(request) : nullopt;
    services.runner.async_run(
        move(request), cancel_token,
        [self, handler = move(handler), retry_request = move(retry_request), attempt](exception_ptr error, sandbox_result result) mutable {
            if (error && retry_request && !self->cancel_token->cancelled() && is_sandbox_error(error)) {
                LOG(WARNING) << "Job " << self->job_id << ": sandbox failed, retrying: " << error_message(error);
                self->run_sandboxed(move(*retry_request), move(handler), attempt + 1);
                return;
            }
            handler(error, move(result));
        });
}

void job::record(size_t index, case_result result) {
    DLOG(INFO) << "Job " << job_id << " case " << result.case_id << ": " << to_string(result.result);
    if (!results[index]) ++completed;
    results[index] = result;
    if (auto o = observer.lock()) {
        try {
            o->on_case_result(job_id, result);
        } catch (std::exception &e) {
            LOG(ERROR) << "Job " << job_id << ": unable to deliver case " << result.case_id << ": " << e.what();
        }
    }
}

void job::check_completion() {
    if (running > 0 || is_terminal(current) || current == job_phase::AGGREGATING) return;

    if (finishing) {
        finish(job_phase::FAILED);
    } else if (cancel_token->cancelled()) {
        finish(job_phase::CANCELLED);
    } else if (completed == spec.cases.size()) {
        finish(job_phase::COMPLETED);
    }
}

void job::cancel() {
    if (is_terminal(current) || current == job_phase::AGGREGATING || cancel_token->cancelled()) return;
    LOG(INFO) << "Job " << job_id << " cancelled in phase " << to_string(current);
    cancel_token->cancel();
}

void job::fail(exception_ptr error) {
    if (is_terminal(current) || finishing) return;
    finishing = true;
    failure = error;
    cancel_token->cancel();
    check_completion();
}

void job::finish(job_phase final_phase) {
    if (is_terminal(current) || current == job_phase::AGGREGATING) return;
    current = job_phase::AGGREGATING;

    job_summary summary;
    summary.job = job_id;
    summary.phase = final_phase;
    vector<verdict> verdicts;
    for (auto &result : results) {
        if (!result) continue;
        summary.cases.push_back(*result);
        verdicts.push_back(result->result);
    }
    summary.result = final_phase == job_phase::FAILED ? verdict::INTERNAL_ERROR : worst_of(verdicts);

    error_kind kind = error_kind::INTERNAL;
    string message;
    if (final_phase == job_phase::FAILED && failure) {
        try {
            rethrow_exception(failure);
        } catch (std::exception &e) {
            kind = kind_of(e);
            message = e.what();
        }
        LOG(WARNING) << "Job " << job_id << " failed: [" << to_string(kind) << "] " << message;
    }

    // 编译结果在线程池中删除，删除完成后才通知任务结束
    auto self = shared_from_this();
    run_blocking(
        services.blocking, services.ioc,
        [dir = move(build_dir)]() mutable {
            if (dir) dir->remove();
        },
        [self, summary = move(summary), kind, message](exception_ptr error) {
            if (error)
                LOG(ERROR) << "Job " << self->job_id << ": unable to remove build directory: " << error_message(error);
            self->current = summary.phase;
            self->archive.reset();
            LOG(INFO) << "Job " << self->job_id << " " << to_string(summary.phase) << " with " << to_string(summary.result);
            auto o = self->observer.lock();
            if (!o) return;
            try {
                if (summary.phase == job_phase::FAILED)
                    o->on_job_error(self->job_id, kind, message);
                o->on_job_complete(summary);
            } catch (std::exception &e) {
                LOG(ERROR) << "Job " << self->job_id << ": unable to deliver the result: " << boost::diagnostic_information(e);
            }
        });
}

const string &job::id() const {
    return job_id;
}

job_phase job::phase() const {
    return current;
}

size_t job::in_flight() const {
    return running;
}

}  // namespace arbiter
