#include "spec/test_spec.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <set>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"

namespace arbiter {
using namespace std;
namespace fs = std::filesystem;
using nlohmann::json;

resource_limits resolve_limits(const limit_override &test, const limit_override &spec, const resource_limits &system) {
    resource_limits limits;
    limits.time_limit = test.time_limit.value_or(spec.time_limit.value_or(system.time_limit));
    limits.memory_limit = test.memory_limit.value_or(spec.memory_limit.value_or(system.memory_limit));
    limits.proc_limit = test.proc_limit.value_or(spec.proc_limit.value_or(system.proc_limit));
    limits.file_limit = test.file_limit.value_or(spec.file_limit.value_or(system.file_limit));
    if (test.wall_time_limit)
        limits.wall_time_limit = *test.wall_time_limit;
    else if (spec.wall_time_limit)
        limits.wall_time_limit = *spec.wall_time_limit;
    else
        limits.wall_time_limit = max(system.wall_time_limit, 2 * limits.time_limit + 1);
    return limits;
}

boost::regex compile_pattern(const string &source) {
    return boost::regex(source, boost::regex::perl | boost::regex::no_mod_s);
}

resource_limits test_spec::limits_for(const test_case &test) const {
    return resolve_limits(test.limits, limits, DEFAULT_LIMITS);
}

static void check_keys(const json &object, const set<string> &allowed, const string &where) {
    if (!object.is_object())
        throw spec_error(spec_error_reason::INVALID_VALUE, where + " must be an object");
    if (auto key = nlohmann::find_unknown_key(object, allowed))
        throw spec_error(spec_error_reason::UNKNOWN_FIELD, fmt::format("{} in {}", *key, where));
}

template <typename T>
static optional<T> optional_field(const json &object, const char *key, const string &where) {
    try {
        return nlohmann::get_optional<T>(object, key);
    } catch (invalid_argument &) {
        throw spec_error(spec_error_reason::INVALID_VALUE, fmt::format("{}.{} has a wrong type", where, key));
    }
}

template <typename T>
static T required_field(const json &object, const char *key, const string &where) {
    auto value = optional_field<T>(object, key, where);
    if (!value)
        throw spec_error(spec_error_reason::INVALID_VALUE, fmt::format("{}.{} is required", where, key));
    return *value;
}

template <typename T>
static optional<T> positive_field(const json &object, const char *key, const string &where) {
    auto value = optional_field<T>(object, key, where);
    if (value && *value <= 0)
        throw spec_error(spec_error_reason::INVALID_VALUE, fmt::format("{}.{} must be positive", where, key));
    return value;
}

static string path_field(const json &object, const char *key, const string &where) {
    auto value = optional_field<string>(object, key, where);
    if (!value) return "";
    try {
        return assert_safe_path(*value);
    } catch (invalid_argument &e) {
        throw spec_error(spec_error_reason::INVALID_VALUE, fmt::format("{}.{}: {}", where, key, e.what()));
    }
}

static vector<string> command_field(const json &object, const char *key, const string &where) {
    auto command = optional_field<vector<string>>(object, key, where);
    if (!command) return {};
    if (command->empty() || any_of(command->begin(), command->end(), [](const string &arg) { return arg.empty(); }))
        throw spec_error(spec_error_reason::INVALID_VALUE, fmt::format("{}.{} must be a non-empty list of non-empty strings", where, key));
    return *command;
}

static limit_override parse_limits(const json &object, const string &where) {
    limit_override limits;
    if (!object.contains("limits")) return limits;

    const json &j = object.at("limits");
    string limits_where = where + ".limits";
    check_keys(j, {"time", "wall_time", "memory", "processes", "output"}, limits_where);
    limits.time_limit = positive_field<double>(j, "time", limits_where);
    limits.wall_time_limit = positive_field<double>(j, "wall_time", limits_where);
    limits.memory_limit = positive_field<int64_t>(j, "memory", limits_where);
    limits.proc_limit = positive_field<int>(j, "processes", limits_where);
    limits.file_limit = positive_field<int64_t>(j, "output", limits_where);
    return limits;
}

static expected_rule parse_expected(const json &j, const string &where) {
    check_keys(j, {"exact", "exact_file", "pattern", "checker", "answer", "answer_file"}, where);

    int kinds = (int)j.contains("exact") + (int)j.contains("exact_file") + (int)j.contains("pattern") + (int)j.contains("checker");
    if (kinds != 1)
        throw spec_error(spec_error_reason::INVALID_VALUE, where + " must have exactly one of exact, exact_file, pattern, checker");
    if (!j.contains("checker") && (j.contains("answer") || j.contains("answer_file")))
        throw spec_error(spec_error_reason::INVALID_VALUE, where + ": answer is only meaningful with checker");

    if (j.contains("exact")) {
        exact_rule rule;
        rule.expected = required_field<string>(j, "exact", where);
        return rule;
    } else if (j.contains("exact_file")) {
        exact_rule rule;
        rule.file = path_field(j, "exact_file", where);
        return rule;
    } else if (j.contains("pattern")) {
        pattern_rule rule;
        rule.source = required_field<string>(j, "pattern", where);
        try {
            rule.pattern = compile_pattern(rule.source);
        } catch (boost::regex_error &e) {
            throw spec_error(spec_error_reason::INVALID_PATTERN, fmt::format("{}: {}: {}", where, rule.source, e.what()));
        }
        return rule;
    } else {
        checker_rule rule;
        rule.program = path_field(j, "checker", where);
        if (j.contains("answer") && j.contains("answer_file"))
            throw spec_error(spec_error_reason::INVALID_VALUE, where + " must not have both answer and answer_file");
        rule.answer = optional_field<string>(j, "answer", where).value_or("");
        rule.answer_file = path_field(j, "answer_file", where);
        return rule;
    }
}

static test_case parse_case(const json &j, size_t index) {
    string where = fmt::format("cases[{}]", index);
    check_keys(j, {"id", "input", "input_file", "expected", "limits"}, where);

    test_case test;
    test.id = required_field<string>(j, "id", where);
    if (test.id.empty())
        throw spec_error(spec_error_reason::INVALID_VALUE, where + ".id must not be empty");
    where = "case " + test.id;

    if (j.contains("input") && j.contains("input_file"))
        throw spec_error(spec_error_reason::INVALID_VALUE, where + " must not have both input and input_file");
    test.input = optional_field<string>(j, "input", where).value_or("");
    test.input_file = path_field(j, "input_file", where);

    if (!j.contains("expected"))
        throw spec_error(spec_error_reason::INVALID_VALUE, where + ".expected is required");
    test.expected = parse_expected(j.at("expected"), where + ".expected");
    test.limits = parse_limits(j, where);
    return test;
}

test_spec load_test_spec(const string &text) {
    json j;
    try {
        j = json::parse(text);
    } catch (json::parse_error &e) {
        throw spec_error(spec_error_reason::SYNTAX, e.what());
    }

    check_keys(j, {"name", "compile", "run", "limits", "cases"}, "specification");

    test_spec spec;
    spec.name = optional_field<string>(j, "name", "specification").value_or("");
    spec.compile = command_field(j, "compile", "specification");
    spec.run = command_field(j, "run", "specification");
    if (spec.run.empty()) spec.run = {"./solution"};
    spec.limits = parse_limits(j, "specification");

    if (!j.contains("cases") || !j.at("cases").is_array() || j.at("cases").empty())
        throw spec_error(spec_error_reason::INVALID_VALUE, "specification.cases must be a non-empty list");

    set<string> ids;
    const json &cases = j.at("cases");
    for (size_t i = 0; i < cases.size(); ++i) {
        test_case test = parse_case(cases[i], i);
        if (!ids.insert(test.id).second)
            throw spec_error(spec_error_reason::DUPLICATE_ID, test.id);
        spec.cases.push_back(move(test));
    }
    return spec;
}

test_spec load_test_spec_file(const fs::path &path) {
    string text;
    try {
        text = read_file_content(path);
    } catch (system_error &e) {
        throw spec_error(spec_error_reason::SYNTAX, e.what());
    }
    return load_test_spec(text);
}

vector<string> referenced_files(const test_spec &spec) {
    vector<string> files;
    for (auto &test : spec.cases) {
        if (!test.input_file.empty()) files.push_back(test.input_file);
        if (auto exact = get_if<exact_rule>(&test.expected); exact && !exact->file.empty())
            files.push_back(exact->file);
        if (auto checker = get_if<checker_rule>(&test.expected)) {
            files.push_back(checker->program);
            if (!checker->answer_file.empty()) files.push_back(checker->answer_file);
        }
    }
    sort(files.begin(), files.end());
    files.erase(unique(files.begin(), files.end()), files.end());
    return files;
}

static string read_referenced(const fs::path &root, const string &file, const test_case &test) {
    fs::path path = root / file;
    if (!is_within(root, path) || !fs::is_regular_file(fs::symlink_status(path)))
        throw spec_error(spec_error_reason::INVALID_VALUE, fmt::format("case {} references missing file {}", test.id, file));
    return read_file_content(path);
}

void resolve_test_files(test_spec &spec, const fs::path &root) {
    for (auto &test : spec.cases) {
        if (!test.input_file.empty())
            test.input = read_referenced(root, test.input_file, test);
        if (auto exact = get_if<exact_rule>(&test.expected); exact && !exact->file.empty())
            exact->expected = read_referenced(root, exact->file, test);
        if (auto checker = get_if<checker_rule>(&test.expected)) {
            if (!checker->answer_file.empty())
                checker->answer = read_referenced(root, checker->answer_file, test);
            fs::path program = root / checker->program;
            if (!fs::is_regular_file(fs::symlink_status(program)))
                throw spec_error(spec_error_reason::INVALID_VALUE, fmt::format("case {} references missing checker {}", test.id, checker->program));
        }
    }
}

static json limits_to_json(const limit_override &limits) {
    json j = json::object();
    if (limits.time_limit) j["time"] = *limits.time_limit;
    if (limits.wall_time_limit) j["wall_time"] = *limits.wall_time_limit;
    if (limits.memory_limit) j["memory"] = *limits.memory_limit;
    if (limits.proc_limit) j["processes"] = *limits.proc_limit;
    if (limits.file_limit) j["output"] = *limits.file_limit;
    return j;
}

json spec_to_json(const test_spec &spec) {
    json j;
    j["name"] = spec.name;
    if (!spec.compile.empty()) j["compile"] = spec.compile;
    j["run"] = spec.run;
    j["limits"] = limits_to_json(spec.limits);
    j["cases"] = json::array();
    for (auto &test : spec.cases) {
        json c;
        c["id"] = test.id;
        if (!test.input_file.empty())
            c["input_file"] = test.input_file;
        else
            c["input"] = test.input;

        json expected;
        visit([&expected](auto &&rule) {
            using T = decay_t<decltype(rule)>;
            if constexpr (is_same_v<T, exact_rule>) {
                if (!rule.file.empty())
                    expected["exact_file"] = rule.file;
                else
                    expected["exact"] = rule.expected;
            } else if constexpr (is_same_v<T, pattern_rule>) {
                expected["pattern"] = rule.source;
            } else {
                expected["checker"] = rule.program;
                if (!rule.answer_file.empty())
                    expected["answer_file"] = rule.answer_file;
                else
                    expected["answer"] = rule.answer;
            }
        }, test.expected);
        c["expected"] = expected;

        resource_limits resolved = spec.limits_for(test);
        c["limits"] = {
            {"time", resolved.time_limit},
            {"wall_time", resolved.wall_time_limit},
            {"memory", resolved.memory_limit},
            {"processes", resolved.proc_limit},
            {"output", resolved.file_limit}};
        j["cases"].push_back(c);
    }
    return j;
}

}  // namespace arbiter
