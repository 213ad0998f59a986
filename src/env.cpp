#include "env.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace arbiter {
using namespace std;

map<string, string> sandbox_environment() {
    map<string, string> env;
    env["PATH"] = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    env["LANG"] = "C.UTF-8";
    return env;
}

map<string, string> checker_environment() {
    map<string, string> env = sandbox_environment();
    env["E_SUCCESS"] = std::to_string(error_codes::E_SUCCESS);
    env["E_INTERNAL_ERROR"] = std::to_string(error_codes::E_INTERNAL_ERROR);
    env["E_ACCEPTED"] = std::to_string(error_codes::E_ACCEPTED);
    env["E_WRONG_ANSWER"] = std::to_string(error_codes::E_WRONG_ANSWER);
    return env;
}

}  // namespace arbiter
