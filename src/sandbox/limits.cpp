#include "sandbox/limits.hpp"
#include <fmt/core.h>

namespace arbiter {

std::string describe(const resource_limits &limits) {
    return fmt::format("time={}s wall={}s memory={}KB processes={} output={}KB",
                       limits.time_limit, limits.wall_time_limit, limits.memory_limit,
                       limits.proc_limit, limits.file_limit);
}

}  // namespace arbiter
