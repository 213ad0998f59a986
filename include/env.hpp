#pragma once

#include <map>
#include <string>

namespace arbiter {

/**
 * @brief 沙箱中程序的基础环境变量，只保留 PATH
 */
std::map<std::string, std::string> sandbox_environment();

/**
 * @brief 比较程序的环境变量，在基础环境变量之上加入退出码约定
 * 比较程序可以通过 $E_ACCEPTED 和 $E_WRONG_ANSWER 得到应该返回的退出码
 */
std::map<std::string, std::string> checker_environment();

}  // namespace arbiter
