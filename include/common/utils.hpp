#pragma once

#include <fmt/core.h>
#include <glog/logging.h>
#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

namespace arbiter {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 将环境变量表转换为 execve 需要的 "KEY=VALUE" 列表
 */
std::vector<std::string> to_environ(const std::map<std::string, std::string> &env);

std::string base64_encode(std::string_view data);

/**
 * @brief 解码 base64 字符串
 * @throw std::invalid_argument 如果字符串不是合法的 base64
 */
std::string base64_decode(std::string_view text);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    double seconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace arbiter
