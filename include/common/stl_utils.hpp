#pragma once

namespace arbiter {

/**
 * @brief 把多个 lambda 合成一个重载集合，用于 std::visit
 */
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace arbiter
