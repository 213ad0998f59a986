#pragma once

#include <string>
#include <string_view>

namespace arbiter {

/**
 * @brief 计算 SHA-256 摘要
 * @return 64 个小写十六进制字符
 */
std::string sha256_hex(std::string_view data);

/**
 * @brief 判断 digest 是否是 64 个小写十六进制字符
 * 摘要会被用作缓存目录名，必须先检查再拼接路径
 */
bool is_valid_digest(const std::string &digest);

/**
 * @brief 检查传输后的压缩包内容与摘要一致
 * @throw archive_error 摘要格式错误或不一致
 */
void verify_digest(std::string_view bytes, const std::string &digest);

}  // namespace arbiter
