#pragma once

#include <filesystem>
#include <string>
#include "archive/archive.hpp"
#include "spec/test_spec.hpp"

namespace arbiter {

/**
 * @brief 本地检查的结果
 */
struct check_report {
    test_spec spec;
    packed_archive archive;
    std::size_t file_count = 0;
};

/**
 * @brief 在提交之前检查测试配置和提交目录
 * 检查内容与评测服务解压时完全相同：目录能否打包、打包后能否在限制内解包、
 * 测试配置能否解析、引用的文件是否都在提交中。
 * @param spec 测试配置文件；spec_in_archive 为真时是提交目录中的相对路径
 * @param dir 提交目录
 * @throw spec_error 测试配置有误
 * @throw archive_error 提交目录无法打包或者超出限制
 */
check_report check_submission(const std::string &spec, const std::filesystem::path &dir, bool spec_in_archive);

}  // namespace arbiter
