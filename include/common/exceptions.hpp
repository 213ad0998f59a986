#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace arbiter {

/**
 * @brief 发送给客户端的错误类别
 * 与 Error 消息中的 kind 字段一一对应
 */
enum class error_kind {
    ARCHIVE,
    SPEC,
    SANDBOX,
    PROTOCOL,
    INTERNAL
};

const char *to_string(error_kind kind);

/**
 * @brief 解析 Error 消息中的 kind 字段
 * @throw std::invalid_argument 如果 kind 不是已知的类别
 */
error_kind parse_error_kind(const std::string &kind);

struct arbiter_exception : std::exception {
    arbiter_exception();
    explicit arbiter_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const arbiter_exception &ex);

    virtual error_kind kind() const;

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示提交的压缩包格式错误或者不安全
 * 比如包含了 ".." 路径、符号链接或者总大小超出限制
 */
struct archive_error : public arbiter_exception {
    archive_error();
    explicit archive_error(const std::string &message);

    error_kind kind() const override;
};

enum class spec_error_reason {
    SYNTAX,
    UNKNOWN_FIELD,
    DUPLICATE_ID,
    INVALID_PATTERN,
    INVALID_VALUE
};

const char *to_string(spec_error_reason reason);

/**
 * @brief 表示测试配置文件有误
 * reason 说明了具体的错误类别
 */
struct spec_error : public arbiter_exception {
    spec_error(spec_error_reason reason, const std::string &message);

    error_kind kind() const override;

    spec_error_reason reason;
};

/**
 * @brief 表示沙箱本身出错（无法创建进程、无法设置资源限制）
 * 选手程序超出资源限制不属于这个错误
 */
struct sandbox_error : public arbiter_exception {
    sandbox_error();
    explicit sandbox_error(const std::string &message);

    error_kind kind() const override;
};

/**
 * @brief 表示客户端或服务端发来了无法解析的消息
 */
struct protocol_error : public arbiter_exception {
    protocol_error();
    explicit protocol_error(const std::string &message);

    error_kind kind() const override;
};

/**
 * @brief 表示评测系统的内部错误
 */
struct internal_error : public arbiter_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 获得任意异常对应的错误类别，非 arbiter_exception 都视为内部错误
 */
error_kind kind_of(const std::exception &ex);

}  // namespace arbiter
