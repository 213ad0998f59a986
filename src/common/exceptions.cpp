#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace arbiter {
using namespace std;

const char *to_string(error_kind kind) {
    switch (kind) {
        case error_kind::ARCHIVE: return "archive";
        case error_kind::SPEC: return "spec";
        case error_kind::SANDBOX: return "sandbox";
        case error_kind::PROTOCOL: return "protocol";
        case error_kind::INTERNAL: return "internal";
    }
    return "internal";
}

error_kind parse_error_kind(const string &kind) {
    if (kind == "archive") return error_kind::ARCHIVE;
    if (kind == "spec") return error_kind::SPEC;
    if (kind == "sandbox") return error_kind::SANDBOX;
    if (kind == "protocol") return error_kind::PROTOCOL;
    if (kind == "internal") return error_kind::INTERNAL;
    throw invalid_argument("unknown error kind " + kind);
}

const char *to_string(spec_error_reason reason) {
    switch (reason) {
        case spec_error_reason::SYNTAX: return "syntax";
        case spec_error_reason::UNKNOWN_FIELD: return "unknown field";
        case spec_error_reason::DUPLICATE_ID: return "duplicate identifier";
        case spec_error_reason::INVALID_PATTERN: return "invalid pattern";
        case spec_error_reason::INVALID_VALUE: return "invalid value";
    }
    return "invalid value";
}

arbiter_exception::arbiter_exception()
    : arbiter_exception("") {}

arbiter_exception::arbiter_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

error_kind arbiter_exception::kind() const {
    return error_kind::INTERNAL;
}

const char *arbiter_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const arbiter_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

archive_error::archive_error()
    : arbiter_exception() {}

archive_error::archive_error(const string &message)
    : arbiter_exception(message) {}

error_kind archive_error::kind() const {
    return error_kind::ARCHIVE;
}

spec_error::spec_error(spec_error_reason reason, const string &message)
    : arbiter_exception(string(to_string(reason)) + ": " + message), reason(reason) {}

error_kind spec_error::kind() const {
    return error_kind::SPEC;
}

sandbox_error::sandbox_error()
    : arbiter_exception() {}

sandbox_error::sandbox_error(const string &message)
    : arbiter_exception(message) {}

error_kind sandbox_error::kind() const {
    return error_kind::SANDBOX;
}

protocol_error::protocol_error()
    : arbiter_exception() {}

protocol_error::protocol_error(const string &message)
    : arbiter_exception(message) {}

error_kind protocol_error::kind() const {
    return error_kind::PROTOCOL;
}

internal_error::internal_error()
    : arbiter_exception() {}

internal_error::internal_error(const string &message)
    : arbiter_exception(message) {}

error_kind kind_of(const std::exception &ex) {
    if (auto arb = dynamic_cast<const arbiter_exception *>(&ex))
        return arb->kind();
    return error_kind::INTERNAL;
}

}  // namespace arbiter
