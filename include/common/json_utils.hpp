#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

namespace nlohmann {

namespace detail_access {

template <typename... Keys>
const json *find(const json &j, Keys &&...keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref;
}

}  // namespace detail_access

template <typename... Keys>
bool exists(const json &j, Keys &&...keys) {
    const json *ref = detail_access::find(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
json access_optional(const json &j, Keys &&...keys) {
    const json *ref = detail_access::find(j, keys...);
    return !ref ? json{} : *ref;
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, Keys &&...keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump(2);
    return std::invalid_argument(msg);
}

template <typename... Keys>
const json &access(const json &j, Keys &&...keys) {
    const json *ref = detail_access::find(j, keys...);
    if (!ref)
        throw build_invalid_argument(j, keys...);
    else
        return *ref;
}

template <typename T, typename... Keys>
const T get_value(const json &j, Keys &&...keys) {
    const json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

template <typename T, typename... Keys>
const T get_value_def(const json &j, const T &def_value, Keys &&...keys) {
    json res = access_optional(j, keys...);
    if (res.is_null()) return def_value;
    try {
        return res.get<T>();
    } catch (json::exception &e) {
        return def_value;
    }
}

/**
 * @brief 字段存在时读取并转换为 T，不存在或为 null 时返回 nullopt
 * @throw std::invalid_argument 如果字段存在但类型不对
 */
template <typename T, typename... Keys>
std::optional<T> get_optional(const json &j, Keys &&...keys) {
    const json *ref = detail_access::find(j, keys...);
    if (!ref || ref->is_null()) return std::nullopt;
    try {
        return ref->get<T>();
    } catch (json::exception &e) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 返回 object 中第一个不在 allowed 内的键，全部合法时返回 nullopt
 */
inline std::optional<std::string> find_unknown_key(const json &object, const std::set<std::string> &allowed) {
    for (auto it = object.begin(); it != object.end(); ++it)
        if (!allowed.count(it.key())) return it.key();
    return std::nullopt;
}

}  // namespace nlohmann
