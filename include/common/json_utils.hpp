#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

namespace detail_lookup {

template <typename Key>
const json *step(const json *ref, const Key &key) {
    if (ref && ref->is_object() && ref->count(key))
        return &ref->at(key);
    return nullptr;
}

template <typename... Keys>
const json *lookup(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    ((ref = step(ref, keys)), ...);
    return ref;
}

}  // namespace detail_lookup

template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    const json *ref = detail_lookup::lookup(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, Keys &&... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump(2);
    return std::invalid_argument(msg);
}

template <typename... Keys>
const json &access(const json &j, Keys &&... keys) {
    const json *ref = detail_lookup::lookup(j, keys...);
    if (!ref) throw build_invalid_argument(j, keys...);
    return *ref;
}

/**
 * @brief 读取必需的字段
 * @throw std::invalid_argument 字段不存在或者类型不匹配
 */
template <typename T, typename... Keys>
T get_value(const json &j, Keys &&... keys) {
    const json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (json::exception &) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 读取可选的字段，字段不存在或者为 null 时返回 def_value
 * @throw std::invalid_argument 字段存在但类型不匹配
 */
template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    const json *res = detail_lookup::lookup(j, keys...);
    if (!res || res->is_null()) return def_value;
    try {
        return res->get<T>();
    } catch (json::exception &) {
        throw build_invalid_argument(j, keys...);
    }
}

template <typename T, typename... Keys>
void assign_optional(const json &j, T &value, Keys &&... keys) {
    value = get_value_def<T>(j, value, keys...);
}

}  // namespace nlohmann
