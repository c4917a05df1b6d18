#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace nlohmann {

/**
 * @brief 沿着 keys 逐层查找 json 对象中的值
 * @return 找不到或者值为 null 时返回 nullptr
 */
template <typename... Keys>
const json *find_value(const json &j, Keys &&... keys) {
    const json *ref = &j;
    ((ref = (ref && ref->is_object() && ref->count(keys)) ? &ref->at(keys) : nullptr), ...);
    return ref && !ref->is_null() ? ref : nullptr;
}

template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    const json *res = find_value(j, keys...);
    if (!res) return def_value;
    try {
        return res->get<T>();
    } catch (json::type_error &) {
        return def_value;
    }
}

/**
 * @brief 以文本形式读取 json 中的值
 * 字符串原样返回，其他类型的值返回其 json 序列化结果（比如数字 4 返回 "4"）
 * @return 找不到或者值为 null 时返回空
 */
template <typename... Keys>
std::optional<std::string> get_text_optional(const json &j, Keys &&... keys) {
    const json *res = find_value(j, keys...);
    if (!res) return std::nullopt;
    if (res->is_string()) return res->get<std::string>();
    return res->dump();
}

}  // namespace nlohmann
