#pragma once

#include <nlohmann/json.hpp>
#include <optional>

namespace nlohmann {

template <typename... Keys>
json access_optional(const json &j, Keys &&... keys) {
    const json *ref = j.is_null() ? nullptr : &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->count(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return !ref ? json{} : *ref;
}

/**
 * @brief 读取 j[keys...] 的值，不存在或者类型不匹配时返回 def_value
 */
template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    json res = access_optional(j, keys...);
    if (res.is_null()) return def_value;
    try {
        return res.get<T>();
    } catch (json::exception &) {
        return def_value;
    }
}

/**
 * @brief 读取 j[keys...] 的数值，不存在或者不是数值（包括布尔值）时返回空
 */
template <typename T, typename... Keys>
std::optional<T> get_number_optional(const json &j, Keys &&... keys) {
    json res = access_optional(j, keys...);
    if (!res.is_number()) return std::nullopt;
    return static_cast<T>(res.get<double>());
}

}  // namespace nlohmann
