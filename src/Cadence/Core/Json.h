#pragma once

#include <algorithm>
#include <chrono>
#include <format>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace nlohmann {
template<typename Clock, typename Duration>
struct adl_serializer<std::chrono::time_point<Clock, Duration>> {
    // Convert `std::chrono::time_point`s to/from JSON.
    // From https://github.com/nlohmann/json/issues/2159#issuecomment-638104529
    inline static void to_json(json &j, const std::chrono::time_point<Clock, Duration> &tp) {
        j = tp.time_since_epoch().count();
    }
    inline static void from_json(const json &j, std::chrono::time_point<Clock, Duration> &tp) {
        Duration duration(j.get<typename Duration::rep>());
        tp = std::chrono::time_point<Clock, Duration>{duration};
    }
};

// This boilerplate is for handling `std::optional` values.
// Empty optionals are omitted from the object, and absent keys read back as `std::nullopt`.
// From https://github.com/nlohmann/json/issues/1749#issuecomment-1099890282
template<class J, class T> constexpr void optional_to_json(J &j, const char *name, const std::optional<T> &value) {
    if (value) j[name] = *value;
}
template<class J, class T> constexpr void optional_from_json(const J &j, const char *name, std::optional<T> &value) {
    const auto it = j.find(name);
    if (it != j.end()) value = it->template get<T>();
    else value = std::nullopt;
}

template<typename> constexpr bool is_optional = false;
template<typename T> constexpr bool is_optional<std::optional<T>> = true;

template<typename T> constexpr void extended_to_json(const char *key, json &j, const T &value) {
    if constexpr (is_optional<T>) optional_to_json(j, key, value);
    else j[key] = value;
}
template<typename T> constexpr void extended_from_json(const char *key, const json &j, T &value) {
    if constexpr (is_optional<T>) optional_from_json(j, key, value);
    else j.at(key).get_to(value);
}
} // namespace nlohmann

#define ExtendedToJson(v1) nlohmann::extended_to_json(#v1, nlohmann_json_j, nlohmann_json_t.v1);
#define ExtendedFromJson(v1) nlohmann::extended_from_json(#v1, nlohmann_json_j, nlohmann_json_t.v1);

// Define `to_json`/`from_json` for `Type` in the current namespace (found by ADL).
// Types without fields serialize as `null`.
#define Json(Type, ...)                                                                                                                                                                              \
    inline void to_json(nlohmann::json &__VA_OPT__(nlohmann_json_j), const Type &__VA_OPT__(nlohmann_json_t)) { __VA_OPT__(NLOHMANN_JSON_EXPAND(NLOHMANN_JSON_PASTE(ExtendedToJson, __VA_ARGS__))) } \
    inline void from_json(const nlohmann::json &__VA_OPT__(nlohmann_json_j), Type &__VA_OPT__(nlohmann_json_t)) { __VA_OPT__(NLOHMANN_JSON_EXPAND(NLOHMANN_JSON_PASTE(ExtendedFromJson, __VA_ARGS__))) }

// Like `NLOHMANN_JSON_SERIALIZE_ENUM`, but reading a value with no matching pair throws `std::runtime_error`,
// rather than falling back to the first pair.
#define JsonEnum(EnumType, ...)                                                                                                                   \
    inline void to_json(nlohmann::json &j, const EnumType &e) {                                                                                  \
        static const std::pair<EnumType, const char *> pairs[] = __VA_ARGS__;                                                                    \
        const auto it = std::find_if(std::begin(pairs), std::end(pairs), [e](const auto &pair) { return pair.first == e; });                     \
        if (it == std::end(pairs)) throw std::runtime_error{std::format("Unknown {} value: {}", #EnumType, int(e))};                             \
        j = it->second;                                                                                                                          \
    }                                                                                                                                            \
    inline void from_json(const nlohmann::json &j, EnumType &e) {                                                                                \
        static const std::pair<EnumType, const char *> pairs[] = __VA_ARGS__;                                                                    \
        const auto it = std::find_if(std::begin(pairs), std::end(pairs), [&j](const auto &pair) {                                                \
            return j.is_string() && j.get_ref<const std::string &>() == pair.second;                                                             \
        });                                                                                                                                      \
        if (it == std::end(pairs)) throw std::runtime_error{std::format("Unknown {} value: {}", #EnumType, j.dump())};                           \
        e = it->first;                                                                                                                           \
    }
