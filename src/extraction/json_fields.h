#pragma once

#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <optional>
#include <string>
#include <chatmine/core/types.h>

// Lenient field access for untrusted host JSON. A field counts as present only
// when it holds a non-empty value of the expected kind; otherwise the next
// candidate key is tried.
namespace chatmine::extraction::json_fields {

using nlohmann::json;

inline const json* field(const json& obj, const char* key) {
    if (!obj.is_object())
        return nullptr;
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return nullptr;
    return &*it;
}

inline bool truthy(const json& value) {
    if (value.is_null())
        return false;
    if (value.is_boolean())
        return value.get<bool>();
    if (value.is_number())
        return value.get<double>() != 0.0;
    if (value.is_string())
        return !value.get_ref<const std::string&>().empty();
    return true;
}

/// First truthy value among @p keys, or nullptr
inline const json* firstTruthy(const json& obj, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (const json* v = field(obj, key); v && truthy(*v))
            return v;
    }
    return nullptr;
}

inline std::optional<std::string> firstString(const json& obj,
                                              std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        const json* v = field(obj, key);
        if (v && v->is_string() && !v->get_ref<const std::string&>().empty())
            return v->get<std::string>();
    }
    return std::nullopt;
}

/// Numeric value as epoch millis; values outside the EpochMillis range count as absent
inline std::optional<EpochMillis> asMillis(const json& value) {
    if (value.is_number_unsigned()) {
        const auto u = value.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<EpochMillis>::max()))
            return std::nullopt;
        return static_cast<EpochMillis>(u);
    }
    if (value.is_number_integer())
        return value.get<EpochMillis>();
    if (value.is_number_float()) {
        // 2^63: the first double above the EpochMillis range
        constexpr double kLimit = 9223372036854775808.0;
        const double d = value.get<double>();
        if (std::isfinite(d) && d >= -kLimit && d < kLimit)
            return static_cast<EpochMillis>(d);
    }
    return std::nullopt;
}

/// ts + 1 without overflowing at the top of the range
inline EpochMillis nextMillis(EpochMillis ts) {
    return ts == std::numeric_limits<EpochMillis>::max() ? ts : ts + 1;
}

/// First non-zero numeric timestamp among @p keys
inline std::optional<EpochMillis> firstTimestamp(const json& obj,
                                                 std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (const json* v = field(obj, key)) {
            if (auto ms = asMillis(*v); ms && *ms != 0)
                return ms;
        }
    }
    return std::nullopt;
}

/// Textual form of a raw timestamp value used as stable-id input
inline std::string timestampKey(const json* value, EpochMillis fallback) {
    if (value && truthy(*value)) {
        if (value->is_string())
            return value->get<std::string>();
        if (auto ms = asMillis(*value); ms && static_cast<double>(*ms) == value->get<double>())
            return std::to_string(*ms);
        return value->dump();
    }
    return std::to_string(fallback);
}

} // namespace chatmine::extraction::json_fields
