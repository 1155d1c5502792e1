//! # JSON Value Implementation
//!
//! Equality and deep copy for `JsonValue`. Serialization lives in
//! `json_serializer.cpp`.
//!
//! Values of different types are never equal; an integer `1` and a double
//! `1.0` compare equal through `JsonNumber::operator==`.

#include "json/json_value.hpp"

namespace schemly::json {

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (data.index() != other.data.index()) {
        return false;
    }

    if (is_null()) {
        return true;
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    if (is_number()) {
        return as_number() == other.as_number();
    }
    if (is_string()) {
        return as_string() == other.as_string();
    }

    if (is_array()) {
        const auto& lhs = as_array();
        const auto& rhs = other.as_array();
        if (lhs.size() != rhs.size()) {
            return false;
        }
        for (size_t i = 0; i < lhs.size(); ++i) {
            if (lhs[i] != rhs[i]) {
                return false;
            }
        }
        return true;
    }

    const auto& lhs = as_object();
    const auto& rhs = other.as_object();
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (const auto& [key, val] : lhs) {
        auto it = rhs.find(key);
        if (it == rhs.end() || it->second != val) {
            return false;
        }
    }
    return true;
}

auto JsonValue::clone() const -> JsonValue {
    if (is_bool()) {
        return JsonValue(as_bool());
    }
    if (is_number()) {
        return JsonValue(as_number());
    }
    if (is_string()) {
        return JsonValue(as_string());
    }
    if (is_array()) {
        JsonArray arr;
        arr.reserve(as_array().size());
        for (const auto& elem : as_array()) {
            arr.push_back(elem.clone());
        }
        return JsonValue(std::move(arr));
    }
    if (is_object()) {
        JsonObject obj;
        for (const auto& [key, val] : as_object()) {
            obj.emplace(key, val.clone());
        }
        return JsonValue(std::move(obj));
    }
    return JsonValue();
}

} // namespace schemly::json
