//! # JSON Values
//!
//! The JSON value model used to export resolved schemas and error reports.
//! Only construction, inspection and serialization are provided; documents
//! are read through the YAML loader, which accepts JSON input as well.
//!
//! ## Storage
//!
//! | JSON Type | C++ Storage | Query | Accessor |
//! |-----------|-------------|-------|----------|
//! | `null` | `std::monostate` | `is_null()` | - |
//! | `true/false` | `bool` | `is_bool()` | `as_bool()` |
//! | number | `JsonNumber` | `is_number()` | `as_i64()`, `as_f64()` |
//! | string | `std::string` | `is_string()` | `as_string()` |
//! | array | `Box<JsonArray>` | `is_array()` | `as_array()` |
//! | object | `Box<JsonObject>` | `is_object()` | `as_object()`, `get()` |
//!
//! Objects are `std::map`s, so keys always serialize in sorted order and the
//! same value always produces the same text.
//!
//! ## Example
//!
//! ```cpp
//! auto entity = json_object();
//! entity.set("name", json_string("Post"));
//! entity.set("timestamps", json_bool(true));
//! std::string text = entity.to_string_pretty();
//! ```

#pragma once

#include "common.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace schemly::json {

struct JsonValue;

/// Ordered sequence of values.
using JsonArray = std::vector<JsonValue>;

/// Key-value pairs, ordered by key.
using JsonObject = std::map<std::string, JsonValue>;

// ============================================================================
// JsonNumber
// ============================================================================

/// A JSON number that remembers whether it was written as an integer.
///
/// Integers serialize without a decimal point (`42`), doubles always carry
/// one (`42.0`), so lengths and precisions never turn into floats in the
/// exported document.
struct JsonNumber {
    enum class Kind : uint8_t {
        Int64, ///< `i64` is active
        Double ///< `f64` is active
    };

    Kind kind = Kind::Int64;
    int64_t i64 = 0;
    double f64 = 0.0;

    JsonNumber() = default;
    explicit JsonNumber(int64_t value) : kind(Kind::Int64), i64(value) {}
    explicit JsonNumber(double value) : kind(Kind::Double), f64(value) {}

    [[nodiscard]] auto is_integer() const -> bool {
        return kind == Kind::Int64;
    }

    /// Returns the value as a double (lossy for integers above 2^53).
    [[nodiscard]] auto as_f64() const -> double {
        return kind == Kind::Int64 ? static_cast<double>(i64) : f64;
    }

    /// Numbers of different kinds compare by their double value.
    [[nodiscard]] auto operator==(const JsonNumber& other) const -> bool {
        if (kind != other.kind) {
            return as_f64() == other.as_f64();
        }
        return kind == Kind::Int64 ? i64 == other.i64 : f64 == other.f64;
    }
};

// ============================================================================
// JsonValue
// ============================================================================

/// Any JSON value.
///
/// Arrays and objects are boxed so the variant stays finite. Because of the
/// boxes a `JsonValue` is move-only; use `clone()` for a deep copy.
struct JsonValue {
    using Null = std::monostate;

    using ValueVariant =
        std::variant<Null, bool, JsonNumber, std::string, Box<JsonArray>, Box<JsonObject>>;

    ValueVariant data;

    JsonValue() : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(int value) : data(JsonNumber(static_cast<int64_t>(value))) {}
    explicit JsonValue(int64_t value) : data(JsonNumber(value)) {}
    explicit JsonValue(uint32_t value) : data(JsonNumber(static_cast<int64_t>(value))) {}
    explicit JsonValue(double value) : data(JsonNumber(value)) {}
    explicit JsonValue(JsonNumber value) : data(value) {}
    explicit JsonValue(const char* value) : data(std::string(value)) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(std::string_view value) : data(std::string(value)) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }

    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }

    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<JsonNumber>(data);
    }

    [[nodiscard]] auto is_integer() const -> bool {
        const auto* num = std::get_if<JsonNumber>(&data);
        return num != nullptr && num->is_integer();
    }

    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }

    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    // ========================================================================
    // Accessors
    // ========================================================================
    //
    // All accessors throw `std::bad_variant_access` on a type mismatch.

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }

    [[nodiscard]] auto as_number() const -> const JsonNumber& {
        return std::get<JsonNumber>(data);
    }

    /// Integer value; doubles are truncated.
    [[nodiscard]] auto as_i64() const -> int64_t {
        const auto& num = as_number();
        return num.is_integer() ? num.i64 : static_cast<int64_t>(num.f64);
    }

    [[nodiscard]] auto as_f64() const -> double {
        return as_number().as_f64();
    }

    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }

    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    [[nodiscard]] auto as_array_mut() -> JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto as_object_mut() -> JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    /// Looks up `key` in an object. Returns `nullptr` for a missing key or a
    /// non-object value.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue* {
        if (const auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            auto it = (*obj)->find(key);
            if (it != (*obj)->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    [[nodiscard]] auto contains(const std::string& key) const -> bool {
        return get(key) != nullptr;
    }

    /// Array element at `index` (throws `std::out_of_range` past the end).
    [[nodiscard]] auto operator[](size_t index) const -> const JsonValue& {
        return as_array().at(index);
    }

    /// Number of elements of an array or object, 0 otherwise.
    [[nodiscard]] auto size() const -> size_t {
        if (const auto* arr = std::get_if<Box<JsonArray>>(&data)) {
            return (*arr)->size();
        }
        if (const auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            return (*obj)->size();
        }
        return 0;
    }

    // ========================================================================
    // Mutation
    // ========================================================================

    void push(JsonValue value) {
        as_array_mut().push_back(std::move(value));
    }

    void set(const std::string& key, JsonValue value) {
        as_object_mut()[key] = std::move(value);
    }

    // ========================================================================
    // Serialization
    // ========================================================================

    /// Compact text, no whitespace.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Indented text with one member or element per line.
    [[nodiscard]] auto to_string_pretty(int indent = 2) const -> std::string;

    /// Writes the compact form to `os`.
    auto write_to(std::ostream& os) const -> std::ostream&;

    /// Deep copy.
    [[nodiscard]] auto clone() const -> JsonValue;

    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;

    [[nodiscard]] auto operator!=(const JsonValue& other) const -> bool {
        return !(*this == other);
    }
};

// ============================================================================
// Factory Functions
// ============================================================================

inline auto json_null() -> JsonValue {
    return JsonValue();
}

inline auto json_bool(bool value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_int(int64_t value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_float(double value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_string(std::string value) -> JsonValue {
    return JsonValue(std::move(value));
}

inline auto json_array() -> JsonValue {
    return JsonValue(JsonArray{});
}

inline auto json_object() -> JsonValue {
    return JsonValue(JsonObject{});
}

/// Builds a JSON array of strings.
inline auto json_string_array(const std::vector<std::string>& values) -> JsonValue {
    JsonArray arr;
    arr.reserve(values.size());
    for (const auto& v : values) {
        arr.emplace_back(v);
    }
    return JsonValue(std::move(arr));
}

} // namespace schemly::json
