//! # JSON Serializer
//!
//! Converts `JsonValue` trees to text, compact or indented.
//!
//! Strings escape `"`, `\`, the short control escapes (`\b \f \n \r \t`) and
//! every other byte below 0x20 as `\u00XX`. Non-finite doubles are written
//! as `null`. Object members come out in key order because `JsonObject` is
//! a `std::map`.

#include "json/json_value.hpp"

#include <cmath>
#include <cstdio>
#include <ostream>
#include <sstream>

namespace schemly::json {

namespace {

void append_escaped(const std::string& s, std::string& out) {
    out += '"';
    for (char c : s) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                out += buf;
            } else {
                out += c;
            }
            break;
        }
    }
    out += '"';
}

auto format_number(const JsonNumber& num) -> std::string {
    if (num.is_integer()) {
        return std::to_string(num.i64);
    }
    if (std::isnan(num.f64) || std::isinf(num.f64)) {
        return "null";
    }

    std::ostringstream oss;
    oss.precision(17);
    oss << num.f64;
    std::string result = oss.str();

    // Keep doubles recognizable as doubles
    if (result.find_first_of(".eE") == std::string::npos) {
        result += ".0";
    }
    return result;
}

/// Writes `value`; `indent < 0` selects the compact form.
void serialize(const JsonValue& value, std::string& out, int indent, int depth) {
    if (value.is_null()) {
        out += "null";
        return;
    }
    if (value.is_bool()) {
        out += value.as_bool() ? "true" : "false";
        return;
    }
    if (value.is_number()) {
        out += format_number(value.as_number());
        return;
    }
    if (value.is_string()) {
        append_escaped(value.as_string(), out);
        return;
    }

    const bool pretty = indent >= 0;
    auto newline = [&](int level) {
        if (pretty) {
            out += '\n';
            out.append(static_cast<size_t>(level * indent), ' ');
        }
    };

    if (value.is_array()) {
        const auto& arr = value.as_array();
        if (arr.empty()) {
            out += "[]";
            return;
        }
        out += '[';
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                out += ',';
            }
            newline(depth + 1);
            serialize(arr[i], out, indent, depth + 1);
        }
        newline(depth);
        out += ']';
        return;
    }

    const auto& obj = value.as_object();
    if (obj.empty()) {
        out += "{}";
        return;
    }
    out += '{';
    bool first = true;
    for (const auto& [key, member] : obj) {
        if (!first) {
            out += ',';
        }
        first = false;
        newline(depth + 1);
        append_escaped(key, out);
        out += pretty ? ": " : ":";
        serialize(member, out, indent, depth + 1);
    }
    newline(depth);
    out += '}';
}

} // namespace

auto JsonValue::to_string() const -> std::string {
    std::string out;
    serialize(*this, out, -1, 0);
    return out;
}

auto JsonValue::to_string_pretty(int indent) const -> std::string {
    std::string out;
    serialize(*this, out, indent < 0 ? 0 : indent, 0);
    return out;
}

auto JsonValue::write_to(std::ostream& os) const -> std::ostream& {
    return os << to_string();
}

} // namespace schemly::json
