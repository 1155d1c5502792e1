//! # Field Type Resolver Implementation

#include "schema/field_resolver.hpp"

#include "log/log.hpp"
#include "schema/naming.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <set>

namespace schemly::schema {

namespace {

constexpr int64_t MAX_DECIMAL_PRECISION = 65;

auto is_integer_literal(std::string_view text, bool allow_negative) -> bool {
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
        if (text[0] == '-' && !allow_negative) {
            return false;
        }
        text.remove_prefix(1);
    }
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

auto is_numeric_literal(std::string_view text, bool allow_negative) -> bool {
    if (text.empty() || std::isspace(static_cast<unsigned char>(text[0])) != 0) {
        return false;
    }
    std::string copy(text);
    char* end = nullptr;
    double value = std::strtod(copy.c_str(), &end);
    if (end != copy.c_str() + copy.size()) {
        return false;
    }
    return allow_negative || value >= 0.0;
}

auto is_numeric_type(FieldType type) -> bool {
    return is_integer_type(type) || type == FieldType::Float || type == FieldType::Decimal;
}

} // namespace

auto is_compatible_default(const Field& field, std::string_view value) -> bool {
    if (field.nullable && to_lower(value) == "null") {
        return true;
    }
    if (field.type == FieldType::Boolean) {
        std::string lower = to_lower(value);
        return lower == "true" || lower == "false" || lower == "1" || lower == "0";
    }
    if (is_integer_type(field.type)) {
        return is_integer_literal(value, !field.is_unsigned);
    }
    if (field.type == FieldType::Float || field.type == FieldType::Decimal) {
        return is_numeric_literal(value, !field.is_unsigned);
    }
    if (field.type == FieldType::Enum) {
        return std::any_of(field.enum_values.begin(), field.enum_values.end(),
                           [&](const EnumValue& e) { return e.value == value; });
    }
    return true;
}

auto resolve_field(const RawField& raw, std::string_view owner) -> Result<Field, ErrorList> {
    ErrorList errors;
    ErrorLocation where;
    where.entity = std::string(owner);
    where.field = raw.name;
    where.mark = raw.mark;

    auto type = parse_field_type(raw.type);
    if (!type) {
        auto err = make_error(ErrorKind::UnknownFieldType,
                              "unknown field type '" + raw.type + "'", where);
        err.notes.push_back("expected one of: string, text, mediumText, longText, tinyInteger, "
                            "smallInteger, mediumInteger, integer, bigInteger, float, decimal, "
                            "boolean, date, dateTime, timestamp, time, json, uuid, enum, binary, "
                            "ipAddress");
        errors.push_back(std::move(err));
        return errors;
    }

    Field field;
    field.name = raw.name;
    field.type = *type;
    field.nullable = raw.nullable.value_or(false);
    field.unique = raw.unique.value_or(false);
    field.indexed = raw.index.value_or(false);
    field.is_unsigned = raw.is_unsigned.value_or(false);
    field.auto_increment = raw.auto_increment.value_or(false);
    field.primary = raw.primary.value_or(false);
    field.comment = raw.comment;
    field.validation_rules = raw.validation_rules;
    field.mark = raw.mark;

    // Length
    if (is_string_type(field.type)) {
        if (raw.length) {
            if (*raw.length <= 0 || *raw.length > std::numeric_limits<uint32_t>::max()) {
                errors.push_back(make_error(ErrorKind::InvalidFieldLength,
                                            "string length must be positive, got " +
                                                std::to_string(*raw.length),
                                            where));
            } else {
                field.length = static_cast<uint32_t>(*raw.length);
            }
        } else {
            field.length = DEFAULT_STRING_LENGTH;
        }
    } else if (raw.length) {
        SCHEMLY_LOG_WARN("field", owner << "." << raw.name << ": ignoring length on "
                                        << field_type_name(field.type) << " field");
    }

    // Decimal precision
    if (field.type == FieldType::Decimal) {
        if (!raw.precision) {
            auto err = make_error(ErrorKind::MissingDecimalPrecision,
                                  "decimal field requires a precision", where);
            err.notes.push_back("add `decimalPrecision: { precision: 10, scale: 2 }`");
            errors.push_back(std::move(err));
        } else {
            int64_t precision = *raw.precision;
            int64_t scale = raw.scale.value_or(0);
            if (precision < 1 || precision > MAX_DECIMAL_PRECISION) {
                errors.push_back(make_error(ErrorKind::InvalidDecimalPrecision,
                                            "decimal precision must be between 1 and 65, got " +
                                                std::to_string(precision),
                                            where));
            } else if (scale < 0 || scale > precision) {
                errors.push_back(make_error(ErrorKind::InvalidDecimalPrecision,
                                            "decimal scale " + std::to_string(scale) +
                                                " must be between 0 and the precision (" +
                                                std::to_string(precision) + ")",
                                            where));
            } else {
                field.decimal =
                    DecimalSpec{static_cast<uint32_t>(precision), static_cast<uint32_t>(scale)};
            }
        }
    } else if (raw.precision || raw.scale) {
        SCHEMLY_LOG_WARN("field", owner << "." << raw.name << ": ignoring precision on "
                                        << field_type_name(field.type) << " field");
    }

    // Enum values
    bool enum_ok = true;
    if (field.type == FieldType::Enum) {
        if (!raw.enum_values || raw.enum_values->empty()) {
            errors.push_back(make_error(ErrorKind::MissingEnumValues,
                                        "enum field requires at least one value", where));
            enum_ok = false;
        } else {
            std::set<std::string> seen;
            std::set<std::string> reported;
            for (const auto& value : *raw.enum_values) {
                if (value.value.empty()) {
                    errors.push_back(
                        make_error(ErrorKind::EmptyEnumValue, "enum value must not be empty", where));
                    enum_ok = false;
                    continue;
                }
                if (!seen.insert(value.value).second) {
                    if (reported.insert(value.value).second) {
                        errors.push_back(make_error(ErrorKind::DuplicateEnumValue,
                                                    "duplicate enum value '" + value.value + "'",
                                                    where));
                    }
                    enum_ok = false;
                    continue;
                }
                field.enum_values.push_back(
                    EnumValue{value.value, value.label.value_or(value.value)});
            }
        }
    } else if (raw.enum_values && !raw.enum_values->empty()) {
        SCHEMLY_LOG_WARN("field", owner << "." << raw.name << ": ignoring enum values on "
                                        << field_type_name(field.type) << " field");
    }

    if (field.auto_increment && !is_integer_type(field.type)) {
        errors.push_back(make_error(ErrorKind::InvalidAutoIncrement,
                                    std::string("auto-increment requires an integer type, got ") +
                                        field_type_name(field.type),
                                    where));
    }

    if (field.primary && field.nullable) {
        errors.push_back(make_error(ErrorKind::NullablePrimaryKey,
                                    "primary key column cannot be nullable", where));
    }

    if (field.is_unsigned && !is_numeric_type(field.type)) {
        SCHEMLY_LOG_WARN("field", owner << "." << raw.name << ": ignoring unsigned on "
                                        << field_type_name(field.type) << " field");
        field.is_unsigned = false;
    }

    if (raw.default_value) {
        // Enum defaults can only be checked against a valid value list
        if (field.type != FieldType::Enum || enum_ok) {
            if (!is_compatible_default(field, *raw.default_value)) {
                errors.push_back(make_error(ErrorKind::InvalidDefaultValue,
                                            "default value '" + *raw.default_value +
                                                "' is not a valid " +
                                                field_type_name(field.type),
                                            where));
            }
        }
        field.default_value = raw.default_value;
    }

    field.cast = raw.cast_type ? raw.cast_type : default_cast(field.type);

    if (!errors.empty()) {
        return errors;
    }

    SCHEMLY_LOG_TRACE("field", owner << "." << field.name << ": " << field_type_name(field.type));
    return field;
}

} // namespace schemly::schema
