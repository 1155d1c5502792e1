//! # Schema Errors Implementation

#include "schema/error.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace schemly::schema {

auto error_category(ErrorKind kind) -> ErrorCategory {
    switch (kind) {
    case ErrorKind::MalformedInput:
    case ErrorKind::InvalidOption:
        return ErrorCategory::Input;
    case ErrorKind::UnknownFieldType:
    case ErrorKind::MissingDecimalPrecision:
    case ErrorKind::InvalidDecimalPrecision:
    case ErrorKind::MissingEnumValues:
    case ErrorKind::DuplicateEnumValue:
    case ErrorKind::EmptyEnumValue:
    case ErrorKind::InvalidFieldLength:
    case ErrorKind::InvalidAutoIncrement:
    case ErrorKind::NullablePrimaryKey:
    case ErrorKind::InvalidDefaultValue:
        return ErrorCategory::Field;
    case ErrorKind::UnknownTargetEntity:
    case ErrorKind::UnknownRelationshipKind:
    case ErrorKind::PivotKeyConflict:
    case ErrorKind::UnmatchedMorphName:
    case ErrorKind::CascadePolicyConflict:
        return ErrorCategory::Relationship;
    case ErrorKind::CyclicDependency:
        return ErrorCategory::Graph;
    case ErrorKind::DuplicateEntityName:
    case ErrorKind::DuplicateTableName:
    case ErrorKind::DuplicateFieldName:
    case ErrorKind::EmptyEntity:
    case ErrorKind::InvalidIdentifier:
    case ErrorKind::ReservedIdentifier:
    case ErrorKind::ManualPrimaryKey:
        return ErrorCategory::Validation;
    }
    return ErrorCategory::Validation;
}

auto error_code(ErrorKind kind) -> const char* {
    switch (kind) {
    case ErrorKind::MalformedInput:
        return "M001";
    case ErrorKind::InvalidOption:
        return "M002";
    case ErrorKind::UnknownFieldType:
        return "F001";
    case ErrorKind::MissingDecimalPrecision:
        return "F002";
    case ErrorKind::InvalidDecimalPrecision:
        return "F003";
    case ErrorKind::MissingEnumValues:
        return "F004";
    case ErrorKind::DuplicateEnumValue:
        return "F005";
    case ErrorKind::EmptyEnumValue:
        return "F006";
    case ErrorKind::InvalidFieldLength:
        return "F007";
    case ErrorKind::InvalidAutoIncrement:
        return "F008";
    case ErrorKind::NullablePrimaryKey:
        return "F009";
    case ErrorKind::InvalidDefaultValue:
        return "F010";
    case ErrorKind::UnknownTargetEntity:
        return "R001";
    case ErrorKind::UnknownRelationshipKind:
        return "R002";
    case ErrorKind::PivotKeyConflict:
        return "R003";
    case ErrorKind::UnmatchedMorphName:
        return "R004";
    case ErrorKind::CascadePolicyConflict:
        return "R005";
    case ErrorKind::CyclicDependency:
        return "G001";
    case ErrorKind::DuplicateEntityName:
        return "V001";
    case ErrorKind::DuplicateTableName:
        return "V002";
    case ErrorKind::DuplicateFieldName:
        return "V003";
    case ErrorKind::EmptyEntity:
        return "V004";
    case ErrorKind::InvalidIdentifier:
        return "V005";
    case ErrorKind::ReservedIdentifier:
        return "V006";
    case ErrorKind::ManualPrimaryKey:
        return "V007";
    }
    return "V000";
}

auto error_kind_name(ErrorKind kind) -> const char* {
    switch (kind) {
    case ErrorKind::MalformedInput:
        return "MalformedInput";
    case ErrorKind::InvalidOption:
        return "InvalidOption";
    case ErrorKind::UnknownFieldType:
        return "UnknownFieldType";
    case ErrorKind::MissingDecimalPrecision:
        return "MissingDecimalPrecision";
    case ErrorKind::InvalidDecimalPrecision:
        return "InvalidDecimalPrecision";
    case ErrorKind::MissingEnumValues:
        return "MissingEnumValues";
    case ErrorKind::DuplicateEnumValue:
        return "DuplicateEnumValue";
    case ErrorKind::EmptyEnumValue:
        return "EmptyEnumValue";
    case ErrorKind::InvalidFieldLength:
        return "InvalidFieldLength";
    case ErrorKind::InvalidAutoIncrement:
        return "InvalidAutoIncrement";
    case ErrorKind::NullablePrimaryKey:
        return "NullablePrimaryKey";
    case ErrorKind::InvalidDefaultValue:
        return "InvalidDefaultValue";
    case ErrorKind::UnknownTargetEntity:
        return "UnknownTargetEntity";
    case ErrorKind::UnknownRelationshipKind:
        return "UnknownRelationshipKind";
    case ErrorKind::PivotKeyConflict:
        return "PivotKeyConflict";
    case ErrorKind::UnmatchedMorphName:
        return "UnmatchedMorphName";
    case ErrorKind::CascadePolicyConflict:
        return "CascadePolicyConflict";
    case ErrorKind::CyclicDependency:
        return "CyclicDependency";
    case ErrorKind::DuplicateEntityName:
        return "DuplicateEntityName";
    case ErrorKind::DuplicateTableName:
        return "DuplicateTableName";
    case ErrorKind::DuplicateFieldName:
        return "DuplicateFieldName";
    case ErrorKind::EmptyEntity:
        return "EmptyEntity";
    case ErrorKind::InvalidIdentifier:
        return "InvalidIdentifier";
    case ErrorKind::ReservedIdentifier:
        return "ReservedIdentifier";
    case ErrorKind::ManualPrimaryKey:
        return "ManualPrimaryKey";
    }
    return "Unknown";
}

// ============================================================================
// Formatting
// ============================================================================

auto ErrorLocation::describe() const -> std::string {
    std::ostringstream oss;
    const char* sep = "";
    auto part = [&](const char* label, const std::string& value) {
        if (!value.empty()) {
            oss << sep << label << " `" << value << "`";
            sep = ", ";
        }
    };
    part("entity", entity);
    part("field", field);
    part("relationship", relationship);
    part("pivot", pivot);
    if (mark.is_known()) {
        oss << (*sep ? " " : "") << "(line " << mark.line << ", column " << mark.column << ")";
    }
    return oss.str();
}

auto SchemaError::to_string() const -> std::string {
    std::ostringstream oss;
    oss << "error[" << code() << "] " << error_kind_name(kind) << ": " << message;
    if (!location.empty()) {
        oss << "\n  --> " << location.describe();
    }
    for (const auto& note : notes) {
        oss << "\n  = note: " << note;
    }
    return oss.str();
}

auto make_error(ErrorKind kind, std::string message, ErrorLocation location) -> SchemaError {
    return SchemaError{kind, std::move(message), std::move(location), {}};
}

void append_errors(ErrorList& into, ErrorList from) {
    into.reserve(into.size() + from.size());
    for (auto& err : from) {
        into.push_back(std::move(err));
    }
}

auto has_error(const ErrorList& errors, ErrorKind kind) -> bool {
    return count_errors(errors, kind) > 0;
}

auto count_errors(const ErrorList& errors, ErrorKind kind) -> size_t {
    return static_cast<size_t>(std::count_if(
        errors.begin(), errors.end(), [kind](const SchemaError& e) { return e.kind == kind; }));
}

auto format_errors(const ErrorList& errors) -> std::string {
    std::ostringstream oss;
    for (const auto& err : errors) {
        oss << err.to_string() << "\n\n";
    }
    oss << errors.size() << (errors.size() == 1 ? " error" : " errors") << "\n";
    return oss.str();
}

} // namespace schemly::schema
