//! # Field Type Resolver Tests

#include "schema/field_resolver.hpp"

#include <gtest/gtest.h>

using namespace schemly;
using namespace schemly::schema;

class FieldResolverTest : public ::testing::Test {
protected:
    static auto raw(const std::string& name, const std::string& type) -> RawField {
        RawField field;
        field.name = name;
        field.type = type;
        return field;
    }

    static auto ok(const RawField& field) -> Field {
        auto result = resolve_field(field, "Post");
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? format_errors(unwrap_err(result)) : "");
        if (is_err(result)) {
            return {};
        }
        return unwrap(result);
    }

    static auto errors(const RawField& field) -> ErrorList {
        auto result = resolve_field(field, "Post");
        EXPECT_TRUE(is_err(result));
        if (is_ok(result)) {
            return {};
        }
        return unwrap_err(result);
    }
};

// ============================================================================
// Types
// ============================================================================

TEST_F(FieldResolverTest, TypeSpellings) {
    EXPECT_EQ(parse_field_type("string"), FieldType::String);
    EXPECT_EQ(parse_field_type("varchar"), FieldType::String);
    EXPECT_EQ(parse_field_type("bigInteger"), FieldType::BigInteger);
    EXPECT_EQ(parse_field_type("big_integer"), FieldType::BigInteger);
    EXPECT_EQ(parse_field_type("BIGINT"), FieldType::BigInteger);
    EXPECT_EQ(parse_field_type("dateTime"), FieldType::DateTime);
    EXPECT_EQ(parse_field_type("inet"), FieldType::IpAddress);
    EXPECT_EQ(parse_field_type("double"), FieldType::Float);
    EXPECT_FALSE(parse_field_type("money").has_value());
}

TEST_F(FieldResolverTest, UnknownType) {
    auto errs = errors(raw("price", "money"));
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].kind, ErrorKind::UnknownFieldType);
    EXPECT_EQ(errs[0].location.entity, "Post");
    EXPECT_EQ(errs[0].location.field, "price");
    EXPECT_FALSE(errs[0].notes.empty());
}

TEST_F(FieldResolverTest, DerivedCasts) {
    EXPECT_EQ(ok(raw("flag", "boolean")).cast, "boolean");
    EXPECT_EQ(ok(raw("count", "integer")).cast, "integer");
    EXPECT_EQ(ok(raw("meta", "json")).cast, "array");
    EXPECT_EQ(ok(raw("at", "timestamp")).cast, "datetime");
    EXPECT_FALSE(ok(raw("title", "string")).cast.has_value());

    auto field = raw("meta", "json");
    field.cast_type = "collection";
    EXPECT_EQ(ok(field).cast, "collection");
}

// ============================================================================
// Strings
// ============================================================================

TEST_F(FieldResolverTest, StringLength) {
    EXPECT_EQ(ok(raw("title", "string")).length, DEFAULT_STRING_LENGTH);

    auto field = raw("title", "string");
    field.length = 80;
    EXPECT_EQ(ok(field).length, 80u);

    field.length = 0;
    auto errs = errors(field);
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].kind, ErrorKind::InvalidFieldLength);
}

TEST_F(FieldResolverTest, LengthIgnoredOnNonStrings) {
    auto field = raw("body", "text");
    field.length = 500;
    EXPECT_FALSE(ok(field).length.has_value());
}

// ============================================================================
// Decimals
// ============================================================================

TEST_F(FieldResolverTest, DecimalPrecision) {
    auto field = raw("price", "decimal");
    field.precision = 10;
    field.scale = 2;
    auto resolved = ok(field);
    ASSERT_TRUE(resolved.decimal.has_value());
    EXPECT_EQ(resolved.decimal->precision, 10u);
    EXPECT_EQ(resolved.decimal->scale, 2u);

    field.scale.reset();
    EXPECT_EQ(ok(field).decimal->scale, 0u);
}

TEST_F(FieldResolverTest, DecimalWithoutPrecision) {
    auto errs = errors(raw("price", "decimal"));
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].kind, ErrorKind::MissingDecimalPrecision);
}

TEST_F(FieldResolverTest, DecimalBounds) {
    auto field = raw("price", "decimal");
    field.precision = 66;
    EXPECT_EQ(errors(field)[0].kind, ErrorKind::InvalidDecimalPrecision);

    field.precision = 0;
    EXPECT_EQ(errors(field)[0].kind, ErrorKind::InvalidDecimalPrecision);

    field.precision = 5;
    field.scale = 6;
    EXPECT_EQ(errors(field)[0].kind, ErrorKind::InvalidDecimalPrecision);

    field.precision = 65;
    field.scale = 65;
    EXPECT_TRUE(is_ok(resolve_field(field, "Post")));
}

// ============================================================================
// Enums
// ============================================================================

TEST_F(FieldResolverTest, EnumLabelsDefaultToValues) {
    auto field = raw("status", "enum");
    field.enum_values = std::vector<RawEnumValue>{{"draft", std::nullopt}, {"live", "Published"}};
    auto resolved = ok(field);
    ASSERT_EQ(resolved.enum_values.size(), 2u);
    EXPECT_EQ(resolved.enum_values[0], (EnumValue{"draft", "draft"}));
    EXPECT_EQ(resolved.enum_values[1], (EnumValue{"live", "Published"}));
}

TEST_F(FieldResolverTest, EnumProblems) {
    auto field = raw("status", "enum");
    EXPECT_EQ(errors(field)[0].kind, ErrorKind::MissingEnumValues);

    field.enum_values = std::vector<RawEnumValue>{};
    EXPECT_EQ(errors(field)[0].kind, ErrorKind::MissingEnumValues);

    field.enum_values = std::vector<RawEnumValue>{
        {"a", std::nullopt}, {"", std::nullopt}, {"a", std::nullopt}, {"a", std::nullopt}};
    auto errs = errors(field);
    EXPECT_EQ(count_errors(errs, ErrorKind::EmptyEnumValue), 1u);
    EXPECT_EQ(count_errors(errs, ErrorKind::DuplicateEnumValue), 1u);
}

// ============================================================================
// Flags and Defaults
// ============================================================================

TEST_F(FieldResolverTest, FlagConstraints) {
    auto field = raw("code", "string");
    field.auto_increment = true;
    EXPECT_EQ(errors(field)[0].kind, ErrorKind::InvalidAutoIncrement);

    auto key = raw("uuid", "uuid");
    key.primary = true;
    key.nullable = true;
    EXPECT_EQ(errors(key)[0].kind, ErrorKind::NullablePrimaryKey);

    auto counter = raw("counter", "bigInteger");
    counter.auto_increment = true;
    counter.is_unsigned = true;
    auto resolved = ok(counter);
    EXPECT_TRUE(resolved.auto_increment);
    EXPECT_TRUE(resolved.is_unsigned);

    auto title = raw("title", "string");
    title.is_unsigned = true;
    EXPECT_FALSE(ok(title).is_unsigned);
}

TEST_F(FieldResolverTest, DefaultValues) {
    Field flag;
    flag.type = FieldType::Boolean;
    EXPECT_TRUE(is_compatible_default(flag, "true"));
    EXPECT_TRUE(is_compatible_default(flag, "0"));
    EXPECT_FALSE(is_compatible_default(flag, "maybe"));

    Field count;
    count.type = FieldType::Integer;
    EXPECT_TRUE(is_compatible_default(count, "42"));
    EXPECT_TRUE(is_compatible_default(count, "-3"));
    EXPECT_FALSE(is_compatible_default(count, "4.2"));
    EXPECT_FALSE(is_compatible_default(count, "null"));
    count.is_unsigned = true;
    EXPECT_FALSE(is_compatible_default(count, "-3"));
    count.nullable = true;
    EXPECT_TRUE(is_compatible_default(count, "null"));

    Field price;
    price.type = FieldType::Decimal;
    EXPECT_TRUE(is_compatible_default(price, "9.99"));
    EXPECT_FALSE(is_compatible_default(price, "9.99 EUR"));

    Field title;
    title.type = FieldType::String;
    EXPECT_TRUE(is_compatible_default(title, "anything"));
}

TEST_F(FieldResolverTest, IncompatibleDefault) {
    auto field = raw("status", "enum");
    field.enum_values = std::vector<RawEnumValue>{{"draft", std::nullopt}};
    field.default_value = "archived";
    EXPECT_EQ(errors(field)[0].kind, ErrorKind::InvalidDefaultValue);

    field.default_value = "draft";
    EXPECT_EQ(ok(field).default_value, "draft");
}

TEST_F(FieldResolverTest, IndependentProblemsAreAllReported) {
    auto field = raw("price", "decimal");
    field.auto_increment = true;
    field.primary = true;
    field.nullable = true;
    auto errs = errors(field);
    EXPECT_EQ(errs.size(), 3u);
    EXPECT_TRUE(has_error(errs, ErrorKind::MissingDecimalPrecision));
    EXPECT_TRUE(has_error(errs, ErrorKind::InvalidAutoIncrement));
    EXPECT_TRUE(has_error(errs, ErrorKind::NullablePrimaryKey));
}
