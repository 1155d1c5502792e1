//! # Naming Convention Tests
//!
//! Case conversion, English inflection, derived table / key / pivot names
//! and identifier checks.

#include "schema/naming.hpp"

#include <gtest/gtest.h>

using namespace schemly::schema;

// ============================================================================
// Case Conversion
// ============================================================================

TEST(NamingCaseTest, SnakeCase) {
    EXPECT_EQ(snake_case("User"), "user");
    EXPECT_EQ(snake_case("BlogPost"), "blog_post");
    EXPECT_EQ(snake_case("blogPost"), "blog_post");
    EXPECT_EQ(snake_case("HTTPServer"), "http_server");
    EXPECT_EQ(snake_case("Order2Item"), "order2_item");
    EXPECT_EQ(snake_case("already_snake"), "already_snake");
    EXPECT_EQ(snake_case("kebab-case name"), "kebab_case_name");
    EXPECT_EQ(snake_case("trailing_"), "trailing");
    EXPECT_EQ(snake_case(""), "");
}

TEST(NamingCaseTest, CamelAndPascalCase) {
    EXPECT_EQ(camel_case("BlogPost"), "blogPost");
    EXPECT_EQ(camel_case("blog_post"), "blogPost");
    EXPECT_EQ(camel_case("User"), "user");
    EXPECT_EQ(pascal_case("blog_post"), "BlogPost");
    EXPECT_EQ(pascal_case("order-item"), "OrderItem");
}

TEST(NamingCaseTest, KebabCase) {
    EXPECT_EQ(kebab_case("BlogPost"), "blog-post");
    EXPECT_EQ(kebab_case("user"), "user");
}

// ============================================================================
// Inflection
// ============================================================================

TEST(NamingInflectionTest, PluralizeRegular) {
    EXPECT_EQ(pluralize("post"), "posts");
    EXPECT_EQ(pluralize("category"), "categories");
    EXPECT_EQ(pluralize("day"), "days");
    EXPECT_EQ(pluralize("box"), "boxes");
    EXPECT_EQ(pluralize("address"), "addresses");
    EXPECT_EQ(pluralize("branch"), "branches");
    EXPECT_EQ(pluralize("wolf"), "wolves");
    EXPECT_EQ(pluralize("knife"), "knives");
    EXPECT_EQ(pluralize("cliff"), "cliffs");
}

TEST(NamingInflectionTest, PluralizeIrregularAndUncountable) {
    EXPECT_EQ(pluralize("person"), "people");
    EXPECT_EQ(pluralize("Person"), "People");
    EXPECT_EQ(pluralize("child"), "children");
    EXPECT_EQ(pluralize("news"), "news");
    EXPECT_EQ(pluralize("equipment"), "equipment");
}

TEST(NamingInflectionTest, PluralizeLastSegmentOnly) {
    EXPECT_EQ(pluralize("blog_post"), "blog_posts");
    EXPECT_EQ(pluralize("order_category"), "order_categories");
    EXPECT_EQ(pluralize("sales_person"), "sales_people");
}

TEST(NamingInflectionTest, Singularize) {
    EXPECT_EQ(singularize("posts"), "post");
    EXPECT_EQ(singularize("categories"), "category");
    EXPECT_EQ(singularize("boxes"), "box");
    EXPECT_EQ(singularize("addresses"), "address");
    EXPECT_EQ(singularize("wolves"), "wolf");
    EXPECT_EQ(singularize("knives"), "knife");
    EXPECT_EQ(singularize("people"), "person");
    EXPECT_EQ(singularize("status"), "status");
    EXPECT_EQ(singularize("statuses"), "status");
    EXPECT_EQ(singularize("analysis"), "analysis");
    EXPECT_EQ(singularize("data"), "data");
    EXPECT_EQ(singularize("blog_posts"), "blog_post");
}

TEST(NamingInflectionTest, EmptyInput) {
    EXPECT_EQ(pluralize(""), "");
    EXPECT_EQ(singularize(""), "");
}

// ============================================================================
// Derived Names
// ============================================================================

TEST(NamingDerivedTest, TableNames) {
    EXPECT_EQ(table_name_for("User"), "users");
    EXPECT_EQ(table_name_for("BlogPost"), "blog_posts");
    EXPECT_EQ(table_name_for("Category"), "categories");
    EXPECT_EQ(table_name_for("Person"), "people");
}

TEST(NamingDerivedTest, ForeignKeys) {
    EXPECT_EQ(foreign_key_for("User"), "user_id");
    EXPECT_EQ(foreign_key_for("BlogPost"), "blog_post_id");
    EXPECT_EQ(foreign_key_for("Category"), "category_id");
}

TEST(NamingDerivedTest, PivotNamesAreOrderIndependent) {
    EXPECT_EQ(pivot_name_for("posts", "tags"), "posts_tags");
    EXPECT_EQ(pivot_name_for("tags", "posts"), "posts_tags");
    EXPECT_EQ(pivot_name_for("users", "users"), "users_users");
    EXPECT_EQ(pivot_name_for("roles", "blog_posts"), "blog_posts_roles");
}

// ============================================================================
// Identifier Checks
// ============================================================================

TEST(NamingIdentifierTest, ValidIdentifiers) {
    EXPECT_TRUE(is_valid_identifier("User"));
    EXPECT_TRUE(is_valid_identifier("_private"));
    EXPECT_TRUE(is_valid_identifier("field2"));
    EXPECT_FALSE(is_valid_identifier(""));
    EXPECT_FALSE(is_valid_identifier("2fast"));
    EXPECT_FALSE(is_valid_identifier("has-dash"));
    EXPECT_FALSE(is_valid_identifier("has space"));
    EXPECT_FALSE(is_valid_identifier(std::string(65, 'a')));
    EXPECT_TRUE(is_valid_identifier(std::string(64, 'a')));
}

TEST(NamingIdentifierTest, TableNames) {
    EXPECT_TRUE(is_valid_table_name("users"));
    EXPECT_TRUE(is_valid_table_name("2024_events"));
    EXPECT_FALSE(is_valid_table_name(""));
    EXPECT_FALSE(is_valid_table_name("user-data"));
    EXPECT_FALSE(is_valid_table_name(std::string(129, 't')));
}

TEST(NamingIdentifierTest, ReservedWords) {
    EXPECT_TRUE(is_reserved_word("class"));
    EXPECT_TRUE(is_reserved_word("Class"));
    EXPECT_TRUE(is_reserved_word("LIST"));
    EXPECT_TRUE(is_reserved_word("object"));
    EXPECT_FALSE(is_reserved_word("User"));
    EXPECT_FALSE(is_reserved_word("Post"));
}
