//! # Schema Resolver Tests
//!
//! End-to-end resolution of whole documents: inference, pivot merging,
//! polymorphic matching, emission order and error accumulation.

#include "schema/resolver.hpp"

#include "schema/export.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <string>

using namespace schemly;
using namespace schemly::schema;

class SchemaResolverTest : public ::testing::Test {
protected:
    SchemaResolver resolver{ResolveSettings{false}};

    auto resolve_ok(const std::string& text) -> ResolvedSchema {
        auto result = resolver.resolve_string(text);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? format_errors(unwrap_err(result)) : "");
        if (is_err(result)) {
            return {};
        }
        return std::move(unwrap(result));
    }

    auto resolve_err(const std::string& text) -> ErrorList {
        auto result = resolver.resolve_string(text);
        EXPECT_TRUE(is_err(result));
        if (is_ok(result)) {
            return {};
        }
        return std::move(unwrap_err(result));
    }

    static auto position(const ResolvedSchema& schema, EmissionStep::Kind kind,
                         const std::string& name) -> size_t {
        const auto& order = schema.emission_order;
        auto it = std::find(order.begin(), order.end(), EmissionStep{kind, name});
        return static_cast<size_t>(it - order.begin());
    }

    /// Every node is emitted after everything it references.
    static void expect_topological(const ResolvedSchema& schema) {
        using Kind = EmissionStep::Kind;
        for (const auto& entity : schema.entities) {
            for (const auto& rel : entity.relationships) {
                if (!rel.is<BelongsTo>() || rel.as<BelongsTo>().target == entity.name) {
                    continue;
                }
                EXPECT_LT(position(schema, Kind::Entity, rel.as<BelongsTo>().target),
                          position(schema, Kind::Entity, entity.name))
                    << entity.name << "." << rel.method_name;
            }
        }
        for (const auto& pivot : schema.pivots) {
            for (const auto& referenced : pivot.referenced_entities()) {
                EXPECT_LT(position(schema, Kind::Entity, referenced),
                          position(schema, Kind::Pivot, pivot.name))
                    << pivot.name;
            }
        }
    }
};

// ============================================================================
// Inference
// ============================================================================

TEST_F(SchemaResolverTest, BelongsToOrdersTargetFirst) {
    auto schema = resolve_ok(R"(
models:
  - name: Post
    fields: [{ name: title, type: string }]
    relationships:
      - { type: belongsTo, model: User }
  - name: User
    fields: [{ name: name, type: string }]
)");
    ASSERT_EQ(schema.entities.size(), 2u);
    EXPECT_EQ(schema.entities[0].name, "User");
    EXPECT_EQ(schema.entities[1].name, "Post");
    EXPECT_EQ(schema.entities[1].table, "posts");

    const auto& rel = schema.entities[1].relationships[0];
    EXPECT_EQ(rel.method_name, "user");
    EXPECT_EQ(rel.as<BelongsTo>().foreign_key, "user_id");
    EXPECT_EQ(rel.as<BelongsTo>().owner_key, "id");
    expect_topological(schema);
}

TEST_F(SchemaResolverTest, ExplicitForeignKeyWins) {
    auto schema = resolve_ok(R"(
models:
  - name: User
    fields: [{ name: name, type: string }]
  - name: Post
    fields:
      - { name: author_id, type: bigInteger, nullable: true }
    relationships:
      - { type: belongsTo, model: User, name: author, foreignKey: author_id, onDelete: set-null }
)");
    const Entity* post = schema.find_entity("Post");
    ASSERT_NE(post, nullptr);
    EXPECT_EQ(post->relationships[0].method_name, "author");
    EXPECT_EQ(post->relationships[0].as<BelongsTo>().foreign_key, "author_id");
    EXPECT_EQ(post->relationships[0].as<BelongsTo>().on_delete, CascadePolicy::SetNull);
}

TEST_F(SchemaResolverTest, OptionsDefaultsAndOverrides) {
    auto schema = resolve_ok(R"(
outputDir: out
databaseEngine: PGSQL
models:
  - { name: User, timestamps: true }
)");
    EXPECT_EQ(schema.options.output_dir, "out");
    EXPECT_EQ(schema.options.database_engine, "pgsql");
    EXPECT_TRUE(schema.options.generate_models);
    EXPECT_TRUE(schema.entities[0].has_timestamps);
}

// ============================================================================
// Many-to-Many
// ============================================================================

TEST_F(SchemaResolverTest, ImplicitPivotIsSharedByBothSides) {
    auto schema = resolve_ok(R"(
models:
  - name: Tag
    fields: [{ name: label, type: string }]
    relationships:
      - { type: belongsToMany, model: Post }
  - name: Post
    fields: [{ name: title, type: string }]
    relationships:
      - { type: belongsToMany, model: Tag }
)");
    ASSERT_EQ(schema.pivots.size(), 1u);
    const Pivot& pivot = schema.pivots[0];
    EXPECT_EQ(pivot.name, "posts_tags");
    EXPECT_EQ(pivot.first_key, "post_id");
    EXPECT_EQ(pivot.second_key, "tag_id");

    const auto& from_tag = schema.find_entity("Tag")->relationships[0].as<BelongsToMany>();
    const auto& from_post = schema.find_entity("Post")->relationships[0].as<BelongsToMany>();
    EXPECT_EQ(from_tag.pivot, "posts_tags");
    EXPECT_EQ(from_post.pivot, "posts_tags");
    EXPECT_EQ(from_post.foreign_pivot_key, "post_id");
    EXPECT_EQ(from_post.related_pivot_key, "tag_id");
    EXPECT_EQ(from_tag.foreign_pivot_key, "tag_id");
    EXPECT_EQ(from_tag.related_pivot_key, "post_id");

    EXPECT_EQ(schema.emission_order.back(), (EmissionStep{EmissionStep::Kind::Pivot, "posts_tags"}));
    expect_topological(schema);
}

TEST_F(SchemaResolverTest, PivotDoesNotDependOnDeclarationOrder) {
    const char* post_first = R"(
models:
  - name: Post
    fields: [{ name: title, type: string }]
    relationships: [{ type: belongsToMany, model: Tag, pivotFields: [weight] }]
  - name: Tag
    fields: [{ name: label, type: string }]
    relationships: [{ type: belongsToMany, model: Post }]
)";
    const char* tag_first = R"(
models:
  - name: Tag
    fields: [{ name: label, type: string }]
    relationships: [{ type: belongsToMany, model: Post }]
  - name: Post
    fields: [{ name: title, type: string }]
    relationships: [{ type: belongsToMany, model: Tag, pivotFields: [weight] }]
)";
    auto a = resolve_ok(post_first);
    auto b = resolve_ok(tag_first);
    ASSERT_EQ(a.pivots.size(), 1u);
    EXPECT_EQ(a.pivots, b.pivots);
}

TEST_F(SchemaResolverTest, DeclaredPivotKeysFlowIntoRelationships) {
    auto schema = resolve_ok(R"(
pivotTables:
  - name: role_user
    model1: Role
    model2: User
    foreignKey1: role_ref
    timestamps: true
    additionalFields: [{ name: granted_by, type: integer }]
models:
  - name: Role
    fields: [{ name: label, type: string }]
    relationships: [{ type: belongsToMany, model: User, pivotTable: role_user }]
  - name: User
    fields: [{ name: email, type: string }]
    relationships: [{ type: belongsToMany, model: Role, pivotTable: role_user }]
)");
    const Pivot* pivot = schema.find_pivot("role_user");
    ASSERT_NE(pivot, nullptr);
    EXPECT_TRUE(pivot->declared);
    EXPECT_TRUE(pivot->timestamps);
    ASSERT_EQ(pivot->fields.size(), 1u);
    EXPECT_EQ(pivot->fields[0].name, "granted_by");

    const auto& from_user = schema.find_entity("User")->relationships[0].as<BelongsToMany>();
    EXPECT_EQ(from_user.foreign_pivot_key, "user_id");
    EXPECT_EQ(from_user.related_pivot_key, "role_ref");
}

TEST_F(SchemaResolverTest, DeclaredPivotIsReusedWithoutPivotTable) {
    auto schema = resolve_ok(R"(
pivotTables:
  - name: post_tag
    model1: Post
    model2: Tag
    foreignKey1: post_id
    foreignKey2: tag_id
models:
  - name: Post
    fields: [{ name: title, type: string }]
    relationships: [{ type: belongsToMany, model: Tag }]
  - name: Tag
    fields: [{ name: label, type: string }]
    relationships: [{ type: belongsToMany, model: Post, withTimestamps: true }]
)");
    ASSERT_EQ(schema.pivots.size(), 1u);
    EXPECT_EQ(schema.pivots[0].name, "post_tag");
    EXPECT_TRUE(schema.pivots[0].declared);
    EXPECT_TRUE(schema.pivots[0].timestamps);
    EXPECT_EQ(schema.find_pivot("posts_tags"), nullptr);

    const auto& from_post = schema.find_entity("Post")->relationships[0].as<BelongsToMany>();
    EXPECT_EQ(from_post.pivot, "post_tag");
    EXPECT_EQ(from_post.foreign_pivot_key, "post_id");
    EXPECT_EQ(from_post.related_pivot_key, "tag_id");
    const auto& from_tag = schema.find_entity("Tag")->relationships[0].as<BelongsToMany>();
    EXPECT_EQ(from_tag.pivot, "post_tag");
    EXPECT_EQ(from_tag.foreign_pivot_key, "tag_id");
    EXPECT_EQ(from_tag.related_pivot_key, "post_id");
}

TEST_F(SchemaResolverTest, EntityLevelDeclaredSelfPivotIsReused) {
    auto schema = resolve_ok(R"(
models:
  - name: Category
    fields: [{ name: label, type: string }]
    pivotTables:
      - { name: category_links, model1: Category, model2: Category }
    relationships: [{ type: belongsToMany, model: Category }]
)");
    ASSERT_EQ(schema.pivots.size(), 1u);
    const Pivot& pivot = schema.pivots[0];
    EXPECT_EQ(pivot.name, "category_links");
    EXPECT_EQ(pivot.first_key, "category_id");
    EXPECT_EQ(pivot.second_key, "related_category_id");

    const auto& rel = schema.find_entity("Category")->relationships[0].as<BelongsToMany>();
    EXPECT_EQ(rel.pivot, "category_links");
    EXPECT_EQ(rel.related_pivot_key, "related_category_id");
}

TEST_F(SchemaResolverTest, TwoDeclaredPivotsForOnePairNeedAName) {
    const char* declarations = R"(
pivotTables:
  - { name: post_tag, model1: Post, model2: Tag }
  - { name: tag_post, model1: Tag, model2: Post }
models:
  - name: Post
    fields: [{ name: title, type: string }]
    relationships: [{ type: belongsToMany, model: Tag }]
  - name: Tag
    fields: [{ name: label, type: string }]
)";
    auto errors = resolve_err(declarations);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, ErrorKind::PivotKeyConflict);
    EXPECT_EQ(errors[0].location.entity, "Post");
    ASSERT_EQ(errors[0].notes.size(), 3u);
    EXPECT_EQ(errors[0].notes[0], "declared pivot 'post_tag'");
    EXPECT_EQ(errors[0].notes[1], "declared pivot 'tag_post'");

    std::string named = declarations;
    named.replace(named.find("model: Tag }"), 12, "model: Tag, pivotTable: tag_post }");
    auto schema = resolve_ok(named);
    EXPECT_EQ(schema.pivots.size(), 2u);
    EXPECT_EQ(schema.find_entity("Post")->relationships[0].as<BelongsToMany>().pivot, "tag_post");
}

TEST_F(SchemaResolverTest, ConflictingPivotKeys) {
    auto errors = resolve_err(R"(
models:
  - name: Post
    fields: [{ name: title, type: string }]
    relationships: [{ type: belongsToMany, model: Tag, foreignPivotKey: article_id }]
  - name: Tag
    fields: [{ name: label, type: string }]
    relationships: [{ type: belongsToMany, model: Post, relatedPivotKey: post_id }]
)");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, ErrorKind::PivotKeyConflict);
}

// ============================================================================
// Polymorphic
// ============================================================================

TEST_F(SchemaResolverTest, MorphManySidesShareTheMorphName) {
    auto schema = resolve_ok(R"(
models:
  - name: Comment
    fields: [{ name: body, type: text }]
    relationships: [{ type: morphTo, morphName: commentable }]
  - name: Post
    fields: [{ name: title, type: string }]
    relationships: [{ type: morphMany, model: Comment, morphName: commentable }]
  - name: Product
    fields: [{ name: sku, type: string }]
    relationships: [{ type: morphMany, model: Comment, morphName: commentable }]
)");
    const auto& morph_to = schema.find_entity("Comment")->relationships[0].as<MorphTo>();
    EXPECT_EQ(morph_to.type_column, "commentable_type");
    EXPECT_EQ(morph_to.id_column, "commentable_id");
    EXPECT_EQ(schema.find_entity("Post")->relationships[0].as<MorphMany>().morph_name,
              "commentable");
    EXPECT_EQ(schema.find_entity("Product")->relationships[0].as<MorphMany>().morph_name,
              "commentable");
    EXPECT_EQ(schema.find_entity("Product")->relationships[0].method_name, "comments");
}

TEST_F(SchemaResolverTest, MorphManyWithoutMorphName) {
    auto errors = resolve_err(R"(
models:
  - name: Comment
    fields: [{ name: body, type: text }]
    relationships: [{ type: morphTo, morphName: commentable }]
  - name: Post
    fields: [{ name: title, type: string }]
    relationships: [{ type: morphMany, model: Comment, morphName: commentable }]
  - name: Product
    fields: [{ name: sku, type: string }]
    relationships: [{ type: morphMany, model: Comment }]
)");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, ErrorKind::UnmatchedMorphName);
    EXPECT_EQ(errors[0].location.entity, "Product");
}

TEST_F(SchemaResolverTest, MorphToManyPivot) {
    auto schema = resolve_ok(R"(
models:
  - name: Post
    fields: [{ name: title, type: string }]
    relationships: [{ type: morphToMany, model: Tag, morphName: taggable }]
  - name: Video
    fields: [{ name: url, type: string }]
    relationships: [{ type: morphToMany, model: Tag, morphName: taggable }]
  - name: Tag
    fields: [{ name: label, type: string }]
)");
    const Pivot* pivot = schema.find_pivot("taggables");
    ASSERT_NE(pivot, nullptr);
    EXPECT_TRUE(pivot->is_polymorphic());
    EXPECT_EQ(pivot->morph_entities, (std::vector<std::string>{"Post", "Video"}));

    const auto& rel = schema.find_entity("Video")->relationships[0].as<MorphToMany>();
    EXPECT_EQ(rel.foreign_pivot_key, "taggable_id");
    EXPECT_EQ(rel.related_pivot_key, "tag_id");
    expect_topological(schema);
}

// ============================================================================
// Self-References and Cycles
// ============================================================================

TEST_F(SchemaResolverTest, SelfReferenceIsNotACycle) {
    auto schema = resolve_ok(R"(
models:
  - name: Category
    fields:
      - { name: name, type: string }
      - { name: category_id, type: bigInteger, nullable: true }
    relationships:
      - { type: belongsTo, model: Category, name: parent }
      - { type: hasMany, model: Category, name: children }
)");
    ASSERT_EQ(schema.entities.size(), 1u);
    const auto& rels = schema.entities[0].relationships;
    ASSERT_EQ(rels.size(), 2u);
    EXPECT_EQ(rels[0].as<BelongsTo>().foreign_key, "category_id");
    EXPECT_EQ(rels[1].as<HasMany>().foreign_key, "category_id");
}

TEST_F(SchemaResolverTest, MutualBelongsToIsACycle) {
    auto errors = resolve_err(R"(
models:
  - name: A
    fields: [{ name: x, type: string }]
    relationships: [{ type: belongsTo, model: B }]
  - name: B
    fields: [{ name: y, type: string }]
    relationships: [{ type: belongsTo, model: A }]
)");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, ErrorKind::CyclicDependency);
    EXPECT_EQ(errors[0].message, "dependency cycle: A -> B -> A");
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(SchemaResolverTest, DecimalWithoutPrecisionAmongOtherErrors) {
    auto errors = resolve_err(R"(
models:
  - name: Product
    fields:
      - { name: price, type: decimal }
      - { name: weight, type: grams }
    relationships:
      - { type: belongsTo, model: Vendor }
  - name: Order
    fields:
      - { name: id, type: integer }
)");
    EXPECT_TRUE(has_error(errors, ErrorKind::MissingDecimalPrecision));
    EXPECT_TRUE(has_error(errors, ErrorKind::UnknownFieldType));
    EXPECT_TRUE(has_error(errors, ErrorKind::UnknownTargetEntity));
    EXPECT_TRUE(has_error(errors, ErrorKind::ManualPrimaryKey));
    // Product lost every field but is not reported as empty
    EXPECT_FALSE(has_error(errors, ErrorKind::EmptyEntity));
    EXPECT_EQ(errors.size(), 4u);
}

TEST_F(SchemaResolverTest, ErrorsComeInStageOrder) {
    auto errors = resolve_err(R"(
databaseEngine: oracle
models:
  - name: User
    fields: [{ name: bad, type: nope }]
  - name: User
    fields: [{ name: email, type: string }]
)");
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_EQ(errors[0].kind, ErrorKind::InvalidOption);
    EXPECT_EQ(errors[1].kind, ErrorKind::UnknownFieldType);
    EXPECT_EQ(errors[2].kind, ErrorKind::DuplicateEntityName);
}

TEST_F(SchemaResolverTest, MalformedDocumentStopsEarly) {
    auto errors = resolve_err("models: [ { name: User\n");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, ErrorKind::MalformedInput);
}

// ============================================================================
// Determinism and Files
// ============================================================================

TEST_F(SchemaResolverTest, ResolutionIsDeterministic) {
    const std::string path = std::string(SCHEMLY_FIXTURE_DIR) + "/blog.yaml";
    auto first = resolver.resolve_file(path);
    auto second = resolver.resolve_file(path);
    ASSERT_TRUE(is_ok(first)) << (is_err(first) ? format_errors(unwrap_err(first)) : "");
    ASSERT_TRUE(is_ok(second));

    EXPECT_EQ(unwrap(first), unwrap(second));
    EXPECT_EQ(to_json(unwrap(first)).to_string(), to_json(unwrap(second)).to_string());
}

TEST_F(SchemaResolverTest, BlogFixture) {
    auto result = resolver.resolve_file(std::string(SCHEMLY_FIXTURE_DIR) + "/blog.yaml");
    ASSERT_TRUE(is_ok(result)) << (is_err(result) ? format_errors(unwrap_err(result)) : "");
    const auto& schema = unwrap(result);

    std::vector<std::string> order;
    for (const auto& step : schema.emission_order) {
        order.push_back(step.name);
    }
    EXPECT_EQ(order, (std::vector<std::string>{"Comment", "Tag", "User", "Post", "posts_tags"}));
    EXPECT_TRUE(schema.options.generate_dto);

    const Pivot* pivot = schema.find_pivot("posts_tags");
    ASSERT_NE(pivot, nullptr);
    EXPECT_TRUE(pivot->timestamps);
    EXPECT_FALSE(pivot->declared);

    const Entity* post = schema.find_entity("Post");
    ASSERT_NE(post, nullptr);
    EXPECT_TRUE(post->has_soft_deletes);
    EXPECT_EQ(post->find_field("price")->decimal, (DecimalSpec{8, 2}));
    EXPECT_EQ(post->relationships[0].method_name, "author");
    EXPECT_EQ(post->relationships[2].method_name, "comments");
    expect_topological(schema);
}

TEST_F(SchemaResolverTest, MissingFile) {
    auto result = resolver.resolve_file(std::string(SCHEMLY_FIXTURE_DIR) + "/missing.yaml");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result)[0].kind, ErrorKind::MalformedInput);
}
