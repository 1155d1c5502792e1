//! # Pivot Registry
//!
//! Owns every join table of a resolution. Pivots enter the registry in two
//! ways:
//!
//! - **Declarations** (`declare`): schema- or entity-level `pivotTables`
//!   entries with fixed entities and keys.
//! - **Claims** (`claim`, `claim_morph`): one per `belongsToMany` or
//!   `morphToMany` relationship, naming the pivot it needs and the keys it
//!   would like.
//!
//! A pair of entities has at most one plain pivot: a `belongsToMany` that
//! names no pivot reuses the declaration for its pair (`declared_between`)
//! instead of deriving a second join table.
//!
//! `finalize()` merges all claims on a name into one `Pivot`. The outcome
//! does not depend on the order claims were filed in, so declaring a
//! many-to-many from either side (or both) yields the same pivot. After
//! finalization `keys_for(id)` gives each claim its (foreign, related) keys.
//!
//! ## Merge Rules
//!
//! | Situation | Result |
//! |-----------|--------|
//! | claim on a declared pivot, same pair, no explicit keys | declared keys |
//! | claim key differs from the declared key for that side | `PivotKeyConflict` |
//! | two different explicit keys for one side | `PivotKeyConflict` |
//! | claim relating a different pair than the pivot | `PivotKeyConflict` |
//! | both sides end up with the same column | `PivotKeyConflict` |
//! | polymorphic and plain claims on one name | `PivotKeyConflict` |
//! | `withTimestamps` on any claim | pivot has timestamps |
//! | `pivotFields` | ordered union of all claims |

#ifndef SCHEMLY_SCHEMA_PIVOT_REGISTRY_HPP
#define SCHEMLY_SCHEMA_PIVOT_REGISTRY_HPP

#include "schema/error.hpp"
#include "schema/model.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace schemly::schema {

/// Identifies a claim filed with `claim` or `claim_morph`.
using ClaimId = size_t;

/// A `belongsToMany` view of a pivot.
struct PivotClaim {
    std::string pivot_name;
    std::string owner;
    std::string owner_table;
    std::string target;
    std::string target_table;
    /// Explicit `foreignPivotKey` (references the owner).
    std::optional<std::string> owner_key;
    /// Explicit `relatedPivotKey` (references the target).
    std::optional<std::string> target_key;
    bool with_timestamps = false;
    std::vector<std::string> pivot_fields;
    ErrorLocation where;
};

/// A `morphToMany` view of a polymorphic pivot.
struct MorphPivotClaim {
    std::string pivot_name;
    std::string owner;
    std::string target;
    std::string morph_name;
    /// Explicit `foreignPivotKey` (the `{morph}_id` column).
    std::optional<std::string> morph_key;
    /// Explicit `relatedPivotKey` (references the target).
    std::optional<std::string> target_key;
    bool with_timestamps = false;
    std::vector<std::string> pivot_fields;
    ErrorLocation where;
};

/// Keys handed back to a claim: `foreign` references the claiming entity,
/// `related` the target.
struct PivotKeys {
    std::string foreign;
    std::string related;

    auto operator==(const PivotKeys& other) const -> bool = default;
};

/// Second key of a self-referential pivot on `entity`: `related_{singular}_id`.
[[nodiscard]] auto self_related_key_for(std::string_view entity) -> std::string;

class PivotRegistry {
public:
    /// Seeds a declared pivot. Declaring the same name twice with identical
    /// content is accepted; differing content is a `PivotKeyConflict`.
    void declare(Pivot pivot, ErrorLocation where = {});

    [[nodiscard]] auto claim(PivotClaim claim) -> ClaimId;

    [[nodiscard]] auto claim_morph(MorphPivotClaim claim) -> ClaimId;

    /// Merges all claims. Returns every declaration and merge error.
    [[nodiscard]] auto finalize() -> ErrorList;

    /// Keys for a claim after `finalize()`, or `nullopt` if the claim was
    /// rejected.
    [[nodiscard]] auto keys_for(ClaimId id) const -> std::optional<PivotKeys>;

    /// Finalized pivots in first-registration order.
    [[nodiscard]] auto pivots() const -> const std::vector<Pivot>& {
        return pivots_;
    }

    [[nodiscard]] auto find(const std::string& name) const -> const Pivot*;

    [[nodiscard]] auto is_declared(const std::string& name) const -> bool;

    /// Names of declared, non-polymorphic pivots relating `a` and `b` in
    /// either order, in declaration order.
    [[nodiscard]] auto declared_between(const std::string& a, const std::string& b) const
        -> std::vector<std::string>;

private:
    struct Slot {
        Pivot pivot;
        bool declared = false;
        ErrorLocation where;
        std::vector<ClaimId> claims;
    };

    struct ClaimRecord {
        std::variant<PivotClaim, MorphPivotClaim> claim;
        size_t slot = 0;
        std::optional<PivotKeys> keys;
    };

    std::vector<Slot> slots_;
    std::unordered_map<std::string, size_t> slot_index_;
    std::vector<ClaimRecord> claims_;
    std::vector<Pivot> pivots_;
    ErrorList errors_;

    auto slot_for(const std::string& name) -> size_t;

    void finalize_plain(Slot& slot);
    void finalize_self(Slot& slot);
    void finalize_morph(Slot& slot);

    void conflict(const ErrorLocation& where, const std::string& pivot, std::string message);
};

} // namespace schemly::schema

#endif // SCHEMLY_SCHEMA_PIVOT_REGISTRY_HPP
