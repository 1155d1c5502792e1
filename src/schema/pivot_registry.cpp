//! # Pivot Registry Implementation
//!
//! Each slot is finalized on its own. Plain pivots between two distinct
//! entities key their sides by entity; self-referential pivots key them by
//! column name, since both sides name the same entity.

#include "schema/pivot_registry.hpp"

#include "log/log.hpp"
#include "schema/naming.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace schemly::schema {

namespace {

void append_unique(std::vector<std::string>& into, const std::vector<std::string>& from) {
    for (const auto& column : from) {
        if (std::find(into.begin(), into.end(), column) == into.end()) {
            into.push_back(column);
        }
    }
}

auto same_pair(const Pivot& pivot, const PivotClaim& claim) -> bool {
    return (claim.owner == pivot.first_entity && claim.target == pivot.second_entity) ||
           (claim.owner == pivot.second_entity && claim.target == pivot.first_entity);
}

auto describe_keys(const std::set<std::string>& keys) -> std::string {
    std::string out;
    for (const auto& key : keys) {
        out += out.empty() ? "'" : ", '";
        out += key;
        out += "'";
    }
    return out;
}

} // namespace

auto self_related_key_for(std::string_view entity) -> std::string {
    return "related_" + singular_snake_case(entity) + "_id";
}

// ============================================================================
// Registration
// ============================================================================

auto PivotRegistry::slot_for(const std::string& name) -> size_t {
    auto it = slot_index_.find(name);
    if (it != slot_index_.end()) {
        return it->second;
    }
    Slot slot;
    slot.pivot.name = name;
    slots_.push_back(std::move(slot));
    slot_index_.emplace(name, slots_.size() - 1);
    return slots_.size() - 1;
}

void PivotRegistry::declare(Pivot pivot, ErrorLocation where) {
    where.pivot = pivot.name;
    size_t index = slot_for(pivot.name);
    Slot& slot = slots_[index];

    pivot.declared = true;
    if (slot.declared) {
        if (slot.pivot == pivot) {
            SCHEMLY_LOG_DEBUG("pivot", "merged repeated declaration of '" << pivot.name << "'");
            return;
        }
        auto err = make_error(ErrorKind::PivotKeyConflict,
                              "pivot '" + pivot.name + "' is declared twice with different content",
                              where);
        err.notes.push_back("first declared between '" + slot.pivot.first_entity + "' and '" +
                            slot.pivot.second_entity + "'");
        errors_.push_back(std::move(err));
        return;
    }

    slot.pivot = std::move(pivot);
    slot.declared = true;
    slot.where = std::move(where);
    SCHEMLY_LOG_DEBUG("pivot", "declared '" << slot.pivot.name << "' (" << slot.pivot.first_entity
                                            << "." << slot.pivot.first_key << ", "
                                            << slot.pivot.second_entity << "."
                                            << slot.pivot.second_key << ")");
}

auto PivotRegistry::claim(PivotClaim claim) -> ClaimId {
    claim.where.pivot = claim.pivot_name;
    size_t slot = slot_for(claim.pivot_name);
    ClaimId id = claims_.size();
    slots_[slot].claims.push_back(id);
    SCHEMLY_LOG_TRACE("pivot", "claim #" << id << " on '" << claim.pivot_name << "' from "
                                         << claim.owner << " to " << claim.target);
    claims_.push_back(ClaimRecord{std::move(claim), slot, std::nullopt});
    return id;
}

auto PivotRegistry::claim_morph(MorphPivotClaim claim) -> ClaimId {
    claim.where.pivot = claim.pivot_name;
    size_t slot = slot_for(claim.pivot_name);
    ClaimId id = claims_.size();
    slots_[slot].claims.push_back(id);
    SCHEMLY_LOG_TRACE("pivot", "morph claim #" << id << " on '" << claim.pivot_name << "' from "
                                               << claim.owner << " via " << claim.morph_name);
    claims_.push_back(ClaimRecord{std::move(claim), slot, std::nullopt});
    return id;
}

void PivotRegistry::conflict(const ErrorLocation& where, const std::string& pivot,
                             std::string message) {
    ErrorLocation loc = where;
    loc.pivot = pivot;
    errors_.push_back(make_error(ErrorKind::PivotKeyConflict, std::move(message), std::move(loc)));
}

// ============================================================================
// Finalization
// ============================================================================

auto PivotRegistry::finalize() -> ErrorList {
    pivots_.clear();
    for (auto& slot : slots_) {
        bool morph = false;
        if (!slot.declared && !slot.claims.empty()) {
            morph = std::holds_alternative<MorphPivotClaim>(claims_[slot.claims.front()].claim);
        }

        if (morph) {
            finalize_morph(slot);
        } else {
            bool self = false;
            if (slot.declared) {
                self = slot.pivot.first_entity == slot.pivot.second_entity;
            } else {
                const auto& first = std::get<PivotClaim>(claims_[slot.claims.front()].claim);
                self = first.owner == first.target;
            }
            if (self) {
                finalize_self(slot);
            } else {
                finalize_plain(slot);
            }
        }

        if (slot.declared || !slot.pivot.first_entity.empty()) {
            pivots_.push_back(slot.pivot);
        }
    }
    SCHEMLY_LOG_DEBUG("pivot", "finalized " << pivots_.size() << " pivots, " << errors_.size()
                                            << " conflicts");
    return errors_;
}

void PivotRegistry::finalize_plain(Slot& slot) {
    Pivot& pivot = slot.pivot;
    std::vector<ClaimId> accepted;

    // Pair
    for (ClaimId id : slot.claims) {
        auto* claim = std::get_if<PivotClaim>(&claims_[id].claim);
        if (claim == nullptr) {
            const auto& morph = std::get<MorphPivotClaim>(claims_[id].claim);
            conflict(morph.where, pivot.name,
                     "polymorphic relationship uses non-polymorphic pivot '" + pivot.name + "'");
            continue;
        }
        if (!slot.declared && pivot.first_entity.empty()) {
            // Canonical side order follows the table names
            bool owner_first = claim->owner_table < claim->target_table ||
                               (claim->owner_table == claim->target_table &&
                                claim->owner < claim->target);
            pivot.first_entity = owner_first ? claim->owner : claim->target;
            pivot.second_entity = owner_first ? claim->target : claim->owner;
            pivot.mark = claim->where.mark;
        }
        if (!same_pair(pivot, *claim)) {
            conflict(claim->where, pivot.name,
                     "pivot '" + pivot.name + "' relates '" + pivot.first_entity + "' and '" +
                         pivot.second_entity + "', not '" + claim->owner + "' and '" +
                         claim->target + "'");
            continue;
        }
        accepted.push_back(id);
    }

    // Keys
    bool keys_ok = true;
    if (!slot.declared) {
        std::set<std::string> explicit_keys[2];
        for (ClaimId id : accepted) {
            const auto& claim = std::get<PivotClaim>(claims_[id].claim);
            int owner_side = claim.owner == pivot.first_entity ? 0 : 1;
            if (claim.owner_key) {
                explicit_keys[owner_side].insert(*claim.owner_key);
            }
            if (claim.target_key) {
                explicit_keys[1 - owner_side].insert(*claim.target_key);
            }
        }
        const std::string* side_entity[2] = {&pivot.first_entity, &pivot.second_entity};
        std::string* side_key[2] = {&pivot.first_key, &pivot.second_key};
        for (int side = 0; side < 2; ++side) {
            if (explicit_keys[side].size() > 1) {
                const auto& first = std::get<PivotClaim>(claims_[accepted.front()].claim);
                conflict(first.where, pivot.name,
                         "pivot '" + pivot.name + "' has conflicting keys for '" +
                             *side_entity[side] + "': " + describe_keys(explicit_keys[side]));
                keys_ok = false;
            } else if (explicit_keys[side].size() == 1) {
                *side_key[side] = *explicit_keys[side].begin();
            } else {
                *side_key[side] = foreign_key_for(*side_entity[side]);
            }
        }
        if (keys_ok && pivot.first_key == pivot.second_key) {
            const auto& first = std::get<PivotClaim>(claims_[accepted.front()].claim);
            conflict(first.where, pivot.name,
                     "both sides of pivot '" + pivot.name + "' use column '" + pivot.first_key +
                         "'");
            keys_ok = false;
        }
    }
    if (!keys_ok) {
        return;
    }

    for (ClaimId id : accepted) {
        const auto& claim = std::get<PivotClaim>(claims_[id].claim);
        bool owner_first = claim.owner == pivot.first_entity;
        PivotKeys keys{owner_first ? pivot.first_key : pivot.second_key,
                       owner_first ? pivot.second_key : pivot.first_key};
        if (claim.owner_key && *claim.owner_key != keys.foreign) {
            conflict(claim.where, pivot.name,
                     "foreign pivot key '" + *claim.owner_key + "' does not match '" +
                         keys.foreign + "' declared for pivot '" + pivot.name + "'");
            continue;
        }
        if (claim.target_key && *claim.target_key != keys.related) {
            conflict(claim.where, pivot.name,
                     "related pivot key '" + *claim.target_key + "' does not match '" +
                         keys.related + "' declared for pivot '" + pivot.name + "'");
            continue;
        }
        pivot.timestamps = pivot.timestamps || claim.with_timestamps;
        append_unique(pivot.extra_columns, claim.pivot_fields);
        claims_[id].keys = std::move(keys);
    }
}

void PivotRegistry::finalize_self(Slot& slot) {
    Pivot& pivot = slot.pivot;
    std::vector<ClaimId> accepted;

    for (ClaimId id : slot.claims) {
        auto* claim = std::get_if<PivotClaim>(&claims_[id].claim);
        if (claim == nullptr) {
            const auto& morph = std::get<MorphPivotClaim>(claims_[id].claim);
            conflict(morph.where, pivot.name,
                     "polymorphic relationship uses non-polymorphic pivot '" + pivot.name + "'");
            continue;
        }
        if (!slot.declared && pivot.first_entity.empty()) {
            pivot.first_entity = claim->owner;
            pivot.second_entity = claim->owner;
            pivot.mark = claim->where.mark;
        }
        if (!same_pair(pivot, *claim)) {
            conflict(claim->where, pivot.name,
                     "pivot '" + pivot.name + "' relates '" + pivot.first_entity +
                         "' to itself, not '" + claim->owner + "' and '" + claim->target + "'");
            continue;
        }
        accepted.push_back(id);
    }

    if (!slot.declared) {
        // Both sides name one entity, so the key pair is collected as a set
        std::set<std::string> explicit_keys;
        for (ClaimId id : accepted) {
            const auto& claim = std::get<PivotClaim>(claims_[id].claim);
            if (claim.owner_key) {
                explicit_keys.insert(*claim.owner_key);
            }
            if (claim.target_key) {
                explicit_keys.insert(*claim.target_key);
            }
        }
        if (explicit_keys.size() > 2) {
            const auto& first = std::get<PivotClaim>(claims_[accepted.front()].claim);
            conflict(first.where, pivot.name,
                     "pivot '" + pivot.name + "' has more than two key columns: " +
                         describe_keys(explicit_keys));
            return;
        }

        std::string owner_key = foreign_key_for(pivot.first_entity);
        std::string related_key = self_related_key_for(pivot.first_entity);
        std::set<std::string> pair = explicit_keys;
        if (pair.size() == 1) {
            pair.insert(*pair.begin() != owner_key ? owner_key : related_key);
        } else if (pair.empty()) {
            pair = {owner_key, related_key};
        }
        // The owner-side default key comes first when it takes part
        pivot.first_key = pair.count(owner_key) != 0 ? owner_key : *pair.begin();
        for (const auto& key : pair) {
            if (key != pivot.first_key) {
                pivot.second_key = key;
            }
        }
    }

    for (ClaimId id : accepted) {
        const auto& claim = std::get<PivotClaim>(claims_[id].claim);
        auto other = [&](const std::string& key) -> std::optional<std::string> {
            if (key == pivot.first_key) {
                return pivot.second_key;
            }
            if (key == pivot.second_key) {
                return pivot.first_key;
            }
            return std::nullopt;
        };

        PivotKeys keys;
        if (claim.owner_key) {
            auto related = other(*claim.owner_key);
            if (!related) {
                conflict(claim.where, pivot.name,
                         "foreign pivot key '" + *claim.owner_key + "' is not a column of pivot '" +
                             pivot.name + "'");
                continue;
            }
            keys = PivotKeys{*claim.owner_key, *related};
        } else if (claim.target_key) {
            auto foreign = other(*claim.target_key);
            if (!foreign) {
                conflict(claim.where, pivot.name,
                         "related pivot key '" + *claim.target_key +
                             "' is not a column of pivot '" + pivot.name + "'");
                continue;
            }
            keys = PivotKeys{*foreign, *claim.target_key};
        } else {
            keys = PivotKeys{pivot.first_key, pivot.second_key};
        }
        if (claim.target_key && *claim.target_key != keys.related) {
            conflict(claim.where, pivot.name,
                     "related pivot key '" + *claim.target_key + "' does not pair with '" +
                         keys.foreign + "' on pivot '" + pivot.name + "'");
            continue;
        }
        pivot.timestamps = pivot.timestamps || claim.with_timestamps;
        append_unique(pivot.extra_columns, claim.pivot_fields);
        claims_[id].keys = std::move(keys);
    }
}

void PivotRegistry::finalize_morph(Slot& slot) {
    Pivot& pivot = slot.pivot;
    const auto& first = std::get<MorphPivotClaim>(claims_[slot.claims.front()].claim);
    pivot.morph_name = first.morph_name;
    pivot.morph_type_column = first.morph_name + "_type";
    pivot.first_entity = first.target;
    pivot.mark = first.where.mark;

    std::vector<ClaimId> accepted;
    std::set<std::string> target_keys;
    std::set<std::string> morph_keys;
    for (ClaimId id : slot.claims) {
        auto* claim = std::get_if<MorphPivotClaim>(&claims_[id].claim);
        if (claim == nullptr) {
            const auto& plain = std::get<PivotClaim>(claims_[id].claim);
            conflict(plain.where, pivot.name,
                     "pivot '" + pivot.name + "' is polymorphic ('" + *pivot.morph_name +
                         "') and cannot back a belongsToMany");
            continue;
        }
        if (claim->morph_name != *pivot.morph_name || claim->target != pivot.first_entity) {
            conflict(claim->where, pivot.name,
                     "polymorphic pivot '" + pivot.name + "' is shared by '" + *pivot.morph_name +
                         "' -> '" + pivot.first_entity + "' and '" + claim->morph_name +
                         "' -> '" + claim->target + "'");
            continue;
        }
        if (claim->target_key) {
            target_keys.insert(*claim->target_key);
        }
        if (claim->morph_key) {
            morph_keys.insert(*claim->morph_key);
        }
        accepted.push_back(id);
    }

    if (target_keys.size() > 1 || morph_keys.size() > 1) {
        const auto& where = std::get<MorphPivotClaim>(claims_[accepted.front()].claim).where;
        conflict(where, pivot.name,
                 "polymorphic pivot '" + pivot.name + "' has conflicting keys: " +
                     describe_keys(target_keys.size() > 1 ? target_keys : morph_keys));
        return;
    }
    pivot.first_key =
        target_keys.empty() ? foreign_key_for(pivot.first_entity) : *target_keys.begin();
    pivot.second_key = morph_keys.empty() ? *pivot.morph_name + "_id" : *morph_keys.begin();
    if (pivot.first_key == pivot.second_key || pivot.first_key == pivot.morph_type_column) {
        const auto& where = std::get<MorphPivotClaim>(claims_[accepted.front()].claim).where;
        conflict(where, pivot.name,
                 "both sides of pivot '" + pivot.name + "' use column '" + pivot.first_key + "'");
        return;
    }

    for (ClaimId id : accepted) {
        const auto& claim = std::get<MorphPivotClaim>(claims_[id].claim);
        if (std::find(pivot.morph_entities.begin(), pivot.morph_entities.end(), claim.owner) ==
            pivot.morph_entities.end()) {
            pivot.morph_entities.push_back(claim.owner);
        }
        pivot.timestamps = pivot.timestamps || claim.with_timestamps;
        append_unique(pivot.extra_columns, claim.pivot_fields);
        claims_[id].keys = PivotKeys{pivot.second_key, pivot.first_key};
    }
    std::sort(pivot.morph_entities.begin(), pivot.morph_entities.end());
}

// ============================================================================
// Queries
// ============================================================================

auto PivotRegistry::keys_for(ClaimId id) const -> std::optional<PivotKeys> {
    if (id >= claims_.size()) {
        return std::nullopt;
    }
    return claims_[id].keys;
}

auto PivotRegistry::find(const std::string& name) const -> const Pivot* {
    auto it = std::find_if(pivots_.begin(), pivots_.end(),
                           [&](const Pivot& p) { return p.name == name; });
    return it == pivots_.end() ? nullptr : &*it;
}

auto PivotRegistry::is_declared(const std::string& name) const -> bool {
    auto it = slot_index_.find(name);
    return it != slot_index_.end() && slots_[it->second].declared;
}

auto PivotRegistry::declared_between(const std::string& a, const std::string& b) const
    -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& slot : slots_) {
        const Pivot& pivot = slot.pivot;
        if (!slot.declared || pivot.morph_name) {
            continue;
        }
        if ((pivot.first_entity == a && pivot.second_entity == b) ||
            (pivot.first_entity == b && pivot.second_entity == a)) {
            names.push_back(pivot.name);
        }
    }
    return names;
}

} // namespace schemly::schema
