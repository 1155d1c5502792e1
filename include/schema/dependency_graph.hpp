//! # Dependency Graph
//!
//! Orders entities and pivots for emission. A node must be emitted after
//! every node it references:
//!
//! - `A belongsTo B` adds the edge `A -> B`.
//! - Every pivot depends on each entity it joins.
//!
//! Self-references (`Category belongsTo Category`) are recorded but never
//! block emission. The order is Kahn's algorithm that always emits the ready
//! node with the smallest index, so entities keep their document order
//! wherever dependencies allow, and pivots follow their entities.
//!
//! Nodes left over after the sort lie on cycles. Each strongly connected
//! group is reported once as `CyclicDependency`, with one closed path
//! through it.

#ifndef SCHEMLY_SCHEMA_DEPENDENCY_GRAPH_HPP
#define SCHEMLY_SCHEMA_DEPENDENCY_GRAPH_HPP

#include "common.hpp"
#include "schema/error.hpp"
#include "schema/model.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace schemly::schema {

struct GraphNode {
    EmissionStep::Kind kind;
    std::string name;
};

/// `from` depends on `to`. `via` names the relationship or pivot that
/// induced the edge.
struct GraphEdge {
    size_t from;
    size_t to;
    std::string via;
};

class DependencyGraph {
public:
    /// Nodes are every entity in order, then every pivot in order.
    [[nodiscard]] static auto build(const std::vector<Entity>& entities,
                                    const std::vector<Pivot>& pivots) -> DependencyGraph;

    auto add_node(EmissionStep::Kind kind, const std::string& name) -> size_t;

    /// Adds `from -> to`. An edge from a node to itself is only counted.
    void add_edge(size_t from, size_t to, std::string via);

    [[nodiscard]] auto find_entity(const std::string& name) const -> std::optional<size_t>;

    /// Emission order, or one `CyclicDependency` per cycle.
    [[nodiscard]] auto sort() const -> Result<std::vector<EmissionStep>, ErrorList>;

    [[nodiscard]] auto nodes() const -> const std::vector<GraphNode>& {
        return nodes_;
    }

    [[nodiscard]] auto edges() const -> const std::vector<GraphEdge>& {
        return edges_;
    }

    [[nodiscard]] auto self_reference_count() const -> size_t {
        return self_references_;
    }

private:
    std::vector<GraphNode> nodes_;
    std::vector<GraphEdge> edges_;
    std::unordered_map<std::string, size_t> entity_index_;
    size_t self_references_ = 0;

    auto report_cycles(const std::vector<bool>& emitted) const -> ErrorList;
};

} // namespace schemly::schema

#endif // SCHEMLY_SCHEMA_DEPENDENCY_GRAPH_HPP
