//! # Dependency Graph Implementation

#include "schema/dependency_graph.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <functional>
#include <set>
#include <utility>

namespace schemly::schema {

auto DependencyGraph::add_node(EmissionStep::Kind kind, const std::string& name) -> size_t {
    nodes_.push_back(GraphNode{kind, name});
    size_t index = nodes_.size() - 1;
    if (kind == EmissionStep::Kind::Entity) {
        entity_index_.emplace(name, index);
    }
    return index;
}

void DependencyGraph::add_edge(size_t from, size_t to, std::string via) {
    if (from == to) {
        ++self_references_;
        SCHEMLY_LOG_TRACE("graph", "self-reference on " << nodes_[from].name << " via " << via);
        return;
    }
    SCHEMLY_LOG_TRACE("graph", nodes_[from].name << " -> " << nodes_[to].name << " via " << via);
    edges_.push_back(GraphEdge{from, to, std::move(via)});
}

auto DependencyGraph::find_entity(const std::string& name) const -> std::optional<size_t> {
    auto it = entity_index_.find(name);
    if (it == entity_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto DependencyGraph::build(const std::vector<Entity>& entities, const std::vector<Pivot>& pivots)
    -> DependencyGraph {
    DependencyGraph graph;
    for (const auto& entity : entities) {
        graph.add_node(EmissionStep::Kind::Entity, entity.name);
    }

    for (const auto& entity : entities) {
        auto from = graph.find_entity(entity.name);
        for (const auto& rel : entity.relationships) {
            if (!rel.is<BelongsTo>()) {
                continue;
            }
            auto to = graph.find_entity(rel.as<BelongsTo>().target);
            if (from && to) {
                graph.add_edge(*from, *to, entity.name + "." + rel.method_name + " (belongsTo)");
            }
        }
    }

    for (const auto& pivot : pivots) {
        size_t from = graph.add_node(EmissionStep::Kind::Pivot, pivot.name);
        for (const auto& referenced : pivot.referenced_entities()) {
            if (auto to = graph.find_entity(referenced)) {
                graph.add_edge(from, *to, "pivot " + pivot.name);
            }
        }
    }
    return graph;
}

// ============================================================================
// Topological Sort
// ============================================================================

auto DependencyGraph::sort() const -> Result<std::vector<EmissionStep>, ErrorList> {
    std::vector<size_t> pending(nodes_.size(), 0);
    std::vector<std::vector<size_t>> dependents(nodes_.size());
    for (const auto& edge : edges_) {
        ++pending[edge.from];
        dependents[edge.to].push_back(edge.from);
    }

    std::set<size_t> ready;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (pending[i] == 0) {
            ready.insert(i);
        }
    }

    std::vector<EmissionStep> order;
    std::vector<bool> emitted(nodes_.size(), false);
    order.reserve(nodes_.size());
    while (!ready.empty()) {
        size_t next = *ready.begin();
        ready.erase(ready.begin());
        emitted[next] = true;
        order.push_back(EmissionStep{nodes_[next].kind, nodes_[next].name});
        for (size_t dependent : dependents[next]) {
            if (--pending[dependent] == 0) {
                ready.insert(dependent);
            }
        }
    }

    if (order.size() != nodes_.size()) {
        return report_cycles(emitted);
    }
    SCHEMLY_LOG_DEBUG("graph", "sorted " << order.size() << " nodes, " << edges_.size()
                                         << " edges, " << self_references_
                                         << " self-references");
    return order;
}

auto DependencyGraph::report_cycles(const std::vector<bool>& emitted) const -> ErrorList {
    const size_t n = nodes_.size();
    std::vector<std::vector<const GraphEdge*>> out_edges(n);
    for (const auto& edge : edges_) {
        if (!emitted[edge.from] && !emitted[edge.to]) {
            out_edges[edge.from].push_back(&edge);
        }
    }

    // Tarjan over the nodes the sort could not emit
    constexpr size_t UNVISITED = static_cast<size_t>(-1);
    std::vector<size_t> index(n, UNVISITED);
    std::vector<size_t> lowlink(n, 0);
    std::vector<bool> on_stack(n, false);
    std::vector<size_t> stack;
    std::vector<size_t> component(n, UNVISITED);
    std::vector<std::vector<size_t>> components;
    size_t counter = 0;

    std::function<void(size_t)> connect = [&](size_t v) {
        index[v] = lowlink[v] = counter++;
        stack.push_back(v);
        on_stack[v] = true;
        for (const GraphEdge* edge : out_edges[v]) {
            size_t w = edge->to;
            if (index[w] == UNVISITED) {
                connect(w);
                lowlink[v] = std::min(lowlink[v], lowlink[w]);
            } else if (on_stack[w]) {
                lowlink[v] = std::min(lowlink[v], index[w]);
            }
        }
        if (lowlink[v] == index[v]) {
            std::vector<size_t> members;
            size_t w = UNVISITED;
            do {
                w = stack.back();
                stack.pop_back();
                on_stack[w] = false;
                component[w] = components.size();
                members.push_back(w);
            } while (w != v);
            std::sort(members.begin(), members.end());
            components.push_back(std::move(members));
        }
    };
    for (size_t v = 0; v < n; ++v) {
        if (!emitted[v] && index[v] == UNVISITED) {
            connect(v);
        }
    }

    std::sort(components.begin(), components.end(),
              [](const std::vector<size_t>& a, const std::vector<size_t>& b) {
                  return a.front() < b.front();
              });

    ErrorList errors;
    for (const auto& members : components) {
        if (members.size() < 2) {
            continue;
        }
        // One closed path from the smallest member back to itself
        size_t start = members.front();
        size_t group = component[start];
        std::vector<const GraphEdge*> path;
        std::vector<bool> visited(n, false);
        std::function<bool(size_t)> walk = [&](size_t v) -> bool {
            visited[v] = true;
            for (const GraphEdge* edge : out_edges[v]) {
                if (component[edge->to] != group) {
                    continue;
                }
                path.push_back(edge);
                if (edge->to == start) {
                    return true;
                }
                if (!visited[edge->to] && walk(edge->to)) {
                    return true;
                }
                path.pop_back();
            }
            return false;
        };
        if (!walk(start)) {
            continue;
        }

        std::string rendered = nodes_[start].name;
        for (const GraphEdge* edge : path) {
            rendered += " -> " + nodes_[edge->to].name;
        }

        ErrorLocation where;
        if (nodes_[start].kind == EmissionStep::Kind::Entity) {
            where.entity = nodes_[start].name;
        } else {
            where.pivot = nodes_[start].name;
        }
        auto err = make_error(ErrorKind::CyclicDependency, "dependency cycle: " + rendered, where);
        for (const GraphEdge* edge : path) {
            err.notes.push_back("induced by " + edge->via);
        }
        SCHEMLY_LOG_DEBUG("graph", "cycle " << rendered);
        errors.push_back(std::move(err));
    }
    return errors;
}

} // namespace schemly::schema
