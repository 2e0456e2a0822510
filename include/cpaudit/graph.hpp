#pragma once

/**
 * @file graph.hpp
 * @brief Relationship graph over catalog entities
 */

#include "cpaudit/catalog.hpp"
#include "cpaudit/common.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace cpaudit::graph {

using catalog::EntityId;

/// Handle of an edge record inside the graph's arena
using EdgeId = std::size_t;

/**
 * How an edge was formed.
 * - kContainment: host address inside a network ("Di")
 * - kMembership: entity listed as a group member ("Mono")
 */
enum class EdgeMethod { kContainment, kMembership };

struct Edge
{
    EntityId start = 0;
    EntityId end = 0;
    EdgeMethod method = EdgeMethod::kMembership;
};

/**
 * RelationshipGraph
 *
 * Edge records live in one arena; every entity keeps the handles of the
 * edges it participates in, in installation order.
 *
 * - Containment installs two records: host->network on the host and
 *   network->host on the network.
 * - Membership installs one record (start = group, end = member) on both
 *   the group and the member.
 *
 * The graph borrows the catalog, which must outlive it.
 */
class RelationshipGraph
{
public:
    [[nodiscard]] static cpaudit::Result<RelationshipGraph> build(const catalog::Catalog& catalog);

    [[nodiscard]] const catalog::Catalog& objects() const { return *m_catalog; }
    [[nodiscard]] const Edge& edge(EdgeId id) const { return m_edges.at(id); }
    [[nodiscard]] std::size_t edge_count() const { return m_edges.size(); }

    /// Edges incident to `id`
    [[nodiscard]] std::span<const EdgeId> incident(EntityId id) const
    {
        return m_incident.at(id);
    }

    /// True when an edge with this start, end and method is recorded on `start`
    [[nodiscard]] bool has_edge(EntityId start, EntityId end, EdgeMethod method) const;

private:
    explicit RelationshipGraph(const catalog::Catalog& catalog);

    void add_membership(EntityId group, EntityId member);
    void add_containment(EntityId host, EntityId network);

    [[nodiscard]] cpaudit::VoidResult link_members();
    [[nodiscard]] cpaudit::VoidResult link_subnets();

    const catalog::Catalog* m_catalog;
    std::vector<Edge> m_edges;
    std::vector<std::vector<EdgeId>> m_incident;
};

}  // namespace cpaudit::graph
