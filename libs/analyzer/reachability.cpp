/**
 * @file reachability.cpp
 * @brief Two-phase breadth-first associated-set traversal
 */

#include "cpaudit/reachability.hpp"

#include <deque>
#include <utility>
#include <vector>

namespace cpaudit::analyzer {

AssociatedSet::AssociatedSet(std::vector<EntityId> order, std::size_t catalog_size)
    : m_order(std::move(order))
    , m_member(catalog_size, false)
{
    for (EntityId id : m_order) {
        m_member.at(id) = true;
    }
}

AssociatedSet associated_set(const graph::RelationshipGraph& graph, EntityId target)
{
    const auto& objects = graph.objects();
    std::vector<bool> visited(objects.size(), false);
    std::deque<EntityId> queue;

    visited.at(target) = true;
    queue.push_back(target);

    for (graph::EdgeId edge_id : graph.incident(target)) {
        const EntityId next = graph.edge(edge_id).end;
        if (visited[next] || objects.at(next).kind != catalog::EntityKind::kNetwork) {
            continue;
        }
        visited[next] = true;
        queue.push_back(next);
    }

    std::vector<EntityId> order;
    while (!queue.empty()) {
        const EntityId current = queue.front();
        queue.pop_front();
        order.push_back(current);

        for (graph::EdgeId edge_id : graph.incident(current)) {
            const EntityId next = graph.edge(edge_id).start;
            if (visited[next]) {
                continue;
            }
            visited[next] = true;
            queue.push_back(next);
        }
    }
    return AssociatedSet(std::move(order), objects.size());
}

}  // namespace cpaudit::analyzer
