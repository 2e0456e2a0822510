#pragma once

/**
 * @file reachability.hpp
 * @brief Associated-set traversal from a target entity
 */

#include "cpaudit/graph.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace cpaudit::analyzer {

using catalog::EntityId;

/**
 * Entities associated with a target, in discovery order.
 * The target is always the first element.
 */
class AssociatedSet
{
public:
    AssociatedSet(std::vector<EntityId> order, std::size_t catalog_size);

    [[nodiscard]] const std::vector<EntityId>& order() const { return m_order; }
    [[nodiscard]] std::size_t size() const { return m_order.size(); }
    [[nodiscard]] bool contains(EntityId id) const
    {
        return id < m_member.size() && m_member[id];
    }

private:
    std::vector<EntityId> m_order;
    std::vector<bool> m_member;
};

/**
 * Breadth-first traversal in two phases:
 *   1. From the target, only edges ending at a network are followed.
 *   2. From every queued entity, each incident edge contributes its start
 *      endpoint. Members reach the groups that list them (transitively)
 *      while a network does not fan back out to its other hosts.
 */
[[nodiscard]] AssociatedSet associated_set(const graph::RelationshipGraph& graph, EntityId target);

}  // namespace cpaudit::analyzer
