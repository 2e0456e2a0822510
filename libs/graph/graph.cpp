/**
 * @file graph.cpp
 * @brief Membership and containment edge construction
 */

#include "cpaudit/graph.hpp"

#include "cpaudit/ipv4.hpp"

#include <algorithm>
#include <format>
#include <optional>
#include <ranges>
#include <vector>

namespace cpaudit::graph {

using catalog::Entity;
using catalog::EntityKind;

namespace {

struct HostAddress
{
    EntityId id;
    std::uint32_t address;
};

[[nodiscard]] std::string describe(const Entity& entity)
{
    return std::format("{} ({})", entity.name, entity.uid);
}

}  // namespace

RelationshipGraph::RelationshipGraph(const catalog::Catalog& catalog)
    : m_catalog(&catalog)
    , m_incident(catalog.size())
{}

cpaudit::Result<RelationshipGraph> RelationshipGraph::build(const catalog::Catalog& catalog)
{
    RelationshipGraph graph(catalog);
    if (auto linked = graph.link_members(); !linked) {
        return std::unexpected(linked.error());
    }
    if (auto linked = graph.link_subnets(); !linked) {
        return std::unexpected(linked.error());
    }
    return graph;
}

bool RelationshipGraph::has_edge(EntityId start, EntityId end, EdgeMethod method) const
{
    return std::ranges::any_of(incident(start), [&](EdgeId id) {
        const Edge& e = m_edges[id];
        return e.start == start && e.end == end && e.method == method;
    });
}

void RelationshipGraph::add_membership(EntityId group, EntityId member)
{
    const EdgeId id = m_edges.size();
    m_edges.push_back(Edge{.start = group, .end = member, .method = EdgeMethod::kMembership});
    m_incident[member].push_back(id);
    m_incident[group].push_back(id);
}

void RelationshipGraph::add_containment(EntityId host, EntityId network)
{
    const EdgeId to_network = m_edges.size();
    m_edges.push_back(Edge{.start = host, .end = network, .method = EdgeMethod::kContainment});
    const EdgeId to_host = m_edges.size();
    m_edges.push_back(Edge{.start = network, .end = host, .method = EdgeMethod::kContainment});
    m_incident[host].push_back(to_network);
    m_incident[network].push_back(to_host);
}

cpaudit::VoidResult RelationshipGraph::link_members()
{
    const auto& entities = m_catalog->entities();
    for (auto [index, group] : std::views::enumerate(entities)) {
        if (!group.has_members()) {
            continue;
        }
        const auto group_id = static_cast<EntityId>(index);
        for (const auto& member_uid : group.members) {
            auto member = m_catalog->resolve_uid(member_uid);
            if (!member) {
                return std::unexpected(cpaudit::Error::make(
                    member.error().code,
                    std::format("group {} lists unknown member {}", describe(group), member_uid)));
            }
            add_membership(group_id, *member);
        }
    }
    return {};
}

cpaudit::VoidResult RelationshipGraph::link_subnets()
{
    const auto& entities = m_catalog->entities();

    std::vector<HostAddress> hosts;
    for (auto [index, entity] : std::views::enumerate(entities)) {
        if (!entity.has_address()) {
            continue;
        }
        // hosts without an IPv4 address belong to no network
        if (auto address = common::parse_ipv4(entity.ipv4_address)) {
            hosts.push_back(HostAddress{.id = static_cast<EntityId>(index), .address = *address});
        }
    }

    for (auto [index, network] : std::views::enumerate(entities)) {
        if (!network.has_subnet()) {
            continue;
        }
        auto range = common::parse_cidr(network.subnet4, network.mask_length4);
        if (!range) {
            return std::unexpected(cpaudit::Error::make(
                range.error().code,
                std::format("network {}: {}", describe(network), range.error().message)));
        }
        const auto network_id = static_cast<EntityId>(index);
        for (const auto& host : hosts) {
            if (common::cidr_contains(*range, host.address)) {
                add_containment(host.id, network_id);
            }
        }
    }
    return {};
}

}  // namespace cpaudit::graph
