#pragma once

/**
 * @file catalog.hpp
 * @brief Object catalog: typed policy entities indexed by uid and name
 */

#include "cpaudit/common.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace cpaudit::catalog {

/**
 * Policy object kinds the analysis distinguishes.
 * Any type tag not listed here decodes as kOther and keeps its raw tag.
 */
enum class EntityKind {
    kHost,
    kNetwork,
    kGroup,
    kServiceGroup,
    kService,
    kAny,
    kOther
};

/// Index of an entity inside its Catalog
using EntityId = std::size_t;

constexpr std::string_view kAnyObjectType = "CpmiAnyObject";
constexpr std::string_view kAcceptActionName = "Accept";

struct Entity
{
    std::string uid;
    std::string name;
    std::string comments;
    std::string type;
    EntityKind kind = EntityKind::kOther;

    std::string ipv4_address;            ///< hosts
    std::string subnet4;                 ///< networks
    int mask_length4 = 0;                ///< networks
    std::string port;                    ///< services
    std::string protocol;                ///< services
    std::vector<std::string> members;    ///< groups, in export order

    [[nodiscard]] bool has_address() const { return kind == EntityKind::kHost; }
    [[nodiscard]] bool has_subnet() const { return kind == EntityKind::kNetwork; }
    [[nodiscard]] bool has_members() const
    {
        return kind == EntityKind::kGroup || kind == EntityKind::kServiceGroup;
    }
    [[nodiscard]] bool has_port() const { return kind == EntityKind::kService; }
};

[[nodiscard]] EntityKind kind_from_type(std::string_view type);

[[nodiscard]] std::string_view to_string(EntityKind kind);

/**
 * Decode one object record.
 * @return DecodeError when a required field is missing or a field has the wrong JSON type
 */
[[nodiscard]] cpaudit::Result<Entity> decode_entity(const nlohmann::json& record);

/**
 * Catalog
 *
 * Sole owner of the entities of one export. Entities never move after load,
 * so EntityId values stay valid for the catalog's lifetime.
 *
 * Duplicate uids: the later record replaces the earlier one in place, and
 * the earlier record's name no longer refers to that uid.
 * Duplicate names: the name index keeps the later uid. Both conditions are
 * recorded so callers can report them.
 */
class Catalog
{
public:
    [[nodiscard]] static cpaudit::Result<Catalog> load(const nlohmann::json& records);

    [[nodiscard]] std::size_t size() const { return m_entities.size(); }
    [[nodiscard]] const Entity& at(EntityId id) const { return m_entities.at(id); }
    [[nodiscard]] const std::vector<Entity>& entities() const { return m_entities; }

    [[nodiscard]] std::optional<EntityId> find(std::string_view uid) const;
    [[nodiscard]] std::optional<EntityId> find_by_name(std::string_view name) const;

    /// UnknownReference when the uid is not in the export
    [[nodiscard]] cpaudit::Result<EntityId> resolve_uid(std::string_view uid) const;

    /// UnknownTarget for unknown names, AmbiguousTarget for names shared by several uids
    [[nodiscard]] cpaudit::Result<EntityId> resolve_target(std::string_view name) const;

    /// Uids that appeared more than once, sorted
    [[nodiscard]] std::vector<std::string> duplicate_uids() const;

    /// Names claimed by more than one uid, sorted
    [[nodiscard]] std::vector<std::string> ambiguous_names() const;

    /// All uids that claimed `name`, in load order
    [[nodiscard]] std::vector<std::string> uids_named(std::string_view name) const;

private:
    void insert(Entity entity);
    void release_name(const std::string& name, std::string_view uid);

    std::vector<Entity> m_entities;
    std::map<std::string, EntityId, std::less<>> m_by_uid;
    std::map<std::string, std::string, std::less<>> m_name_to_uid;
    std::map<std::string, std::vector<std::string>, std::less<>> m_name_claims;
    std::map<std::string, std::size_t, std::less<>> m_uid_counts;
};

}  // namespace cpaudit::catalog
