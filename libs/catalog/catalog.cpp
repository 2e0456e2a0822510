/**
 * @file catalog.cpp
 * @brief Object record decoding and catalog indexes
 */

#include "cpaudit/catalog.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <ranges>
#include <string>
#include <utility>
#include <vector>

namespace cpaudit::catalog {

namespace {

[[nodiscard]] std::string record_label(const nlohmann::json& record)
{
    if (record.is_object() && record.contains("uid") && record.at("uid").is_string()) {
        return record.at("uid").get<std::string>();
    }
    return "<no uid>";
}

}  // namespace

EntityKind kind_from_type(std::string_view type)
{
    if (type == "host") {
        return EntityKind::kHost;
    }
    if (type == "network") {
        return EntityKind::kNetwork;
    }
    if (type == "group") {
        return EntityKind::kGroup;
    }
    if (type == "service-group") {
        return EntityKind::kServiceGroup;
    }
    if (type.starts_with("service-")) {
        return EntityKind::kService;
    }
    if (type == kAnyObjectType) {
        return EntityKind::kAny;
    }
    return EntityKind::kOther;
}

std::string_view to_string(EntityKind kind)
{
    switch (kind) {
        case EntityKind::kHost:
            return "host";
        case EntityKind::kNetwork:
            return "network";
        case EntityKind::kGroup:
            return "group";
        case EntityKind::kServiceGroup:
            return "service-group";
        case EntityKind::kService:
            return "service";
        case EntityKind::kAny:
            return "any";
        case EntityKind::kOther:
            break;
    }
    return "other";
}

cpaudit::Result<Entity> decode_entity(const nlohmann::json& record)
{
    if (!record.is_object()) {
        return std::unexpected(
            cpaudit::Error::make("DecodeError", "object record must be a JSON object"));
    }
    Entity entity;
    try {
        entity.uid = record.at("uid").get<std::string>();
        entity.name = record.at("name").get<std::string>();
        entity.type = record.at("type").get<std::string>();
        entity.comments = record.value("comments", std::string{});
        entity.ipv4_address = record.value("ipv4-address", std::string{});
        entity.subnet4 = record.value("subnet4", std::string{});
        entity.mask_length4 = record.value("mask-length4", 0);
        entity.port = record.value("port", std::string{});
        entity.protocol = record.value("protocol", std::string{});
        if (record.contains("members")) {
            entity.members = record.at("members").get<std::vector<std::string>>();
        }
    } catch (const std::exception& ex) {
        return std::unexpected(cpaudit::Error::make(
            "DecodeError",
            std::format("failed to decode object record {}: {}", record_label(record), ex.what())));
    }
    entity.kind = kind_from_type(entity.type);
    return entity;
}

cpaudit::Result<Catalog> Catalog::load(const nlohmann::json& records)
{
    if (!records.is_array()) {
        return std::unexpected(
            cpaudit::Error::make("DecodeError", "object export must be a JSON array"));
    }
    Catalog catalog;
    catalog.m_entities.reserve(records.size());
    for (auto [index, record] : std::views::enumerate(records)) {
        auto entity = decode_entity(record);
        if (!entity) {
            return std::unexpected(cpaudit::Error::make(
                entity.error().code,
                std::format("record #{}: {}", index, entity.error().message)));
        }
        catalog.insert(std::move(*entity));
    }
    return catalog;
}

void Catalog::insert(Entity entity)
{
    ++m_uid_counts[entity.uid];

    auto existing = m_by_uid.find(entity.uid);
    if (existing != m_by_uid.end()) {
        release_name(m_entities[existing->second].name, entity.uid);
    }

    auto& claims = m_name_claims[entity.name];
    if (std::ranges::find(claims, entity.uid) == claims.end()) {
        claims.push_back(entity.uid);
    }
    m_name_to_uid.insert_or_assign(entity.name, entity.uid);

    if (existing != m_by_uid.end()) {
        m_entities[existing->second] = std::move(entity);
        return;
    }
    const EntityId id = m_entities.size();
    m_by_uid.emplace(entity.uid, id);
    m_entities.push_back(std::move(entity));
}

void Catalog::release_name(const std::string& name, std::string_view uid)
{
    auto claims = m_name_claims.find(name);
    if (claims == m_name_claims.end()) {
        return;
    }
    std::erase(claims->second, uid);
    if (claims->second.empty()) {
        m_name_claims.erase(claims);
        m_name_to_uid.erase(name);
        return;
    }
    // the latest remaining claimant owns the name
    m_name_to_uid.insert_or_assign(name, claims->second.back());
}

std::optional<EntityId> Catalog::find(std::string_view uid) const
{
    if (auto it = m_by_uid.find(uid); it != m_by_uid.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<EntityId> Catalog::find_by_name(std::string_view name) const
{
    auto it = m_name_to_uid.find(name);
    if (it == m_name_to_uid.end()) {
        return std::nullopt;
    }
    return find(it->second);
}

cpaudit::Result<EntityId> Catalog::resolve_uid(std::string_view uid) const
{
    if (auto id = find(uid)) {
        return *id;
    }
    return std::unexpected(cpaudit::Error::make(
        "UnknownReference", std::format("uid {} is not present in the object export", uid)));
}

cpaudit::Result<EntityId> Catalog::resolve_target(std::string_view name) const
{
    auto claims = uids_named(name);
    if (claims.size() > 1) {
        std::string listed;
        for (const auto& uid : claims) {
            listed += listed.empty() ? uid : ", " + uid;
        }
        return std::unexpected(cpaudit::Error::make(
            "AmbiguousTarget",
            std::format("name '{}' is shared by {} objects ({}); select one with --target-uid",
                        name,
                        claims.size(),
                        listed)));
    }
    if (auto id = find_by_name(name)) {
        return *id;
    }
    return std::unexpected(
        cpaudit::Error::make("UnknownTarget", std::format("no object named '{}'", name)));
}

std::vector<std::string> Catalog::duplicate_uids() const
{
    std::vector<std::string> duplicates;
    for (const auto& [uid, count] : m_uid_counts) {
        if (count > 1) {
            duplicates.push_back(uid);
        }
    }
    return duplicates;
}

std::vector<std::string> Catalog::ambiguous_names() const
{
    std::vector<std::string> names;
    for (const auto& [name, uids] : m_name_claims) {
        if (uids.size() > 1) {
            names.push_back(name);
        }
    }
    return names;
}

std::vector<std::string> Catalog::uids_named(std::string_view name) const
{
    if (auto it = m_name_claims.find(name); it != m_name_claims.end()) {
        return it->second;
    }
    return {};
}

}  // namespace cpaudit::catalog
