/**
 * @file acl.cpp
 * @brief Access rule decoding
 */

#include "cpaudit/acl.hpp"

#include <exception>
#include <format>
#include <ranges>
#include <string>
#include <vector>

namespace cpaudit::acl {

namespace {

[[nodiscard]] std::vector<std::string> uid_list(const nlohmann::json& record, const char* key)
{
    if (!record.contains(key)) {
        return {};
    }
    return record.at(key).get<std::vector<std::string>>();
}

[[nodiscard]] std::string rule_label(const nlohmann::json& record)
{
    auto it = record.find("uid");
    if (it != record.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "<no uid>";
}

}  // namespace

bool is_access_rule(const nlohmann::json& record)
{
    if (!record.is_object()) {
        return false;
    }
    auto it = record.find("type");
    if (it == record.end() || !it->is_string()) {
        return false;
    }
    return it->get_ref<const std::string&>().find(kAccessRuleTag) != std::string::npos;
}

cpaudit::Result<AclRule> decode_rule(const nlohmann::json& record)
{
    AclRule rule;
    try {
        rule.uid = record.value("uid", std::string{});
        rule.name = record.value("name", std::string{});
        rule.type = record.value("type", std::string{});
        rule.comments = record.value("comments", std::string{});
        rule.action = record.value("action", std::string{});
        rule.enabled = record.value("enabled", false);
        rule.number = record.value("rule-number", 0);
        rule.source = uid_list(record, "source");
        rule.source_negate = record.value("source-negate", false);
        rule.destination = uid_list(record, "destination");
        rule.destination_negate = record.value("destination-negate", false);
        rule.service = uid_list(record, "service");
    } catch (const std::exception& ex) {
        return std::unexpected(cpaudit::Error::make(
            "DecodeError",
            std::format("failed to decode access rule {}: {}", rule_label(record), ex.what())));
    }
    return rule;
}

cpaudit::Result<std::vector<AclRule>> load_rules(const nlohmann::json& records)
{
    if (!records.is_array()) {
        return std::unexpected(
            cpaudit::Error::make("DecodeError", "rule base export must be a JSON array"));
    }
    std::vector<AclRule> rules;
    for (auto [index, record] : std::views::enumerate(records)) {
        if (!is_access_rule(record)) {
            continue;
        }
        auto rule = decode_rule(record);
        if (!rule) {
            return std::unexpected(cpaudit::Error::make(
                rule.error().code, std::format("record #{}: {}", index, rule.error().message)));
        }
        rules.push_back(std::move(*rule));
    }
    return rules;
}

}  // namespace cpaudit::acl
