#pragma once

/**
 * @file acl.hpp
 * @brief Access rule records decoded from a rule base export
 */

#include "cpaudit/common.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace cpaudit::acl {

/// Rule base records whose type contains this tag are access rules
constexpr std::string_view kAccessRuleTag = "access-rule";

/**
 * One access rule. Object references are uids resolved against the
 * catalog when the rule is classified or rendered, not when it is decoded.
 */
struct AclRule
{
    std::string uid;
    std::string name;
    std::string type;
    std::string comments;
    std::string action;  ///< uid of the action object
    bool enabled = false;
    int number = 0;

    std::vector<std::string> source;
    bool source_negate = false;
    std::vector<std::string> destination;
    bool destination_negate = false;
    std::vector<std::string> service;
};

[[nodiscard]] bool is_access_rule(const nlohmann::json& record);

[[nodiscard]] cpaudit::Result<AclRule> decode_rule(const nlohmann::json& record);

/**
 * Decode every access rule of a rule base export, in export order.
 * Sections, placeholders and other record kinds are skipped.
 */
[[nodiscard]] cpaudit::Result<std::vector<AclRule>> load_rules(const nlohmann::json& records);

}  // namespace cpaudit::acl
