/**
 * @file classifier.cpp
 * @brief Access rule classification against an associated set
 */

#include "cpaudit/classifier.hpp"

#include <format>
#include <optional>
#include <string>
#include <vector>

namespace cpaudit::analyzer {

namespace {

enum class ClauseOutcome {
    kNoHit,
    kMatch,
    kExcluded  ///< hit under negation or with a non-accept action
};

class RuleMatcher
{
public:
    RuleMatcher(const acl::AclRule& rule,
                const catalog::Catalog& objects,
                const AssociatedSet& associated)
        : m_rule(rule)
        , m_objects(objects)
        , m_associated(associated)
    {}

    [[nodiscard]] cpaudit::Result<ClauseOutcome> evaluate(const std::vector<std::string>& uids,
                                                          bool negated)
    {
        for (const auto& uid : uids) {
            auto id = m_objects.resolve_uid(uid);
            if (!id) {
                return std::unexpected(reference_error(id.error()));
            }
            if (!m_associated.contains(*id)
                && m_objects.at(*id).kind != catalog::EntityKind::kAny) {
                continue;
            }
            if (negated) {
                return ClauseOutcome::kExcluded;
            }
            auto accept = accepts();
            if (!accept) {
                return std::unexpected(accept.error());
            }
            return *accept ? ClauseOutcome::kMatch : ClauseOutcome::kExcluded;
        }
        return ClauseOutcome::kNoHit;
    }

private:
    // Resolved on first use only
    [[nodiscard]] cpaudit::Result<bool> accepts()
    {
        if (!m_accepts) {
            auto action = m_objects.resolve_uid(m_rule.action);
            if (!action) {
                return std::unexpected(reference_error(action.error()));
            }
            m_accepts = m_objects.at(*action).name == catalog::kAcceptActionName;
        }
        return *m_accepts;
    }

    [[nodiscard]] cpaudit::Error reference_error(const cpaudit::Error& error) const
    {
        return cpaudit::Error::make(error.code,
                                    std::format("rule {}: {}", m_rule.number, error.message));
    }

    const acl::AclRule& m_rule;
    const catalog::Catalog& m_objects;
    const AssociatedSet& m_associated;
    std::optional<bool> m_accepts;
};

}  // namespace

cpaudit::Result<RuleDirection> classify_rule(const acl::AclRule& rule,
                                             const catalog::Catalog& objects,
                                             const AssociatedSet& associated)
{
    if (!rule.enabled) {
        return RuleDirection::kNone;
    }
    RuleMatcher matcher(rule, objects, associated);

    auto source = matcher.evaluate(rule.source, rule.source_negate);
    if (!source) {
        return std::unexpected(source.error());
    }
    if (*source == ClauseOutcome::kMatch) {
        return RuleDirection::kOutbound;
    }
    if (*source == ClauseOutcome::kExcluded) {
        return RuleDirection::kNone;
    }

    auto destination = matcher.evaluate(rule.destination, rule.destination_negate);
    if (!destination) {
        return std::unexpected(destination.error());
    }
    return *destination == ClauseOutcome::kMatch ? RuleDirection::kInbound : RuleDirection::kNone;
}

cpaudit::Result<Classification> classify(std::span<const acl::AclRule> rules,
                                         const catalog::Catalog& objects,
                                         const AssociatedSet& associated)
{
    Classification result;
    for (const auto& rule : rules) {
        auto direction = classify_rule(rule, objects, associated);
        if (!direction) {
            return std::unexpected(direction.error());
        }
        switch (*direction) {
            case RuleDirection::kOutbound:
                result.outbound.push_back(rule);
                break;
            case RuleDirection::kInbound:
                result.inbound.push_back(rule);
                break;
            case RuleDirection::kNone:
                break;
        }
    }
    return result;
}

}  // namespace cpaudit::analyzer
