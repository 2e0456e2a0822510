#pragma once

/**
 * @file classifier.hpp
 * @brief Partition of access rules relative to an associated set
 */

#include "cpaudit/acl.hpp"
#include "cpaudit/catalog.hpp"
#include "cpaudit/common.hpp"
#include "cpaudit/reachability.hpp"

#include <span>
#include <vector>

namespace cpaudit::analyzer {

enum class RuleDirection {
    kNone,
    kOutbound,  ///< a source clause matched: traffic leaving the associated set
    kInbound    ///< a destination clause matched: traffic entering the associated set
};

struct Classification
{
    std::vector<acl::AclRule> outbound;
    std::vector<acl::AclRule> inbound;
};

/**
 * Decide the bucket of a single rule.
 *
 * A clause is hit when one of its uids is in the associated set or is the
 * "any" object. A hit clause matches when it is not negated and the rule's
 * action object is named Accept; otherwise the whole rule is kNone.
 * Sources are checked before destinations. Disabled rules are kNone.
 *
 * @return UnknownReference when a uid needed for the decision is not in the catalog
 */
[[nodiscard]] cpaudit::Result<RuleDirection> classify_rule(const acl::AclRule& rule,
                                                           const catalog::Catalog& objects,
                                                           const AssociatedSet& associated);

/// Stable partition of `rules` into outbound and inbound buckets
[[nodiscard]] cpaudit::Result<Classification> classify(std::span<const acl::AclRule> rules,
                                                       const catalog::Catalog& objects,
                                                       const AssociatedSet& associated);

}  // namespace cpaudit::analyzer
