#pragma once

/**
 * @file audit.hpp
 * @brief End-to-end audit of one target over a policy export
 */

#include "cpaudit/common.hpp"
#include "cpaudit/report.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cpaudit::audit {

struct AuditOptions
{
    std::filesystem::path objects_path;
    std::filesystem::path acls_path;
    std::optional<std::string> target_name;
    std::optional<std::string> target_uid;
    std::filesystem::path schema_dir;
    bool validate = true;
};

struct AuditOutput
{
    report::AuditReport report;
    std::vector<std::string> warnings;  ///< duplicate uids and names found in the export
};

/**
 * Load both exports, build the relationship graph, compute the target's
 * associated set and classify the access rules.
 *
 * Nothing is returned unless every step succeeds.
 */
[[nodiscard]] cpaudit::Result<AuditOutput> run_audit(const AuditOptions& options);

}  // namespace cpaudit::audit
