#pragma once

/**
 * @file report.hpp
 * @brief Audit report rows, text tables and JSON output
 */

#include "cpaudit/acl.hpp"
#include "cpaudit/catalog.hpp"
#include "cpaudit/classifier.hpp"
#include "cpaudit/common.hpp"
#include "cpaudit/reachability.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace cpaudit::report {

enum class OutputFormat { kText, kJson };

struct ObjectRow
{
    std::string name;
    std::string type;
    std::string extra;    ///< address, subnet/prefix or member count
    std::string comment;  ///< trimmed
    std::string uid;
};

struct RuleRow
{
    int number = 0;
    std::vector<std::string> source;       ///< names, "!" prefixed when negated
    std::vector<std::string> destination;  ///< names, "!" prefixed when negated
    std::vector<std::string> service;      ///< name:type[:port], groups expanded
};

struct AuditReport
{
    std::string target;
    std::vector<ObjectRow> associated;
    std::vector<RuleRow> outbound;
    std::vector<RuleRow> inbound;
};

/// A titled grid; cells may hold several lines separated by '\n'
struct Table
{
    std::string title;
    std::vector<std::string> headings;
    std::vector<std::vector<std::string>> rows;
};

[[nodiscard]] ObjectRow object_row(const catalog::Entity& entity);

/// Names of the referenced objects, each prefixed with "!" when negated
[[nodiscard]] cpaudit::Result<std::vector<std::string>>
endpoint_names(std::span<const std::string> uids, bool negated, const catalog::Catalog& objects);

/// Service descriptions with group services replaced by their members
[[nodiscard]] cpaudit::Result<std::vector<std::string>>
service_descriptions(std::span<const std::string> uids, const catalog::Catalog& objects);

[[nodiscard]] cpaudit::Result<RuleRow> rule_row(const acl::AclRule& rule,
                                                const catalog::Catalog& objects);

[[nodiscard]] cpaudit::Result<AuditReport>
build_report(std::string_view target,
             const catalog::Catalog& objects,
             const analyzer::AssociatedSet& associated,
             const analyzer::Classification& classification);

[[nodiscard]] std::vector<std::string> render_table(const Table& table);

/// The three tables of a report, separated by blank lines
[[nodiscard]] std::vector<std::string> render_text(const AuditReport& report);

[[nodiscard]] nlohmann::json to_json(const AuditReport& report);

}  // namespace cpaudit::report
