/**
 * @file report.cpp
 * @brief Audit report construction and rendering
 */

#include "cpaudit/report.hpp"

#include "cpaudit/ipv4.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <ranges>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cpaudit::report {

namespace {

using catalog::Entity;
using catalog::EntityKind;

constexpr std::string_view kNegationMarker = "!";

[[nodiscard]] std::string describe_service(const Entity& service)
{
    if (service.type.find("icmp") != std::string::npos) {
        return std::format("{}:{}", service.name, service.type);
    }
    return std::format("{}:{}:{}", service.name, service.type, service.port);
}

[[nodiscard]] bool is_group_service(const Entity& service)
{
    return service.type.find("group") != std::string::npos;
}

/// Appends the description of `uid`, expanding each group at most once
[[nodiscard]] cpaudit::VoidResult append_service(std::string_view uid,
                                                 const catalog::Catalog& objects,
                                                 std::set<catalog::EntityId>& expanded,
                                                 std::vector<std::string>& lines)
{
    auto id = objects.resolve_uid(uid);
    if (!id) {
        return std::unexpected(id.error());
    }
    const Entity& service = objects.at(*id);
    if (!is_group_service(service)) {
        lines.push_back(describe_service(service));
        return {};
    }
    if (!expanded.insert(*id).second) {
        return {};
    }
    for (const auto& member : service.members) {
        if (auto appended = append_service(member, objects, expanded, lines); !appended) {
            return appended;
        }
    }
    return {};
}

[[nodiscard]] std::string join_lines(const std::vector<std::string>& lines)
{
    std::string joined;
    for (const auto& [i, line] : std::views::enumerate(lines)) {
        if (i != 0) {
            joined += '\n';
        }
        joined += line;
    }
    return joined;
}

[[nodiscard]] std::vector<std::string> split_lines(std::string_view cell)
{
    std::vector<std::string> lines;
    for (auto part : cell | std::views::split('\n')) {
        lines.emplace_back(part.begin(), part.end());
    }
    if (lines.empty()) {
        lines.emplace_back();
    }
    return lines;
}

// Code points, not bytes: UTF-8 continuation bytes take no column
[[nodiscard]] std::size_t display_width(std::string_view text)
{
    return static_cast<std::size_t>(std::ranges::count_if(
        text, [](char ch) { return (static_cast<unsigned char>(ch) & 0xC0U) != 0x80U; }));
}

[[nodiscard]] std::string separator_line(const std::vector<std::size_t>& widths)
{
    std::string line = "+";
    for (std::size_t width : widths) {
        line += std::string(width + 2, '-');
        line += '+';
    }
    return line;
}

[[nodiscard]] std::string grid_line(const std::vector<std::string>& cells,
                                    const std::vector<std::size_t>& widths)
{
    std::string line = "|";
    for (const auto& [cell, width] : std::views::zip(cells, widths)) {
        line += ' ';
        line += cell;
        line.append(width - std::min(width, display_width(cell)), ' ');
        line += " |";
    }
    return line;
}

[[nodiscard]] Table rule_table(std::string title, const std::vector<RuleRow>& rules)
{
    Table table{.title = std::move(title),
                .headings = {"No.", "Src", "Dst", "Service"},
                .rows = {}};
    for (const auto& rule : rules) {
        table.rows.push_back({std::to_string(rule.number),
                              join_lines(rule.source),
                              join_lines(rule.destination),
                              join_lines(rule.service)});
    }
    return table;
}

[[nodiscard]] cpaudit::Result<std::vector<RuleRow>>
rule_rows(const std::vector<acl::AclRule>& rules, const catalog::Catalog& objects)
{
    std::vector<RuleRow> rows;
    rows.reserve(rules.size());
    for (const auto& rule : rules) {
        auto row = rule_row(rule, objects);
        if (!row) {
            return std::unexpected(row.error());
        }
        rows.push_back(std::move(*row));
    }
    return rows;
}

[[nodiscard]] nlohmann::json rule_rows_json(const std::vector<RuleRow>& rows)
{
    nlohmann::json out = nlohmann::json::array();
    for (const auto& row : rows) {
        out.push_back({
            {"rule_number",      row.number},
            {     "source",      row.source},
            {"destination", row.destination},
            {    "service",     row.service}
        });
    }
    return out;
}

}  // namespace

ObjectRow object_row(const Entity& entity)
{
    std::string extra;
    switch (entity.kind) {
        case EntityKind::kHost:
            extra = entity.ipv4_address;
            break;
        case EntityKind::kNetwork:
            extra = common::format_cidr(entity.subnet4, entity.mask_length4);
            break;
        case EntityKind::kGroup:
            extra = std::format("Members {}", entity.members.size());
            break;
        default:
            break;
    }
    return ObjectRow{.name = entity.name,
                     .type = entity.type,
                     .extra = std::move(extra),
                     .comment = common::trim(entity.comments),
                     .uid = entity.uid};
}

cpaudit::Result<std::vector<std::string>>
endpoint_names(std::span<const std::string> uids, bool negated, const catalog::Catalog& objects)
{
    std::vector<std::string> names;
    names.reserve(uids.size());
    for (const auto& uid : uids) {
        auto id = objects.resolve_uid(uid);
        if (!id) {
            return std::unexpected(id.error());
        }
        const auto& name = objects.at(*id).name;
        names.push_back(negated ? std::string(kNegationMarker) + name : name);
    }
    return names;
}

cpaudit::Result<std::vector<std::string>>
service_descriptions(std::span<const std::string> uids, const catalog::Catalog& objects)
{
    std::vector<std::string> lines;
    std::set<catalog::EntityId> expanded;
    for (const auto& uid : uids) {
        if (auto appended = append_service(uid, objects, expanded, lines); !appended) {
            return std::unexpected(appended.error());
        }
    }
    return lines;
}

cpaudit::Result<RuleRow> rule_row(const acl::AclRule& rule, const catalog::Catalog& objects)
{
    auto source = endpoint_names(rule.source, rule.source_negate, objects);
    if (!source) {
        return std::unexpected(source.error());
    }
    auto destination = endpoint_names(rule.destination, rule.destination_negate, objects);
    if (!destination) {
        return std::unexpected(destination.error());
    }
    auto service = service_descriptions(rule.service, objects);
    if (!service) {
        return std::unexpected(service.error());
    }
    return RuleRow{.number = rule.number,
                   .source = std::move(*source),
                   .destination = std::move(*destination),
                   .service = std::move(*service)};
}

cpaudit::Result<AuditReport> build_report(std::string_view target,
                                          const catalog::Catalog& objects,
                                          const analyzer::AssociatedSet& associated,
                                          const analyzer::Classification& classification)
{
    AuditReport report;
    report.target = std::string(target);
    for (catalog::EntityId id : associated.order()) {
        report.associated.push_back(object_row(objects.at(id)));
    }

    auto outbound = rule_rows(classification.outbound, objects);
    if (!outbound) {
        return std::unexpected(outbound.error());
    }
    auto inbound = rule_rows(classification.inbound, objects);
    if (!inbound) {
        return std::unexpected(inbound.error());
    }
    report.outbound = std::move(*outbound);
    report.inbound = std::move(*inbound);
    return report;
}

std::vector<std::string> render_table(const Table& table)
{
    std::vector<std::size_t> widths;
    widths.reserve(table.headings.size());
    for (const auto& heading : table.headings) {
        widths.push_back(display_width(heading));
    }

    // Each row expands to as many physical lines as its tallest cell
    std::vector<std::vector<std::vector<std::string>>> split_rows;
    split_rows.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        std::vector<std::vector<std::string>> cells;
        for (const auto& [column, cell] : std::views::enumerate(row)) {
            auto lines = split_lines(cell);
            const auto col = static_cast<std::size_t>(column);
            if (col < widths.size()) {
                for (const auto& line : lines) {
                    widths[col] = std::max(widths[col], display_width(line));
                }
            }
            cells.push_back(std::move(lines));
        }
        cells.resize(widths.size(), std::vector<std::string>{std::string{}});
        split_rows.push_back(std::move(cells));
    }

    std::vector<std::string> out;
    out.push_back(table.title);
    const std::string separator = separator_line(widths);
    out.push_back(separator);
    out.push_back(grid_line(table.headings, widths));
    out.push_back(separator);
    for (const auto& cells : split_rows) {
        std::size_t height = 1;
        for (const auto& lines : cells) {
            height = std::max(height, lines.size());
        }
        for (std::size_t line_no = 0; line_no < height; ++line_no) {
            std::vector<std::string> physical;
            physical.reserve(widths.size());
            for (std::size_t col = 0; col < widths.size(); ++col) {
                const auto& lines = cells[col];
                physical.push_back(line_no < lines.size() ? lines[line_no] : std::string{});
            }
            out.push_back(grid_line(physical, widths));
        }
        out.push_back(separator);
    }
    return out;
}

std::vector<std::string> render_text(const AuditReport& report)
{
    Table associated{.title = report.target + " Belongs To",
                     .headings = {"Name", "Type", "Extra", "Comment", "UID"},
                     .rows = {}};
    for (const auto& row : report.associated) {
        associated.rows.push_back({row.name, row.type, row.extra, row.comment, row.uid});
    }

    std::vector<std::string> lines = render_table(associated);
    lines.emplace_back();
    std::ranges::copy(render_table(rule_table(report.target + "->Target", report.outbound)),
                      std::back_inserter(lines));
    lines.emplace_back();
    std::ranges::copy(render_table(rule_table("Target->" + report.target, report.inbound)),
                      std::back_inserter(lines));
    return lines;
}

nlohmann::json to_json(const AuditReport& report)
{
    nlohmann::json associated = nlohmann::json::array();
    for (const auto& row : report.associated) {
        associated.push_back({
            {   "name",    row.name},
            {   "type",    row.type},
            {  "extra",   row.extra},
            {"comment", row.comment},
            {    "uid",     row.uid}
        });
    }
    return nlohmann::json{
        {    "target",                   report.target},
        {"associated",                      associated},
        {  "outbound", rule_rows_json(report.outbound)},
        {   "inbound",  rule_rows_json(report.inbound)}
    };
}

}  // namespace cpaudit::report
