/**
 * @file audit.cpp
 * @brief Audit pipeline: load, link, traverse, classify
 */

#include "cpaudit/audit.hpp"

#include "cpaudit/acl.hpp"
#include "cpaudit/catalog.hpp"
#include "cpaudit/classifier.hpp"
#include "cpaudit/graph.hpp"
#include "cpaudit/reachability.hpp"
#include "cpaudit/schema_validate.hpp"
#include "cpaudit/version.hpp"

#include <format>
#include <string>
#include <string_view>
#include <vector>

namespace cpaudit::audit {

namespace {

[[nodiscard]] cpaudit::Result<nlohmann::json> load_document(const std::filesystem::path& path,
                                                            const AuditOptions& options,
                                                            std::string_view schema_name)
{
    auto payload = common::read_json_file(path);
    if (!payload) {
        return std::unexpected(payload.error());
    }
    if (options.validate) {
        if (auto validation =
                common::validate_document(*payload, options.schema_dir, schema_name, path.string());
            !validation) {
            return std::unexpected(validation.error());
        }
    }
    return payload;
}

[[nodiscard]] std::vector<std::string> export_warnings(const catalog::Catalog& objects)
{
    std::vector<std::string> warnings;
    for (const auto& uid : objects.duplicate_uids()) {
        warnings.push_back(std::format("uid {} appears more than once; the last record is used", uid));
    }
    for (const auto& name : objects.ambiguous_names()) {
        warnings.push_back(std::format("name '{}' is used by {} objects",
                                       name,
                                       objects.uids_named(name).size()));
    }
    return warnings;
}

[[nodiscard]] cpaudit::Result<catalog::EntityId> resolve_target(const catalog::Catalog& objects,
                                                                const AuditOptions& options)
{
    if (options.target_uid) {
        if (auto id = objects.find(*options.target_uid)) {
            return *id;
        }
        return std::unexpected(cpaudit::Error::make(
            "UnknownTarget", std::format("no object with uid {}", *options.target_uid)));
    }
    if (!options.target_name) {
        return std::unexpected(cpaudit::Error::make("MissingArgument", "no target given"));
    }
    return objects.resolve_target(*options.target_name);
}

}  // namespace

cpaudit::Result<AuditOutput> run_audit(const AuditOptions& options)
{
    auto object_records = load_document(options.objects_path, options, kObjectsSchema);
    if (!object_records) {
        return std::unexpected(object_records.error());
    }
    auto objects = catalog::Catalog::load(*object_records);
    if (!objects) {
        return std::unexpected(objects.error());
    }

    auto graph = graph::RelationshipGraph::build(*objects);
    if (!graph) {
        return std::unexpected(graph.error());
    }

    auto target = resolve_target(*objects, options);
    if (!target) {
        return std::unexpected(target.error());
    }
    auto associated = analyzer::associated_set(*graph, *target);

    auto rule_records = load_document(options.acls_path, options, kAclRulesSchema);
    if (!rule_records) {
        return std::unexpected(rule_records.error());
    }
    auto rules = acl::load_rules(*rule_records);
    if (!rules) {
        return std::unexpected(rules.error());
    }

    auto classification = analyzer::classify(*rules, *objects, associated);
    if (!classification) {
        return std::unexpected(classification.error());
    }

    const std::string label = options.target_name.value_or(objects->at(*target).name);
    auto built = report::build_report(label, *objects, associated, *classification);
    if (!built) {
        return std::unexpected(built.error());
    }
    return AuditOutput{.report = std::move(*built), .warnings = export_warnings(*objects)};
}

}  // namespace cpaudit::audit
