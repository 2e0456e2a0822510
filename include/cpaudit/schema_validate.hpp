#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation of policy export documents
 */

#include "cpaudit/common.hpp"

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace cpaudit::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] cpaudit::VoidResult validate_json(const nlohmann::json& j,
                                                const std::string& schema_path);

/**
 * Validate an input document against `<schema_dir>/<schema_name>.schema.json`.
 * Failures are reported as SchemaInvalid with `label` naming the document.
 */
[[nodiscard]] cpaudit::VoidResult validate_document(const nlohmann::json& j,
                                                    const std::filesystem::path& schema_dir,
                                                    std::string_view schema_name,
                                                    std::string_view label);

}  // namespace cpaudit::common
