#pragma once

/**
 * @file version.hpp
 * @brief cpaudit version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace cpaudit {

/// cpaudit version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Input schema versions accepted by the loaders
constexpr const char* kObjectsSchema = "objects.v1";
constexpr const char* kAclRulesSchema = "acl_rules.v1";

}  // namespace cpaudit
