#pragma once

/**
 * @file common.hpp
 * @brief Common types: Error, Result, JSON file loading
 */

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace cpaudit {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

}  // namespace cpaudit

namespace cpaudit::common {

/**
 * Read and parse a JSON document from disk
 * @param path Input file
 * @return Parsed document, IOError or ParseError
 */
[[nodiscard]] cpaudit::Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

/**
 * Trim leading and trailing whitespace
 */
[[nodiscard]] std::string trim(std::string_view input);

}  // namespace cpaudit::common
