/**
 * @file json_io.cpp
 * @brief JSON file loading and small string helpers
 */

#include "cpaudit/common.hpp"

#include <cctype>
#include <exception>
#include <fstream>
#include <string>
#include <string_view>

namespace cpaudit::common {

cpaudit::Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            cpaudit::Error::make("IOError", "Failed to open JSON file: " + path.string()));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const std::exception& ex) {
        return std::unexpected(
            cpaudit::Error::make("ParseError",
                                 "Failed to parse JSON file: " + path.string() + ": " + ex.what()));
    }
    return payload;
}

std::string trim(std::string_view input)
{
    std::size_t start = 0;
    while (start < input.size() && std::isspace(static_cast<unsigned char>(input[start])) != 0) {
        ++start;
    }
    std::size_t end = input.size();
    while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
        --end;
    }
    return std::string(input.substr(start, end - start));
}

}  // namespace cpaudit::common
