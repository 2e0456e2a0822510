/**
 * @file ipv4.cpp
 * @brief IPv4 address parsing and CIDR containment
 */

#include "cpaudit/ipv4.hpp"

#include <format>
#include <string>

#include <arpa/inet.h>

namespace cpaudit::common {

std::optional<std::uint32_t> parse_ipv4(std::string_view text)
{
    if (text.empty()) {
        return std::nullopt;
    }
    const std::string buffer(text);
    in_addr addr{};
    if (inet_pton(AF_INET, buffer.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return ntohl(addr.s_addr);
}

cpaudit::Result<Cidr> parse_cidr(std::string_view base_address, int prefix_length)
{
    if (prefix_length < 0 || prefix_length > 32) {
        return std::unexpected(cpaudit::Error::make(
            "InvalidSubnet",
            std::format("invalid CIDR address: {}", format_cidr(base_address, prefix_length))));
    }
    auto base = parse_ipv4(base_address);
    if (!base) {
        return std::unexpected(cpaudit::Error::make(
            "InvalidSubnet",
            std::format("invalid CIDR address: {}", format_cidr(base_address, prefix_length))));
    }
    // prefix 0 matches everything; shifting a 32-bit value by 32 is undefined
    const std::uint32_t mask =
        prefix_length == 0 ? 0U : ~std::uint32_t{0} << (32 - static_cast<unsigned>(prefix_length));
    return Cidr{.network = *base & mask, .mask = mask, .prefix_length = prefix_length};
}

std::string format_cidr(std::string_view base_address, int prefix_length)
{
    return std::format("{}/{}", base_address, prefix_length);
}

}  // namespace cpaudit::common
