#pragma once

/**
 * @file ipv4.hpp
 * @brief IPv4 address and CIDR range helpers
 */

#include "cpaudit/common.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cpaudit::common {

/**
 * IPv4 network range in host byte order.
 * `network` is already masked.
 */
struct Cidr
{
    std::uint32_t network = 0;
    std::uint32_t mask = 0;
    int prefix_length = 0;
};

/**
 * Parse a dotted-quad IPv4 address
 * @return Address in host byte order, or nullopt for empty or non-IPv4 text
 */
[[nodiscard]] std::optional<std::uint32_t> parse_ipv4(std::string_view text);

/**
 * Build a CIDR range from a base address and a prefix length.
 * Host bits in the base address are allowed and cleared.
 * @return InvalidSubnet when the address is not IPv4 or the prefix is outside [0, 32]
 */
[[nodiscard]] cpaudit::Result<Cidr> parse_cidr(std::string_view base_address, int prefix_length);

[[nodiscard]] inline bool cidr_contains(const Cidr& range, std::uint32_t address)
{
    return (address & range.mask) == range.network;
}

/// "10.0.0.0/24" form of a base address and prefix length
[[nodiscard]] std::string format_cidr(std::string_view base_address, int prefix_length);

}  // namespace cpaudit::common
