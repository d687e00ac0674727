#pragma once
/**
 * @file dscp.hpp
 * @brief DSCP name <-> code point helpers shared by adapters and the SDN service.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "qosctl/config/constants.hpp"

namespace qosctl::domain {

/**
 * @brief Resolve a DSCP name to its 6-bit code point.
 * @param name Case-insensitive "EF", "AFxy", "CSn", "BE" or "default".
 * @return Code point (0..63); nullopt for unknown names.
 */
std::optional<uint8_t> dscp_code_point(std::string_view name) noexcept;

/// IPv4 TOS byte for a code point (dscp << 2, ECN bits clear).
constexpr uint8_t dscp_to_tos(uint8_t code_point) noexcept {
    return static_cast<uint8_t>((code_point << config::constants::DSCP_TOS_SHIFT) &
                                config::constants::DSCP_TOS_MASK);
}

/// TOS byte rendered the way tc expects it ("0xb8"); "0x00" for unknown names.
std::string dscp_tos_hex(std::string_view name);

/// Lower-case copy, used for vendor syntax ("EF" -> "ef").
std::string to_lower(std::string_view s);

} // namespace qosctl::domain
