/**
 * @file dscp.cpp
 * @brief DSCP lookup table (RFC 2474 class selectors, RFC 2597 AF, RFC 3246 EF).
 */
#include "qosctl/domain/dscp.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include <fmt/format.h>

#include "qosctl/config/constants.hpp"

namespace qosctl::domain {

namespace {

namespace k = config::constants;

struct DscpName {
    std::string_view name;
    uint8_t          code;
};

/// Class Selector n.
constexpr uint8_t cs(unsigned n) noexcept {
    return static_cast<uint8_t>(n << k::DSCP_CLASS_SHIFT);
}

/// Assured Forwarding class @p cls, drop precedence @p drop (RFC 2597).
constexpr uint8_t af(unsigned cls, unsigned drop) noexcept {
    return static_cast<uint8_t>(cs(cls) | (drop << k::DSCP_DROP_SHIFT));
}

static_assert(cs(1) == k::DSCP_CS1 && cs(5) == k::DSCP_CS5);
static_assert(af(3, 1) == k::DSCP_AF31 && af(4, 1) == k::DSCP_AF41);

constexpr std::array<DscpName, 23> kDscpTable{{
    {"default", k::DSCP_BE}, {"be", k::DSCP_BE},
    {"cs0", cs(0)}, {"cs1", cs(1)}, {"cs2", cs(2)}, {"cs3", cs(3)},
    {"cs4", cs(4)}, {"cs5", cs(5)}, {"cs6", cs(6)}, {"cs7", cs(7)},
    {"af11", af(1, 1)}, {"af12", af(1, 2)}, {"af13", af(1, 3)},
    {"af21", af(2, 1)}, {"af22", af(2, 2)}, {"af23", af(2, 3)},
    {"af31", af(3, 1)}, {"af32", af(3, 2)}, {"af33", af(3, 3)},
    {"af41", af(4, 1)}, {"af42", af(4, 2)}, {"af43", af(4, 3)},
    {"ef", k::DSCP_EF},
}};

} // namespace

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<uint8_t> dscp_code_point(std::string_view name) noexcept {
    // Names are at most 7 chars; compare case-insensitively without allocating.
    for (const auto& entry : kDscpTable) {
        if (entry.name.size() != name.size()) continue;
        bool equal = true;
        for (std::size_t i = 0; i < name.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(name[i])) != entry.name[i]) {
                equal = false;
                break;
            }
        }
        if (equal) return entry.code;
    }
    return std::nullopt;
}

std::string dscp_tos_hex(std::string_view name) {
    const auto code = dscp_code_point(name);
    return fmt::format("{:#04x}", static_cast<unsigned>(code ? dscp_to_tos(*code) : uint8_t{0}));
}

} // namespace qosctl::domain
