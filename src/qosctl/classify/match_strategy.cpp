/**
 * @file match_strategy.cpp
 * @brief Leaf strategies, CIDR containment and composite evaluation.
 */
#include "qosctl/classify/match_strategy.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstring>

#include "qosctl/domain/dscp.hpp"

namespace qosctl::classify {

// -----------------------------------------------------------------------------
// Address helpers
// -----------------------------------------------------------------------------
namespace {

/// Parsed IPv4/IPv6 address in network byte order.
struct RawAddress {
    int                      family{0};   ///< AF_INET / AF_INET6
    std::array<uint8_t, 16>  bytes{};
    std::size_t              length{0};   ///< 4 or 16
};

std::optional<RawAddress> parse_address(std::string_view text) noexcept {
    // inet_pton needs a NUL-terminated buffer; INET6_ADDRSTRLEN bounds any valid input.
    char buf[INET6_ADDRSTRLEN + 1]{};
    if (text.empty() || text.size() > INET6_ADDRSTRLEN) return std::nullopt;
    std::memcpy(buf, text.data(), text.size());

    RawAddress out;
    if (::inet_pton(AF_INET, buf, out.bytes.data()) == 1) {
        out.family = AF_INET;
        out.length = 4;
        return out;
    }
    if (::inet_pton(AF_INET6, buf, out.bytes.data()) == 1) {
        out.family = AF_INET6;
        out.length = 16;
        return out;
    }
    return std::nullopt;
}

bool prefix_equal(const RawAddress& a, const RawAddress& net, unsigned prefix_len) noexcept {
    const unsigned full_bytes = prefix_len / 8;
    const unsigned rem_bits   = prefix_len % 8;
    if (std::memcmp(a.bytes.data(), net.bytes.data(), full_bytes) != 0) return false;
    if (rem_bits == 0) return true;
    const auto mask = static_cast<uint8_t>(0xFF << (8 - rem_bits));
    return (a.bytes[full_bytes] & mask) == (net.bytes[full_bytes] & mask);
}

} // namespace

bool ip_matches(std::string_view address, std::string_view criterion) noexcept {
    const auto slash = criterion.find('/');
    if (slash == std::string_view::npos) {
        const auto a = parse_address(address);
        const auto b = parse_address(criterion);
        if (!a || !b) return false;
        return a->family == b->family &&
               std::memcmp(a->bytes.data(), b->bytes.data(), a->length) == 0;
    }

    const auto addr = parse_address(address);
    const auto net  = parse_address(criterion.substr(0, slash));
    if (!addr || !net || addr->family != net->family) return false;

    const auto len_text = criterion.substr(slash + 1);
    unsigned prefix_len = 0;
    const auto [ptr, ec] = std::from_chars(len_text.data(), len_text.data() + len_text.size(), prefix_len);
    if (ec != std::errc{} || ptr != len_text.data() + len_text.size()) return false;
    if (prefix_len > addr->length * 8) return false;

    return prefix_equal(*addr, *net, prefix_len);
}

// -----------------------------------------------------------------------------
// Leaf strategies
// -----------------------------------------------------------------------------
bool ProtocolMatch::matches(const PacketInfo& p) const noexcept {
    return protocol == domain::Protocol::Any || p.protocol == protocol;
}

bool SourceIpMatch::matches(const PacketInfo& p) const noexcept {
    return !address || ip_matches(p.source_ip, *address);
}

bool DestinationIpMatch::matches(const PacketInfo& p) const noexcept {
    return !address || ip_matches(p.destination_ip, *address);
}

bool SourcePortMatch::matches(const PacketInfo& p) const noexcept {
    return port == 0 || p.source_port == port;
}

bool DestinationPortMatch::matches(const PacketInfo& p) const noexcept {
    return port == 0 || p.destination_port == port;
}

bool SourcePortRangeMatch::matches(const PacketInfo& p) const noexcept {
    return range.contains(p.source_port);
}

bool DestinationPortRangeMatch::matches(const PacketInfo& p) const noexcept {
    return range.contains(p.destination_port);
}

bool DscpMatch::matches(const PacketInfo& p) const noexcept {
    if (!dscp) return true;
    if (!p.dscp) return false;
    const auto want = domain::dscp_code_point(*dscp);
    const auto have = domain::dscp_code_point(*p.dscp);
    if (want && have) return *want == *have;
    return domain::to_lower(*dscp) == domain::to_lower(*p.dscp);
}

bool VlanMatch::matches(const PacketInfo& p) const noexcept {
    if (!vlan || *vlan == 0) return true;
    return p.vlan && *p.vlan == *vlan;
}

bool matches(const MatchStrategy& strategy, const PacketInfo& packet) noexcept {
    return std::visit([&packet](const auto& s) { return s.matches(packet); }, strategy);
}

// -----------------------------------------------------------------------------
// Composite
// -----------------------------------------------------------------------------
CompositeMatchStrategy& CompositeMatchStrategy::add(MatchStrategy s) {
    strategies_.push_back(std::move(s));
    return *this;
}

bool CompositeMatchStrategy::matches(const PacketInfo& packet) const noexcept {
    return std::all_of(strategies_.begin(), strategies_.end(),
                       [&packet](const MatchStrategy& s) { return classify::matches(s, packet); });
}

namespace {

template <class RangeT, class PortT>
void add_port_criterion(CompositeMatchStrategy& out, const std::optional<domain::PortRange>& ports) {
    if (!ports || ports->start == 0) return;
    if (ports->end != 0 && ports->end != ports->start) {
        out.add(RangeT{*ports});
    } else {
        out.add(PortT{ports->start});
    }
}

} // namespace

CompositeMatchStrategy CompositeMatchStrategy::from_classifier(const domain::TrafficClassifier& c) {
    CompositeMatchStrategy out;
    if (c.protocol != domain::Protocol::Any) out.add(ProtocolMatch{c.protocol});
    if (c.source_ip && !c.source_ip->empty()) out.add(SourceIpMatch{c.source_ip});
    if (c.destination_ip && !c.destination_ip->empty()) out.add(DestinationIpMatch{c.destination_ip});
    add_port_criterion<SourcePortRangeMatch, SourcePortMatch>(out, c.source_ports);
    add_port_criterion<DestinationPortRangeMatch, DestinationPortMatch>(out, c.destination_ports);
    if (c.dscp_marking && !c.dscp_marking->empty()) out.add(DscpMatch{c.dscp_marking});
    if (c.vlan && *c.vlan != 0) out.add(VlanMatch{c.vlan});
    return out;
}

// -----------------------------------------------------------------------------
// Class matcher
// -----------------------------------------------------------------------------
ClassMatcher::ClassMatcher(const domain::TrafficClass& tc) : name_(tc.name) {
    alternatives_.reserve(tc.classifiers.size());
    for (const auto& c : tc.classifiers) {
        alternatives_.push_back(CompositeMatchStrategy::from_classifier(c));
    }
}

bool ClassMatcher::matches(const PacketInfo& packet) const noexcept {
    return std::any_of(alternatives_.begin(), alternatives_.end(),
                       [&packet](const CompositeMatchStrategy& c) { return c.matches(packet); });
}

std::optional<std::string> classify_packet(const std::vector<ClassMatcher>& classes,
                                           const PacketInfo& packet) {
    for (const auto& m : classes) {
        if (m.matches(packet)) return m.class_name();
    }
    return std::nullopt;
}

} // namespace qosctl::classify
