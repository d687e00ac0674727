#pragma once
/**
 * @file match_strategy.hpp
 * @brief Composable packet-match predicates (protocol, IP, port, DSCP, VLAN).
 * @details Each strategy is a value type that carries its own criterion, so a
 *          strategy built once can be reused from any thread. An absent, "any"
 *          or zero criterion is a wildcard. CompositeMatchStrategy ANDs its
 *          members; an empty composite matches every packet.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "qosctl/domain/model.hpp"

namespace qosctl::classify {

/**
 * @struct PacketInfo
 * @brief Header fields a strategy can inspect.
 */
struct PacketInfo {
    domain::Protocol           protocol{domain::Protocol::Any};
    std::string                source_ip;
    std::string                destination_ip;
    uint16_t                   source_port{0};
    uint16_t                   destination_port{0};
    std::optional<std::string> dscp;   ///< DSCP name when known
    std::optional<uint16_t>    vlan;   ///< 802.1Q id when tagged
};

/**
 * @brief True if @p address equals @p criterion, or lies inside it when the
 *        criterion is a CIDR block ("10.0.0.0/8", "2001:db8::/32").
 * @details Malformed addresses or prefixes never match.
 */
bool ip_matches(std::string_view address, std::string_view criterion) noexcept;

// ---- Leaf strategies ----------------------------------------------------------

struct ProtocolMatch {
    domain::Protocol protocol{domain::Protocol::Any};
    bool matches(const PacketInfo& p) const noexcept;
};

struct SourceIpMatch {
    std::optional<std::string> address;  ///< nullopt = wildcard
    bool matches(const PacketInfo& p) const noexcept;
};

struct DestinationIpMatch {
    std::optional<std::string> address;  ///< nullopt = wildcard
    bool matches(const PacketInfo& p) const noexcept;
};

struct SourcePortMatch {
    uint16_t port{0};                    ///< 0 = wildcard
    bool matches(const PacketInfo& p) const noexcept;
};

struct DestinationPortMatch {
    uint16_t port{0};                    ///< 0 = wildcard
    bool matches(const PacketInfo& p) const noexcept;
};

struct SourcePortRangeMatch {
    domain::PortRange range;             ///< (0,0) = wildcard
    bool matches(const PacketInfo& p) const noexcept;
};

struct DestinationPortRangeMatch {
    domain::PortRange range;             ///< (0,0) = wildcard
    bool matches(const PacketInfo& p) const noexcept;
};

struct DscpMatch {
    std::optional<std::string> dscp;     ///< nullopt = wildcard; compared case-insensitively
    bool matches(const PacketInfo& p) const noexcept;
};

struct VlanMatch {
    std::optional<uint16_t> vlan;        ///< nullopt or 0 = wildcard (0 is a priority tag, not a VLAN)
    bool matches(const PacketInfo& p) const noexcept;
};

/// Any leaf strategy.
using MatchStrategy = std::variant<ProtocolMatch,
                                   SourceIpMatch,
                                   DestinationIpMatch,
                                   SourcePortMatch,
                                   DestinationPortMatch,
                                   SourcePortRangeMatch,
                                   DestinationPortRangeMatch,
                                   DscpMatch,
                                   VlanMatch>;

/// Evaluate a single strategy.
bool matches(const MatchStrategy& strategy, const PacketInfo& packet) noexcept;

/**
 * @class CompositeMatchStrategy
 * @brief AND of an arbitrary list of strategies.
 */
class CompositeMatchStrategy {
public:
    CompositeMatchStrategy() = default;
    explicit CompositeMatchStrategy(std::vector<MatchStrategy> strategies)
        : strategies_(std::move(strategies)) {}

    /// Append a strategy; returns *this for chaining.
    CompositeMatchStrategy& add(MatchStrategy s);

    /// True when every member matches (vacuously true when empty).
    bool matches(const PacketInfo& packet) const noexcept;

    std::size_t size() const noexcept { return strategies_.size(); }
    bool empty() const noexcept { return strategies_.empty(); }
    const std::vector<MatchStrategy>& strategies() const noexcept { return strategies_; }

    /**
     * @brief Build the composite for a classifier.
     * @details A start and end port become a range match, a lone start port an
     *          exact match; unset or wildcard fields are skipped.
     */
    static CompositeMatchStrategy from_classifier(const domain::TrafficClassifier& c);

private:
    std::vector<MatchStrategy> strategies_;
};

/**
 * @class ClassMatcher
 * @brief Precompiled matcher for a traffic class (OR across its classifiers).
 */
class ClassMatcher {
public:
    explicit ClassMatcher(const domain::TrafficClass& tc);

    const std::string& class_name() const noexcept { return name_; }
    bool matches(const PacketInfo& packet) const noexcept;

private:
    std::string                         name_;
    std::vector<CompositeMatchStrategy> alternatives_;
};

/**
 * @brief First class of @p classes whose matcher accepts @p packet.
 * @return Class name, or nullopt when nothing matches.
 */
std::optional<std::string> classify_packet(const std::vector<ClassMatcher>& classes,
                                           const PacketInfo& packet);

} // namespace qosctl::classify
