#pragma once
/**
 * @file model.hpp
 * @brief QoS domain model: classifiers, classes, policies and queue outputs.
 * @details Plain value types with no dependencies. Bandwidth is in kbps, burst in
 *          kb, buffers and queue limits in packets (FQ-CoDel thresholds carry
 *          microseconds, see CongestionParameters).
 */

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "qosctl/domain/errors.hpp"

namespace qosctl::domain {

/**
 * @enum Protocol
 * @brief L4 protocol selector; Any is the wildcard.
 */
enum class Protocol : uint8_t {
    Any = 0,
    Tcp,
    Udp,
    Icmp,
    Igmp
};

/// Lower-case protocol name ("any", "tcp", ...).
std::string_view to_string(Protocol p) noexcept;
/// Case-insensitive parse; nullopt for unknown names.
std::optional<Protocol> parse_protocol(std::string_view name) noexcept;
/// IANA protocol number (0 for Any).
uint8_t protocol_number(Protocol p) noexcept;

/** @enum Direction
 *  @brief Interface direction a policy is bound to.
 */
enum class Direction : uint8_t { Ingress, Egress };

std::string_view to_string(Direction d) noexcept;
std::optional<Direction> parse_direction(std::string_view name) noexcept;

/**
 * @struct PortRange
 * @brief Inclusive L4 port range. (0,0) is the wildcard.
 */
struct PortRange {
    uint16_t start{0}; ///< First port
    uint16_t end{0};   ///< Last port (inclusive)

    bool is_wildcard() const noexcept { return start == 0 && end == 0; }
    bool is_single() const noexcept { return start != 0 && start == end; }
    bool contains(uint16_t port) const noexcept { return is_wildcard() || (start <= port && port <= end); }

    bool operator==(const PortRange&) const = default;
};

/**
 * @struct TrafficClassifier
 * @brief Packet-match criteria; every absent field is a wildcard.
 */
struct TrafficClassifier {
    std::string                name;                      ///< Optional label
    Protocol                   protocol{Protocol::Any};   ///< L4 protocol
    std::optional<std::string> source_ip;                 ///< Exact address or CIDR
    std::optional<std::string> destination_ip;            ///< Exact address or CIDR
    std::optional<PortRange>   source_ports;              ///< Single port when start == end
    std::optional<PortRange>   destination_ports;         ///< Single port when start == end
    std::optional<std::string> dscp_marking;              ///< DSCP name (e.g. "EF")
    std::optional<uint16_t>    vlan;                      ///< 802.1Q VLAN id

    bool operator==(const TrafficClassifier&) const = default;
};

/**
 * @struct TrafficClass
 * @brief One class of a policy with its guarantees and classifiers.
 */
struct TrafficClass {
    std::string                    name;               ///< Unique within the policy
    uint8_t                        priority{0};        ///< 0..7
    uint32_t                       min_bandwidth{0};   ///< Guaranteed kbps
    uint32_t                       max_bandwidth{0};   ///< Ceiling kbps (0 = unlimited)
    std::string                    dscp{"default"};    ///< DSCP name or "default"
    uint32_t                       burst{0};           ///< Burst in kb
    std::vector<TrafficClassifier> classifiers;        ///< OR-ed match criteria

    bool has_dscp() const noexcept { return !dscp.empty() && dscp != "default"; }

    bool operator==(const TrafficClass&) const = default;
};

/**
 * @struct QoSPolicy
 * @brief Declarative policy: bandwidth budget and ordered traffic classes.
 */
struct QoSPolicy {
    int64_t                   id{0};               ///< Repository id
    std::string               name;                ///< Policy name (used in device configs)
    std::string               description;         ///< Free text
    uint32_t                  bandwidth_limit{0};  ///< Total kbps, must be > 0
    int32_t                   priority{0};         ///< Policy-level priority
    bool                      is_active{true};     ///< Soft-disable flag
    std::vector<TrafficClass> traffic_classes;     ///< Ordered classes

    bool operator==(const QoSPolicy&) const = default;
};

/**
 * @struct QueueParameters
 * @brief Scheduler parameters computed for one class.
 */
struct QueueParameters {
    uint32_t buffer_size{0};        ///< Packets
    uint32_t queue_limit{0};        ///< Packets
    uint32_t service_rate{0};       ///< kbps
    double   weight{1.0};           ///< Relative weight (CBWFQ 1..100, FQ-CoDel quantum, DRR weight)
    uint8_t  priority_level{0};     ///< Class priority carried to the device
    double   bandwidth_percent{0};  ///< Guaranteed share of the policy limit
    uint32_t quantum{0};            ///< Bytes per round (FQ-CoDel / DRR), 0 otherwise
    uint32_t flows{0};              ///< FQ-CoDel sub-queues, 0 otherwise

    bool operator==(const QueueParameters&) const = default;
};

/** @enum CongestionAlgorithm
 *  @brief Congestion-avoidance kind attached to a queue.
 */
enum class CongestionAlgorithm : uint8_t { TailDrop, Red, Wred, Ecn };

std::string_view to_string(CongestionAlgorithm a) noexcept;

/**
 * @struct CongestionParameters
 * @brief Drop/mark behaviour of a queue.
 * @details For ECN (FQ-CoDel) the thresholds are the CoDel target and interval in us.
 */
struct CongestionParameters {
    CongestionAlgorithm           algorithm{CongestionAlgorithm::TailDrop};
    uint32_t                      min_threshold{0};
    uint32_t                      max_threshold{0};
    double                        drop_probability{0.0};  ///< Max probability at max_threshold
    std::map<std::string, double> dscp_weights;           ///< WRED weight per DSCP in [0,1]

    bool operator==(const CongestionParameters&) const = default;
};

/**
 * @struct QueueConfiguration
 * @brief A class paired with its computed queue and congestion parameters.
 */
struct QueueConfiguration {
    TrafficClass         traffic_class;
    QueueParameters      queue;
    CongestionParameters congestion;
};

/**
 * @struct InterfaceQoSPolicy
 * @brief Association between a policy and an interface direction.
 */
struct InterfaceQoSPolicy {
    int64_t     id{0};
    int64_t     device_id{0};
    int64_t     interface_id{0};
    std::string interface_name;
    int64_t     policy_id{0};
    Direction   direction{Direction::Egress};
    bool        active{true};
    std::string controller_policy_id;  ///< SDN policy id for OpenFlow bindings

    bool operator==(const InterfaceQoSPolicy&) const = default;
};

/// Sum of min_bandwidth over a set of classes (64-bit to avoid overflow).
uint64_t total_min_bandwidth(const std::vector<TrafficClass>& classes) noexcept;

/**
 * @brief Structural validation of a policy.
 * @return Validation error listing every offending field; success otherwise.
 */
Result<void> validate_policy(const QoSPolicy& policy);

} // namespace qosctl::domain
