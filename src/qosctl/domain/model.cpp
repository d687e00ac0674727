/**
 * @file model.cpp
 * @brief Enum names, error labels and structural policy validation.
 */
#include "qosctl/domain/model.hpp"

#include <fmt/format.h>

#include <unordered_set>

#include "qosctl/config/constants.hpp"
#include "qosctl/domain/dscp.hpp"

namespace qosctl {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Validation:             return "validation_error";
        case ErrorKind::LowLatencyValidation:   return "low_latency_validation_error";
        case ErrorKind::PolicyNotFound:         return "policy_not_found";
        case ErrorKind::DeviceNotFound:         return "device_not_found";
        case ErrorKind::InterfaceNotFound:      return "interface_not_found";
        case ErrorKind::UnsupportedDevice:      return "unsupported_device";
        case ErrorKind::UnsupportedAlgorithm:   return "unsupported_algorithm";
        case ErrorKind::ConfigurationExecution: return "configuration_execution_error";
        case ErrorKind::AlreadyApplied:         return "already_applied";
        case ErrorKind::Cancelled:              return "cancelled";
        case ErrorKind::Parse:                  return "parse_error";
    }
    return "unknown_error";
}

} // namespace qosctl

namespace qosctl::domain {

std::string_view to_string(Protocol p) noexcept {
    switch (p) {
        case Protocol::Any:  return "any";
        case Protocol::Tcp:  return "tcp";
        case Protocol::Udp:  return "udp";
        case Protocol::Icmp: return "icmp";
        case Protocol::Igmp: return "igmp";
    }
    return "any";
}

std::optional<Protocol> parse_protocol(std::string_view name) noexcept {
    const std::string lower = to_lower(name);
    if (lower.empty() || lower == "any") return Protocol::Any;
    if (lower == "tcp")  return Protocol::Tcp;
    if (lower == "udp")  return Protocol::Udp;
    if (lower == "icmp") return Protocol::Icmp;
    if (lower == "igmp") return Protocol::Igmp;
    return std::nullopt;
}

uint8_t protocol_number(Protocol p) noexcept {
    switch (p) {
        case Protocol::Tcp:  return 6;
        case Protocol::Udp:  return 17;
        case Protocol::Icmp: return 1;
        case Protocol::Igmp: return 2;
        case Protocol::Any:  break;
    }
    return 0;
}

std::string_view to_string(Direction d) noexcept {
    return d == Direction::Ingress ? "ingress" : "egress";
}

std::optional<Direction> parse_direction(std::string_view name) noexcept {
    const std::string lower = to_lower(name);
    if (lower == "ingress" || lower == "input")  return Direction::Ingress;
    if (lower == "egress"  || lower == "output") return Direction::Egress;
    return std::nullopt;
}

std::string_view to_string(CongestionAlgorithm a) noexcept {
    switch (a) {
        case CongestionAlgorithm::TailDrop: return "tail_drop";
        case CongestionAlgorithm::Red:      return "red";
        case CongestionAlgorithm::Wred:     return "wred";
        case CongestionAlgorithm::Ecn:      return "ecn";
    }
    return "tail_drop";
}

uint64_t total_min_bandwidth(const std::vector<TrafficClass>& classes) noexcept {
    uint64_t sum = 0;
    for (const auto& tc : classes) sum += tc.min_bandwidth;
    return sum;
}

Result<void> validate_policy(const QoSPolicy& policy) {
    using config::constants::MAX_CLASS_PRIORITY;

    std::vector<std::string> problems;
    if (policy.bandwidth_limit == 0) {
        problems.emplace_back("bandwidth_limit must be greater than 0");
    }

    std::unordered_set<std::string> seen;
    for (const auto& tc : policy.traffic_classes) {
        if (!tc.name.empty() && !seen.insert(tc.name).second) {
            problems.push_back(fmt::format("duplicate traffic class '{}'", tc.name));
        }
        if (tc.priority > MAX_CLASS_PRIORITY) {
            problems.push_back(fmt::format("class '{}': priority {} outside 0..{}",
                                           tc.name, tc.priority, MAX_CLASS_PRIORITY));
        }
        if (tc.max_bandwidth > 0 && tc.min_bandwidth > tc.max_bandwidth) {
            problems.push_back(fmt::format("class '{}': min_bandwidth {} exceeds max_bandwidth {}",
                                           tc.name, tc.min_bandwidth, tc.max_bandwidth));
        }
        if (tc.has_dscp() && !dscp_code_point(tc.dscp)) {
            problems.push_back(fmt::format("class '{}': unknown DSCP '{}'", tc.name, tc.dscp));
        }
    }

    if (!problems.empty()) {
        return make_error(ErrorKind::Validation,
                          fmt::format("policy '{}' is malformed", policy.name),
                          std::move(problems));
    }
    return {};
}

} // namespace qosctl::domain
