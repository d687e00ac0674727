/**
 * @file cisco_adapter.cpp
 * @brief IOS command generation.
 */
#include "qosctl/adapters/cisco_adapter.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

#include "qosctl/config/constants.hpp"
#include "qosctl/domain/dscp.hpp"

namespace qosctl::adapters {

using domain::CongestionAlgorithm;
using domain::Direction;
using domain::QueueConfiguration;
using queueing::AlgorithmType;

namespace {

const char* service_direction(Direction d) noexcept {
    return d == Direction::Egress ? "output" : "input";
}

void push_unique(CommandList& out, std::string line) {
    if (std::find(out.begin(), out.end(), line) == out.end()) out.push_back(std::move(line));
}

CommandList class_map(const domain::TrafficClass& tc) {
    CommandList body;
    for (const auto& c : tc.classifiers) {
        if (c.protocol != domain::Protocol::Any) {
            push_unique(body, fmt::format("match protocol {}", domain::to_string(c.protocol)));
        }
        if (c.dscp_marking && !c.dscp_marking->empty()) {
            push_unique(body, fmt::format("match dscp {}", domain::to_lower(*c.dscp_marking)));
        }
        if (c.destination_ports && c.destination_ports->start != 0) {
            const auto& p = *c.destination_ports;
            if (p.end == 0 || p.end == p.start) {
                push_unique(body, fmt::format("match port {}", p.start));
            } else {
                push_unique(body, fmt::format("match port range {} {}", p.start, p.end));
            }
        }
        if (c.source_ip && !c.source_ip->empty()) {
            push_unique(body, fmt::format("match source-address ip {}", *c.source_ip));
        }
        if (c.destination_ip && !c.destination_ip->empty()) {
            push_unique(body, fmt::format("match destination-address ip {}", *c.destination_ip));
        }
    }
    if (tc.has_dscp()) push_unique(body, fmt::format("match dscp {}", domain::to_lower(tc.dscp)));
    return body;
}

void congestion_lines(CommandList& out, const domain::CongestionParameters& cp) {
    const int scale = CiscoAdapter::probability_scale(cp.drop_probability);
    if (cp.algorithm == CongestionAlgorithm::Red) {
        out.emplace_back("random-detect");
        out.push_back(fmt::format("random-detect precedence 0 {} {} {}", cp.min_threshold, cp.max_threshold, scale));
        return;
    }
    if (cp.algorithm != CongestionAlgorithm::Wred) return;

    out.emplace_back("random-detect dscp-based");
    if (cp.dscp_weights.empty()) {
        out.push_back(fmt::format("random-detect dscp-based {} {} 10", cp.min_threshold, cp.max_threshold));
        return;
    }
    for (const auto& [dscp, weight] : cp.dscp_weights) {
        uint32_t min_th = cp.min_threshold;
        uint32_t max_th = cp.max_threshold;
        // Preferred DSCPs tolerate a deeper queue before early drop.
        if (weight > 0.5) {
            min_th = static_cast<uint32_t>(min_th * (1.0 + weight));
            max_th = static_cast<uint32_t>(max_th * (1.0 + weight));
        }
        out.push_back(fmt::format("random-detect dscp {} {} {} {}", domain::to_lower(dscp), min_th, max_th, scale));
    }
}

void strict_priority_lines(CommandList& out, const QueueConfiguration& q) {
    const auto& qp = q.queue;
    out.push_back(fmt::format("priority {}", qp.service_rate));
    const uint64_t rate_bps = static_cast<uint64_t>(qp.service_rate) * 1000;
    if (q.traffic_class.burst > 0) {
        const uint64_t burst_bytes = static_cast<uint64_t>(q.traffic_class.burst) * 1000;
        out.push_back(fmt::format("police {} {} conform-action transmit exceed-action drop", rate_bps, burst_bytes));
    } else {
        out.push_back(fmt::format("police {} conform-action transmit exceed-action drop", rate_bps));
    }
}

void bandwidth_lines(CommandList& out, const QueueConfiguration& q) {
    const auto& qp = q.queue;
    const long percent = std::lround(qp.bandwidth_percent);
    if (percent > 0) {
        out.push_back(fmt::format("bandwidth percent {}", percent));
    } else {
        out.push_back(fmt::format("bandwidth {}", qp.service_rate));
    }
    if (qp.weight > 1.0) {
        out.push_back(fmt::format("fair-queue {} weight {}", qp.queue_limit, std::lround(qp.weight)));
    } else {
        out.push_back(fmt::format("fair-queue {}", qp.queue_limit));
    }
    out.push_back(fmt::format("queue-limit {}", qp.queue_limit));
    congestion_lines(out, q.congestion);
}

} // namespace

bool CiscoAdapter::supports(AlgorithmType algorithm) const noexcept {
    return algorithm == AlgorithmType::Cbwfq || algorithm == AlgorithmType::Llq;
}

int CiscoAdapter::probability_scale(double drop_probability) noexcept {
    const int scaled = static_cast<int>(std::floor(drop_probability * 10.0 + 1e-9));
    return std::clamp(scaled, 1, 10);
}

Result<CommandList> CiscoAdapter::generate(const GenerateRequest& request) const {
    if (auto ok = check_request(*this, request); !ok) {
        return qosctl_detail::unexpected<QosError>(ok.error());
    }

    CommandList out;
    out.emplace_back("configure terminal");
    out.emplace_back("class-map match-any default-class");
    out.emplace_back("match any");

    for (const auto& q : request.queues) {
        const auto& tc = q.traffic_class;
        const std::string name = sanitize_name(tc.name, '_');
        out.push_back(fmt::format("class-map {} {}", tc.classifiers.size() > 1 ? "match-any" : "match-all", name));
        for (auto& line : class_map(tc)) out.push_back(std::move(line));
    }

    const std::string policy = sanitize_name(request.policy_name, '_');
    out.push_back(fmt::format("policy-map {}", policy));
    const bool llq = request.algorithm == AlgorithmType::Llq;
    for (const auto& q : request.queues) {
        out.push_back(fmt::format("class {}", sanitize_name(q.traffic_class.name, '_')));
        if (llq && q.queue.priority_level >= config::constants::PRIORITY_CLASS_THRESHOLD) {
            strict_priority_lines(out, q);
        } else {
            bandwidth_lines(out, q);
        }
    }
    out.emplace_back("class class-default");
    out.emplace_back("fair-queue");

    out.push_back(fmt::format("interface {}", request.interface_name));
    out.push_back(fmt::format("service-policy {} {}", service_direction(request.direction), policy));
    out.emplace_back("exit");
    out.emplace_back("end");
    return out;
}

CommandList CiscoAdapter::generate_removal(const std::string& interface_name,
                                           const std::string& policy_name,
                                           Direction direction) const {
    const std::string policy = sanitize_name(policy_name, '_');
    return {
        "configure terminal",
        fmt::format("interface {}", interface_name),
        fmt::format("no service-policy {} {}", service_direction(direction), policy),
        "exit",
        fmt::format("no policy-map {}", policy),
        "end",
    };
}

CommandList CiscoAdapter::generate_red_policy(const std::string& interface_name,
                                              const std::string& policy_name,
                                              uint32_t min_threshold,
                                              uint32_t max_threshold,
                                              double drop_probability) {
    const std::string policy = sanitize_name(policy_name, '_');
    return {
        "configure terminal",
        fmt::format("policy-map {}", policy),
        "class class-default",
        "random-detect",
        fmt::format("random-detect precedence 0 {} {} {}", min_threshold, max_threshold,
                    probability_scale(drop_probability)),
        "exit",
        "exit",
        fmt::format("interface {}", interface_name),
        fmt::format("service-policy output {}", policy),
        "end",
    };
}

} // namespace qosctl::adapters
