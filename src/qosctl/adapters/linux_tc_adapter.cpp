/**
 * @file linux_tc_adapter.cpp
 * @brief tc command generation and `tc qdisc show` parsing.
 */
#include "qosctl/adapters/linux_tc_adapter.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <sstream>

#include "qosctl/config/constants.hpp"
#include "qosctl/domain/dscp.hpp"

namespace qosctl::adapters {

namespace k = config::constants;
using domain::CongestionAlgorithm;
using domain::QueueConfiguration;
using queueing::AlgorithmType;

namespace {

/// Classid minors available to traffic classes below the default class.
constexpr uint32_t kMaxClasses = k::TC_DEFAULT_CLASS_MINOR - k::TC_FIRST_CLASS_MINOR;

std::string leaf_qdisc(const std::string& dev, uint32_t minor, const QueueConfiguration& q, uint32_t rate) {
    const auto& qp = q.queue;
    const auto& cp = q.congestion;
    const std::string head = fmt::format("tc qdisc add dev {} parent 1:{} handle {}:", dev, minor, minor);

    switch (cp.algorithm) {
        case CongestionAlgorithm::Red:
        case CongestionAlgorithm::Wred: {
            // tc red works in bytes; thresholds are in packets of avpkt bytes.
            const uint64_t avpkt = k::TC_RED_AVPKT;
            const uint64_t burst = (2ULL * cp.min_threshold + cp.max_threshold) / 3 + 1;
            return fmt::format("{} red limit {} min {} max {} avpkt {} burst {} probability {} bandwidth {}kbit",
                               head, qp.queue_limit * avpkt, cp.min_threshold * avpkt, cp.max_threshold * avpkt,
                               avpkt, burst, cp.drop_probability, rate);
        }
        case CongestionAlgorithm::Ecn: {
            std::string line = fmt::format("{} fq_codel limit {} target {}us interval {}us",
                                           head, qp.queue_limit, cp.min_threshold, cp.max_threshold);
            if (qp.quantum > 0) line += fmt::format(" quantum {}", qp.quantum);
            if (qp.flows > 0) line += fmt::format(" flows {}", qp.flows);
            return line + " ecn";
        }
        case CongestionAlgorithm::TailDrop:
            break;
    }
    return fmt::format("{} sfq perturb 10", head);
}

/// u32 match clauses of one classifier, excluding the port (handled per block).
std::string match_clauses(const domain::TrafficClass& tc, const domain::TrafficClassifier* c) {
    std::string m;
    if (c != nullptr) {
        if (c->protocol != domain::Protocol::Any) {
            m += fmt::format(" match ip protocol {} 0xff", domain::protocol_number(c->protocol));
        }
        if (c->source_ip && !c->source_ip->empty() && c->source_ip->find(':') == std::string::npos) {
            m += fmt::format(" match ip src {}", *c->source_ip);
        }
        if (c->destination_ip && !c->destination_ip->empty() && c->destination_ip->find(':') == std::string::npos) {
            m += fmt::format(" match ip dst {}", *c->destination_ip);
        }
        if (c->dscp_marking && domain::dscp_code_point(*c->dscp_marking)) {
            m += fmt::format(" match ip tos {} {:#04x}", domain::dscp_tos_hex(*c->dscp_marking), k::DSCP_TOS_MASK);
            return m;
        }
    }
    if (tc.has_dscp()) m += fmt::format(" match ip tos {} {:#04x}", domain::dscp_tos_hex(tc.dscp), k::DSCP_TOS_MASK);
    return m;
}

void filters(CommandList& out, const std::string& dev, uint32_t prio, uint32_t minor, const domain::TrafficClass& tc) {
    const std::string head = fmt::format("tc filter add dev {} parent 1: protocol ip prio {} u32", dev, prio);
    const std::string tail = fmt::format(" flowid 1:{}", minor);

    if (tc.classifiers.empty()) {
        if (tc.has_dscp()) out.push_back(head + match_clauses(tc, nullptr) + tail);
        return;
    }
    for (const auto& c : tc.classifiers) {
        const std::string clauses = match_clauses(tc, &c);
        if (c.destination_ports && c.destination_ports->start != 0) {
            const auto& p = *c.destination_ports;
            const uint16_t last = p.end == 0 ? p.start : std::max(p.start, p.end);
            for (const auto& [value, mask] : LinuxTcAdapter::port_blocks(p.start, last)) {
                out.push_back(fmt::format("{}{} match ip dport {} {:#06x}{}", head, clauses, value, mask, tail));
            }
        } else if (!clauses.empty()) {
            out.push_back(head + clauses + tail);
        }
    }
}

CommandList root_fq_codel(const std::string& dev, const QueueConfiguration& q) {
    const auto& qp = q.queue;
    std::string line = fmt::format("tc qdisc add dev {} root fq_codel limit {} target {}us interval {}us",
                                   dev, qp.queue_limit, q.congestion.min_threshold, q.congestion.max_threshold);
    if (qp.quantum > 0) line += fmt::format(" quantum {}", qp.quantum);
    if (qp.flows > 0) line += fmt::format(" flows {}", qp.flows);
    line += " ecn";
    return {fmt::format("tc qdisc del dev {} root 2>/dev/null || true", dev), std::move(line)};
}

std::vector<std::string> split_words(std::string_view line) {
    std::vector<std::string> words;
    std::istringstream in{std::string(line)};
    std::string w;
    while (in >> w) words.push_back(std::move(w));
    return words;
}

} // namespace

bool LinuxTcAdapter::supports(AlgorithmType algorithm) const noexcept {
    return queueing::is_supported(algorithm);
}

std::vector<std::pair<uint16_t, uint16_t>> LinuxTcAdapter::port_blocks(uint16_t first, uint16_t last) {
    std::vector<std::pair<uint16_t, uint16_t>> out;
    uint32_t lo = first;
    const uint32_t hi = last;
    while (lo <= hi) {
        uint32_t size = 1;
        // Grow while the block stays aligned on lo and inside the range.
        while (size < 0x10000 && lo % (size * 2) == 0 && lo + size * 2 - 1 <= hi) size *= 2;
        out.emplace_back(static_cast<uint16_t>(lo), static_cast<uint16_t>(0xFFFF & ~(size - 1)));
        lo += size;
    }
    return out;
}

Result<CommandList> LinuxTcAdapter::generate(const GenerateRequest& request) const {
    if (auto ok = check_request(*this, request); !ok) {
        return qosctl_detail::unexpected<QosError>(ok.error());
    }
    if (request.direction != domain::Direction::Egress) {
        return make_error(ErrorKind::UnsupportedDevice, "tc shaping is egress only",
                          {fmt::format("interface {}", request.interface_name)});
    }
    if (request.queues.size() > kMaxClasses) {
        return make_error(ErrorKind::Validation,
                          fmt::format("{} classes exceed the {} HTB classes available", request.queues.size(), kMaxClasses));
    }

    const std::string& dev = request.interface_name;
    if (request.algorithm == AlgorithmType::FqCodel && request.queues.size() == 1) {
        return root_fq_codel(dev, request.queues.front());
    }

    const uint32_t total = request.total_bandwidth > 0 ? request.total_bandwidth : k::TC_DEFAULT_TOTAL_KBPS;

    CommandList out;
    out.push_back(fmt::format("tc qdisc del dev {} root 2>/dev/null || true", dev));
    out.push_back(fmt::format("tc qdisc add dev {} root handle 1: htb default {}", dev, k::TC_DEFAULT_CLASS_MINOR));
    out.push_back(fmt::format("tc class add dev {} parent 1: classid 1:1 htb rate {}kbit", dev, total));

    for (std::size_t i = 0; i < request.queues.size(); ++i) {
        const auto& q = request.queues[i];
        const uint32_t minor = k::TC_FIRST_CLASS_MINOR + static_cast<uint32_t>(i);
        const uint32_t rate = q.queue.service_rate > 0 ? q.queue.service_rate : k::TC_MIN_CLASS_RATE_KBPS;
        const uint64_t ceil = static_cast<uint64_t>(rate) * k::TC_CEIL_FACTOR;
        out.push_back(fmt::format("tc class add dev {} parent 1:1 classid 1:{} htb rate {}kbit ceil {}kbit",
                                  dev, minor, rate, ceil));
        out.push_back(leaf_qdisc(dev, minor, q, rate));
        filters(out, dev, 1 + static_cast<uint32_t>(i) * k::TC_FILTER_PRIO_STEP, minor, q.traffic_class);
    }

    out.push_back(fmt::format("tc class add dev {} parent 1:1 classid 1:{} htb rate {}kbit ceil {}kbit",
                              dev, k::TC_DEFAULT_CLASS_MINOR, k::TC_MIN_CLASS_RATE_KBPS, total));
    out.push_back(fmt::format("tc qdisc add dev {} parent 1:{} handle {}: sfq perturb 10",
                              dev, k::TC_DEFAULT_CLASS_MINOR, k::TC_DEFAULT_CLASS_MINOR));
    return out;
}

CommandList LinuxTcAdapter::generate_removal(const std::string& interface_name,
                                             const std::string&,
                                             domain::Direction direction) const {
    if (direction == domain::Direction::Ingress) {
        return {fmt::format("tc qdisc del dev {} ingress 2>/dev/null || true", interface_name)};
    }
    return {fmt::format("tc qdisc del dev {} root 2>/dev/null || true", interface_name)};
}

AppliedPolicies LinuxTcAdapter::parse_applied_policies(std::string_view show_output) {
    // qdisc htb 1: dev eth0 root refcnt 2 r2q 10 default 0x30
    // qdisc sfq 10: dev eth0 parent 1:10 limit 127p quantum 1514b
    AppliedPolicies out;
    std::istringstream in{std::string(show_output)};
    std::string line;
    while (std::getline(in, line)) {
        const auto w = split_words(line);
        if (w.size() < 5 || w[0] != "qdisc") continue;
        const auto dev = std::find(w.begin(), w.end(), "dev");
        if (dev == w.end() || std::next(dev) == w.end()) continue;

        std::string parent;
        if (std::find(w.begin(), w.end(), "root") != w.end()) {
            parent = "root";
        } else if (const auto p = std::find(w.begin(), w.end(), "parent"); p != w.end() && std::next(p) != w.end()) {
            parent = *std::next(p);
        } else if (std::find(w.begin(), w.end(), "ingress") != w.end()) {
            parent = "ingress";
        }
        out[*std::next(dev)].push_back(AppliedPolicy{w[1], w[2], std::move(parent)});
    }
    return out;
}

} // namespace qosctl::adapters
