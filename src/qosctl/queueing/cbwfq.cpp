/**
 * @file cbwfq.cpp
 * @brief CBWFQ weights, buffers, queue limits and WRED thresholds.
 */
#include "qosctl/queueing/cbwfq.hpp"

#include <algorithm>
#include <cmath>

#include "qosctl/config/constants.hpp"

namespace qosctl::queueing {

namespace cst = qosctl::config::constants;
using domain::CongestionAlgorithm;
using domain::CongestionParameters;
using domain::QueueConfiguration;
using domain::QueueParameters;
using domain::TrafficClass;

double CbwfqAlgorithm::weight(const TrafficClass& tc, const std::vector<TrafficClass>& all) noexcept {
    uint8_t  max_priority = 0;
    uint32_t max_min_bw   = 0;
    for (const auto& c : all) {
        max_priority = std::max(max_priority, c.priority);
        max_min_bw   = std::max(max_min_bw, c.min_bandwidth);
    }
    const double priority_factor = max_priority > 0
        ? static_cast<double>(tc.priority) / max_priority : 1.0;
    const double bw_factor = max_min_bw > 0
        ? static_cast<double>(tc.min_bandwidth) / max_min_bw : 1.0;

    const double w = (priority_factor * cst::CBWFQ_PRIORITY_SHARE +
                      bw_factor * cst::CBWFQ_BANDWIDTH_SHARE) * 100.0;
    return std::clamp(w, cst::CBWFQ_WEIGHT_MIN, cst::CBWFQ_WEIGHT_MAX);
}

uint32_t CbwfqAlgorithm::buffer_size(uint32_t bandwidth_kbps, uint32_t burst_kb) noexcept {
    if (burst_kb > 0) {
        return static_cast<uint32_t>(std::ceil(burst_kb / cst::AVG_PACKET_KB));
    }
    const auto packets = static_cast<uint32_t>(
        std::ceil(bandwidth_kbps * cst::CBWFQ_BUFFER_SECONDS / cst::PACKET_KBITS));
    return std::max(cst::CBWFQ_MIN_BUFFER, packets);
}

uint32_t CbwfqAlgorithm::queue_limit(uint32_t bandwidth_kbps) noexcept {
    return std::clamp(bandwidth_kbps / cst::CBWFQ_QUEUE_DIVISOR,
                      cst::CBWFQ_MIN_QUEUE_LIMIT, cst::CBWFQ_MAX_QUEUE_LIMIT);
}

Result<std::vector<QueueConfiguration>> CbwfqAlgorithm::calculate(const domain::QoSPolicy& policy) const {
    if (auto ok = check_guaranteed_bandwidth(policy); !ok) {
        return qosctl_detail::unexpected<QosError>(ok.error());
    }
    return calculate_unchecked(policy);
}

std::vector<QueueConfiguration> CbwfqAlgorithm::calculate_unchecked(const domain::QoSPolicy& policy) const {
    std::vector<TrafficClass> ordered = policy.traffic_classes;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const TrafficClass& a, const TrafficClass& b) { return a.priority > b.priority; });

    std::vector<QueueConfiguration> out;
    out.reserve(ordered.size());
    for (const auto& tc : ordered) {
        const uint32_t min_bw = tc.min_bandwidth;

        QueueParameters q;
        q.buffer_size       = buffer_size(min_bw, tc.burst);
        q.queue_limit       = queue_limit(min_bw);
        q.service_rate      = min_bw;
        q.weight            = weight(tc, policy.traffic_classes);
        q.priority_level    = tc.priority;
        q.bandwidth_percent = policy.bandwidth_limit > 0
            ? static_cast<double>(min_bw) / policy.bandwidth_limit * 100.0 : 0.0;

        CongestionParameters c;
        if (tc.has_dscp()) {
            c.algorithm        = CongestionAlgorithm::Wred;
            c.min_threshold    = q.queue_limit / 4;
            c.max_threshold    = q.queue_limit * 3 / 4;
            c.drop_probability = cst::WRED_DEFAULT_DROP_PROB;
            c.dscp_weights     = {{tc.dscp, 1.0}};
        }

        out.push_back(QueueConfiguration{tc, q, c});
    }
    return out;
}

} // namespace qosctl::queueing
