/**
 * @file llq.cpp
 * @brief LLQ admission checks, strict-priority queues and CBWFQ delegation.
 */
#include "qosctl/queueing/llq.hpp"

#include <fmt/format.h>

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

uint32_t LlqAlgorithm::priority_buffer_size(uint32_t bandwidth_kbps, uint32_t burst_kb) noexcept {
    if (burst_kb > 0) {
        return static_cast<uint32_t>(std::ceil(burst_kb / cst::AVG_PACKET_KB));
    }
    const auto packets = static_cast<uint32_t>(
        std::ceil(bandwidth_kbps * cst::LLQ_BUFFER_SECONDS / cst::PACKET_KBITS));
    return std::max(cst::LLQ_MIN_BUFFER, packets);
}

uint32_t LlqAlgorithm::priority_queue_limit(uint32_t bandwidth_kbps) noexcept {
    return std::clamp(bandwidth_kbps / cst::LLQ_QUEUE_DIVISOR,
                      cst::LLQ_MIN_QUEUE_LIMIT, cst::LLQ_MAX_QUEUE_LIMIT);
}

Result<std::vector<QueueConfiguration>> LlqAlgorithm::calculate(const domain::QoSPolicy& policy) const {
    if (policy.bandwidth_limit == 0) {
        return make_error(ErrorKind::Validation,
                          fmt::format("policy '{}': bandwidth_limit must be greater than 0", policy.name));
    }

    std::vector<TrafficClass> priority_classes;
    std::vector<TrafficClass> standard_classes;
    for (const auto& tc : policy.traffic_classes) {
        (tc.priority >= cst::PRIORITY_CLASS_THRESHOLD ? priority_classes : standard_classes).push_back(tc);
    }

    const uint64_t priority_bw = domain::total_min_bandwidth(priority_classes);
    const double priority_percent = static_cast<double>(priority_bw) / policy.bandwidth_limit * 100.0;
    if (priority_percent > cst::LLQ_MAX_PRIORITY_PERCENT) {
        return make_error(ErrorKind::LowLatencyValidation,
                          fmt::format("priority classes reserve {:.1f}% of the bandwidth, above the {}% limit",
                                      priority_percent, cst::LLQ_MAX_PRIORITY_PERCENT));
    }

    // priority_bw <= 33% of the limit here, so the subtraction cannot wrap.
    const auto standard_bw = static_cast<uint32_t>(policy.bandwidth_limit - priority_bw);
    const uint64_t standard_min = domain::total_min_bandwidth(standard_classes);
    if (standard_min > standard_bw) {
        return make_error(ErrorKind::LowLatencyValidation,
                          fmt::format("standard classes guarantee {} kbps but only {} kbps remain "
                                      "after priority reservations", standard_min, standard_bw));
    }

    // Strict-priority queues first, highest priority first; ties keep policy order.
    std::stable_sort(priority_classes.begin(), priority_classes.end(),
                     [](const TrafficClass& a, const TrafficClass& b) { return a.priority > b.priority; });

    std::vector<QueueConfiguration> out;
    out.reserve(policy.traffic_classes.size());
    for (const auto& tc : priority_classes) {
        QueueParameters q;
        q.buffer_size       = priority_buffer_size(tc.min_bandwidth, tc.burst);
        q.queue_limit       = priority_queue_limit(tc.min_bandwidth);
        q.service_rate      = tc.min_bandwidth;
        q.weight            = 0.0;   // strict priority ignores weights
        q.priority_level    = tc.priority;
        q.bandwidth_percent = 0.0;

        CongestionParameters c;
        c.algorithm     = CongestionAlgorithm::TailDrop;
        c.min_threshold = 0;
        c.max_threshold = 0;

        out.push_back(QueueConfiguration{tc, q, c});
    }

    domain::QoSPolicy standard = policy;
    standard.bandwidth_limit = standard_bw;
    standard.traffic_classes = std::move(standard_classes);
    auto rest = calculate_unchecked(standard);
    out.insert(out.end(), std::make_move_iterator(rest.begin()), std::make_move_iterator(rest.end()));
    return out;
}

} // namespace qosctl::queueing
