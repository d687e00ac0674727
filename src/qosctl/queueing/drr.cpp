/**
 * @file drr.cpp
 * @brief DRR weights, quanta and buffers.
 */
#include "qosctl/queueing/drr.hpp"

#include <algorithm>

#include "qosctl/config/constants.hpp"

namespace qosctl::queueing {

namespace cst = qosctl::config::constants;
using domain::CongestionAlgorithm;
using domain::CongestionParameters;
using domain::QueueConfiguration;
using domain::QueueParameters;
using domain::TrafficClass;

double DrrAlgorithm::weight(const TrafficClass& tc) noexcept {
    const double priority_weight  = tc.priority + 1.0;
    const double bandwidth_weight = std::max(1.0, tc.min_bandwidth / static_cast<double>(cst::KBPS_PER_WEIGHT_UNIT));
    return priority_weight * bandwidth_weight;
}

uint32_t DrrAlgorithm::quantum(double weight, double total_weight, uint32_t bandwidth_limit_kbps) noexcept {
    if (total_weight <= 0.0) return cst::DRR_DEFAULT_QUANTUM;
    const double bandwidth_factor = std::max(1.0, bandwidth_limit_kbps / static_cast<double>(cst::DRR_BANDWIDTH_UNIT));
    const double raw = cst::DRR_DEFAULT_QUANTUM * (weight / total_weight) * bandwidth_factor;
    // Truncate like the byte count it is, then bound.
    const auto q = static_cast<uint64_t>(raw);
    return static_cast<uint32_t>(std::clamp<uint64_t>(q, cst::DRR_MIN_QUANTUM, cst::DRR_MAX_QUANTUM));
}

uint32_t DrrAlgorithm::buffer_size(uint32_t quantum) noexcept {
    const uint32_t packets = std::max<uint32_t>(1, quantum / cst::DRR_AVG_PACKET_BYTES);
    return std::clamp(packets * cst::DRR_BUFFER_PER_QUANTUM, cst::DRR_MIN_BUFFER, cst::DRR_MAX_BUFFER);
}

Result<std::vector<QueueConfiguration>> DrrAlgorithm::calculate(const domain::QoSPolicy& policy) const {
    if (auto ok = check_guaranteed_bandwidth(policy); !ok) {
        return qosctl_detail::unexpected<QosError>(ok.error());
    }

    double total_weight = 0.0;
    for (const auto& tc : policy.traffic_classes) total_weight += weight(tc);

    std::vector<TrafficClass> ordered = policy.traffic_classes;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const TrafficClass& a, const TrafficClass& b) { return a.priority > b.priority; });

    std::vector<QueueConfiguration> out;
    out.reserve(ordered.size());
    for (const auto& tc : ordered) {
        const double   w   = weight(tc);
        const uint32_t qtm = quantum(w, total_weight, policy.bandwidth_limit);
        const uint32_t buf = buffer_size(qtm);

        QueueParameters q;
        q.buffer_size       = buf;
        q.queue_limit       = buf * 2;
        q.service_rate      = tc.min_bandwidth;
        q.weight            = w;
        q.priority_level    = tc.priority;
        q.bandwidth_percent = static_cast<double>(tc.min_bandwidth) / policy.bandwidth_limit * 100.0;
        q.quantum           = qtm;

        CongestionParameters c;
        if (tc.priority >= cst::PRIORITY_CLASS_THRESHOLD) {
            c.algorithm        = CongestionAlgorithm::Red;
            c.min_threshold    = q.queue_limit / 4;
            c.max_threshold    = q.queue_limit * 3 / 4;
            c.drop_probability = cst::WRED_DEFAULT_DROP_PROB;
        }

        out.push_back(QueueConfiguration{tc, q, c});
    }
    return out;
}

} // namespace qosctl::queueing
