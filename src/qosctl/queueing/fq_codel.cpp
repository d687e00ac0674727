/**
 * @file fq_codel.cpp
 * @brief FQ-CoDel target delays, quanta and flow counts.
 */
#include "qosctl/queueing/fq_codel.hpp"

#include <algorithm>

#include "qosctl/config/constants.hpp"

namespace qosctl::queueing {

namespace cst = qosctl::config::constants;
using domain::CongestionAlgorithm;
using domain::CongestionParameters;
using domain::QueueConfiguration;
using domain::QueueParameters;
using domain::TrafficClass;

uint32_t FqCodelAlgorithm::target_delay_us(uint8_t priority) noexcept {
    if (priority >= 7) return cst::CODEL_TARGET_VOICE_US;
    if (priority >= 5) return cst::CODEL_TARGET_VIDEO_US;
    if (priority >= 3) return cst::CODEL_TARGET_INTERACTIVE_US;
    return cst::CODEL_TARGET_BULK_US;
}

uint32_t FqCodelAlgorithm::interval_us(uint8_t priority) noexcept {
    return std::max(cst::CODEL_MIN_INTERVAL_US, target_delay_us(priority) * cst::CODEL_INTERVAL_FACTOR);
}

uint32_t FqCodelAlgorithm::base_quantum(uint32_t total_bandwidth_kbps) noexcept {
    if (total_bandwidth_kbps >= cst::FQ_TIER_1G_KBPS)   return cst::FQ_QUANTUM_1G;
    if (total_bandwidth_kbps >= cst::FQ_TIER_100M_KBPS) return cst::FQ_QUANTUM_100M;
    return cst::FQ_MTU_QUANTUM;
}

uint32_t FqCodelAlgorithm::quantum(const TrafficClass& tc, uint32_t base) noexcept {
    const double priority_factor  = (tc.priority + 1) / 8.0;
    const double bandwidth_factor = std::max(1.0, tc.min_bandwidth / static_cast<double>(cst::KBPS_PER_WEIGHT_UNIT));
    const auto q = static_cast<uint32_t>(base * priority_factor * bandwidth_factor);
    return std::max(cst::FQ_MTU_QUANTUM, q);
}

uint32_t FqCodelAlgorithm::flows(uint32_t min_bandwidth_kbps) noexcept {
    if (min_bandwidth_kbps >= cst::FQ_FLOWS_100M_KBPS) return cst::FQ_FLOWS_LARGE;
    if (min_bandwidth_kbps >= cst::FQ_FLOWS_10M_KBPS)  return cst::FQ_FLOWS_DEFAULT;
    return cst::FQ_FLOWS_SMALL;
}

Result<std::vector<QueueConfiguration>> FqCodelAlgorithm::calculate(const domain::QoSPolicy& policy) const {
    if (auto ok = check_guaranteed_bandwidth(policy); !ok) {
        return qosctl_detail::unexpected<QosError>(ok.error());
    }

    std::vector<TrafficClass> ordered = policy.traffic_classes;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const TrafficClass& a, const TrafficClass& b) { return a.priority > b.priority; });

    const uint32_t base = base_quantum(policy.bandwidth_limit);

    std::vector<QueueConfiguration> out;
    out.reserve(ordered.size());
    for (const auto& tc : ordered) {
        const uint32_t qtm = quantum(tc, base);
        const uint32_t n   = flows(tc.min_bandwidth);

        QueueParameters q;
        q.buffer_size       = n * 2;
        q.queue_limit       = n * 4;
        q.service_rate      = tc.min_bandwidth;
        q.weight            = static_cast<double>(qtm);
        q.priority_level    = tc.priority;
        q.bandwidth_percent = static_cast<double>(tc.min_bandwidth) / policy.bandwidth_limit * 100.0;
        q.quantum           = qtm;
        q.flows             = n;

        CongestionParameters c;
        c.algorithm        = CongestionAlgorithm::Ecn;
        c.min_threshold    = target_delay_us(tc.priority);
        c.max_threshold    = interval_us(tc.priority);
        c.drop_probability = 0.0;

        out.push_back(QueueConfiguration{tc, q, c});
    }
    return out;
}

} // namespace qosctl::queueing
