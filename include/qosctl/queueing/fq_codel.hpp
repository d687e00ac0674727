#pragma once
/**
 * @file fq_codel.hpp
 * @brief FQ-CoDel calculator: per-class CoDel target/interval, quantum and flow count.
 * @details Outputs carry the CoDel target and interval (microseconds) in the
 *          ECN congestion thresholds, and the quantum both as `quantum` and as
 *          the relative `weight`.
 */

#include <cstdint>
#include <vector>

#include "qosctl/queueing/queue_algorithm.hpp"

namespace qosctl::queueing {

class FqCodelAlgorithm : public QueueAlgorithm {
public:
    AlgorithmType type() const noexcept override { return AlgorithmType::FqCodel; }

    Result<std::vector<domain::QueueConfiguration>>
    calculate(const domain::QoSPolicy& policy) const override;

    /// CoDel target: 2/3/5/10 ms for priority >= 7 / >= 5 / >= 3 / below.
    static uint32_t target_delay_us(uint8_t priority) noexcept;
    /// max(100 ms, 20 x target).
    static uint32_t interval_us(uint8_t priority) noexcept;
    /// 4608 / 3072 / 1514 bytes for >= 1 Gbps / >= 100 Mbps / below.
    static uint32_t base_quantum(uint32_t total_bandwidth_kbps) noexcept;
    /// max(1514, base * (priority + 1) / 8 * max(1, min_bw / 1000)).
    static uint32_t quantum(const domain::TrafficClass& tc, uint32_t base) noexcept;
    /// 2048 / 1024 / 512 sub-queues for >= 100 Mbps / >= 10 Mbps / below.
    static uint32_t flows(uint32_t min_bandwidth_kbps) noexcept;
};

} // namespace qosctl::queueing
