#pragma once
/**
 * @file drr.hpp
 * @brief Deficit Round Robin calculator.
 */

#include <cstdint>
#include <vector>

#include "qosctl/queueing/queue_algorithm.hpp"

namespace qosctl::queueing {

class DrrAlgorithm : public QueueAlgorithm {
public:
    AlgorithmType type() const noexcept override { return AlgorithmType::Drr; }

    Result<std::vector<domain::QueueConfiguration>>
    calculate(const domain::QoSPolicy& policy) const override;

    /// (priority + 1) * max(1, min_bw / 1000).
    static double weight(const domain::TrafficClass& tc) noexcept;

    /**
     * @brief Bytes served per round.
     * @return clamp(1500 * weight / total_weight * max(1, limit / 100000), 512, 65536);
     *         1500 when total_weight is 0.
     */
    static uint32_t quantum(double weight, double total_weight, uint32_t bandwidth_limit_kbps) noexcept;

    /// clamp(max(1, quantum / 1000) * 4, 16, 1024) packets.
    static uint32_t buffer_size(uint32_t quantum) noexcept;
};

} // namespace qosctl::queueing
