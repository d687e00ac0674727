#pragma once
/**
 * @file cbwfq.hpp
 * @brief Class-Based Weighted Fair Queuing calculator.
 * @details Each class is guaranteed its min_bandwidth; the surplus is shared by
 *          a weight blending priority (70%) and relative bandwidth (30%).
 */

#include <cstdint>
#include <vector>

#include "qosctl/queueing/queue_algorithm.hpp"

namespace qosctl::queueing {

class CbwfqAlgorithm : public QueueAlgorithm {
public:
    AlgorithmType type() const noexcept override { return AlgorithmType::Cbwfq; }

    Result<std::vector<domain::QueueConfiguration>>
    calculate(const domain::QoSPolicy& policy) const override;

    /**
     * @brief Relative weight of @p tc among @p all, clamped to [1,100].
     * @details A factor whose maximum over the policy is 0 counts as 1.
     */
    static double weight(const domain::TrafficClass& tc,
                         const std::vector<domain::TrafficClass>& all) noexcept;

    /// Packets: ceil(burst / 1.5) when burst > 0, else max(16, ceil(bw * 0.1 / 12)).
    static uint32_t buffer_size(uint32_t bandwidth_kbps, uint32_t burst_kb) noexcept;

    /// Packets: clamp(bw / 8, 64, 4096).
    static uint32_t queue_limit(uint32_t bandwidth_kbps) noexcept;

protected:
    /// CBWFQ pass without the sum-of-guarantees check (LLQ has already run its own).
    std::vector<domain::QueueConfiguration>
    calculate_unchecked(const domain::QoSPolicy& policy) const;
};

} // namespace qosctl::queueing
