#pragma once
/**
 * @file llq.hpp
 * @brief Low Latency Queuing: strict-priority queues on top of CBWFQ.
 * @details Classes with priority >= 5 are served first with tail-drop and short
 *          buffers. Their combined guarantee may not exceed 33% of the policy
 *          limit. The remaining classes run through CBWFQ against what is left.
 */

#include <cstdint>
#include <vector>

#include "qosctl/queueing/cbwfq.hpp"

namespace qosctl::queueing {

class LlqAlgorithm : public CbwfqAlgorithm {
public:
    AlgorithmType type() const noexcept override { return AlgorithmType::Llq; }

    Result<std::vector<domain::QueueConfiguration>>
    calculate(const domain::QoSPolicy& policy) const override;

    /// Packets: ceil(burst / 1.5) when burst > 0, else max(8, ceil(bw * 0.05 / 12)).
    static uint32_t priority_buffer_size(uint32_t bandwidth_kbps, uint32_t burst_kb) noexcept;

    /// Packets: clamp(bw / 16, 32, 1024).
    static uint32_t priority_queue_limit(uint32_t bandwidth_kbps) noexcept;
};

} // namespace qosctl::queueing
