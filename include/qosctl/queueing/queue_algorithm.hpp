#pragma once
/**
 * @file queue_algorithm.hpp
 * @brief Queue algorithm interface, algorithm registry and bandwidth allocation.
 * @details Every algorithm turns a QoSPolicy into one QueueConfiguration per
 *          class, ordered by decreasing class priority. Implementations are
 *          stateless; a single instance may be shared across threads.
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "qosctl/domain/errors.hpp"
#include "qosctl/domain/model.hpp"

namespace qosctl::queueing {

/**
 * @enum AlgorithmType
 * @brief Queueing disciplines known to the control plane.
 * @details Only CBWFQ, LLQ, FQ-CoDel and DRR have calculators; the others are
 *          accepted in documents but rejected by make_algorithm().
 */
enum class AlgorithmType : uint8_t {
    Fifo = 0,
    Pq,       ///< Priority queuing
    Cq,       ///< Custom queuing
    Fq,       ///< Fair queuing
    Wfq,      ///< Weighted fair queuing
    Cbwfq,    ///< Class-based WFQ
    Llq,      ///< Low latency queuing (CBWFQ + strict priority)
    Mdrr,     ///< Modified DRR
    FqCodel,  ///< Flow queue controlled delay
    Drr       ///< Deficit round robin
};

/// Short lower-case name ("cbwfq", "fq_codel", ...).
std::string_view to_string(AlgorithmType t) noexcept;

/**
 * @brief Case-insensitive parse.
 * @details Accepts the short names and the long forms used by policy
 *          documents ("class_based_wfq", "low_latency_queuing", "deficit_round_robin").
 */
std::optional<AlgorithmType> parse_algorithm(std::string_view name) noexcept;

/// True for the four disciplines with a calculator.
constexpr bool is_supported(AlgorithmType t) noexcept {
    return t == AlgorithmType::Cbwfq || t == AlgorithmType::Llq ||
           t == AlgorithmType::FqCodel || t == AlgorithmType::Drr;
}

/**
 * @class QueueAlgorithm
 * @brief Pure policy -> queue parameters calculator.
 */
class QueueAlgorithm {
public:
    virtual ~QueueAlgorithm() = default;

    /// Discipline implemented by this calculator.
    virtual AlgorithmType type() const noexcept = 0;

    /**
     * @brief Compute per-class queue and congestion parameters.
     * @return Configurations sorted by decreasing priority, or a Validation /
     *         LowLatencyValidation error when the bandwidth invariants fail.
     */
    virtual Result<std::vector<domain::QueueConfiguration>>
    calculate(const domain::QoSPolicy& policy) const = 0;
};

/**
 * @brief Build the calculator for @p type.
 * @return UnsupportedAlgorithm for disciplines without a calculator.
 */
Result<std::unique_ptr<QueueAlgorithm>> make_algorithm(AlgorithmType type);

/**
 * @brief Shared guard: bandwidth_limit > 0 and sum(min_bandwidth) <= bandwidth_limit.
 * @return Validation error naming both figures on violation.
 */
Result<void> check_guaranteed_bandwidth(const domain::QoSPolicy& policy);

/**
 * @struct BandwidthShare
 * @brief Effective bandwidth of one class once the surplus is distributed.
 */
struct BandwidthShare {
    std::string class_name;        ///< Traffic class name
    uint32_t    guaranteed_kbps{0};///< service_rate of the class
    double      weight{0.0};       ///< Weight used for the surplus split
    double      shared_kbps{0.0};  ///< Portion of the surplus
    double      total_kbps{0.0};   ///< guaranteed + shared
    uint8_t     priority{0};       ///< Class priority
};

/**
 * @brief Distribute `limit - sum(service_rate)` proportionally to weight.
 * @details Weight-0 queues (LLQ strict priority) get no share. When no queue has
 *          a positive weight, or there is no surplus, every share is 0.
 */
std::vector<BandwidthShare> allocate_remaining(uint32_t bandwidth_limit,
                                               const std::vector<domain::QueueConfiguration>& configs);

} // namespace qosctl::queueing
