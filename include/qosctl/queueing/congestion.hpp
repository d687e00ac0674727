#pragma once
/**
 * @file congestion.hpp
 * @brief RED / WRED drop-probability functions.
 * @details Pure functions of their arguments; safe to call from any thread.
 */

#include <cstdint>
#include <string_view>

#include "qosctl/domain/model.hpp"

namespace qosctl::queueing {

/**
 * @brief Random Early Detection drop probability.
 * @param occupancy   Current queue depth (packets).
 * @param min_th      At or below this depth nothing is dropped.
 * @param max_th      At or above this depth everything is dropped.
 * @param max_prob    Probability reached just below @p max_th.
 * @return 0 for occupancy <= min_th, 1 for occupancy >= max_th, otherwise
 *         ((occupancy - min_th) / (max_th - min_th)) * max_prob.
 */
double red_drop_probability(double occupancy, double min_th, double max_th, double max_prob) noexcept;

/**
 * @brief Weighted RED: RED scaled by (1 - weight).
 * @param weight Per-DSCP weight, clamped to [0,1]. 0 is plain RED.
 */
double wred_drop_probability(double occupancy, double min_th, double max_th,
                             double max_prob, double weight) noexcept;

/**
 * @brief Drop probability for a queue described by @p params.
 * @details RED uses the configured thresholds. WRED looks up @p dscp in
 *          dscp_weights (missing entries weigh 0). Tail-drop drops only at or
 *          above max_threshold, and never when both thresholds are 0. ECN marks
 *          instead of dropping, so it always yields 0.
 */
double drop_probability(const domain::CongestionParameters& params,
                        double occupancy,
                        std::string_view dscp = {}) noexcept;

} // namespace qosctl::queueing
