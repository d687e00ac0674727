/**
 * @file congestion.cpp
 * @brief RED / WRED implementation and per-queue dispatch.
 */
#include "qosctl/queueing/congestion.hpp"

#include <algorithm>
#include <string>

namespace qosctl::queueing {

double red_drop_probability(double occupancy, double min_th, double max_th, double max_prob) noexcept {
    if (occupancy <= min_th) return 0.0;
    if (occupancy >= max_th) return 1.0;
    // max_th > occupancy > min_th here, so the span is positive.
    const double fraction = (occupancy - min_th) / (max_th - min_th);
    return fraction * max_prob;
}

double wred_drop_probability(double occupancy, double min_th, double max_th,
                             double max_prob, double weight) noexcept {
    const double w = std::clamp(weight, 0.0, 1.0);
    return red_drop_probability(occupancy, min_th, max_th, max_prob) * (1.0 - w);
}

double drop_probability(const domain::CongestionParameters& params,
                        double occupancy,
                        std::string_view dscp) noexcept {
    using domain::CongestionAlgorithm;
    const auto min_th = static_cast<double>(params.min_threshold);
    const auto max_th = static_cast<double>(params.max_threshold);

    switch (params.algorithm) {
        case CongestionAlgorithm::Red:
            return red_drop_probability(occupancy, min_th, max_th, params.drop_probability);
        case CongestionAlgorithm::Wred: {
            double weight = 0.0;
            const auto it = params.dscp_weights.find(std::string(dscp));
            if (it != params.dscp_weights.end()) weight = it->second;
            return wred_drop_probability(occupancy, min_th, max_th, params.drop_probability, weight);
        }
        case CongestionAlgorithm::TailDrop:
            if (params.max_threshold == 0) return 0.0;
            return occupancy >= max_th ? 1.0 : 0.0;
        case CongestionAlgorithm::Ecn:
            return 0.0;
    }
    return 0.0;
}

} // namespace qosctl::queueing
