#pragma once
/**
 * @file cisco_adapter.hpp
 * @brief Cisco IOS MQC rendering (class-map / policy-map / service-policy).
 */

#include <string>

#include "qosctl/adapters/device_adapter.hpp"

namespace qosctl::adapters {

/**
 * @class CiscoAdapter
 * @brief CBWFQ and LLQ on IOS.
 * @details Under LLQ, classes with priority_level >= 5 get `priority` plus a
 *          policer; every other class gets `bandwidth`, `fair-queue` and
 *          `queue-limit`, followed by `random-detect` when RED/WRED applies.
 *          A class with several classifiers becomes a match-any class-map.
 */
class CiscoAdapter final : public DeviceAdapter {
public:
    DeviceVendor vendor() const noexcept override { return DeviceVendor::Cisco; }
    bool supports(queueing::AlgorithmType algorithm) const noexcept override;

    Result<CommandList> generate(const GenerateRequest& request) const override;

    CommandList generate_removal(const std::string& interface_name,
                                 const std::string& policy_name,
                                 domain::Direction direction) const override;

    /**
     * @brief Stand-alone RED on class-default.
     * @param drop_probability Mapped to the IOS 1..10 scale and clamped.
     */
    static CommandList generate_red_policy(const std::string& interface_name,
                                           const std::string& policy_name,
                                           uint32_t min_threshold,
                                           uint32_t max_threshold,
                                           double drop_probability);

    /// IOS mark-probability scale: trunc(p * 10) clamped to 1..10.
    static int probability_scale(double drop_probability) noexcept;
};

} // namespace qosctl::adapters
