#pragma once
/**
 * @file juniper_adapter.hpp
 * @brief JUNOS class-of-service rendering (`set` statements + commit).
 */

#include <string>
#include <string_view>

#include "qosctl/adapters/device_adapter.hpp"

namespace qosctl::adapters {

/**
 * @class JuniperAdapter
 * @brief Forwarding classes, drop profiles, schedulers, a scheduler map and a
 *        DSCP classifier bound to the interface.
 * @details Every object name is limited to [A-Za-z0-9_-] and 32 characters.
 */
class JuniperAdapter final : public DeviceAdapter {
public:
    DeviceVendor vendor() const noexcept override { return DeviceVendor::Juniper; }
    bool supports(queueing::AlgorithmType algorithm) const noexcept override;

    Result<CommandList> generate(const GenerateRequest& request) const override;

    CommandList generate_removal(const std::string& interface_name,
                                 const std::string& policy_name,
                                 domain::Direction direction) const override;

    /// JUNOS-safe object name.
    static std::string junos_name(std::string_view name);

    /// Name of the scheduler map generated for a policy.
    static std::string scheduler_map_name(std::string_view policy_name);
    /// Name of the DSCP classifier generated for a policy.
    static std::string classifier_name(std::string_view policy_name);

    /**
     * @brief Extract scheduler-maps and classifiers per interface from
     *        `show configuration class-of-service | display set` output.
     */
    static AppliedPolicies parse_applied_policies(std::string_view show_output);
};

} // namespace qosctl::adapters
