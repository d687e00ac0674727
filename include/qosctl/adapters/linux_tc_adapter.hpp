#pragma once
/**
 * @file linux_tc_adapter.hpp
 * @brief Linux traffic control (iproute2 `tc`) rendering.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "qosctl/adapters/device_adapter.hpp"

namespace qosctl::adapters {

/**
 * @class LinuxTcAdapter
 * @brief HTB hierarchy with per-class leaf qdiscs and u32 filters.
 * @details Layout: root `1:` (default 30) -> `1:1` at the link rate -> one class
 *          `1:<10+i>` per queue and the default class `1:30`. Leaves are RED for
 *          RED/WRED, fq_codel for ECN and SFQ otherwise. A single-queue FQ-CoDel
 *          policy is installed as a root fq_codel instead. Egress only.
 */
class LinuxTcAdapter final : public DeviceAdapter {
public:
    DeviceVendor vendor() const noexcept override { return DeviceVendor::Linux; }
    bool supports(queueing::AlgorithmType algorithm) const noexcept override;

    Result<CommandList> generate(const GenerateRequest& request) const override;

    CommandList generate_removal(const std::string& interface_name,
                                 const std::string& policy_name,
                                 domain::Direction direction) const override;

    /**
     * @brief Aligned (value, mask) blocks that exactly cover [first, last].
     * @details Used for u32 `dport` matches, which only take a value/mask pair.
     */
    static std::vector<std::pair<uint16_t, uint16_t>> port_blocks(uint16_t first, uint16_t last);

    /// Parse `tc qdisc show` output into qdiscs per device.
    static AppliedPolicies parse_applied_policies(std::string_view show_output);
};

} // namespace qosctl::adapters
