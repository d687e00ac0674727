#pragma once
/**
 * @file device_adapter.hpp
 * @brief Vendor adapter interface: queue configurations -> CLI command lists.
 * @details Adapters are pure generators. They never execute anything; the
 *          caller hands the result to a CommandExecutor.
 */

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "qosctl/adapters/command_executor.hpp"
#include "qosctl/domain/errors.hpp"
#include "qosctl/domain/model.hpp"
#include "qosctl/queueing/queue_algorithm.hpp"

namespace qosctl::adapters {

/**
 * @enum DeviceVendor
 * @brief Device families with QoS support.
 * @details OpenFlow switches are configured through the SDN controller and
 *          have no CLI adapter.
 */
enum class DeviceVendor : uint8_t { Cisco, Juniper, Linux, OpenFlow };

std::string_view to_string(DeviceVendor v) noexcept;
/// Case-insensitive; accepts "cisco", "juniper"/"junos", "linux", "openflow"/"sdn".
std::optional<DeviceVendor> parse_vendor(std::string_view name) noexcept;

/**
 * @struct GenerateRequest
 * @brief Everything an adapter needs to render one policy on one interface.
 */
struct GenerateRequest {
    std::string                             interface_name;
    std::string                             policy_name;
    domain::Direction                       direction{domain::Direction::Egress};
    queueing::AlgorithmType                 algorithm{queueing::AlgorithmType::Cbwfq};
    uint32_t                                total_bandwidth{0};  ///< kbps; 0 = adapter default
    std::vector<domain::QueueConfiguration> queues;              ///< As returned by the algorithm
};

/// One QoS object found on an interface by a show-command parser.
struct AppliedPolicy {
    std::string kind;    ///< "scheduler-map", "classifier", qdisc kind, ...
    std::string name;    ///< Object name or handle
    std::string parent;  ///< tc parent ("root", "1:1"); empty elsewhere

    bool operator==(const AppliedPolicy&) const = default;
};

/// Interface name -> QoS objects bound to it.
using AppliedPolicies = std::map<std::string, std::vector<AppliedPolicy>>;

class DeviceAdapter {
public:
    virtual ~DeviceAdapter() = default;

    virtual DeviceVendor vendor() const noexcept = 0;

    /// Whether the device family can express @p algorithm.
    virtual bool supports(queueing::AlgorithmType algorithm) const noexcept = 0;

    /**
     * @brief Render a policy.
     * @return Ordered commands; Validation error for an empty interface, policy
     *         name or queue list; UnsupportedAlgorithm when !supports(algorithm).
     */
    virtual Result<CommandList> generate(const GenerateRequest& request) const = 0;

    /// Commands detaching (and deleting) @p policy_name from an interface.
    virtual CommandList generate_removal(const std::string& interface_name,
                                         const std::string& policy_name,
                                         domain::Direction direction) const = 0;
};

/**
 * @brief Adapter for a vendor.
 * @return UnsupportedDevice for OpenFlow.
 */
Result<std::unique_ptr<DeviceAdapter>> make_adapter(DeviceVendor vendor);

/// Shared request checks (interface, policy name, queues, algorithm support).
Result<void> check_request(const DeviceAdapter& adapter, const GenerateRequest& request);

/// Replace every character outside [A-Za-z0-9_-] with @p fill, then cut to @p max_len (0 = no limit).
std::string sanitize_name(std::string_view name, char fill, std::size_t max_len = 0);

} // namespace qosctl::adapters
