#pragma once
/**
 * @file repositories.hpp
 * @brief Storage seams used by the orchestration use cases.
 * @details Policies, devices and interface associations live outside the core.
 *          The use cases only see these interfaces; memory_repositories.hpp
 *          provides process-local implementations.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "qosctl/adapters/device_adapter.hpp"
#include "qosctl/domain/errors.hpp"
#include "qosctl/domain/model.hpp"
#include "qosctl/queueing/queue_algorithm.hpp"

namespace qosctl::orchestration {

/** @struct NetworkInterface
 *  @brief One interface of a managed device.
 */
struct NetworkInterface {
    int64_t                 id{0};
    std::string             name;        ///< "GigabitEthernet0/1", "ge-0/0/0", "eth0"
    std::optional<uint32_t> port;        ///< OpenFlow port number
    uint32_t                speed_kbps{0};
};

/** @struct NetworkDevice
 *  @brief A managed device and its QoS capabilities.
 */
struct NetworkDevice {
    int64_t                              id{0};
    std::string                          name;
    adapters::DeviceVendor               vendor{adapters::DeviceVendor::Cisco};
    std::string                          management_address;  ///< Handed to the CommandExecutor
    std::optional<uint64_t>              datapath_id;         ///< OpenFlow switches only
    bool                                 qos_capable{true};
    std::vector<queueing::AlgorithmType> algorithms;          ///< Empty: whatever the adapter supports
    std::vector<NetworkInterface>        interfaces;

    /// Interface by exact name; nullptr when absent.
    const NetworkInterface* find_interface(std::string_view iface) const noexcept;

    /// Executor target: management address, or the name when none is set.
    const std::string& target() const noexcept {
        return management_address.empty() ? name : management_address;
    }
};

/**
 * @brief Whether @p device may carry @p algorithm.
 * @return UnsupportedDevice when QoS is disabled or the algorithm is not listed.
 */
Result<void> check_capability(const NetworkDevice& device, queueing::AlgorithmType algorithm);

class PolicyRepository {
public:
    virtual ~PolicyRepository() = default;

    /// PolicyNotFound for an unknown id.
    virtual Result<domain::QoSPolicy> get(int64_t policy_id) const = 0;
    /// Insert (id 0 gets a fresh id) or replace; returns the stored id.
    virtual int64_t save(domain::QoSPolicy policy) = 0;
    virtual std::vector<domain::QoSPolicy> list() const = 0;
    virtual bool remove(int64_t policy_id) = 0;
};

class NetworkDeviceRepository {
public:
    virtual ~NetworkDeviceRepository() = default;

    /// DeviceNotFound for an unknown id.
    virtual Result<NetworkDevice> get(int64_t device_id) const = 0;
    virtual int64_t save(NetworkDevice device) = 0;
    virtual std::vector<NetworkDevice> list() const = 0;
};

class InterfaceQoSPolicyRepository {
public:
    virtual ~InterfaceQoSPolicyRepository() = default;

    /// Active association bound to one interface direction, if any.
    virtual std::optional<domain::InterfaceQoSPolicy>
    find_active(int64_t device_id, int64_t interface_id, domain::Direction direction) const = 0;

    /// Active associations referencing @p policy_id.
    virtual std::vector<domain::InterfaceQoSPolicy> find_by_policy(int64_t policy_id) const = 0;

    /// Insert (id 0 gets a fresh id) or replace; returns the stored record.
    virtual domain::InterfaceQoSPolicy save(domain::InterfaceQoSPolicy association) = 0;

    /// Mark an association inactive; PolicyNotFound for an unknown id.
    virtual Result<void> deactivate(int64_t association_id) = 0;
};

} // namespace qosctl::orchestration
