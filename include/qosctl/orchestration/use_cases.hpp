#pragma once
/**
 * @file use_cases.hpp
 * @brief Policy orchestration: validate, render, execute and record.
 * @details Every use case validates before touching a device. Failures come
 *          back as an OperationResult with success = false; nothing is
 *          persisted unless the device (or controller) accepted the change.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "qosctl/adapters/command_executor.hpp"
#include "qosctl/config/constants.hpp"
#include "qosctl/domain/errors.hpp"
#include "qosctl/domain/model.hpp"
#include "qosctl/obs/observability.hpp"
#include "qosctl/orchestration/repositories.hpp"
#include "qosctl/queueing/queue_algorithm.hpp"

namespace qosctl::sdn {
class SdnService;
}

namespace qosctl::orchestration {

/** @struct OperationResult
 *  @brief Outcome of an orchestration call.
 */
struct OperationResult {
    bool                                      success{false};
    std::string                               message;
    std::vector<std::string>                  errors;
    std::vector<std::string>                  warnings;
    adapters::CommandList                     commands_generated;
    std::vector<domain::QueueConfiguration>   queue_configurations;
    std::optional<domain::InterfaceQoSPolicy> association;  ///< Record created or deactivated
    std::optional<ErrorKind>                  error_kind;   ///< Set when success is false
};

/** @struct Dependencies
 *  @brief Collaborators shared by the use cases; all must outlive them.
 */
struct Dependencies {
    PolicyRepository&             policies;
    NetworkDeviceRepository&      devices;
    InterfaceQoSPolicyRepository& associations;
    adapters::CommandExecutor&    executor;
    sdn::SdnService*              sdn{nullptr};       ///< Required for OpenFlow devices
    obs::Observer*                observer{nullptr};
    std::chrono::milliseconds     device_timeout{config::constants::DEVICE_TIMEOUT_MS};
};

struct ApplyRequest {
    int64_t                 policy_id{0};
    int64_t                 device_id{0};
    std::string             interface_name;
    domain::Direction       direction{domain::Direction::Egress};
    queueing::AlgorithmType algorithm{queueing::AlgorithmType::Cbwfq};
    bool                    reapply_if_exists{false};  ///< Replace an active association instead of failing
};

/**
 * @class ValidateAndApplyPolicyUseCase
 * @brief Two-phase application of a policy to an interface direction.
 * @details Phase one fetches the policy, device and interface, checks the
 *          device capability and runs the queue algorithm. Phase two checks for
 *          an active association, renders the commands, executes them within
 *          device_timeout, then swaps the association. Phase two is serialized
 *          per (device, interface, direction), so concurrent applies to one
 *          binding leave a single active association. OpenFlow devices go
 *          through the SDN service instead of a CLI adapter.
 */
class ValidateAndApplyPolicyUseCase {
public:
    explicit ValidateAndApplyPolicyUseCase(Dependencies deps) : deps_(deps) {}

    OperationResult execute(const ApplyRequest& request);

private:
    Dependencies deps_;
};

/** @struct AllocationReport
 *  @brief Bandwidth split computed for a policy, without touching a device.
 */
struct AllocationReport {
    int64_t                                 policy_id{0};
    queueing::AlgorithmType                 algorithm{queueing::AlgorithmType::Cbwfq};
    uint32_t                                bandwidth_limit{0};
    uint64_t                                total_guaranteed{0};  ///< Sum of service rates
    uint64_t                                remaining{0};         ///< limit - guaranteed
    std::vector<domain::QueueConfiguration> configurations;
    std::vector<queueing::BandwidthShare>   shares;
};

class CalculateBandwidthAllocationUseCase {
public:
    explicit CalculateBandwidthAllocationUseCase(const PolicyRepository& policies) : policies_(policies) {}

    Result<AllocationReport> execute(int64_t policy_id, queueing::AlgorithmType algorithm) const;

private:
    const PolicyRepository& policies_;
};

/// CBWFQ application plus a side-effect-free preview.
class ConfigureCbwfqUseCase {
public:
    explicit ConfigureCbwfqUseCase(Dependencies deps) : apply_(deps), calc_(deps.policies) {}

    OperationResult execute(int64_t policy_id, int64_t device_id, const std::string& interface_name,
                            domain::Direction direction = domain::Direction::Egress,
                            bool reapply_if_exists = false);

    Result<AllocationReport> preview(int64_t policy_id) const;

private:
    ValidateAndApplyPolicyUseCase       apply_;
    CalculateBandwidthAllocationUseCase calc_;
};

/// LLQ application plus a side-effect-free preview.
class ConfigureLlqUseCase {
public:
    explicit ConfigureLlqUseCase(Dependencies deps) : apply_(deps), calc_(deps.policies) {}

    OperationResult execute(int64_t policy_id, int64_t device_id, const std::string& interface_name,
                            domain::Direction direction = domain::Direction::Egress,
                            bool reapply_if_exists = false);

    Result<AllocationReport> preview(int64_t policy_id) const;

private:
    ValidateAndApplyPolicyUseCase       apply_;
    CalculateBandwidthAllocationUseCase calc_;
};

/**
 * @class RemovePolicyFromInterfaceUseCase
 * @brief Detach the active policy of an interface direction.
 * @details The association is deactivated only after the device (or the
 *          controller) accepted the removal.
 */
class RemovePolicyFromInterfaceUseCase {
public:
    explicit RemovePolicyFromInterfaceUseCase(Dependencies deps) : deps_(deps) {}

    OperationResult execute(int64_t device_id, const std::string& interface_name,
                            domain::Direction direction = domain::Direction::Egress);

private:
    Dependencies deps_;
};

} // namespace qosctl::orchestration
