/**
 * @file use_cases.cpp
 * @brief Orchestration of validation, rendering, execution and persistence.
 */
#include "qosctl/orchestration/use_cases.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <map>
#include <memory>
#include <mutex>
#include <tuple>
#include <utility>

#include "qosctl/adapters/device_adapter.hpp"
#include "qosctl/sdn/openflow.hpp"
#include "qosctl/sdn/sdn_service.hpp"

namespace qosctl::orchestration {

namespace {

OperationResult failure(const QosError& err) {
    OperationResult r;
    r.success    = false;
    r.message    = err.message;
    r.error_kind = err.kind;
    r.errors     = err.details.empty() ? std::vector<std::string>{err.message} : err.details;
    return r;
}

bool is_validation(ErrorKind k) noexcept {
    return k == ErrorKind::Validation || k == ErrorKind::LowLatencyValidation;
}

Result<NetworkInterface> resolve_interface(const NetworkDevice& device, const std::string& name) {
    const auto* iface = device.find_interface(name);
    if (iface == nullptr) {
        return make_error(ErrorKind::InterfaceNotFound,
                          fmt::format("interface {} not found on device {}", name, device.name));
    }
    return *iface;
}

/**
 * @brief One mutex per (device, interface, direction).
 * @details Phase two of apply and removal run under it, so the association
 *          check, the device call and the association swap are one step for
 *          that binding. Entries live for the process.
 */
class BindingLocks {
public:
    std::mutex& for_binding(int64_t device_id, int64_t interface_id, domain::Direction direction) {
        std::lock_guard lk(mu_);
        auto& slot = locks_[Key{device_id, interface_id, direction}];
        if (!slot) slot = std::make_unique<std::mutex>();
        return *slot;
    }

private:
    using Key = std::tuple<int64_t, int64_t, domain::Direction>;

    std::mutex                                 mu_;
    std::map<Key, std::unique_ptr<std::mutex>> locks_;
};

BindingLocks& binding_locks() {
    static BindingLocks locks;
    return locks;
}

} // namespace

// ---------------------------------------------------------------------------
// ValidateAndApplyPolicyUseCase
// ---------------------------------------------------------------------------

OperationResult ValidateAndApplyPolicyUseCase::execute(const ApplyRequest& request) {
    auto fail = [&](const QosError& err) {
        spdlog::warn("Apply of policy {} on device {} {} failed: {}", request.policy_id, request.device_id,
                     request.interface_name, err.message);
        obs::notify(deps_.observer, obs::Event{is_validation(err.kind) ? obs::EventKind::ValidationFailed
                                                                       : obs::EventKind::ExecutionFailed,
                                               fmt::format("policy {}", request.policy_id), err.message, false, 0.0});
        return failure(err);
    };

    // ---- Phase one: fetch and validate, no side effects ----
    auto policy = deps_.policies.get(request.policy_id);
    if (!policy) return fail(policy.error());
    auto device = deps_.devices.get(request.device_id);
    if (!device) return fail(device.error());
    auto iface = resolve_interface(*device, request.interface_name);
    if (!iface) return fail(iface.error());
    if (auto cap = check_capability(*device, request.algorithm); !cap) return fail(cap.error());
    if (auto valid = domain::validate_policy(*policy); !valid) return fail(valid.error());

    auto algo = queueing::make_algorithm(request.algorithm);
    if (!algo) return fail(algo.error());
    auto configs = (*algo)->calculate(*policy);
    if (!configs) return fail(configs.error());

    const bool openflow = device->vendor == adapters::DeviceVendor::OpenFlow;
    std::unique_ptr<adapters::DeviceAdapter> adapter;
    if (openflow) {
        if (deps_.sdn == nullptr) {
            return fail(QosError{ErrorKind::UnsupportedDevice,
                                 fmt::format("device {} needs an SDN controller", device->name), {}});
        }
        if (!device->datapath_id || !iface->port) {
            return fail(QosError{ErrorKind::UnsupportedDevice,
                                 fmt::format("device {} has no datapath id or port for {}", device->name, iface->name),
                                 {}});
        }
    } else {
        auto made = adapters::make_adapter(device->vendor);
        if (!made) return fail(made.error());
        adapter = std::move(*made);
        if (!adapter->supports(request.algorithm)) {
            return fail(QosError{ErrorKind::UnsupportedAlgorithm,
                                 fmt::format("{} cannot express {}", adapters::to_string(device->vendor),
                                             queueing::to_string(request.algorithm)),
                                 {}});
        }
    }

    // ---- Phase two: existing binding, render, execute, persist ----
    std::lock_guard binding(binding_locks().for_binding(device->id, iface->id, request.direction));
    auto existing = deps_.associations.find_active(device->id, iface->id, request.direction);
    if (existing && !request.reapply_if_exists) {
        return fail(QosError{ErrorKind::AlreadyApplied,
                             fmt::format("policy {} already active on {} {}", existing->policy_id, device->name,
                                         iface->name),
                             {}});
    }

    OperationResult out;
    out.queue_configurations = *configs;

    domain::InterfaceQoSPolicy assoc;
    assoc.device_id      = device->id;
    assoc.interface_id   = iface->id;
    assoc.interface_name = iface->name;
    assoc.policy_id      = policy->id;
    assoc.direction      = request.direction;
    assoc.active         = true;

    if (openflow) {
        auto applied = deps_.sdn->apply_to_switch(sdn::switch_id_for(*device->datapath_id), *iface->port, *policy);
        if (!applied) {
            // The SDN service already reported the failure to the observer.
            spdlog::warn("Apply of policy {} on {} port {} failed: {}", policy->name, device->name, *iface->port,
                         applied.error().message);
            return failure(applied.error());
        }
        assoc.controller_policy_id = *applied;
        // Make before break: the old flows go once the new ones are in.
        if (existing && !existing->controller_policy_id.empty()) {
            if (auto rm = deps_.sdn->remove_policy(existing->controller_policy_id); !rm) {
                out.warnings.push_back(fmt::format("previous SDN policy {} not removed: {}",
                                                   existing->controller_policy_id, rm.error().message));
            }
        }
    } else {
        adapters::GenerateRequest gen;
        gen.interface_name  = iface->name;
        gen.policy_name     = policy->name;
        gen.direction       = request.direction;
        gen.algorithm       = request.algorithm;
        gen.total_bandwidth = policy->bandwidth_limit;
        gen.queues          = *configs;
        auto commands = adapter->generate(gen);
        if (!commands) return fail(commands.error());

        // The previous policy is detached in the same batch.
        if (existing) {
            auto old = deps_.policies.get(existing->policy_id);
            if (old) {
                out.commands_generated = adapter->generate_removal(iface->name, old->name, request.direction);
            } else {
                out.warnings.push_back(fmt::format("previous policy {} unknown, not detached", existing->policy_id));
            }
        }
        out.commands_generated.insert(out.commands_generated.end(), commands->begin(), commands->end());

        auto run = deps_.executor.execute(device->target(), out.commands_generated, deps_.device_timeout);
        if (!run) return fail(run.error());
        if (!run->success) {
            return fail(QosError{ErrorKind::ConfigurationExecution,
                                 fmt::format("device {} rejected the configuration", device->name),
                                 {run->output}});
        }
    }

    if (existing) {
        if (auto d = deps_.associations.deactivate(existing->id); !d) out.warnings.push_back(d.error().message);
    }
    out.association = deps_.associations.save(assoc);
    out.success     = true;
    out.message     = fmt::format("policy {} applied to {} {} ({})", policy->name, device->name, iface->name,
                                  queueing::to_string(request.algorithm));

    spdlog::info("{}", out.message);
    obs::notify(deps_.observer,
                obs::Event{obs::EventKind::PolicyApplied, policy->name, out.message, true, 0.0});
    return out;
}

// ---------------------------------------------------------------------------
// Bandwidth allocation
// ---------------------------------------------------------------------------

Result<AllocationReport> CalculateBandwidthAllocationUseCase::execute(int64_t policy_id,
                                                                      queueing::AlgorithmType algorithm) const {
    auto policy = policies_.get(policy_id);
    if (!policy) return qosctl_detail::unexpected<QosError>(policy.error());
    auto algo = queueing::make_algorithm(algorithm);
    if (!algo) return qosctl_detail::unexpected<QosError>(algo.error());
    auto configs = (*algo)->calculate(*policy);
    if (!configs) return qosctl_detail::unexpected<QosError>(configs.error());

    AllocationReport r;
    r.policy_id       = policy_id;
    r.algorithm       = algorithm;
    r.bandwidth_limit = policy->bandwidth_limit;
    for (const auto& c : *configs) r.total_guaranteed += c.queue.service_rate;
    r.remaining      = r.total_guaranteed < r.bandwidth_limit ? r.bandwidth_limit - r.total_guaranteed : 0;
    r.shares         = queueing::allocate_remaining(policy->bandwidth_limit, *configs);
    r.configurations = std::move(*configs);
    return r;
}

OperationResult ConfigureCbwfqUseCase::execute(int64_t policy_id, int64_t device_id,
                                               const std::string& interface_name,
                                               domain::Direction direction, bool reapply_if_exists) {
    return apply_.execute(ApplyRequest{policy_id, device_id, interface_name, direction,
                                       queueing::AlgorithmType::Cbwfq, reapply_if_exists});
}

Result<AllocationReport> ConfigureCbwfqUseCase::preview(int64_t policy_id) const {
    return calc_.execute(policy_id, queueing::AlgorithmType::Cbwfq);
}

OperationResult ConfigureLlqUseCase::execute(int64_t policy_id, int64_t device_id,
                                             const std::string& interface_name,
                                             domain::Direction direction, bool reapply_if_exists) {
    return apply_.execute(ApplyRequest{policy_id, device_id, interface_name, direction,
                                       queueing::AlgorithmType::Llq, reapply_if_exists});
}

Result<AllocationReport> ConfigureLlqUseCase::preview(int64_t policy_id) const {
    return calc_.execute(policy_id, queueing::AlgorithmType::Llq);
}

// ---------------------------------------------------------------------------
// RemovePolicyFromInterfaceUseCase
// ---------------------------------------------------------------------------

OperationResult RemovePolicyFromInterfaceUseCase::execute(int64_t device_id, const std::string& interface_name,
                                                          domain::Direction direction) {
    auto fail = [&](const QosError& err) {
        spdlog::warn("Removal from device {} {} failed: {}", device_id, interface_name, err.message);
        obs::notify(deps_.observer, obs::Event{obs::EventKind::ExecutionFailed, interface_name, err.message,
                                               false, 0.0});
        return failure(err);
    };

    auto device = deps_.devices.get(device_id);
    if (!device) return fail(device.error());
    auto iface = resolve_interface(*device, interface_name);
    if (!iface) return fail(iface.error());

    std::lock_guard binding(binding_locks().for_binding(device->id, iface->id, direction));
    auto existing = deps_.associations.find_active(device->id, iface->id, direction);
    if (!existing) {
        return fail(QosError{ErrorKind::PolicyNotFound,
                             fmt::format("no active policy on {} {} {}", device->name, iface->name,
                                         domain::to_string(direction)),
                             {}});
    }

    OperationResult out;
    if (device->vendor == adapters::DeviceVendor::OpenFlow) {
        if (deps_.sdn == nullptr) {
            return fail(QosError{ErrorKind::UnsupportedDevice,
                                 fmt::format("device {} needs an SDN controller", device->name), {}});
        }
        if (auto rm = deps_.sdn->remove_policy(existing->controller_policy_id); !rm) return fail(rm.error());
    } else {
        auto policy = deps_.policies.get(existing->policy_id);
        if (!policy) return fail(policy.error());
        auto adapter = adapters::make_adapter(device->vendor);
        if (!adapter) return fail(adapter.error());
        out.commands_generated = (*adapter)->generate_removal(iface->name, policy->name, direction);

        auto run = deps_.executor.execute(device->target(), out.commands_generated, deps_.device_timeout);
        if (!run) return fail(run.error());
        if (!run->success) {
            return fail(QosError{ErrorKind::ConfigurationExecution,
                                 fmt::format("device {} rejected the removal", device->name), {run->output}});
        }
    }

    if (auto d = deps_.associations.deactivate(existing->id); !d) return fail(d.error());
    existing->active = false;
    out.association  = *existing;
    out.success      = true;
    out.message      = fmt::format("policy {} removed from {} {}", existing->policy_id, device->name, iface->name);

    spdlog::info("{}", out.message);
    obs::notify(deps_.observer, obs::Event{obs::EventKind::PolicyRemoved, iface->name, out.message, true, 0.0});
    return out;
}

} // namespace qosctl::orchestration
