/**
 * @file memory_repositories.cpp
 * @brief Snapshot-backed repositories.
 */
#include "qosctl/orchestration/memory_repositories.hpp"

#include <fmt/format.h>

#include <utility>

namespace qosctl::orchestration {

//------------------------------- Policies -------------------------------------

Result<domain::QoSPolicy> InMemoryPolicyRepository::get(int64_t policy_id) const {
    auto p = store_.find(policy_id);
    if (!p) return make_error(ErrorKind::PolicyNotFound, fmt::format("policy {} not found", policy_id));
    return *p;
}

int64_t InMemoryPolicyRepository::save(domain::QoSPolicy policy) {
    if (policy.id == 0) policy.id = store_.next_id();
    else store_.observe_id(policy.id);
    return store_.mutate([&](auto& m) {
        const int64_t id = policy.id;
        m.insert_or_assign(id, std::move(policy));
        return id;
    });
}

std::vector<domain::QoSPolicy> InMemoryPolicyRepository::list() const {
    std::vector<domain::QoSPolicy> out;
    for (const auto& [id, p] : *store_.snapshot()) out.push_back(p);
    return out;
}

bool InMemoryPolicyRepository::remove(int64_t policy_id) {
    return store_.mutate([&](auto& m) { return m.erase(policy_id) > 0; });
}

//------------------------------- Devices --------------------------------------

Result<NetworkDevice> InMemoryDeviceRepository::get(int64_t device_id) const {
    auto d = store_.find(device_id);
    if (!d) return make_error(ErrorKind::DeviceNotFound, fmt::format("device {} not found", device_id));
    return *d;
}

int64_t InMemoryDeviceRepository::save(NetworkDevice device) {
    if (device.id == 0) device.id = store_.next_id();
    else store_.observe_id(device.id);
    return store_.mutate([&](auto& m) {
        const int64_t id = device.id;
        m.insert_or_assign(id, std::move(device));
        return id;
    });
}

std::vector<NetworkDevice> InMemoryDeviceRepository::list() const {
    std::vector<NetworkDevice> out;
    for (const auto& [id, d] : *store_.snapshot()) out.push_back(d);
    return out;
}

//------------------------------- Associations ---------------------------------

std::optional<domain::InterfaceQoSPolicy>
InMemoryAssociationRepository::find_active(int64_t device_id, int64_t interface_id,
                                           domain::Direction direction) const {
    for (const auto& [id, a] : *store_.snapshot()) {
        if (a.active && a.device_id == device_id && a.interface_id == interface_id && a.direction == direction) {
            return a;
        }
    }
    return std::nullopt;
}

std::vector<domain::InterfaceQoSPolicy> InMemoryAssociationRepository::find_by_policy(int64_t policy_id) const {
    std::vector<domain::InterfaceQoSPolicy> out;
    for (const auto& [id, a] : *store_.snapshot()) {
        if (a.active && a.policy_id == policy_id) out.push_back(a);
    }
    return out;
}

domain::InterfaceQoSPolicy InMemoryAssociationRepository::save(domain::InterfaceQoSPolicy association) {
    if (association.id == 0) association.id = store_.next_id();
    else store_.observe_id(association.id);
    return store_.mutate([&](auto& m) {
        m.insert_or_assign(association.id, association);
        return association;
    });
}

Result<void> InMemoryAssociationRepository::deactivate(int64_t association_id) {
    const bool found = store_.mutate([&](auto& m) {
        auto it = m.find(association_id);
        if (it == m.end()) return false;
        it->second.active = false;
        return true;
    });
    if (!found) {
        return make_error(ErrorKind::PolicyNotFound, fmt::format("association {} not found", association_id));
    }
    return {};
}

std::vector<domain::InterfaceQoSPolicy> InMemoryAssociationRepository::all() const {
    std::vector<domain::InterfaceQoSPolicy> out;
    for (const auto& [id, a] : *store_.snapshot()) out.push_back(a);
    return out;
}

} // namespace qosctl::orchestration
