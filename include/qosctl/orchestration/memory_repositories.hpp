#pragma once
/**
 * @file memory_repositories.hpp
 * @brief Process-local repositories (demo, tests, embedding without a database).
 * @details Read-mostly maps published as immutable snapshots: readers load the
 *          current shared_ptr and never block; writers copy, mutate and swap
 *          under a mutex that only serialises writers.
 */

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "qosctl/orchestration/repositories.hpp"

namespace qosctl::orchestration {

/**
 * @class SnapshotStore
 * @brief id -> record map with copy-on-write snapshots.
 */
template <class T>
class SnapshotStore {
public:
    using Map = std::map<int64_t, T>;

    std::shared_ptr<const Map> snapshot() const noexcept {
        return std::atomic_load_explicit(&map_, std::memory_order_acquire);
    }

    std::optional<T> find(int64_t id) const {
        auto snap = snapshot();
        auto it = snap->find(id);
        if (it == snap->end()) return std::nullopt;
        return it->second;
    }

    /// Apply @p fn to a private copy and publish it. Returns what @p fn returns.
    template <class Fn>
    auto mutate(Fn&& fn) {
        std::lock_guard lk(write_mu_);
        auto next = std::make_shared<Map>(*snapshot());
        auto out = fn(*next);
        std::shared_ptr<const Map> cnext = std::move(next);
        std::atomic_store_explicit(&map_, std::move(cnext), std::memory_order_release);
        return out;
    }

    int64_t next_id() noexcept { return ++last_id_; }

    /// Keep generated ids above an explicitly chosen one.
    void observe_id(int64_t id) noexcept {
        int64_t cur = last_id_.load(std::memory_order_relaxed);
        while (id > cur && !last_id_.compare_exchange_weak(cur, id)) {}
    }

private:
    std::shared_ptr<const Map> map_{std::make_shared<Map>()};
    std::mutex                 write_mu_;
    std::atomic<int64_t>       last_id_{0};
};

class InMemoryPolicyRepository final : public PolicyRepository {
public:
    Result<domain::QoSPolicy> get(int64_t policy_id) const override;
    int64_t save(domain::QoSPolicy policy) override;
    std::vector<domain::QoSPolicy> list() const override;
    bool remove(int64_t policy_id) override;

private:
    SnapshotStore<domain::QoSPolicy> store_;
};

class InMemoryDeviceRepository final : public NetworkDeviceRepository {
public:
    Result<NetworkDevice> get(int64_t device_id) const override;
    int64_t save(NetworkDevice device) override;
    std::vector<NetworkDevice> list() const override;

private:
    SnapshotStore<NetworkDevice> store_;
};

class InMemoryAssociationRepository final : public InterfaceQoSPolicyRepository {
public:
    std::optional<domain::InterfaceQoSPolicy>
    find_active(int64_t device_id, int64_t interface_id, domain::Direction direction) const override;
    std::vector<domain::InterfaceQoSPolicy> find_by_policy(int64_t policy_id) const override;
    domain::InterfaceQoSPolicy save(domain::InterfaceQoSPolicy association) override;
    Result<void> deactivate(int64_t association_id) override;

    /// Every record, active or not, in id order.
    std::vector<domain::InterfaceQoSPolicy> all() const;

private:
    SnapshotStore<domain::InterfaceQoSPolicy> store_;
};

} // namespace qosctl::orchestration
