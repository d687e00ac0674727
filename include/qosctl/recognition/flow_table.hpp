#pragma once
/**
 * @file flow_table.hpp
 * @brief Sharded live-flow table for application recognition.
 * @details Flows are keyed by their 5-tuple and spread over N shards by the
 *          FNV-1a hash of the key; each shard has its own mutex, so packets of
 *          unrelated flows never contend. Callers receive snapshots (copies),
 *          never references into a shard.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "qosctl/domain/model.hpp"

namespace qosctl::recognition {

using Clock = std::chrono::steady_clock;

/**
 * @struct PacketObservation
 * @brief One observed packet as handed to the recognition service.
 */
struct PacketObservation {
    std::string        source_ip;
    std::string        destination_ip;
    uint16_t           source_port{0};
    uint16_t           destination_port{0};
    domain::Protocol   protocol{domain::Protocol::Any};
    uint32_t           packet_size{0};   ///< Bytes on the wire
    std::string        payload;          ///< Raw payload bytes (may be empty)
    std::map<std::string, std::string> headers; ///< Application headers, if parsed upstream
};

/** @struct FlowKey
 *  @brief Directional 5-tuple.
 */
struct FlowKey {
    std::string      source_ip;
    std::string      destination_ip;
    uint16_t         source_port{0};
    uint16_t         destination_port{0};
    domain::Protocol protocol{domain::Protocol::Any};

    bool operator==(const FlowKey&) const = default;

    static FlowKey of(const PacketObservation& p) {
        return FlowKey{p.source_ip, p.destination_ip, p.source_port, p.destination_port, p.protocol};
    }
};

/// 64-bit FNV-1a over the key fields.
struct FlowKeyHash {
    std::size_t operator()(const FlowKey& k) const noexcept;
};

/**
 * @struct TrafficFlow
 * @brief Runtime state of one flow.
 */
struct TrafficFlow {
    FlowKey                            key;
    Clock::time_point                  first_seen{};
    Clock::time_point                  last_seen{};
    uint64_t                           packets{0};
    uint64_t                           bytes{0};
    std::vector<std::string>           payload_samples; ///< Bounded payload prefixes
    std::map<std::string, std::string> headers;         ///< Captured from the first packet
};

/** @struct FlowTableConfig
 *  @brief Retention bounds of the flow table.
 */
struct FlowTableConfig {
    std::size_t shards{16};               ///< Lock shards (>= 1)
    std::size_t max_payload_samples{10};  ///< Samples kept per flow
    std::size_t payload_sample_bytes{200};///< Prefix length kept per sample
};

/**
 * @class FlowTable
 * @brief Thread-safe 5-tuple -> TrafficFlow map.
 */
class FlowTable {
public:
    explicit FlowTable(FlowTableConfig cfg = {});

    FlowTable(const FlowTable&) = delete;
    FlowTable& operator=(const FlowTable&) = delete;

    /**
     * @brief Create or update the flow a packet belongs to.
     * @details A new flow records its first payload prefix and the packet's
     *          headers. An existing flow bumps counters and last_seen, and keeps
     *          appending payload prefixes until the sample bound is reached.
     * @return Snapshot of the flow after the update.
     */
    TrafficFlow observe(const PacketObservation& packet, Clock::time_point now);

    /// Snapshot of a flow, if present.
    std::optional<TrafficFlow> find(const FlowKey& key) const;

    /// Remove flows whose last_seen is before @p cutoff; returns the number removed.
    std::size_t evict_older_than(Clock::time_point cutoff);

    /// Number of live flows (sums every shard).
    std::size_t size() const;

    const FlowTableConfig& config() const noexcept { return cfg_; }

private:
    struct Shard {
        mutable std::mutex mu;
        std::unordered_map<FlowKey, TrafficFlow, FlowKeyHash> flows;
    };

    Shard& shard_for(const FlowKey& key) const noexcept;

    FlowTableConfig                     cfg_;
    std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace qosctl::recognition
