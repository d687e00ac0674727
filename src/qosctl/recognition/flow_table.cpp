/**
 * @file flow_table.cpp
 * @brief Flow key hashing and sharded flow bookkeeping.
 */
#include "qosctl/recognition/flow_table.hpp"

#include <algorithm>

namespace qosctl::recognition {

namespace {

constexpr uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr uint64_t kFnvPrime  = 1099511628211ULL;

inline void fnv_mix(uint64_t& h, const void* data, std::size_t n) noexcept {
    const auto* p = static_cast<const uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
        h ^= p[i];
        h *= kFnvPrime;
    }
}

} // namespace

std::size_t FlowKeyHash::operator()(const FlowKey& k) const noexcept {
    uint64_t h = kFnvOffset;
    fnv_mix(h, k.source_ip.data(), k.source_ip.size());
    fnv_mix(h, "|", 1);
    fnv_mix(h, k.destination_ip.data(), k.destination_ip.size());
    fnv_mix(h, &k.source_port, sizeof(k.source_port));
    fnv_mix(h, &k.destination_port, sizeof(k.destination_port));
    const auto proto = static_cast<uint8_t>(k.protocol);
    fnv_mix(h, &proto, sizeof(proto));
    return static_cast<std::size_t>(h);
}

FlowTable::FlowTable(FlowTableConfig cfg) : cfg_(cfg) {
    cfg_.shards = std::max<std::size_t>(1, cfg_.shards);
    shards_.reserve(cfg_.shards);
    for (std::size_t i = 0; i < cfg_.shards; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

FlowTable::Shard& FlowTable::shard_for(const FlowKey& key) const noexcept {
    return *shards_[FlowKeyHash{}(key) % shards_.size()];
}

TrafficFlow FlowTable::observe(const PacketObservation& packet, Clock::time_point now) {
    FlowKey key = FlowKey::of(packet);
    Shard& shard = shard_for(key);

    std::lock_guard<std::mutex> lk(shard.mu);
    auto it = shard.flows.find(key);
    if (it == shard.flows.end()) {
        TrafficFlow flow;
        flow.key        = key;
        flow.first_seen = now;
        flow.last_seen  = now;
        flow.packets    = 1;
        flow.bytes      = packet.packet_size;
        if (!packet.payload.empty() && cfg_.max_payload_samples > 0) {
            flow.payload_samples.push_back(packet.payload.substr(0, cfg_.payload_sample_bytes));
        }
        flow.headers = packet.headers;
        it = shard.flows.emplace(std::move(key), std::move(flow)).first;
        return it->second;
    }

    TrafficFlow& flow = it->second;
    flow.last_seen = std::max(flow.last_seen, now);
    flow.packets += 1;
    flow.bytes   += packet.packet_size;
    if (!packet.payload.empty() && flow.payload_samples.size() < cfg_.max_payload_samples) {
        flow.payload_samples.push_back(packet.payload.substr(0, cfg_.payload_sample_bytes));
    }
    return flow;
}

std::optional<TrafficFlow> FlowTable::find(const FlowKey& key) const {
    const Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lk(shard.mu);
    const auto it = shard.flows.find(key);
    if (it == shard.flows.end()) return std::nullopt;
    return it->second;
}

std::size_t FlowTable::evict_older_than(Clock::time_point cutoff) {
    std::size_t removed = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lk(shard->mu);
        removed += std::erase_if(shard->flows, [cutoff](const auto& kv) {
            return kv.second.last_seen < cutoff;
        });
    }
    return removed;
}

std::size_t FlowTable::size() const {
    std::size_t n = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lk(shard->mu);
        n += shard->flows.size();
    }
    return n;
}

} // namespace qosctl::recognition
