/**
 * @file openflow.cpp
 * @brief Priority bands and per-class queue/meter/match construction.
 */
#include "qosctl/sdn/openflow.hpp"

#include <fmt/format.h>

#include "qosctl/config/constants.hpp"
#include "qosctl/domain/dscp.hpp"

namespace qosctl::sdn {

namespace k = config::constants;

PriorityBand priority_band(uint8_t qos_priority) noexcept {
    switch (qos_priority) {
        case 7:         return PriorityBand::Voice;
        case 6: case 5: return PriorityBand::Video;
        case 4: case 3: return PriorityBand::Interactive;
        case 2: case 1: return PriorityBand::Bulk;
        default:        return PriorityBand::Default;
    }
}

uint32_t openflow_priority(uint8_t qos_priority) noexcept {
    return static_cast<uint32_t>(priority_band(qos_priority));
}

std::string switch_id_for(uint64_t datapath_id) {
    return fmt::format("of:{:016x}", datapath_id);
}

SdnQueue make_queue(uint32_t queue_id, const domain::TrafficClass& tc) {
    SdnQueue q;
    q.queue_id     = queue_id;
    q.min_rate_bps = tc.min_bandwidth > 0 ? uint64_t{tc.min_bandwidth} * 1000 : k::SDN_DEFAULT_MIN_RATE_BPS;
    q.max_rate_bps = tc.max_bandwidth > 0 ? uint64_t{tc.max_bandwidth} * 1000 : k::SDN_DEFAULT_MAX_RATE_BPS;
    q.priority     = tc.priority;
    q.name         = tc.name.empty() ? fmt::format("queue_{}", queue_id) : tc.name;
    q.dscp         = domain::dscp_code_point(tc.dscp).value_or(0);
    return q;
}

Meter make_meter(uint32_t meter_id, const domain::TrafficClass& tc) {
    MeterBand band;
    band.rate_kbps   = tc.max_bandwidth > 0 ? tc.max_bandwidth : k::SDN_DEFAULT_MAX_RATE_BPS / 1000;
    band.burst_kbits = tc.burst > 0 ? uint64_t{tc.burst} * 8 : k::SDN_DEFAULT_METER_BURST_BITS / 1000;
    return Meter{meter_id, {band}};
}

FlowMatch make_match(const domain::TrafficClass& tc, const domain::TrafficClassifier* classifier) {
    FlowMatch m;
    std::optional<uint8_t> dscp;
    if (tc.has_dscp()) dscp = domain::dscp_code_point(tc.dscp);

    if (classifier != nullptr) {
        const auto proto = classifier->protocol;
        if (proto != domain::Protocol::Any) m.ip_proto = domain::protocol_number(proto);

        const auto& ports = classifier->destination_ports;
        if (ports && ports->start != 0) {
            // OpenFlow 1.3 has no port ranges; the first port of a range is matched.
            if (proto == domain::Protocol::Tcp) m.tcp_dst = ports->start;
            if (proto == domain::Protocol::Udp) m.udp_dst = ports->start;
        }
        if (classifier->dscp_marking) {
            if (const auto cp = domain::dscp_code_point(*classifier->dscp_marking)) dscp = cp;
        }
    }
    m.ip_dscp = dscp;
    if (m.ip_proto || m.ip_dscp) m.eth_type = k::ETH_TYPE_IPV4;
    return m;
}

bool queue_is_valid(const SdnQueue& q) noexcept {
    return q.queue_id > 0 && q.max_rate_bps > 0 && q.min_rate_bps <= q.max_rate_bps;
}

} // namespace qosctl::sdn
