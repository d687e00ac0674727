#pragma once
/**
 * @file openflow.hpp
 * @brief OpenFlow value types (rules, queues, meters) and their construction
 *        from traffic classes.
 * @details Rates on queues are in bps; meter rates are in kbps (the ONOS
 *          KB_PER_SEC unit). A rule with switch_id "*" is a template that
 *          deploy() copies onto each target switch.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "qosctl/config/constants.hpp"
#include "qosctl/domain/model.hpp"

namespace qosctl::sdn {

/// OpenFlow flow priorities, highest first. Emergency sits above every class band.
enum class PriorityBand : uint32_t {
    Emergency   = config::constants::OF_PRIORITY_EMERGENCY,
    Voice       = config::constants::OF_PRIORITY_VOICE,
    Video       = config::constants::OF_PRIORITY_VIDEO,
    Interactive = config::constants::OF_PRIORITY_INTERACTIVE,
    Bulk        = config::constants::OF_PRIORITY_BULK,
    Default     = config::constants::OF_PRIORITY_DEFAULT,
};

/// Band for a QoS priority (0..7). Emergency is never derived from a class.
PriorityBand priority_band(uint8_t qos_priority) noexcept;

/// Map a QoS priority (0..7) onto the OpenFlow priority bands.
uint32_t openflow_priority(uint8_t qos_priority) noexcept;

/// Controller identifier of an OpenFlow switch ("of:" + 16 hex digits).
std::string switch_id_for(uint64_t datapath_id);

/** @struct FlowMatch
 *  @brief OpenFlow match fields; unset fields are wildcards.
 */
struct FlowMatch {
    std::optional<uint32_t> in_port;
    std::optional<uint16_t> eth_type;
    std::optional<uint8_t>  ip_proto;
    std::optional<uint16_t> tcp_dst;
    std::optional<uint16_t> udp_dst;
    std::optional<uint8_t>  ip_dscp;   ///< 6-bit code point

    bool operator==(const FlowMatch&) const = default;
};

enum class ActionType : uint8_t { SetQueue, Meter, Output };

struct FlowAction {
    ActionType  type{ActionType::Output};
    uint32_t    id{0};     ///< Queue or meter id
    std::string port;      ///< Output port ("NORMAL", "CONTROLLER", a number)

    bool operator==(const FlowAction&) const = default;
};

/** @struct OpenFlowRule
 *  @brief One flow entry.
 */
struct OpenFlowRule {
    std::string             switch_id{"*"};
    uint8_t                 table_id{0};
    uint32_t                priority{0};
    FlowMatch               match;
    std::vector<FlowAction> actions;
    std::string             flow_id;   ///< Set once the controller accepted the rule
};

/** @struct SdnQueue
 *  @brief Per-class port queue.
 */
struct SdnQueue {
    uint32_t    queue_id{0};
    uint64_t    min_rate_bps{0};
    uint64_t    max_rate_bps{0};
    uint8_t     priority{0};
    std::string name;
    uint8_t     dscp{0};
};

struct MeterBand {
    std::string type{"DROP"};
    uint64_t    rate_kbps{0};
    uint64_t    burst_kbits{0};
};

struct Meter {
    uint32_t               meter_id{0};
    std::vector<MeterBand> bands;
};

/** @struct SdnQosPolicy
 *  @brief Queues, meters and flow templates deployed as one unit.
 */
struct SdnQosPolicy {
    std::string               policy_id;
    std::string               name;
    std::string               description;
    std::vector<OpenFlowRule> flows;
    std::vector<SdnQueue>     queues;
    std::vector<Meter>        meters;
    std::vector<std::string>  switches;   ///< Filled by deploy()
    bool                      active{true};
};

/// Queue for class number @p queue_id (1-based). Unset rates fall back to 1 and 10 Mbps.
SdnQueue make_queue(uint32_t queue_id, const domain::TrafficClass& tc);

/// Single DROP-band meter capping the class at its maximum rate.
Meter make_meter(uint32_t meter_id, const domain::TrafficClass& tc);

/**
 * @brief Match for one classifier of @p tc (nullptr for a class without classifiers).
 * @details IPv4 ethertype is set whenever an IP field is matched; the class
 *          DSCP is used unless the classifier carries its own marking.
 */
FlowMatch make_match(const domain::TrafficClass& tc, const domain::TrafficClassifier* classifier);

/// Local sanity check applied before a queue is handed to a switch.
bool queue_is_valid(const SdnQueue& q) noexcept;

} // namespace qosctl::sdn
