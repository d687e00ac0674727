#pragma once
/**
 * @file controller_api.hpp
 * @brief REST payload shaping for ONOS and OpenDaylight controllers.
 * @details A ControllerApi turns rules, meters and queries into HttpRequests
 *          and parses the replies. It never sends anything itself.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "qosctl/domain/errors.hpp"
#include "qosctl/sdn/http_client.hpp"
#include "qosctl/sdn/openflow.hpp"

namespace qosctl::sdn {

enum class ControllerType : uint8_t { Onos, OpenDaylight };

std::string_view to_string(ControllerType t) noexcept;
/// Case-insensitive; accepts "onos", "opendaylight" / "odl".
std::optional<ControllerType> parse_controller(std::string_view name) noexcept;

/** @struct Link
 *  @brief Directed switch-to-switch link reported by the controller.
 */
struct Link {
    std::string src_switch;
    std::string src_port;
    std::string dst_switch;
    std::string dst_port;

    bool operator==(const Link&) const = default;
};

struct Topology {
    std::vector<std::string> switches;
    std::vector<Link>        links;
};

/// Flow counters read back from one switch.
struct FlowStatistics {
    uint64_t flow_count{0};
    uint64_t bytes{0};
    uint64_t packets{0};
};

/// Where and how to reach the controller.
struct ControllerEndpoint {
    std::string               base_url;   ///< Trailing '/' is ignored
    std::string               username;
    std::string               password;
    std::chrono::milliseconds timeout{5000};
};

class ControllerApi {
public:
    virtual ~ControllerApi() = default;

    virtual ControllerType type() const noexcept = 0;

    /// Install @p rule (switch_id must be concrete) under @p flow_id.
    virtual HttpRequest install_flow(const OpenFlowRule& rule, const std::string& flow_id) const = 0;
    virtual HttpRequest install_meter(const std::string& switch_id, const Meter& meter) const = 0;
    virtual HttpRequest remove_flow(const std::string& switch_id, uint8_t table_id,
                                    const std::string& flow_id) const = 0;

    /// Id the controller stored an accepted flow under; @p requested when it echoes none.
    virtual std::string installed_flow_id(const HttpResponse& response, const std::string& requested) const = 0;

    /// Requests whose bodies, in order, make up the topology.
    virtual std::vector<HttpRequest> topology_requests() const = 0;
    virtual Result<Topology> parse_topology(const std::vector<std::string>& bodies) const = 0;

    virtual HttpRequest flow_statistics(const std::string& switch_id) const = 0;
    virtual Result<FlowStatistics> parse_flow_statistics(std::string_view body) const = 0;

    virtual HttpRequest list_meters(const std::string& switch_id) const = 0;
    virtual Result<std::size_t> parse_meter_count(std::string_view body) const = 0;
};

std::unique_ptr<ControllerApi> make_controller_api(ControllerType type, ControllerEndpoint endpoint);

// ---------------------------------------------------------------------------
// Payload builders, exposed for tests and tooling
// ---------------------------------------------------------------------------

/// ONOS flow rule: priority, timeout, isPermanent, deviceId, tableId, selector, treatment.
nlohmann::json onos_flow(const OpenFlowRule& rule);
/// ONOS meter: deviceId, unit, burst, bands[{type, rate, burstSize}].
nlohmann::json onos_meter(const std::string& switch_id, const Meter& meter);

/// OpenDaylight inventory flow (`flow-node-inventory:flow` list with one entry).
nlohmann::json odl_flow(const OpenFlowRule& rule, const std::string& flow_id);
/// OpenDaylight inventory meter with one drop band.
nlohmann::json odl_meter(const Meter& meter);

} // namespace qosctl::sdn
