/**
 * @file controller_api.cpp
 * @brief ONOS and OpenDaylight REST shaping.
 */
#include "qosctl/sdn/controller_api.hpp"

#include <fmt/format.h>

#include <utility>

#include "qosctl/domain/dscp.hpp"

namespace qosctl::sdn {

using json = nlohmann::json;

std::string_view to_string(ControllerType t) noexcept {
    return t == ControllerType::Onos ? "onos" : "opendaylight";
}

std::optional<ControllerType> parse_controller(std::string_view name) noexcept {
    const std::string n = domain::to_lower(name);
    if (n == "onos") return ControllerType::Onos;
    if (n == "opendaylight" || n == "odl") return ControllerType::OpenDaylight;
    return std::nullopt;
}

namespace {

Result<json> parse_body(std::string_view body, std::string_view what) {
    json doc = json::parse(body.begin(), body.end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return make_error(ErrorKind::Parse, fmt::format("{}: response is not a JSON object", what));
    }
    return doc;
}

std::string trim_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

/// Shared plumbing: base URL, credentials and request construction.
class RestApi : public ControllerApi {
protected:
    explicit RestApi(ControllerEndpoint endpoint)
        : endpoint_(std::move(endpoint)) {
        endpoint_.base_url = trim_slash(std::move(endpoint_.base_url));
    }

    HttpRequest request(HttpMethod method, std::string path, std::string body = {}) const {
        HttpRequest r;
        r.method  = method;
        r.url     = endpoint_.base_url + path;
        r.body    = std::move(body);
        r.timeout = endpoint_.timeout;
        r.headers.emplace_back("Accept", "application/json");
        if (method == HttpMethod::Post || method == HttpMethod::Put) {
            r.headers.emplace_back("Content-Type", "application/json");
        }
        if (!endpoint_.username.empty()) {
            r.headers.emplace_back("Authorization", basic_auth(endpoint_.username, endpoint_.password));
        }
        return r;
    }

    ControllerEndpoint endpoint_;
};

// ---------------------------------------------------------------------------
// ONOS
// ---------------------------------------------------------------------------

class OnosApi final : public RestApi {
public:
    explicit OnosApi(ControllerEndpoint endpoint) : RestApi(std::move(endpoint)) {}

    ControllerType type() const noexcept override { return ControllerType::Onos; }

    HttpRequest install_flow(const OpenFlowRule& rule, const std::string&) const override {
        return request(HttpMethod::Post, fmt::format("/onos/v1/flows/{}", rule.switch_id), onos_flow(rule).dump());
    }

    HttpRequest install_meter(const std::string& switch_id, const Meter& meter) const override {
        return request(HttpMethod::Post, fmt::format("/onos/v1/meters/{}", switch_id),
                       onos_meter(switch_id, meter).dump());
    }

    HttpRequest remove_flow(const std::string& switch_id, uint8_t, const std::string& flow_id) const override {
        return request(HttpMethod::Delete, fmt::format("/onos/v1/flows/{}/{}", switch_id, flow_id));
    }

    std::string installed_flow_id(const HttpResponse& response, const std::string& requested) const override {
        // ONOS answers 201 with Location: .../onos/v1/flows/<device>/<flowId>
        const auto& loc = response.location;
        const auto slash = loc.find_last_of('/');
        if (slash != std::string::npos && slash + 1 < loc.size()) return loc.substr(slash + 1);
        return requested;
    }

    std::vector<HttpRequest> topology_requests() const override {
        return {request(HttpMethod::Get, "/onos/v1/devices"), request(HttpMethod::Get, "/onos/v1/links")};
    }

    Result<Topology> parse_topology(const std::vector<std::string>& bodies) const override {
        if (bodies.size() != 2) {
            return make_error(ErrorKind::Parse, "ONOS topology needs the devices and links responses");
        }
        auto devices = parse_body(bodies[0], "ONOS devices");
        if (!devices) return qosctl_detail::unexpected<QosError>(devices.error());
        auto links = parse_body(bodies[1], "ONOS links");
        if (!links) return qosctl_detail::unexpected<QosError>(links.error());

        Topology topo;
        try {
            for (const auto& d : devices->value("devices", json::array())) {
                if (d.value("type", std::string{"SWITCH"}) != "SWITCH") continue;
                topo.switches.push_back(d.at("id").get<std::string>());
            }
            for (const auto& l : links->value("links", json::array())) {
                topo.links.push_back(Link{l.at("src").at("device").get<std::string>(),
                                          l.at("src").value("port", std::string{}),
                                          l.at("dst").at("device").get<std::string>(),
                                          l.at("dst").value("port", std::string{})});
            }
        } catch (const json::exception& e) {
            return make_error(ErrorKind::Parse, "malformed ONOS topology", {e.what()});
        }
        return topo;
    }

    HttpRequest flow_statistics(const std::string& switch_id) const override {
        return request(HttpMethod::Get, fmt::format("/onos/v1/flows/{}", switch_id));
    }

    Result<FlowStatistics> parse_flow_statistics(std::string_view body) const override {
        auto doc = parse_body(body, "ONOS flows");
        if (!doc) return qosctl_detail::unexpected<QosError>(doc.error());
        FlowStatistics s;
        try {
            for (const auto& f : doc->value("flows", json::array())) {
                ++s.flow_count;
                s.bytes   += f.value("bytes", uint64_t{0});
                s.packets += f.value("packets", uint64_t{0});
            }
        } catch (const json::exception& e) {
            return make_error(ErrorKind::Parse, "malformed ONOS flow statistics", {e.what()});
        }
        return s;
    }

    HttpRequest list_meters(const std::string& switch_id) const override {
        return request(HttpMethod::Get, fmt::format("/onos/v1/meters/{}", switch_id));
    }

    Result<std::size_t> parse_meter_count(std::string_view body) const override {
        auto doc = parse_body(body, "ONOS meters");
        if (!doc) return qosctl_detail::unexpected<QosError>(doc.error());
        const auto it = doc->find("meters");
        if (it == doc->end()) return std::size_t{0};
        if (!it->is_array()) return make_error(ErrorKind::Parse, "ONOS meters: 'meters' is not an array");
        return it->size();
    }
};

// ---------------------------------------------------------------------------
// OpenDaylight
// ---------------------------------------------------------------------------

constexpr const char* kOdlNodes = "/restconf/config/opendaylight-inventory:nodes/node";

class OdlApi final : public RestApi {
public:
    explicit OdlApi(ControllerEndpoint endpoint) : RestApi(std::move(endpoint)) {}

    ControllerType type() const noexcept override { return ControllerType::OpenDaylight; }

    HttpRequest install_flow(const OpenFlowRule& rule, const std::string& flow_id) const override {
        return request(HttpMethod::Put, flow_path(rule.switch_id, rule.table_id, flow_id),
                       odl_flow(rule, flow_id).dump());
    }

    HttpRequest install_meter(const std::string& switch_id, const Meter& meter) const override {
        return request(HttpMethod::Put,
                       fmt::format("{}/{}/flow-node-inventory:meter/{}", kOdlNodes, switch_id, meter.meter_id),
                       odl_meter(meter).dump());
    }

    HttpRequest remove_flow(const std::string& switch_id, uint8_t table_id, const std::string& flow_id) const override {
        return request(HttpMethod::Delete, flow_path(switch_id, table_id, flow_id));
    }

    std::string installed_flow_id(const HttpResponse&, const std::string& requested) const override {
        return requested;
    }

    std::vector<HttpRequest> topology_requests() const override {
        return {request(HttpMethod::Get,
                        "/restconf/operational/network-topology:network-topology/topology/flow:1")};
    }

    Result<Topology> parse_topology(const std::vector<std::string>& bodies) const override {
        if (bodies.size() != 1) return make_error(ErrorKind::Parse, "OpenDaylight topology needs one response");
        auto doc = parse_body(bodies[0], "OpenDaylight topology");
        if (!doc) return qosctl_detail::unexpected<QosError>(doc.error());

        Topology topo;
        try {
            for (const auto& t : doc->value("topology", json::array())) {
                for (const auto& n : t.value("node", json::array())) {
                    auto id = n.at("node-id").get<std::string>();
                    // Hosts show up as "host:<mac>" nodes.
                    if (id.rfind("openflow:", 0) == 0) topo.switches.push_back(std::move(id));
                }
                for (const auto& l : t.value("link", json::array())) {
                    topo.links.push_back(Link{l.at("source").at("source-node").get<std::string>(),
                                              l.at("source").value("source-tp", std::string{}),
                                              l.at("destination").at("dest-node").get<std::string>(),
                                              l.at("destination").value("dest-tp", std::string{})});
                }
            }
        } catch (const json::exception& e) {
            return make_error(ErrorKind::Parse, "malformed OpenDaylight topology", {e.what()});
        }
        return topo;
    }

    HttpRequest flow_statistics(const std::string& switch_id) const override {
        return request(HttpMethod::Get,
                       fmt::format("/restconf/operational/opendaylight-inventory:nodes/node/{}/flow-node-inventory:table/0",
                                   switch_id));
    }

    Result<FlowStatistics> parse_flow_statistics(std::string_view body) const override {
        auto doc = parse_body(body, "OpenDaylight table");
        if (!doc) return qosctl_detail::unexpected<QosError>(doc.error());
        FlowStatistics s;
        try {
            for (const auto& table : doc->value("flow-node-inventory:table", json::array())) {
                for (const auto& f : table.value("flow", json::array())) {
                    ++s.flow_count;
                    const auto st = f.value("opendaylight-flow-statistics:flow-statistics", json::object());
                    s.bytes   += st.value("byte-count", uint64_t{0});
                    s.packets += st.value("packet-count", uint64_t{0});
                }
            }
        } catch (const json::exception& e) {
            return make_error(ErrorKind::Parse, "malformed OpenDaylight flow statistics", {e.what()});
        }
        return s;
    }

    HttpRequest list_meters(const std::string& switch_id) const override {
        return request(HttpMethod::Get, fmt::format("{}/{}", kOdlNodes, switch_id));
    }

    Result<std::size_t> parse_meter_count(std::string_view body) const override {
        auto doc = parse_body(body, "OpenDaylight node");
        if (!doc) return qosctl_detail::unexpected<QosError>(doc.error());
        std::size_t count = 0;
        try {
            for (const auto& node : doc->value("node", json::array())) {
                count += node.value("flow-node-inventory:meter", json::array()).size();
            }
        } catch (const json::exception& e) {
            return make_error(ErrorKind::Parse, "malformed OpenDaylight node", {e.what()});
        }
        return count;
    }

private:
    static std::string flow_path(const std::string& switch_id, uint8_t table_id, const std::string& flow_id) {
        return fmt::format("{}/{}/flow-node-inventory:table/{}/flow/{}", kOdlNodes, switch_id, table_id, flow_id);
    }
};

} // namespace

std::unique_ptr<ControllerApi> make_controller_api(ControllerType type, ControllerEndpoint endpoint) {
    if (type == ControllerType::OpenDaylight) return std::make_unique<OdlApi>(std::move(endpoint));
    return std::make_unique<OnosApi>(std::move(endpoint));
}

// ---------------------------------------------------------------------------
// Payloads
// ---------------------------------------------------------------------------

json onos_flow(const OpenFlowRule& rule) {
    json criteria = json::array();
    const auto& m = rule.match;
    if (m.in_port)  criteria.push_back({{"type", "IN_PORT"}, {"port", std::to_string(*m.in_port)}});
    if (m.eth_type) criteria.push_back({{"type", "ETH_TYPE"}, {"ethType", fmt::format("{:#x}", *m.eth_type)}});
    if (m.ip_proto) criteria.push_back({{"type", "IP_PROTO"}, {"protocol", *m.ip_proto}});
    if (m.ip_dscp)  criteria.push_back({{"type", "IP_DSCP"}, {"ipDscp", *m.ip_dscp}});
    if (m.tcp_dst)  criteria.push_back({{"type", "TCP_DST"}, {"tcpPort", *m.tcp_dst}});
    if (m.udp_dst)  criteria.push_back({{"type", "UDP_DST"}, {"udpPort", *m.udp_dst}});

    json instructions = json::array();
    for (const auto& a : rule.actions) {
        switch (a.type) {
            case ActionType::SetQueue: instructions.push_back({{"type", "QUEUE"}, {"queueId", a.id}}); break;
            case ActionType::Meter:    instructions.push_back({{"type", "METER"}, {"meterId", std::to_string(a.id)}}); break;
            case ActionType::Output:   instructions.push_back({{"type", "OUTPUT"}, {"port", a.port}}); break;
        }
    }

    return json{
        {"priority", rule.priority},
        {"timeout", 0},
        {"isPermanent", true},
        {"deviceId", rule.switch_id},
        {"tableId", rule.table_id},
        {"selector", {{"criteria", std::move(criteria)}}},
        {"treatment", {{"instructions", std::move(instructions)}}},
    };
}

json onos_meter(const std::string& switch_id, const Meter& meter) {
    json bands = json::array();
    for (const auto& b : meter.bands) {
        bands.push_back({{"type", b.type}, {"rate", b.rate_kbps}, {"burstSize", b.burst_kbits}});
    }
    return json{
        {"deviceId", switch_id},
        {"unit", "KB_PER_SEC"},
        {"burst", true},
        {"bands", std::move(bands)},
    };
}

json odl_flow(const OpenFlowRule& rule, const std::string& flow_id) {
    const auto& m = rule.match;
    json match = json::object();
    if (m.in_port)  match["in-port"] = fmt::format("{}:{}", rule.switch_id, *m.in_port);
    if (m.eth_type) match["ethernet-match"] = {{"ethernet-type", {{"type", *m.eth_type}}}};
    if (m.ip_proto || m.ip_dscp) {
        json ip = json::object();
        if (m.ip_proto) ip["ip-protocol"] = *m.ip_proto;
        if (m.ip_dscp)  ip["ip-dscp"] = *m.ip_dscp;
        match["ip-match"] = std::move(ip);
    }
    if (m.tcp_dst) match["tcp-destination-port"] = *m.tcp_dst;
    if (m.udp_dst) match["udp-destination-port"] = *m.udp_dst;

    json instructions = json::array();
    json apply = json::array();
    for (const auto& a : rule.actions) {
        switch (a.type) {
            case ActionType::Meter:
                instructions.push_back({{"order", instructions.size()}, {"meter", {{"meter-id", a.id}}}});
                break;
            case ActionType::SetQueue:
                apply.push_back({{"order", apply.size()}, {"set-queue-action", {{"queue-id", a.id}}}});
                break;
            case ActionType::Output:
                apply.push_back({{"order", apply.size()}, {"output-action", {{"output-node-connector", a.port}}}});
                break;
        }
    }
    if (!apply.empty()) {
        instructions.push_back({{"order", instructions.size()}, {"apply-actions", {{"action", std::move(apply)}}}});
    }

    return json{{"flow-node-inventory:flow", json::array({json{
        {"id", flow_id},
        {"table_id", rule.table_id},
        {"priority", rule.priority},
        {"match", std::move(match)},
        {"instructions", {{"instruction", std::move(instructions)}}},
    }})}};
}

json odl_meter(const Meter& meter) {
    json headers = json::array();
    for (const auto& b : meter.bands) {
        headers.push_back({
            {"band-id", headers.size()},
            {"drop-rate", b.rate_kbps},
            {"drop-burst-size", b.burst_kbits},
            {"meter-band-types", {{"flags", "ofpmbt-drop"}}},
        });
    }
    return json{{"flow-node-inventory:meter", json::array({json{
        {"meter-id", meter.meter_id},
        {"flags", "meter-kbps meter-burst"},
        {"meter-band-headers", {{"meter-band-header", std::move(headers)}}},
    }})}};
}

} // namespace qosctl::sdn
