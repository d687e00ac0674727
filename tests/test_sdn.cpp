/**
 * @file test_sdn.cpp
 * @brief Tests for OpenFlow policy construction, controller payloads and deployment.
 *
 * Validates:
 *  - Priority bands and per-class queues / meters / matches
 *  - ONOS and OpenDaylight payload and request shaping, topology parsing
 *  - Success rate with the strict > 0.8 threshold (4 of 5 switches fails)
 *  - Flows skipped on a switch whose meter or queue was rejected
 *  - Cancellation, read retries, monitoring, single-switch apply and removal
 *  - Concurrency bounded by max_workers
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <mutex>
#include <set>
#include <stop_token>
#include <thread>

#include "qosctl/sdn/sdn_service.hpp"

using namespace qosctl::sdn;
using qosctl::ErrorKind;
using qosctl::Result;
using qosctl::domain::PortRange;
using qosctl::domain::Protocol;
using qosctl::domain::QoSPolicy;
using qosctl::domain::TrafficClass;
using qosctl::domain::TrafficClassifier;

namespace {

/// Scripted controller; every request is recorded.
class FakeController : public HttpClient {
public:
  using Handler = std::function<Result<HttpResponse>(const HttpRequest&)>;

  explicit FakeController(Handler h = {}) : handler_(std::move(h)) {}

  Result<HttpResponse> send(const HttpRequest& r) override {
    std::lock_guard lk(mu_);
    requests_.push_back(r);
    if (handler_) return handler_(r);
    return HttpResponse{r.method == HttpMethod::Get ? 200 : 201, "{}", {}};
  }

  std::size_t count(HttpMethod m, const std::string& url_part) const {
    std::lock_guard lk(mu_);
    return static_cast<std::size_t>(std::count_if(requests_.begin(), requests_.end(), [&](const HttpRequest& r) {
      return r.method == m && r.url.find(url_part) != std::string::npos;
    }));
  }

  std::vector<HttpRequest> requests() const {
    std::lock_guard lk(mu_);
    return requests_;
  }

private:
  Handler                  handler_;
  mutable std::mutex       mu_;
  std::vector<HttpRequest> requests_;
};

/// Accepts every request after a short delay; tracks the peak number of
/// switches with a request in flight.
class PeakTrackingController : public HttpClient {
public:
  Result<HttpResponse> send(const HttpRequest& r) override {
    const std::string sw = switch_of(r.url);
    {
      std::lock_guard lk(mu_);
      in_flight_.insert(sw);
      peak_ = std::max(peak_, in_flight_.size());
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    {
      std::lock_guard lk(mu_);
      in_flight_.erase(in_flight_.find(sw));
    }
    return HttpResponse{r.method == HttpMethod::Get ? 200 : 201, "{}", {}};
  }

  std::size_t peak() const {
    std::lock_guard lk(mu_);
    return peak_;
  }

private:
  static std::string switch_of(const std::string& url) {
    const auto at = url.find("of:");
    return at == std::string::npos ? url : url.substr(at, 19);
  }

  mutable std::mutex         mu_;
  std::multiset<std::string> in_flight_;
  std::size_t                peak_{0};
};

HttpResponse ok(std::string body = "{}") { return HttpResponse{200, std::move(body), {}}; }
HttpResponse created() { return HttpResponse{201, {}, {}}; }
HttpResponse status(int code) { return HttpResponse{code, {}, {}}; }

SdnConfig test_config() {
  SdnConfig cfg;
  cfg.url = "http://ctl:8181";
  return cfg;
}

std::vector<TrafficClass> voice_bulk() {
  TrafficClass voice;
  voice.name          = "voice";
  voice.priority      = 7;
  voice.min_bandwidth = 200;
  voice.max_bandwidth = 400;
  voice.dscp          = "EF";
  TrafficClassifier sip;
  sip.protocol          = Protocol::Udp;
  sip.destination_ports = PortRange{5060, 5060};
  voice.classifiers.push_back(sip);

  TrafficClass bulk;
  bulk.name     = "bulk";
  bulk.priority = 2;
  return {voice, bulk};
}

std::vector<std::string> switches(std::size_t n) {
  std::vector<std::string> out;
  for (std::size_t i = 1; i <= n; ++i) out.push_back(switch_id_for(i));
  return out;
}

} // namespace

// --------------------------- Policy construction ----------------------------

/**
 * @test Priority_Bands
 * @brief QoS priorities map onto the OpenFlow bands; ids are hex datapath ids.
 */
TEST(OpenFlow, Priority_Bands) {
  EXPECT_EQ(openflow_priority(7), 50000u);
  EXPECT_EQ(openflow_priority(6), 40000u);
  EXPECT_EQ(openflow_priority(5), 40000u);
  EXPECT_EQ(openflow_priority(4), 30000u);
  EXPECT_EQ(openflow_priority(3), 30000u);
  EXPECT_EQ(openflow_priority(2), 20000u);
  EXPECT_EQ(openflow_priority(1), 20000u);
  EXPECT_EQ(openflow_priority(0), 10000u);
  EXPECT_EQ(priority_band(7), qosctl::sdn::PriorityBand::Voice);
  EXPECT_EQ(priority_band(0), qosctl::sdn::PriorityBand::Default);
  EXPECT_EQ(static_cast<uint32_t>(qosctl::sdn::PriorityBand::Emergency), 65000u);
  for (uint8_t p = 0; p <= 7; ++p) {
    EXPECT_LT(openflow_priority(p), static_cast<uint32_t>(qosctl::sdn::PriorityBand::Emergency));
  }
  EXPECT_EQ(switch_id_for(1), "of:0000000000000001");
  EXPECT_EQ(switch_id_for(0x2a), "of:000000000000002a");
}

/**
 * @test Te_Policy_Per_Class
 * @brief One queue and meter per class, one flow per classifier, defaults for unset rates.
 */
TEST(OpenFlow, Te_Policy_Per_Class) {
  FakeController http;
  SdnService svc(test_config(), http);
  const auto p = svc.create_traffic_engineering_policy("corp", voice_bulk());

  EXPECT_EQ(p.policy_id.rfind("te_corp_", 0), 0u);
  ASSERT_EQ(p.queues.size(), 2u);
  EXPECT_EQ(p.queues[0].queue_id, 1u);
  EXPECT_EQ(p.queues[0].min_rate_bps, 200000u);
  EXPECT_EQ(p.queues[0].max_rate_bps, 400000u);
  EXPECT_EQ(p.queues[0].dscp, 46);
  EXPECT_EQ(p.queues[1].min_rate_bps, 1000000u);
  EXPECT_EQ(p.queues[1].max_rate_bps, 10000000u);

  ASSERT_EQ(p.meters.size(), 2u);
  EXPECT_EQ(p.meters[0].bands.front().rate_kbps, 400u);
  EXPECT_EQ(p.meters[0].bands.front().burst_kbits, 1000u);
  EXPECT_EQ(p.meters[1].bands.front().rate_kbps, 10000u);

  ASSERT_EQ(p.flows.size(), 2u);
  const auto& voice = p.flows[0];
  EXPECT_EQ(voice.switch_id, "*");
  EXPECT_EQ(voice.priority, 50000u);
  EXPECT_EQ(voice.match.eth_type, uint16_t{0x0800});
  EXPECT_EQ(voice.match.ip_proto, uint8_t{17});
  EXPECT_EQ(voice.match.udp_dst, uint16_t{5060});
  EXPECT_EQ(voice.match.ip_dscp, uint8_t{46});
  ASSERT_EQ(voice.actions.size(), 3u);
  EXPECT_EQ(voice.actions[0], (FlowAction{ActionType::SetQueue, 1, {}}));
  EXPECT_EQ(voice.actions[1], (FlowAction{ActionType::Meter, 1, {}}));
  EXPECT_EQ(voice.actions[2].port, "NORMAL");

  // No classifier and no DSCP: match-all flow.
  EXPECT_EQ(p.flows[1].priority, 20000u);
  EXPECT_EQ(p.flows[1].match, FlowMatch{});
}

// --------------------------- Payloads ---------------------------------------

/**
 * @test Onos_Payloads
 * @brief Flow selector / treatment and meter bands in ONOS REST form.
 */
TEST(Payloads, Onos_Payloads) {
  FakeController http;
  SdnService svc(test_config(), http);
  auto p = svc.create_traffic_engineering_policy("corp", voice_bulk());
  auto rule = p.flows[0];
  rule.switch_id = switch_id_for(1);

  const auto flow = onos_flow(rule);
  EXPECT_EQ(flow["priority"], 50000);
  EXPECT_EQ(flow["isPermanent"], true);
  EXPECT_EQ(flow["deviceId"], "of:0000000000000001");
  const auto& criteria = flow["selector"]["criteria"];
  ASSERT_EQ(criteria.size(), 4u);
  EXPECT_EQ(criteria[0]["type"], "ETH_TYPE");
  EXPECT_EQ(criteria[0]["ethType"], "0x800");
  EXPECT_EQ(criteria[3]["type"], "UDP_DST");
  EXPECT_EQ(criteria[3]["udpPort"], 5060);
  const auto& instr = flow["treatment"]["instructions"];
  ASSERT_EQ(instr.size(), 3u);
  EXPECT_EQ(instr[0]["type"], "QUEUE");
  EXPECT_EQ(instr[0]["queueId"], 1);
  EXPECT_EQ(instr[2]["port"], "NORMAL");

  const auto meter = onos_meter(rule.switch_id, p.meters[0]);
  EXPECT_EQ(meter["unit"], "KB_PER_SEC");
  EXPECT_EQ(meter["bands"][0]["type"], "DROP");
  EXPECT_EQ(meter["bands"][0]["rate"], 400);
  EXPECT_EQ(meter["bands"][0]["burstSize"], 1000);
}

/**
 * @test Odl_Payloads
 * @brief Inventory flow with ethernet/ip match, meter instruction and apply-actions.
 */
TEST(Payloads, Odl_Payloads) {
  FakeController http;
  SdnService svc(test_config(), http);
  auto p = svc.create_traffic_engineering_policy("corp", voice_bulk());
  auto rule = p.flows[0];
  rule.switch_id = "openflow:1";

  const auto doc = odl_flow(rule, "f1");
  const auto& flow = doc["flow-node-inventory:flow"][0];
  EXPECT_EQ(flow["id"], "f1");
  EXPECT_EQ(flow["match"]["ethernet-match"]["ethernet-type"]["type"], 2048);
  EXPECT_EQ(flow["match"]["ip-match"]["ip-protocol"], 17);
  EXPECT_EQ(flow["match"]["ip-match"]["ip-dscp"], 46);
  EXPECT_EQ(flow["match"]["udp-destination-port"], 5060);
  const auto& instr = flow["instructions"]["instruction"];
  ASSERT_EQ(instr.size(), 2u);
  EXPECT_EQ(instr[0]["meter"]["meter-id"], 1);
  EXPECT_EQ(instr[1]["apply-actions"]["action"][0]["set-queue-action"]["queue-id"], 1);
  EXPECT_EQ(instr[1]["apply-actions"]["action"][1]["output-action"]["output-node-connector"], "NORMAL");

  const auto meter = odl_meter(p.meters[0]);
  const auto& band = meter["flow-node-inventory:meter"][0]["meter-band-headers"]["meter-band-header"][0];
  EXPECT_EQ(band["drop-rate"], 400);
  EXPECT_EQ(band["meter-band-types"]["flags"], "ofpmbt-drop");
}

/**
 * @test Request_Shaping
 * @brief URLs per controller, JSON headers and basic auth.
 */
TEST(Payloads, Request_Shaping) {
  OpenFlowRule rule;
  rule.switch_id = switch_id_for(1);

  const auto onos = make_controller_api(ControllerType::Onos, {"http://ctl:8181/", "onos", "rocks", {}});
  const auto post = onos->install_flow(rule, "ignored");
  EXPECT_EQ(post.method, HttpMethod::Post);
  EXPECT_EQ(post.url, "http://ctl:8181/onos/v1/flows/of:0000000000000001");
  const auto auth = std::find_if(post.headers.begin(), post.headers.end(),
                                 [](const auto& h) { return h.first == "Authorization"; });
  ASSERT_NE(auth, post.headers.end());
  EXPECT_EQ(auth->second, "Basic b25vczpyb2Nrcw==");
  EXPECT_EQ(onos->remove_flow(rule.switch_id, 0, "77").url, "http://ctl:8181/onos/v1/flows/of:0000000000000001/77");

  rule.switch_id = "openflow:1";
  const auto odl = make_controller_api(ControllerType::OpenDaylight, {"http://odl:8181", "admin", "admin", {}});
  const auto put = odl->install_flow(rule, "f1");
  EXPECT_EQ(put.method, HttpMethod::Put);
  EXPECT_EQ(put.url,
            "http://odl:8181/restconf/config/opendaylight-inventory:nodes/node/openflow:1/flow-node-inventory:table/0/flow/f1");
  EXPECT_EQ(odl->installed_flow_id(HttpResponse{200, {}, {}}, "f1"), "f1");

  EXPECT_EQ(parse_controller("ODL"), ControllerType::OpenDaylight);
  EXPECT_FALSE(parse_controller("ryu").has_value());
}

/**
 * @test Topology_Parsing
 * @brief Switch devices and links are extracted; malformed bodies are Parse errors.
 */
TEST(Payloads, Topology_Parsing) {
  const auto onos = make_controller_api(ControllerType::Onos, {"http://ctl:8181", {}, {}, {}});
  const std::string devices = R"({"devices":[{"id":"of:0000000000000001","type":"SWITCH"},
                                            {"id":"of:0000000000000002","type":"SWITCH"},
                                            {"id":"roadm:1","type":"ROADM"}]})";
  const std::string links = R"({"links":[{"src":{"device":"of:0000000000000001","port":"2"},
                                          "dst":{"device":"of:0000000000000002","port":"1"}}]})";
  const auto topo = onos->parse_topology({devices, links});
  ASSERT_TRUE(topo.has_value());
  EXPECT_EQ(topo->switches, (std::vector<std::string>{"of:0000000000000001", "of:0000000000000002"}));
  ASSERT_EQ(topo->links.size(), 1u);
  EXPECT_EQ(topo->links[0], (Link{"of:0000000000000001", "2", "of:0000000000000002", "1"}));

  const auto bad = onos->parse_topology({"not json", links});
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().kind, ErrorKind::Parse);

  const auto odl = make_controller_api(ControllerType::OpenDaylight, {"http://odl:8181", {}, {}, {}});
  const auto odl_topo = odl->parse_topology({R"({"topology":[{"node":[{"node-id":"openflow:1"},{"node-id":"host:aa"}]}]})"});
  ASSERT_TRUE(odl_topo.has_value());
  EXPECT_EQ(odl_topo->switches, (std::vector<std::string>{"openflow:1"}));
}

// --------------------------- Deployment -------------------------------------

/**
 * @test Four_Of_Five_Switches_Is_A_Failure
 * @brief 8 of 10 flows accepted gives exactly 0.8, which is not above the threshold.
 */
TEST(Deploy, Four_Of_Five_Switches_Is_A_Failure) {
  const std::string broken = switch_id_for(3);
  FakeController http([&](const HttpRequest& r) -> Result<HttpResponse> {
    if (r.method == HttpMethod::Post && r.url.find("/flows/" + broken) != std::string::npos) return status(500);
    return created();
  });
  SdnService svc(test_config(), http);
  const auto p = svc.create_traffic_engineering_policy("corp", voice_bulk());

  const auto report = svc.deploy(p, switches(5));
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->attempts, 10u);
  EXPECT_EQ(report->successes, 8u);
  EXPECT_DOUBLE_EQ(report->success_rate, 0.8);
  EXPECT_FALSE(report->success);
  EXPECT_FALSE(report->cancelled);
  ASSERT_EQ(report->switches.size(), 5u);
  EXPECT_EQ(report->switches[2].outcome, SwitchOutcome::Partial);
  EXPECT_EQ(report->switches[2].errors.size(), 2u);
  EXPECT_EQ(report->switches[0].outcome, SwitchOutcome::Deployed);

  // Writes are sent once.
  EXPECT_EQ(http.count(HttpMethod::Post, "/flows/" + broken), 2u);
}

/**
 * @test All_Switches_Succeed
 */
TEST(Deploy, All_Switches_Succeed) {
  FakeController http;
  SdnService svc(test_config(), http);
  const auto report = svc.deploy(svc.create_traffic_engineering_policy("corp", voice_bulk()), switches(5));
  ASSERT_TRUE(report.has_value());
  EXPECT_DOUBLE_EQ(report->success_rate, 1.0);
  EXPECT_TRUE(report->success);
  EXPECT_EQ(http.count(HttpMethod::Post, "/onos/v1/meters/"), 10u);
  EXPECT_EQ(svc.active_policies().size(), 1u);
}

/**
 * @test Workers_Bounded_By_Max_Workers
 * @brief No more than max_workers switches have requests in flight at once.
 */
TEST(Deploy, Workers_Bounded_By_Max_Workers) {
  for (const std::size_t workers : {std::size_t{1}, std::size_t{3}}) {
    PeakTrackingController http;
    auto cfg        = test_config();
    cfg.max_workers = workers;
    SdnService svc(cfg, http);

    const auto report = svc.deploy(svc.create_traffic_engineering_policy("corp", voice_bulk()), switches(8));
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->success);
    EXPECT_EQ(report->switches.size(), 8u);
    EXPECT_GE(http.peak(), 1u);
    EXPECT_LE(http.peak(), workers) << "max_workers " << workers;
  }
}

/**
 * @test Meter_Failure_Skips_Flows
 * @brief A rejected meter leaves that switch without any flow install.
 */
TEST(Deploy, Meter_Failure_Skips_Flows) {
  const std::string broken = switch_id_for(2);
  FakeController http([&](const HttpRequest& r) -> Result<HttpResponse> {
    if (r.url.find("/meters/" + broken) != std::string::npos) return status(409);
    return created();
  });
  SdnService svc(test_config(), http);
  const auto report = svc.deploy(svc.create_traffic_engineering_policy("corp", voice_bulk()), switches(2));
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->switches[1].outcome, SwitchOutcome::MeterFailed);
  EXPECT_EQ(report->switches[1].flows_installed, 0u);
  EXPECT_EQ(http.count(HttpMethod::Post, "/flows/" + broken), 0u);
  // Only the first meter was tried on the broken switch.
  EXPECT_EQ(http.count(HttpMethod::Post, "/meters/" + broken), 1u);
  EXPECT_DOUBLE_EQ(report->success_rate, 0.5);
}

/**
 * @test Invalid_Queue_Skips_Switch
 * @brief A queue whose floor exceeds its cap never reaches the controller.
 */
TEST(Deploy, Invalid_Queue_Skips_Switch) {
  auto classes = voice_bulk();
  classes[0].min_bandwidth = 500;  // above max 400
  FakeController http;
  SdnService svc(test_config(), http);
  const auto report = svc.deploy(svc.create_traffic_engineering_policy("corp", classes), switches(2));
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->switches[0].outcome, SwitchOutcome::QueueFailed);
  EXPECT_EQ(report->successes, 0u);
  EXPECT_TRUE(http.requests().empty());
}

/**
 * @test Cancellation_Skips_Remaining_Switches
 * @brief With one worker, a stop requested during the first switch leaves the rest untouched.
 */
TEST(Deploy, Cancellation_Skips_Remaining_Switches) {
  std::stop_source stop;
  FakeController http([&](const HttpRequest& r) -> Result<HttpResponse> {
    if (r.url.find("/flows/") != std::string::npos) stop.request_stop();
    return created();
  });
  auto cfg = test_config();
  cfg.max_workers = 1;
  SdnService svc(cfg, http);

  const auto report = svc.deploy(svc.create_traffic_engineering_policy("corp", voice_bulk()), switches(3),
                                 stop.get_token());
  ASSERT_TRUE(report.has_value());
  EXPECT_TRUE(report->cancelled);
  EXPECT_FALSE(report->success);
  EXPECT_EQ(report->switches[0].outcome, SwitchOutcome::Deployed);
  EXPECT_EQ(report->switches[1].outcome, SwitchOutcome::Skipped);
  EXPECT_EQ(report->switches[2].outcome, SwitchOutcome::Skipped);
  EXPECT_EQ(report->attempts, 6u);
  EXPECT_EQ(report->successes, 2u);
}

/**
 * @test Discovery_Retries_Reads
 * @brief An empty switch list triggers topology discovery; a 503 is retried.
 */
TEST(Deploy, Discovery_Retries_Reads) {
  int device_calls = 0;
  FakeController http([&](const HttpRequest& r) -> Result<HttpResponse> {
    if (r.url.ends_with("/onos/v1/devices")) {
      if (++device_calls == 1) return status(503);
      return ok(R"({"devices":[{"id":"of:0000000000000001"},{"id":"of:0000000000000002"}]})");
    }
    if (r.url.ends_with("/onos/v1/links")) return ok(R"({"links":[]})");
    return created();
  });
  SdnService svc(test_config(), http);
  const auto report = svc.deploy(svc.create_traffic_engineering_policy("corp", voice_bulk()));
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(device_calls, 2);
  ASSERT_EQ(report->switches.size(), 2u);
  EXPECT_TRUE(report->success);
}

/**
 * @test Discovery_Failure_Is_An_Error
 * @brief Reads give up after read_retries extra attempts.
 */
TEST(Deploy, Discovery_Failure_Is_An_Error) {
  FakeController http([](const HttpRequest&) -> Result<HttpResponse> { return status(500); });
  SdnService svc(test_config(), http);
  const auto report = svc.deploy(svc.create_traffic_engineering_policy("corp", voice_bulk()));
  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error().kind, ErrorKind::ConfigurationExecution);
  EXPECT_EQ(http.count(HttpMethod::Get, "/onos/v1/devices"), 3u);
}

// --------------------------- Monitoring and lifecycle -----------------------

/**
 * @test Monitor_Aggregates_Counters
 * @brief Reachable switches are summed; an unreachable one is reported but not counted.
 */
TEST(Monitor, Monitor_Aggregates_Counters) {
  const std::string s1 = switch_id_for(1);
  FakeController http([&](const HttpRequest& r) -> Result<HttpResponse> {
    if (r.method != HttpMethod::Get) return created();
    if (r.url.ends_with("/flows/" + s1)) {
      return ok(R"({"flows":[{"bytes":100,"packets":2},{"bytes":50,"packets":1}]})");
    }
    return status(404);
  });
  SdnService svc(test_config(), http);
  const auto report = svc.deploy(svc.create_traffic_engineering_policy("corp", voice_bulk()), switches(2));
  ASSERT_TRUE(report.has_value());

  const auto perf = svc.monitor(report->policy_id);
  ASSERT_TRUE(perf.has_value());
  EXPECT_EQ(perf->total_flows, 2u);
  EXPECT_EQ(perf->total_bytes, 150u);
  EXPECT_EQ(perf->total_packets, 3u);
  EXPECT_TRUE(perf->switches.at(s1).reachable);
  EXPECT_FALSE(perf->switches.at(switch_id_for(2)).reachable);

  const auto missing = svc.monitor("nope");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().kind, ErrorKind::PolicyNotFound);
}

/**
 * @test Apply_And_Remove_On_Switch
 * @brief Flows carry the ingress port; removal deletes the controller-assigned ids.
 */
TEST(Lifecycle, Apply_And_Remove_On_Switch) {
  const std::string sw = switch_id_for(1);
  int next_id = 4242;
  FakeController http([&](const HttpRequest& r) -> Result<HttpResponse> {
    if (r.method == HttpMethod::Post && r.url.find("/flows/") != std::string::npos) {
      return HttpResponse{201, {}, "http://ctl:8181/onos/v1/flows/" + sw + "/" + std::to_string(next_id++)};
    }
    if (r.method == HttpMethod::Get && r.url.find("/meters/") != std::string::npos) {
      return ok(R"({"meters":[{"id":"1"},{"id":"2"}]})");
    }
    if (r.method == HttpMethod::Get) return ok(R"({"flows":[{},{},{}]})");
    return r.method == HttpMethod::Delete ? status(204) : created();
  });
  SdnService svc(test_config(), http);

  QoSPolicy policy;
  policy.name            = "corp";
  policy.bandwidth_limit = 1000;
  policy.traffic_classes = voice_bulk();

  const auto id = svc.apply_to_switch(sw, 3, policy);
  ASSERT_TRUE(id.has_value());
  const auto reqs = http.requests();
  const auto flow_post = std::find_if(reqs.begin(), reqs.end(), [](const HttpRequest& r) {
    return r.method == HttpMethod::Post && r.url.find("/flows/") != std::string::npos;
  });
  ASSERT_NE(flow_post, reqs.end());
  EXPECT_NE(flow_post->body.find(R"("type":"IN_PORT")"), std::string::npos);

  const auto applied = svc.applied_policies(sw);
  ASSERT_TRUE(applied.has_value());
  EXPECT_EQ(applied->flows, 3u);
  EXPECT_EQ(applied->meters, 2u);
  EXPECT_EQ(applied->policy_ids, (std::vector<std::string>{*id}));

  ASSERT_TRUE(svc.remove_policy(*id).has_value());
  EXPECT_EQ(http.count(HttpMethod::Delete, "/onos/v1/flows/" + sw + "/4242"), 1u);
  EXPECT_EQ(http.count(HttpMethod::Delete, "/onos/v1/flows/" + sw + "/4243"), 1u);
  EXPECT_TRUE(svc.active_policies().empty());

  const auto again = svc.remove_policy(*id);
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().kind, ErrorKind::PolicyNotFound);
}

/**
 * @test Apply_Rolls_Back_On_Failure
 * @brief A rejected flow removes the flows already accepted on that switch.
 */
TEST(Lifecycle, Apply_Rolls_Back_On_Failure) {
  const std::string sw = switch_id_for(1);
  int flow_posts = 0;
  FakeController http([&](const HttpRequest& r) -> Result<HttpResponse> {
    if (r.method == HttpMethod::Post && r.url.find("/flows/") != std::string::npos) {
      if (++flow_posts == 2) return status(400);
      return HttpResponse{201, {}, "http://ctl:8181/onos/v1/flows/" + sw + "/1"};
    }
    return r.method == HttpMethod::Delete ? status(204) : created();
  });
  SdnService svc(test_config(), http);

  QoSPolicy policy;
  policy.name            = "corp";
  policy.bandwidth_limit = 1000;
  policy.traffic_classes = voice_bulk();

  const auto id = svc.apply_to_switch(sw, 3, policy);
  ASSERT_FALSE(id.has_value());
  EXPECT_EQ(id.error().kind, ErrorKind::ConfigurationExecution);
  EXPECT_EQ(http.count(HttpMethod::Delete, "/onos/v1/flows/" + sw + "/1"), 1u);
  EXPECT_TRUE(svc.active_policies().empty());
}
