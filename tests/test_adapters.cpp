/**
 * @file test_adapters.cpp
 * @brief Tests for the Cisco, Juniper and Linux tc generators and the executor.
 *
 * Validates:
 *  - Command layout per vendor for CBWFQ / LLQ / FQ-CoDel / DRR output
 *  - Strict-priority vs bandwidth rendering and RED/WRED variants
 *  - Name sanitisation (classes and policy-maps), port-range mask blocks, show-output parsing
 *  - Request checks (empty inputs, unsupported algorithms, direction)
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

#include "qosctl/adapters/cisco_adapter.hpp"
#include "qosctl/adapters/command_executor.hpp"
#include "qosctl/adapters/juniper_adapter.hpp"
#include "qosctl/adapters/linux_tc_adapter.hpp"
#include "qosctl/queueing/cbwfq.hpp"
#include "qosctl/queueing/drr.hpp"
#include "qosctl/queueing/fq_codel.hpp"
#include "qosctl/queueing/llq.hpp"

using namespace qosctl::adapters;
using qosctl::ErrorKind;
using qosctl::domain::Direction;
using qosctl::domain::PortRange;
using qosctl::domain::Protocol;
using qosctl::domain::QoSPolicy;
using qosctl::domain::QueueConfiguration;
using qosctl::domain::TrafficClass;
using qosctl::domain::TrafficClassifier;
using qosctl::queueing::AlgorithmType;

namespace {

TrafficClass make_class(std::string name, uint8_t prio, uint32_t min_bw,
                        std::string dscp = "default", uint32_t burst = 0) {
  TrafficClass tc;
  tc.name          = std::move(name);
  tc.priority      = prio;
  tc.min_bandwidth = min_bw;
  tc.dscp          = std::move(dscp);
  tc.burst         = burst;
  return tc;
}

TrafficClassifier udp_port(uint16_t port) {
  TrafficClassifier c;
  c.protocol          = Protocol::Udp;
  c.destination_ports = PortRange{port, port};
  return c;
}

QoSPolicy make_policy(uint32_t limit, std::vector<TrafficClass> classes) {
  QoSPolicy p;
  p.name            = "P";
  p.bandwidth_limit = limit;
  p.traffic_classes = std::move(classes);
  return p;
}

/// voice (7, 200 kbps, EF, udp/5060) + bulk (2, 300 kbps) under 1000 kbps.
QoSPolicy voice_bulk_policy() {
  auto voice = make_class("voice", 7, 200, "EF");
  voice.classifiers.push_back(udp_port(5060));
  return make_policy(1000, {voice, make_class("bulk", 2, 300)});
}

GenerateRequest request_for(const QoSPolicy& policy, AlgorithmType algo,
                            std::vector<QueueConfiguration> queues, std::string itf = "Gi0/1") {
  GenerateRequest r;
  r.interface_name  = std::move(itf);
  r.policy_name     = policy.name;
  r.algorithm       = algo;
  r.total_bandwidth = policy.bandwidth_limit;
  r.queues          = std::move(queues);
  return r;
}

bool has(const CommandList& cmds, const std::string& line) {
  return std::find(cmds.begin(), cmds.end(), line) != cmds.end();
}

std::ptrdiff_t index_of(const CommandList& cmds, const std::string& line) {
  return std::distance(cmds.begin(), std::find(cmds.begin(), cmds.end(), line));
}

} // namespace

// --------------------------- Cisco ------------------------------------------

/**
 * @test Cisco_Cbwfq_Layout
 * @brief Class-maps, bandwidth/fair-queue/queue-limit and DSCP-based WRED
 *        with thresholds raised for a preferred DSCP.
 */
TEST(Cisco, Cisco_Cbwfq_Layout) {
  const auto policy = voice_bulk_policy();
  auto queues = qosctl::queueing::CbwfqAlgorithm{}.calculate(policy);
  ASSERT_TRUE(queues.has_value());

  const auto cmds = CiscoAdapter{}.generate(request_for(policy, AlgorithmType::Cbwfq, *queues));
  ASSERT_TRUE(cmds.has_value());
  EXPECT_EQ(cmds->front(), "configure terminal");
  EXPECT_EQ(cmds->back(), "end");

  EXPECT_TRUE(has(*cmds, "class-map match-all voice"));
  EXPECT_TRUE(has(*cmds, "match protocol udp"));
  EXPECT_TRUE(has(*cmds, "match port 5060"));
  EXPECT_TRUE(has(*cmds, "match dscp ef"));

  EXPECT_TRUE(has(*cmds, "policy-map P"));
  EXPECT_TRUE(has(*cmds, "bandwidth percent 20"));
  EXPECT_TRUE(has(*cmds, "fair-queue 64 weight 90"));
  EXPECT_TRUE(has(*cmds, "queue-limit 64"));
  EXPECT_TRUE(has(*cmds, "random-detect dscp-based"));
  // ql 64 -> 16/48, doubled for weight 1.0
  EXPECT_TRUE(has(*cmds, "random-detect dscp ef 32 96 1"));
  EXPECT_TRUE(has(*cmds, "bandwidth percent 30"));
  EXPECT_TRUE(has(*cmds, "fair-queue 64 weight 50"));

  EXPECT_LT(index_of(*cmds, "class voice"), index_of(*cmds, "class bulk"));
  EXPECT_LT(index_of(*cmds, "class class-default"), index_of(*cmds, "interface Gi0/1"));
  EXPECT_TRUE(has(*cmds, "service-policy output P"));
}

/**
 * @test Cisco_Llq_Strict_Priority
 * @brief Priority >= 5 classes render `priority` + police; the rest bandwidth.
 */
TEST(Cisco, Cisco_Llq_Strict_Priority) {
  const auto policy = make_policy(10000, {make_class("voice", 7, 2000, "EF", 10),
                                          make_class("video", 5, 1000),
                                          make_class("bulk", 2, 3000)});
  auto queues = qosctl::queueing::LlqAlgorithm{}.calculate(policy);
  ASSERT_TRUE(queues.has_value());

  const auto cmds = CiscoAdapter{}.generate(request_for(policy, AlgorithmType::Llq, *queues));
  ASSERT_TRUE(cmds.has_value());

  const auto voice = index_of(*cmds, "class voice");
  ASSERT_LT(voice + 2, static_cast<std::ptrdiff_t>(cmds->size()));
  EXPECT_EQ((*cmds)[voice + 1], "priority 2000");
  EXPECT_EQ((*cmds)[voice + 2], "police 2000000 10000 conform-action transmit exceed-action drop");
  EXPECT_TRUE(has(*cmds, "police 1000000 conform-action transmit exceed-action drop"));

  // Standard classes share the 7000 kbps left after strict priority.
  EXPECT_TRUE(has(*cmds, "bandwidth percent 43"));
  EXPECT_LT(index_of(*cmds, "class video"), index_of(*cmds, "class bulk"));
}

/**
 * @test Cisco_Match_Any_For_Several_Classifiers
 * @brief OR across classifiers maps to a match-any class-map.
 */
TEST(Cisco, Cisco_Match_Any_For_Several_Classifiers) {
  auto web = make_class("web traffic", 3, 100);
  web.classifiers = {udp_port(80), udp_port(443)};
  const auto policy = make_policy(1000, {web});
  auto queues = qosctl::queueing::CbwfqAlgorithm{}.calculate(policy);
  ASSERT_TRUE(queues.has_value());

  const auto cmds = CiscoAdapter{}.generate(request_for(policy, AlgorithmType::Cbwfq, *queues));
  ASSERT_TRUE(cmds.has_value());
  EXPECT_TRUE(has(*cmds, "class-map match-any web_traffic"));
  EXPECT_TRUE(has(*cmds, "match port 80"));
  EXPECT_TRUE(has(*cmds, "match port 443"));
  EXPECT_EQ(std::count(cmds->begin(), cmds->end(), "match protocol udp"), 1);
}

/**
 * @test Cisco_Policy_Name_Sanitised
 * @brief The policy-map name gets the same character rules as class names, in apply and removal.
 */
TEST(Cisco, Cisco_Policy_Name_Sanitised) {
  auto policy = voice_bulk_policy();
  policy.name = "branch office/voice";
  auto queues = qosctl::queueing::CbwfqAlgorithm{}.calculate(policy);
  ASSERT_TRUE(queues.has_value());

  const auto cmds = CiscoAdapter{}.generate(request_for(policy, AlgorithmType::Cbwfq, *queues));
  ASSERT_TRUE(cmds.has_value());
  EXPECT_TRUE(has(*cmds, "policy-map branch_office_voice"));
  EXPECT_TRUE(has(*cmds, "service-policy output branch_office_voice"));
  EXPECT_FALSE(has(*cmds, "policy-map branch office/voice"));

  const auto rm = CiscoAdapter{}.generate_removal("Gi0/1", policy.name, Direction::Egress);
  EXPECT_TRUE(has(rm, "no service-policy output branch_office_voice"));
  EXPECT_TRUE(has(rm, "no policy-map branch_office_voice"));

  const auto red = CiscoAdapter::generate_red_policy("Gi0/2", "red policy", 20, 40, 0.5);
  EXPECT_TRUE(has(red, "policy-map red_policy"));
}

/**
 * @test Cisco_Rejects_Bad_Requests
 * @brief FQ-CoDel is not expressible on IOS; empty fields are validation errors.
 */
TEST(Cisco, Cisco_Rejects_Bad_Requests) {
  const auto policy = voice_bulk_policy();
  auto queues = qosctl::queueing::CbwfqAlgorithm{}.calculate(policy);
  ASSERT_TRUE(queues.has_value());

  const auto unsupported = CiscoAdapter{}.generate(request_for(policy, AlgorithmType::FqCodel, *queues));
  ASSERT_FALSE(unsupported.has_value());
  EXPECT_EQ(unsupported.error().kind, ErrorKind::UnsupportedAlgorithm);

  const auto empty = CiscoAdapter{}.generate(request_for(policy, AlgorithmType::Cbwfq, {}, ""));
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error().kind, ErrorKind::Validation);
  EXPECT_EQ(empty.error().details.size(), 2u);
}

/**
 * @test Cisco_Red_Policy_And_Removal
 * @brief Probability scale clamps to 1..10; removal detaches by direction.
 */
TEST(Cisco, Cisco_Red_Policy_And_Removal) {
  EXPECT_EQ(CiscoAdapter::probability_scale(0.0), 1);
  EXPECT_EQ(CiscoAdapter::probability_scale(0.1), 1);
  EXPECT_EQ(CiscoAdapter::probability_scale(0.25), 2);
  EXPECT_EQ(CiscoAdapter::probability_scale(3.0), 10);

  const auto red = CiscoAdapter::generate_red_policy("Gi0/2", "RED-P", 20, 40, 0.5);
  EXPECT_TRUE(has(red, "random-detect precedence 0 20 40 5"));
  EXPECT_TRUE(has(red, "service-policy output RED-P"));

  const auto rm = CiscoAdapter{}.generate_removal("Gi0/1", "P", Direction::Ingress);
  EXPECT_TRUE(has(rm, "no service-policy input P"));
  EXPECT_TRUE(has(rm, "no policy-map P"));
}

// --------------------------- Juniper ----------------------------------------

/**
 * @test Juniper_Cbwfq_Layout
 * @brief Forwarding classes, WRED profile only, schedulers, map, classifier, commit.
 */
TEST(Juniper, Juniper_Cbwfq_Layout) {
  const auto policy = voice_bulk_policy();
  auto queues = qosctl::queueing::CbwfqAlgorithm{}.calculate(policy);
  ASSERT_TRUE(queues.has_value());

  const auto cmds = JuniperAdapter{}.generate(request_for(policy, AlgorithmType::Cbwfq, *queues, "ge-0/0/1"));
  ASSERT_TRUE(cmds.has_value());
  EXPECT_EQ(cmds->front(), "configure");
  ASSERT_GE(cmds->size(), 3u);
  EXPECT_EQ((*cmds)[cmds->size() - 3], "commit check");
  EXPECT_EQ((*cmds)[cmds->size() - 2], "commit");

  EXPECT_TRUE(has(*cmds, "set class-of-service forwarding-classes queue 0 voice"));
  EXPECT_TRUE(has(*cmds, "set class-of-service forwarding-classes queue 1 bulk"));
  EXPECT_TRUE(has(*cmds, "set class-of-service schedulers P-voice transmit-rate 200k"));
  EXPECT_TRUE(has(*cmds, "set class-of-service schedulers P-voice priority high"));
  EXPECT_TRUE(has(*cmds, "set class-of-service schedulers P-bulk priority low"));
  EXPECT_TRUE(has(*cmds, "set class-of-service schedulers P-voice drop-profile-map loss-priority high protocol any drop-profile wred-profile"));
  EXPECT_TRUE(has(*cmds, "set class-of-service scheduler-maps P-sched-map forwarding-class voice scheduler P-voice"));
  EXPECT_TRUE(has(*cmds, "set class-of-service classifiers dscp P-classifier forwarding-class voice loss-priority low code-points ef"));
  EXPECT_TRUE(has(*cmds, "set class-of-service interfaces ge-0/0/1 scheduler-map P-sched-map"));

  const bool any_red = std::any_of(cmds->begin(), cmds->end(), [](const std::string& l) {
    return l.find("drop-profiles red-profile") != std::string::npos;
  });
  EXPECT_FALSE(any_red);
}

/**
 * @test Juniper_Drr_Red_Profile
 * @brief DRR classes with priority >= 5 use RED, which pulls in the RED profile.
 */
TEST(Juniper, Juniper_Drr_Red_Profile) {
  const auto policy = make_policy(10000, {make_class("gold", 6, 2000), make_class("best-effort", 1, 1000)});
  auto queues = qosctl::queueing::DrrAlgorithm{}.calculate(policy);
  ASSERT_TRUE(queues.has_value());

  const auto cmds = JuniperAdapter{}.generate(request_for(policy, AlgorithmType::Drr, *queues, "ge-0/0/2"));
  ASSERT_TRUE(cmds.has_value());
  EXPECT_TRUE(has(*cmds, "set class-of-service drop-profiles red-profile interpolate fill-level 50 drop-probability 10"));
  EXPECT_TRUE(has(*cmds, "set class-of-service schedulers P-gold drop-profile-map loss-priority low protocol any drop-profile red-profile"));
  EXPECT_TRUE(has(*cmds, "set class-of-service schedulers P-gold priority medium"));
  // Built-in forwarding classes are not redeclared.
  EXPECT_FALSE(has(*cmds, "set class-of-service forwarding-classes queue 1 best-effort"));
}

/**
 * @test Juniper_Name_Sanitising
 * @brief Illegal characters become '-' and names stop at 32 characters.
 */
TEST(Juniper, Juniper_Name_Sanitising) {
  EXPECT_EQ(JuniperAdapter::junos_name("Voice Traffic/Gold"), "Voice-Traffic-Gold");
  EXPECT_EQ(JuniperAdapter::junos_name(std::string(40, 'a')).size(), 32u);
  EXPECT_EQ(JuniperAdapter::scheduler_map_name("corp policy"), "corp-policy-sched-map");
}

/**
 * @test Juniper_Parse_Applied
 * @brief Scheduler maps and classifiers are grouped per interface.
 */
TEST(Juniper, Juniper_Parse_Applied) {
  const std::string show =
      "set class-of-service schedulers P-voice priority high\n"
      "set class-of-service interfaces ge-0/0/1 scheduler-map P-sched-map\n"
      "set class-of-service interfaces ge-0/0/1 unit 0 classifiers dscp P-classifier\n"
      "set interfaces ge-0/0/3 unit 0 scheduler-map legacy-map\n";
  const auto parsed = JuniperAdapter::parse_applied_policies(show);
  ASSERT_EQ(parsed.size(), 2u);
  const auto& ge1 = parsed.at("ge-0/0/1");
  ASSERT_EQ(ge1.size(), 2u);
  EXPECT_EQ(ge1[0], (AppliedPolicy{"scheduler-map", "P-sched-map", ""}));
  EXPECT_EQ(ge1[1], (AppliedPolicy{"classifier", "P-classifier", ""}));
  EXPECT_EQ(parsed.at("ge-0/0/3").front().name, "legacy-map");
}

// --------------------------- Linux tc ---------------------------------------

/**
 * @test Linux_Htb_Hierarchy
 * @brief HTB root, per-class rate/ceil, RED leaf in bytes, u32 filter, default class.
 */
TEST(LinuxTc, Linux_Htb_Hierarchy) {
  const auto policy = voice_bulk_policy();
  auto queues = qosctl::queueing::CbwfqAlgorithm{}.calculate(policy);
  ASSERT_TRUE(queues.has_value());

  const auto cmds = LinuxTcAdapter{}.generate(request_for(policy, AlgorithmType::Cbwfq, *queues, "eth0"));
  ASSERT_TRUE(cmds.has_value());
  const std::vector<std::string> expected{
      "tc qdisc del dev eth0 root 2>/dev/null || true",
      "tc qdisc add dev eth0 root handle 1: htb default 30",
      "tc class add dev eth0 parent 1: classid 1:1 htb rate 1000kbit",
      "tc class add dev eth0 parent 1:1 classid 1:10 htb rate 200kbit ceil 400kbit",
      "tc qdisc add dev eth0 parent 1:10 handle 10: red limit 64000 min 16000 max 48000 avpkt 1000 burst 27 probability 0.1 bandwidth 200kbit",
      "tc filter add dev eth0 parent 1: protocol ip prio 1 u32 match ip protocol 17 0xff match ip tos 0xb8 0xfc match ip dport 5060 0xffff flowid 1:10",
      "tc class add dev eth0 parent 1:1 classid 1:11 htb rate 300kbit ceil 600kbit",
      "tc qdisc add dev eth0 parent 1:11 handle 11: sfq perturb 10",
      "tc class add dev eth0 parent 1:1 classid 1:30 htb rate 1000kbit ceil 1000kbit",
      "tc qdisc add dev eth0 parent 1:30 handle 30: sfq perturb 10",
  };
  EXPECT_EQ(*cmds, expected);
}

/**
 * @test Linux_Single_FqCodel_Root
 * @brief One FQ-CoDel class is installed as a root fq_codel qdisc.
 */
TEST(LinuxTc, Linux_Single_FqCodel_Root) {
  const auto policy = make_policy(1000000, {make_class("all", 7, 100000)});
  auto queues = qosctl::queueing::FqCodelAlgorithm{}.calculate(policy);
  ASSERT_TRUE(queues.has_value());
  const auto& q = queues->front();

  const auto cmds = LinuxTcAdapter{}.generate(request_for(policy, AlgorithmType::FqCodel, *queues, "eth1"));
  ASSERT_TRUE(cmds.has_value());
  ASSERT_EQ(cmds->size(), 2u);
  EXPECT_EQ((*cmds)[1], "tc qdisc add dev eth1 root fq_codel limit " + std::to_string(q.queue.queue_limit) +
                            " target 2000us interval 100000us quantum " + std::to_string(q.queue.quantum) +
                            " flows 2048 ecn");
}

/**
 * @test Linux_Port_Range_Blocks
 * @brief Ranges become aligned value/mask blocks covering exactly the range.
 */
TEST(LinuxTc, Linux_Port_Range_Blocks) {
  using Blocks = std::vector<std::pair<uint16_t, uint16_t>>;
  EXPECT_EQ(LinuxTcAdapter::port_blocks(5060, 5060), (Blocks{{5060, 0xFFFF}}));
  EXPECT_EQ(LinuxTcAdapter::port_blocks(16384, 32767), (Blocks{{16384, 0xC000}}));
  EXPECT_EQ(LinuxTcAdapter::port_blocks(1000, 1003), (Blocks{{1000, 0xFFFC}}));
  EXPECT_EQ(LinuxTcAdapter::port_blocks(5, 10), (Blocks{{5, 0xFFFF}, {6, 0xFFFE}, {8, 0xFFFE}, {10, 0xFFFF}}));
}

/**
 * @test Linux_Rejects_Ingress_And_Overflow
 * @brief Ingress shaping and more than 20 classes are refused.
 */
TEST(LinuxTc, Linux_Rejects_Ingress_And_Overflow) {
  const auto policy = voice_bulk_policy();
  auto queues = qosctl::queueing::CbwfqAlgorithm{}.calculate(policy);
  ASSERT_TRUE(queues.has_value());

  auto req = request_for(policy, AlgorithmType::Cbwfq, *queues, "eth0");
  req.direction = Direction::Ingress;
  const auto ingress = LinuxTcAdapter{}.generate(req);
  ASSERT_FALSE(ingress.has_value());
  EXPECT_EQ(ingress.error().kind, ErrorKind::UnsupportedDevice);

  const auto many = LinuxTcAdapter{}.generate(
      request_for(policy, AlgorithmType::Cbwfq, std::vector<QueueConfiguration>(21), "eth0"));
  ASSERT_FALSE(many.has_value());
  EXPECT_EQ(many.error().kind, ErrorKind::Validation);
}

/**
 * @test Linux_Parse_Qdisc_Show
 * @brief qdiscs are grouped per device with their handle and parent.
 */
TEST(LinuxTc, Linux_Parse_Qdisc_Show) {
  const std::string show =
      "qdisc htb 1: dev eth0 root refcnt 2 r2q 10 default 0x30 direct_packets_stat 0\n"
      "qdisc sfq 10: dev eth0 parent 1:10 limit 127p quantum 1514b depth 127\n"
      "qdisc fq_codel 0: dev eth1 root refcnt 2 limit 10240p flows 1024\n"
      "garbage line\n";
  const auto parsed = LinuxTcAdapter::parse_applied_policies(show);
  ASSERT_EQ(parsed.size(), 2u);
  ASSERT_EQ(parsed.at("eth0").size(), 2u);
  EXPECT_EQ(parsed.at("eth0")[0], (AppliedPolicy{"htb", "1:", "root"}));
  EXPECT_EQ(parsed.at("eth0")[1], (AppliedPolicy{"sfq", "10:", "1:10"}));
  EXPECT_EQ(parsed.at("eth1")[0].kind, "fq_codel");
}

// --------------------------- Factory / executor -----------------------------

/**
 * @test Factory_And_DryRun
 * @brief OpenFlow has no CLI adapter; the dry-run executor records batches.
 */
TEST(Factory, Factory_And_DryRun) {
  auto cisco = make_adapter(DeviceVendor::Cisco);
  ASSERT_TRUE(cisco.has_value());
  EXPECT_EQ((*cisco)->vendor(), DeviceVendor::Cisco);

  const auto of = make_adapter(DeviceVendor::OpenFlow);
  ASSERT_FALSE(of.has_value());
  EXPECT_EQ(of.error().kind, ErrorKind::UnsupportedDevice);

  EXPECT_EQ(parse_vendor("JunOS"), DeviceVendor::Juniper);
  EXPECT_FALSE(parse_vendor("arista").has_value());

  DryRunExecutor exec;
  const auto res = exec.execute("r1", {"configure terminal", "end"}, std::chrono::milliseconds(100));
  ASSERT_TRUE(res.has_value());
  EXPECT_TRUE(res->success);
  ASSERT_EQ(exec.batches(), 1u);
  EXPECT_EQ(exec.history().front().commands.size(), 2u);
}
