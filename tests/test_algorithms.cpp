/**
 * @file test_algorithms.cpp
 * @brief Tests for the CBWFQ, LLQ, FQ-CoDel and DRR calculators.
 *
 * Validates:
 *  - Guarantee invariants reject a policy before producing any configuration
 *  - Closed-form weights, buffers, queue limits and thresholds
 *  - Ordering by decreasing priority
 *  - Registry behaviour for unsupported disciplines and surplus allocation
 */

#include <gtest/gtest.h>

#include "qosctl/queueing/cbwfq.hpp"
#include "qosctl/queueing/drr.hpp"
#include "qosctl/queueing/fq_codel.hpp"
#include "qosctl/queueing/llq.hpp"
#include "qosctl/queueing/queue_algorithm.hpp"

using namespace qosctl::queueing;
using qosctl::ErrorKind;
using qosctl::domain::CongestionAlgorithm;
using qosctl::domain::QoSPolicy;
using qosctl::domain::TrafficClass;

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

QoSPolicy make_policy(uint32_t limit, std::vector<TrafficClass> classes) {
  QoSPolicy p;
  p.name            = "test";
  p.bandwidth_limit = limit;
  p.traffic_classes = std::move(classes);
  return p;
}

} // namespace

// --------------------------- CBWFQ ------------------------------------------

/**
 * @test Cbwfq_Guarantees_And_Surplus_Split
 * @brief 1000 kbps limit, classes (prio 7, 200) and (prio 2, 300): service rates
 *        are exactly the guarantees and the 500 kbps surplus follows the weights.
 */
TEST(Cbwfq, Cbwfq_Guarantees_And_Surplus_Split) {
  const auto policy = make_policy(1000, {make_class("voice", 7, 200), make_class("bulk", 2, 300)});
  const auto res = CbwfqAlgorithm{}.calculate(policy);
  ASSERT_TRUE(res.has_value());
  ASSERT_EQ(res->size(), 2u);

  const auto& voice = (*res)[0];
  const auto& bulk  = (*res)[1];
  EXPECT_EQ(voice.traffic_class.name, "voice");
  EXPECT_EQ(voice.queue.service_rate, 200u);
  EXPECT_EQ(bulk.queue.service_rate, 300u);
  EXPECT_NEAR(voice.queue.weight, 90.0, 1e-9);
  EXPECT_NEAR(bulk.queue.weight, 50.0, 1e-9);
  EXPECT_NEAR(voice.queue.bandwidth_percent, 20.0, 1e-9);
  EXPECT_EQ(voice.queue.buffer_size, 16u);   // floor of 16 packets
  EXPECT_EQ(voice.queue.queue_limit, 64u);   // floor of 64 packets
  EXPECT_EQ(voice.congestion.algorithm, CongestionAlgorithm::TailDrop);

  const auto shares = allocate_remaining(policy.bandwidth_limit, *res);
  ASSERT_EQ(shares.size(), 2u);
  EXPECT_NEAR(shares[0].shared_kbps + shares[1].shared_kbps, 500.0, 1e-9);
  EXPECT_NEAR(shares[0].shared_kbps, 500.0 * 90.0 / 140.0, 1e-6);
  EXPECT_NEAR(shares[1].total_kbps, 300.0 + 500.0 * 50.0 / 140.0, 1e-6);
}

/**
 * @test Cbwfq_Rejects_Oversubscription
 */
TEST(Cbwfq, Cbwfq_Rejects_Oversubscription) {
  const auto policy = make_policy(1000, {make_class("a", 3, 600), make_class("b", 1, 500)});
  const auto res = CbwfqAlgorithm{}.calculate(policy);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind, ErrorKind::Validation);
}

/**
 * @test Cbwfq_Wred_And_Burst
 * @brief A DSCP class gets WRED at 1/4 and 3/4 of its queue limit; burst sizes the buffer.
 */
TEST(Cbwfq, Cbwfq_Wred_And_Burst) {
  const auto policy = make_policy(10000, {make_class("video", 4, 8000, "AF41", 30)});
  const auto res = CbwfqAlgorithm{}.calculate(policy);
  ASSERT_TRUE(res.has_value());
  const auto& c = res->front();
  EXPECT_EQ(c.queue.queue_limit, 1000u);
  EXPECT_EQ(c.queue.buffer_size, 20u);
  EXPECT_EQ(c.congestion.algorithm, CongestionAlgorithm::Wred);
  EXPECT_EQ(c.congestion.min_threshold, 250u);
  EXPECT_EQ(c.congestion.max_threshold, 750u);
  EXPECT_DOUBLE_EQ(c.congestion.drop_probability, 0.1);
  EXPECT_DOUBLE_EQ(c.congestion.dscp_weights.at("AF41"), 1.0);
}

/**
 * @test Cbwfq_Queue_Limit_Clamp
 */
TEST(Cbwfq, Cbwfq_Queue_Limit_Clamp) {
  EXPECT_EQ(CbwfqAlgorithm::queue_limit(100), 64u);
  EXPECT_EQ(CbwfqAlgorithm::queue_limit(8000), 1000u);
  EXPECT_EQ(CbwfqAlgorithm::queue_limit(1000000), 4096u);
  EXPECT_EQ(CbwfqAlgorithm::buffer_size(12000, 0), 100u);
}

// --------------------------- LLQ --------------------------------------------

/**
 * @test Llq_Priority_Above_Cap
 * @brief Priority class reserving 40% of the limit is rejected.
 */
TEST(Llq, Llq_Priority_Above_Cap) {
  const auto policy = make_policy(1000, {make_class("voice", 7, 400), make_class("bulk", 2, 300)});
  const auto res = LlqAlgorithm{}.calculate(policy);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind, ErrorKind::LowLatencyValidation);
}

/**
 * @test Llq_Standard_Exceeds_Remaining
 */
TEST(Llq, Llq_Standard_Exceeds_Remaining) {
  const auto policy = make_policy(1000, {make_class("video", 5, 300), make_class("bulk", 2, 800)});
  const auto res = LlqAlgorithm{}.calculate(policy);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind, ErrorKind::LowLatencyValidation);
}

/**
 * @test Llq_Priority_Then_Standard
 * @brief Strict-priority queues come first with tail-drop; the rest is CBWFQ on what remains.
 */
TEST(Llq, Llq_Priority_Then_Standard) {
  const auto policy = make_policy(1000, {make_class("bulk", 2, 300),
                                         make_class("video", 5, 100),
                                         make_class("voice", 7, 200)});
  const auto res = LlqAlgorithm{}.calculate(policy);
  ASSERT_TRUE(res.has_value());
  ASSERT_EQ(res->size(), 3u);

  EXPECT_EQ((*res)[0].traffic_class.name, "voice");
  EXPECT_EQ((*res)[1].traffic_class.name, "video");
  EXPECT_EQ((*res)[2].traffic_class.name, "bulk");

  const auto& voice = (*res)[0];
  EXPECT_DOUBLE_EQ(voice.queue.weight, 0.0);
  EXPECT_DOUBLE_EQ(voice.queue.bandwidth_percent, 0.0);
  EXPECT_EQ(voice.queue.priority_level, 7);
  EXPECT_EQ(voice.queue.buffer_size, 8u);
  EXPECT_EQ(voice.queue.queue_limit, 32u);
  EXPECT_EQ(voice.congestion.algorithm, CongestionAlgorithm::TailDrop);
  EXPECT_EQ(voice.congestion.max_threshold, 0u);

  // Standard classes see 1000 - 300 = 700 kbps.
  EXPECT_NEAR((*res)[2].queue.bandwidth_percent, 300.0 / 700.0 * 100.0, 1e-9);
  EXPECT_NEAR((*res)[2].queue.weight, 100.0, 1e-9);
}

// --------------------------- FQ-CoDel ---------------------------------------

/**
 * @test FqCodel_Gigabit_Voice
 */
TEST(FqCodel, FqCodel_Gigabit_Voice) {
  const auto policy = make_policy(1000000, {make_class("voice", 7, 200000)});
  const auto res = FqCodelAlgorithm{}.calculate(policy);
  ASSERT_TRUE(res.has_value());
  const auto& c = res->front();
  EXPECT_EQ(c.queue.quantum, 4608u * 200u);
  EXPECT_DOUBLE_EQ(c.queue.weight, 4608.0 * 200.0);
  EXPECT_EQ(c.queue.flows, 2048u);
  EXPECT_EQ(c.queue.buffer_size, 4096u);
  EXPECT_EQ(c.queue.queue_limit, 8192u);
  EXPECT_EQ(c.congestion.algorithm, CongestionAlgorithm::Ecn);
  EXPECT_EQ(c.congestion.min_threshold, 2000u);
  EXPECT_EQ(c.congestion.max_threshold, 100000u);
}

/**
 * @test FqCodel_Tiers
 * @brief Target delay tiers, interval floor and minimum quantum.
 */
TEST(FqCodel, FqCodel_Tiers) {
  EXPECT_EQ(FqCodelAlgorithm::target_delay_us(6), 3000u);
  EXPECT_EQ(FqCodelAlgorithm::target_delay_us(3), 5000u);
  EXPECT_EQ(FqCodelAlgorithm::target_delay_us(0), 10000u);
  EXPECT_EQ(FqCodelAlgorithm::interval_us(0), 200000u);
  EXPECT_EQ(FqCodelAlgorithm::interval_us(7), 100000u);
  EXPECT_EQ(FqCodelAlgorithm::base_quantum(150000), 3072u);
  EXPECT_EQ(FqCodelAlgorithm::flows(50000), 1024u);

  const auto policy = make_policy(50000, {make_class("bulk", 0, 500)});
  const auto res = FqCodelAlgorithm{}.calculate(policy);
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ(res->front().queue.quantum, 1514u);
  EXPECT_EQ(res->front().queue.flows, 512u);
}

// --------------------------- DRR --------------------------------------------

/**
 * @test Drr_Weights_And_Quanta
 * @brief Output is sorted by priority; quanta follow the weight share, bounded below by 512.
 */
TEST(Drr, Drr_Weights_And_Quanta) {
  const auto policy = make_policy(1000, {make_class("bulk", 2, 300), make_class("voice", 7, 200)});
  const auto res = DrrAlgorithm{}.calculate(policy);
  ASSERT_TRUE(res.has_value());
  ASSERT_EQ(res->size(), 2u);

  const auto& voice = (*res)[0];
  const auto& bulk  = (*res)[1];
  EXPECT_EQ(voice.traffic_class.name, "voice");
  EXPECT_DOUBLE_EQ(voice.queue.weight, 8.0);
  EXPECT_DOUBLE_EQ(bulk.queue.weight, 3.0);
  EXPECT_EQ(voice.queue.quantum, 1090u);
  EXPECT_EQ(bulk.queue.quantum, 512u);
  EXPECT_EQ(voice.queue.buffer_size, 16u);
  EXPECT_EQ(voice.queue.queue_limit, 32u);

  EXPECT_EQ(voice.congestion.algorithm, CongestionAlgorithm::Red);
  EXPECT_EQ(voice.congestion.min_threshold, 8u);
  EXPECT_EQ(voice.congestion.max_threshold, 24u);
  EXPECT_EQ(bulk.congestion.algorithm, CongestionAlgorithm::TailDrop);
}

/**
 * @test Drr_Rejects_Oversubscription
 */
TEST(Drr, Drr_Rejects_Oversubscription) {
  const auto policy = make_policy(100, {make_class("a", 1, 80), make_class("b", 1, 80)});
  const auto res = DrrAlgorithm{}.calculate(policy);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind, ErrorKind::Validation);
}

/**
 * @test Drr_Quantum_Bounds
 */
TEST(Drr, Drr_Quantum_Bounds) {
  EXPECT_EQ(DrrAlgorithm::quantum(1.0, 0.0, 1000), 1500u);
  EXPECT_EQ(DrrAlgorithm::quantum(1.0, 1.0, 10000000), 65536u);
  EXPECT_EQ(DrrAlgorithm::buffer_size(65536), 260u);
  EXPECT_EQ(DrrAlgorithm::buffer_size(1000000), 1024u);
}

// --------------------------- Registry ---------------------------------------

/**
 * @test Registry_Supported_And_Unsupported
 */
TEST(Registry, Registry_Supported_And_Unsupported) {
  for (auto t : {AlgorithmType::Cbwfq, AlgorithmType::Llq, AlgorithmType::FqCodel, AlgorithmType::Drr}) {
    auto algo = make_algorithm(t);
    ASSERT_TRUE(algo.has_value());
    EXPECT_EQ((*algo)->type(), t);
  }
  for (auto t : {AlgorithmType::Fifo, AlgorithmType::Pq, AlgorithmType::Cq,
                 AlgorithmType::Fq, AlgorithmType::Wfq, AlgorithmType::Mdrr}) {
    auto algo = make_algorithm(t);
    ASSERT_FALSE(algo.has_value());
    EXPECT_EQ(algo.error().kind, ErrorKind::UnsupportedAlgorithm);
  }
}

/**
 * @test Registry_Parse_Names
 */
TEST(Registry, Registry_Parse_Names) {
  EXPECT_EQ(parse_algorithm("class_based_wfq"), AlgorithmType::Cbwfq);
  EXPECT_EQ(parse_algorithm("LLQ"), AlgorithmType::Llq);
  EXPECT_EQ(parse_algorithm("fq_codel"), AlgorithmType::FqCodel);
  EXPECT_EQ(parse_algorithm("deficit_round_robin"), AlgorithmType::Drr);
  EXPECT_FALSE(parse_algorithm("wrr").has_value());
}

/**
 * @test Allocation_Ignores_Zero_Weight
 * @brief Strict-priority queues (weight 0) take no part of the surplus.
 */
TEST(Allocation, Allocation_Ignores_Zero_Weight) {
  const auto policy = make_policy(1000, {make_class("voice", 7, 200), make_class("bulk", 2, 300)});
  const auto res = LlqAlgorithm{}.calculate(policy);
  ASSERT_TRUE(res.has_value());
  const auto shares = allocate_remaining(policy.bandwidth_limit, *res);
  ASSERT_EQ(shares.size(), 2u);
  EXPECT_DOUBLE_EQ(shares[0].shared_kbps, 0.0);
  EXPECT_DOUBLE_EQ(shares[0].total_kbps, 200.0);
  EXPECT_NEAR(shares[1].shared_kbps, 500.0, 1e-9);
}
