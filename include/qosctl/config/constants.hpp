#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the QoS control-plane components.
 * @details These values eliminate magic numbers from the codebase. Runtime knobs
 *          (logging, flow table, SDN controller) are overridable via the Config
 *          Loader (JSON); algorithm constants are fixed by design.
 */

#include <cstddef>
#include <cstdint>

namespace qosctl::config::constants {

// =====================
// DSCP PHB Codepoints (6-bit in IPv4 TOS / IPv6 Traffic Class)
// RFC 2474/2597/3246 etc. Keep as names (not literals) to avoid magic numbers.
// =====================
/// Best Effort: 000000
inline constexpr uint8_t DSCP_BE   = 0x00;
/// Class Selector 1: 001000
inline constexpr uint8_t DSCP_CS1  = 0x08;
/// Assured Forwarding 31: 011010
inline constexpr uint8_t DSCP_AF31 = 0x1A;
/// Assured Forwarding 41: 100010
inline constexpr uint8_t DSCP_AF41 = 0x22;
/// Class Selector 5: 101000
inline constexpr uint8_t DSCP_CS5  = 0x28;
/// Expedited Forwarding: 101110
inline constexpr uint8_t DSCP_EF   = 0x2E;
/// Class bits (CSn, AFn*) sit above the 3 low bits
inline constexpr unsigned DSCP_CLASS_SHIFT = 3;
/// AF drop precedence sits above the low bit
inline constexpr unsigned DSCP_DROP_SHIFT  = 1;
/// Shift from a 6-bit DSCP to the IPv4 TOS byte
inline constexpr unsigned DSCP_TOS_SHIFT = 2;
/// TOS mask covering the DSCP bits
inline constexpr uint8_t  DSCP_TOS_MASK  = 0xFC;

// =====================
// Traffic class limits
// =====================
inline constexpr uint8_t  MAX_CLASS_PRIORITY         = 7;  ///< Priorities are 0..7
inline constexpr uint8_t  PRIORITY_CLASS_THRESHOLD   = 5;  ///< >= 5 is latency-sensitive (LLQ strict / DRR RED)

// =====================
// CBWFQ
// Units: kbps for bandwidth, kb for burst, packets for buffers/limits
// =====================
inline constexpr double   CBWFQ_PRIORITY_SHARE   = 0.7;   ///< Weight of priority factor
inline constexpr double   CBWFQ_BANDWIDTH_SHARE  = 0.3;   ///< Weight of bandwidth factor
inline constexpr double   CBWFQ_WEIGHT_MIN       = 1.0;   ///< Weight floor
inline constexpr double   CBWFQ_WEIGHT_MAX       = 100.0; ///< Weight ceiling
inline constexpr double   AVG_PACKET_KB          = 1.5;   ///< Burst (kb) to packets divisor
inline constexpr double   PACKET_KBITS           = 12.0;  ///< ~1500 B packet in kbit
inline constexpr double   CBWFQ_BUFFER_SECONDS   = 0.1;   ///< 100 ms of traffic
inline constexpr uint32_t CBWFQ_MIN_BUFFER       = 16;
inline constexpr uint32_t CBWFQ_MIN_QUEUE_LIMIT  = 64;
inline constexpr uint32_t CBWFQ_MAX_QUEUE_LIMIT  = 4096;
inline constexpr uint32_t CBWFQ_QUEUE_DIVISOR    = 8;     ///< queue_limit = bw / 8
inline constexpr double   WRED_DEFAULT_DROP_PROB = 0.1;   ///< 10% max drop probability

// =====================
// LLQ
// =====================
inline constexpr double   LLQ_MAX_PRIORITY_PERCENT = 33.0;  ///< Strict-priority cap (% of limit)
inline constexpr double   LLQ_BUFFER_SECONDS       = 0.05;  ///< 50 ms of traffic
inline constexpr uint32_t LLQ_MIN_BUFFER           = 8;
inline constexpr uint32_t LLQ_MIN_QUEUE_LIMIT      = 32;
inline constexpr uint32_t LLQ_MAX_QUEUE_LIMIT      = 1024;
inline constexpr uint32_t LLQ_QUEUE_DIVISOR        = 16;    ///< queue_limit = bw / 16

// =====================
// FQ-CoDel
// Units: microseconds for delays, bytes for quanta
// =====================
inline constexpr uint32_t CODEL_TARGET_VOICE_US       = 2000;   ///< priority >= 7
inline constexpr uint32_t CODEL_TARGET_VIDEO_US       = 3000;   ///< priority >= 5
inline constexpr uint32_t CODEL_TARGET_INTERACTIVE_US = 5000;   ///< priority >= 3
inline constexpr uint32_t CODEL_TARGET_BULK_US        = 10000;  ///< everything else
inline constexpr uint32_t CODEL_MIN_INTERVAL_US       = 100000; ///< 100 ms
inline constexpr uint32_t CODEL_INTERVAL_FACTOR       = 20;     ///< interval = 20 x target
inline constexpr uint32_t FQ_MTU_QUANTUM              = 1514;   ///< 1 x MTU + L2 header
inline constexpr uint32_t FQ_QUANTUM_100M             = 3072;   ///< 2 x MTU
inline constexpr uint32_t FQ_QUANTUM_1G               = 4608;   ///< 3 x MTU
inline constexpr uint32_t FQ_TIER_100M_KBPS           = 100000;
inline constexpr uint32_t FQ_TIER_1G_KBPS             = 1000000;
inline constexpr uint32_t FQ_FLOWS_SMALL              = 512;
inline constexpr uint32_t FQ_FLOWS_DEFAULT            = 1024;
inline constexpr uint32_t FQ_FLOWS_LARGE              = 2048;
inline constexpr uint32_t FQ_FLOWS_10M_KBPS           = 10000;
inline constexpr uint32_t FQ_FLOWS_100M_KBPS          = 100000;

// =====================
// DRR
// =====================
inline constexpr uint32_t DRR_DEFAULT_QUANTUM    = 1500;   ///< Bytes, ~1 MTU
inline constexpr uint32_t DRR_MIN_QUANTUM        = 512;
inline constexpr uint32_t DRR_MAX_QUANTUM        = 65536;
inline constexpr uint32_t DRR_AVG_PACKET_BYTES   = 1000;
inline constexpr uint32_t DRR_BUFFER_PER_QUANTUM = 4;
inline constexpr uint32_t DRR_MIN_BUFFER         = 16;
inline constexpr uint32_t DRR_MAX_BUFFER         = 1024;
inline constexpr uint32_t DRR_BANDWIDTH_UNIT     = 100000; ///< kbps per bandwidth-factor step
inline constexpr uint32_t KBPS_PER_WEIGHT_UNIT   = 1000;   ///< min_bw / 1000 scaling (DRR, FQ-CoDel)

// =====================
// Application recognition
// =====================
inline constexpr double      FUSION_WEIGHT_PAYLOAD    = 0.4;
inline constexpr double      FUSION_WEIGHT_HEADER     = 0.3;
inline constexpr double      FUSION_WEIGHT_BEHAVIORAL = 0.2;
inline constexpr double      FUSION_WEIGHT_PORT       = 0.1;
inline constexpr double      PORT_MATCH_CONFIDENCE    = 0.6;
inline constexpr double      PAYLOAD_MAX_CONFIDENCE   = 0.9;
inline constexpr double      SIGNATURE_THRESHOLD      = 0.7;
inline constexpr uint32_t    FLOW_INACTIVITY_MINUTES  = 30;
inline constexpr uint32_t    FLOW_CLEANUP_INTERVAL_S  = 60;
inline constexpr std::size_t FLOW_MAX_PAYLOAD_SAMPLES = 10;
inline constexpr std::size_t FLOW_PAYLOAD_SAMPLE_BYTES = 200;
inline constexpr std::size_t FLOW_TABLE_SHARDS        = 16;
inline constexpr double      BIDIRECTIONAL_MIN_SECONDS = 5.0;
inline constexpr uint64_t    BIDIRECTIONAL_MIN_PACKETS = 10;
inline constexpr double      LOW_LATENCY_MIN_PPS       = 10.0;
inline constexpr double      CONSTANT_BITRATE_SCORE    = 0.5;

// =====================
// Vendor adapters
// =====================
inline constexpr uint32_t    DEVICE_TIMEOUT_MS        = 30000;
inline constexpr std::size_t JUNOS_MAX_NAME_LEN       = 32;
inline constexpr uint32_t    TC_FIRST_CLASS_MINOR     = 10;
inline constexpr uint32_t    TC_DEFAULT_CLASS_MINOR   = 30;
inline constexpr uint32_t    TC_MIN_CLASS_RATE_KBPS   = 1000;
inline constexpr uint32_t    TC_CEIL_FACTOR           = 2;
inline constexpr uint32_t    TC_DEFAULT_TOTAL_KBPS    = 100000;
inline constexpr uint32_t    TC_FILTER_PRIO_STEP      = 10;
inline constexpr uint32_t    TC_RED_AVPKT             = 1000;

// =====================
// SDN controller
// =====================
inline constexpr uint32_t OF_PRIORITY_EMERGENCY   = 65000;
inline constexpr uint32_t OF_PRIORITY_VOICE       = 50000;
inline constexpr uint32_t OF_PRIORITY_VIDEO       = 40000;
inline constexpr uint32_t OF_PRIORITY_INTERACTIVE = 30000;
inline constexpr uint32_t OF_PRIORITY_BULK        = 20000;
inline constexpr uint32_t OF_PRIORITY_DEFAULT     = 10000;
inline constexpr uint16_t ETH_TYPE_IPV4           = 0x0800;
inline constexpr std::size_t SDN_MAX_WORKERS      = 8;
inline constexpr uint32_t SDN_REQUEST_TIMEOUT_MS  = 5000;
inline constexpr uint32_t SDN_READ_RETRIES        = 2;
inline constexpr double   SDN_SUCCESS_THRESHOLD   = 0.8;  ///< Strict: rate must exceed this
inline constexpr uint64_t SDN_DEFAULT_METER_BURST_BITS = 1000000;
inline constexpr uint64_t SDN_DEFAULT_MIN_RATE_BPS = 1000000;   ///< Queue floor when min_bandwidth is 0
inline constexpr uint64_t SDN_DEFAULT_MAX_RATE_BPS = 10000000;  ///< Queue / meter cap when max_bandwidth is 0
inline constexpr const char* SDN_OUTPUT_PORT       = "NORMAL";

} // namespace qosctl::config::constants
