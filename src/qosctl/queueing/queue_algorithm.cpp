/**
 * @file queue_algorithm.cpp
 * @brief Algorithm names, registry, shared validation and surplus allocation.
 */
#include "qosctl/queueing/queue_algorithm.hpp"

#include <fmt/format.h>

#include <algorithm>

#include "qosctl/domain/dscp.hpp"
#include "qosctl/queueing/cbwfq.hpp"
#include "qosctl/queueing/drr.hpp"
#include "qosctl/queueing/fq_codel.hpp"
#include "qosctl/queueing/llq.hpp"

namespace qosctl::queueing {

std::string_view to_string(AlgorithmType t) noexcept {
    switch (t) {
        case AlgorithmType::Fifo:    return "fifo";
        case AlgorithmType::Pq:      return "pq";
        case AlgorithmType::Cq:      return "cq";
        case AlgorithmType::Fq:      return "fq";
        case AlgorithmType::Wfq:     return "wfq";
        case AlgorithmType::Cbwfq:   return "cbwfq";
        case AlgorithmType::Llq:     return "llq";
        case AlgorithmType::Mdrr:    return "mdrr";
        case AlgorithmType::FqCodel: return "fq_codel";
        case AlgorithmType::Drr:     return "drr";
    }
    return "fifo";
}

std::optional<AlgorithmType> parse_algorithm(std::string_view name) noexcept {
    const std::string n = domain::to_lower(name);
    if (n == "fifo")                                       return AlgorithmType::Fifo;
    if (n == "pq"    || n == "priority_queuing")           return AlgorithmType::Pq;
    if (n == "cq"    || n == "custom_queuing")             return AlgorithmType::Cq;
    if (n == "fq"    || n == "fair_queuing")               return AlgorithmType::Fq;
    if (n == "wfq"   || n == "weighted_fair_queuing")      return AlgorithmType::Wfq;
    if (n == "cbwfq" || n == "class_based_wfq")            return AlgorithmType::Cbwfq;
    if (n == "llq"   || n == "low_latency_queuing")        return AlgorithmType::Llq;
    if (n == "mdrr"  || n == "modified_drr")               return AlgorithmType::Mdrr;
    if (n == "fq_codel" || n == "fq-codel")                return AlgorithmType::FqCodel;
    if (n == "drr"   || n == "deficit_round_robin")        return AlgorithmType::Drr;
    return std::nullopt;
}

Result<std::unique_ptr<QueueAlgorithm>> make_algorithm(AlgorithmType type) {
    switch (type) {
        case AlgorithmType::Cbwfq:   return std::unique_ptr<QueueAlgorithm>(std::make_unique<CbwfqAlgorithm>());
        case AlgorithmType::Llq:     return std::unique_ptr<QueueAlgorithm>(std::make_unique<LlqAlgorithm>());
        case AlgorithmType::FqCodel: return std::unique_ptr<QueueAlgorithm>(std::make_unique<FqCodelAlgorithm>());
        case AlgorithmType::Drr:     return std::unique_ptr<QueueAlgorithm>(std::make_unique<DrrAlgorithm>());
        default:
            break;
    }
    return make_error(ErrorKind::UnsupportedAlgorithm,
                      fmt::format("queue algorithm '{}' is not supported", to_string(type)));
}

Result<void> check_guaranteed_bandwidth(const domain::QoSPolicy& policy) {
    if (policy.bandwidth_limit == 0) {
        return make_error(ErrorKind::Validation,
                          fmt::format("policy '{}': bandwidth_limit must be greater than 0", policy.name));
    }
    const uint64_t guaranteed = domain::total_min_bandwidth(policy.traffic_classes);
    if (guaranteed > policy.bandwidth_limit) {
        return make_error(ErrorKind::Validation,
                          fmt::format("guaranteed bandwidth ({} kbps) exceeds bandwidth limit ({} kbps)",
                                      guaranteed, policy.bandwidth_limit));
    }
    return {};
}

std::vector<BandwidthShare> allocate_remaining(uint32_t bandwidth_limit,
                                               const std::vector<domain::QueueConfiguration>& configs) {
    uint64_t committed = 0;
    double   total_weight = 0.0;
    for (const auto& c : configs) {
        committed += c.queue.service_rate;
        total_weight += std::max(0.0, c.queue.weight);
    }
    const double surplus = committed >= bandwidth_limit
        ? 0.0 : static_cast<double>(bandwidth_limit - committed);

    std::vector<BandwidthShare> out;
    out.reserve(configs.size());
    for (const auto& c : configs) {
        BandwidthShare s;
        s.class_name      = c.traffic_class.name;
        s.guaranteed_kbps = c.queue.service_rate;
        s.weight          = std::max(0.0, c.queue.weight);
        s.priority        = c.traffic_class.priority;
        if (total_weight > 0.0) {
            s.shared_kbps = surplus * (s.weight / total_weight);
        }
        s.total_kbps = static_cast<double>(s.guaranteed_kbps) + s.shared_kbps;
        out.push_back(std::move(s));
    }
    return out;
}

} // namespace qosctl::queueing
