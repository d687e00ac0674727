/**
 * @file juniper_adapter.cpp
 * @brief JUNOS command generation and `display set` parsing.
 */
#include "qosctl/adapters/juniper_adapter.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <sstream>

#include "qosctl/config/constants.hpp"
#include "qosctl/domain/dscp.hpp"

namespace qosctl::adapters {

using domain::CongestionAlgorithm;
using queueing::AlgorithmType;

namespace {

constexpr std::array<std::string_view, 4> kBuiltinClasses{
    "best-effort", "expedited-forwarding", "assured-forwarding", "network-control"};

constexpr const char* kRedProfile  = "red-profile";
constexpr const char* kWredProfile = "wred-profile";

bool is_builtin_class(const std::string& name) {
    const std::string lower = domain::to_lower(name);
    return std::find(kBuiltinClasses.begin(), kBuiltinClasses.end(), lower) != kBuiltinClasses.end();
}

const char* scheduler_priority(uint8_t level) noexcept {
    if (level >= 7) return "high";
    if (level >= 4) return "medium";
    return "low";
}

void drop_profiles(CommandList& out, bool red, bool wred) {
    if (red) {
        out.push_back(fmt::format("set class-of-service drop-profiles {} interpolate fill-level 50 drop-probability 10", kRedProfile));
        out.push_back(fmt::format("set class-of-service drop-profiles {} interpolate fill-level 75 drop-probability 50", kRedProfile));
        out.push_back(fmt::format("set class-of-service drop-profiles {} interpolate fill-level 90 drop-probability 90", kRedProfile));
    }
    if (wred) {
        out.push_back(fmt::format("set class-of-service drop-profiles {} interpolate fill-level 40 drop-probability 5", kWredProfile));
        out.push_back(fmt::format("set class-of-service drop-profiles {} interpolate fill-level 60 drop-probability 20", kWredProfile));
        out.push_back(fmt::format("set class-of-service drop-profiles {} interpolate fill-level 80 drop-probability 70", kWredProfile));
    }
}

std::vector<std::string> split_words(std::string_view line) {
    std::vector<std::string> words;
    std::istringstream in{std::string(line)};
    std::string w;
    while (in >> w) words.push_back(std::move(w));
    return words;
}

} // namespace

bool JuniperAdapter::supports(AlgorithmType algorithm) const noexcept {
    return algorithm == AlgorithmType::Cbwfq || algorithm == AlgorithmType::Llq ||
           algorithm == AlgorithmType::Drr;
}

std::string JuniperAdapter::junos_name(std::string_view name) {
    return sanitize_name(name, '-', config::constants::JUNOS_MAX_NAME_LEN);
}

std::string JuniperAdapter::scheduler_map_name(std::string_view policy_name) {
    return junos_name(fmt::format("{}-sched-map", policy_name));
}

std::string JuniperAdapter::classifier_name(std::string_view policy_name) {
    return junos_name(fmt::format("{}-classifier", policy_name));
}

Result<CommandList> JuniperAdapter::generate(const GenerateRequest& request) const {
    if (auto ok = check_request(*this, request); !ok) {
        return qosctl_detail::unexpected<QosError>(ok.error());
    }

    const std::string policy = junos_name(request.policy_name);
    const std::string sched_map = scheduler_map_name(request.policy_name);
    const std::string classifier = classifier_name(request.policy_name);

    CommandList out;
    out.emplace_back("configure");

    // Forwarding classes, one queue each in output order.
    for (std::size_t i = 0; i < request.queues.size(); ++i) {
        const std::string fc = junos_name(request.queues[i].traffic_class.name);
        if (is_builtin_class(fc)) continue;
        out.push_back(fmt::format("set class-of-service forwarding-classes queue {} {}", i, fc));
    }

    const bool any_red = std::any_of(request.queues.begin(), request.queues.end(), [](const auto& q) {
        return q.congestion.algorithm == CongestionAlgorithm::Red;
    });
    const bool any_wred = std::any_of(request.queues.begin(), request.queues.end(), [](const auto& q) {
        return q.congestion.algorithm == CongestionAlgorithm::Wred;
    });
    drop_profiles(out, any_red, any_wred);

    for (const auto& q : request.queues) {
        const auto& qp = q.queue;
        const std::string scheduler = junos_name(fmt::format("{}-{}", policy, junos_name(q.traffic_class.name)));
        const std::string prefix = fmt::format("set class-of-service schedulers {}", scheduler);
        out.push_back(fmt::format("{} transmit-rate {}k", prefix, qp.service_rate));
        out.push_back(fmt::format("{} priority {}", prefix, scheduler_priority(qp.priority_level)));
        if (qp.buffer_size > 0) {
            out.push_back(fmt::format("{} buffer-size temporal {}k", prefix, qp.buffer_size));
        }
        if (q.congestion.algorithm == CongestionAlgorithm::Red) {
            out.push_back(fmt::format("{} drop-profile-map loss-priority low protocol any drop-profile {}", prefix, kRedProfile));
        } else if (q.congestion.algorithm == CongestionAlgorithm::Wred) {
            out.push_back(fmt::format("{} drop-profile-map loss-priority low protocol any drop-profile {}", prefix, kWredProfile));
            out.push_back(fmt::format("{} drop-profile-map loss-priority high protocol any drop-profile {}", prefix, kWredProfile));
        }
        out.push_back(fmt::format("set class-of-service scheduler-maps {} forwarding-class {} scheduler {}",
                                  sched_map, junos_name(q.traffic_class.name), scheduler));
    }

    out.push_back(fmt::format("set class-of-service classifiers dscp {} import default", classifier));
    for (const auto& q : request.queues) {
        const auto& tc = q.traffic_class;
        if (!tc.has_dscp() || !domain::dscp_code_point(tc.dscp)) continue;
        out.push_back(fmt::format("set class-of-service classifiers dscp {} forwarding-class {} loss-priority low code-points {}",
                                  classifier, junos_name(tc.name), domain::to_lower(tc.dscp)));
    }

    out.push_back(fmt::format("set class-of-service interfaces {} scheduler-map {}", request.interface_name, sched_map));
    out.push_back(fmt::format("set class-of-service interfaces {} unit 0 classifiers dscp {}", request.interface_name, classifier));
    out.emplace_back("commit check");
    out.emplace_back("commit");
    out.emplace_back("exit");
    return out;
}

CommandList JuniperAdapter::generate_removal(const std::string& interface_name,
                                             const std::string& policy_name,
                                             domain::Direction) const {
    return {
        "configure",
        fmt::format("delete class-of-service interfaces {} scheduler-map", interface_name),
        fmt::format("delete class-of-service interfaces {} unit 0 classifiers", interface_name),
        fmt::format("delete class-of-service scheduler-maps {}", scheduler_map_name(policy_name)),
        fmt::format("delete class-of-service classifiers dscp {}", classifier_name(policy_name)),
        "commit check",
        "commit",
        "exit",
    };
}

AppliedPolicies JuniperAdapter::parse_applied_policies(std::string_view show_output) {
    AppliedPolicies out;
    std::istringstream in{std::string(show_output)};
    std::string line;
    while (std::getline(in, line)) {
        const auto words = split_words(line);
        const auto itf = std::find(words.begin(), words.end(), "interfaces");
        if (itf == words.end() || std::next(itf) == words.end()) continue;
        const std::string& iface = *std::next(itf);

        const auto smap = std::find(words.begin(), words.end(), "scheduler-map");
        if (smap != words.end() && std::next(smap) != words.end()) {
            out[iface].push_back(AppliedPolicy{"scheduler-map", *std::next(smap), {}});
            continue;
        }
        const auto cls = std::find(words.begin(), words.end(), "classifiers");
        if (cls != words.end() && std::next(cls) != words.end()) {
            out[iface].push_back(AppliedPolicy{"classifier", words.back(), {}});
        }
    }
    return out;
}

} // namespace qosctl::adapters
