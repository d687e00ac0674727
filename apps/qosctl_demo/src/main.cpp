/**
 * @file main.cpp
 * @brief qosctl_demo: compute a policy under every supported algorithm and
 *        render it for each vendor through a dry-run executor.
 *
 * Usage:
 *   qosctl_demo [config.json] [policy.json]
 *
 * Without a policy file a three-class sample (voice, video, bulk) is used.
 * Nothing is sent to a device; the commands are printed.
 */

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include "qosctl/adapters/command_executor.hpp"
#include "qosctl/config/config_loader.hpp"
#include "qosctl/obs/logging.hpp"
#include "qosctl/obs/observability.hpp"
#include "qosctl/orchestration/memory_repositories.hpp"
#include "qosctl/orchestration/use_cases.hpp"

using namespace qosctl;

namespace {

domain::QoSPolicy sample_policy() {
    domain::QoSPolicy p;
    p.name            = "branch_office";
    p.description     = "Voice, video and bulk on a 10 Mbps uplink";
    p.bandwidth_limit = 10000;

    domain::TrafficClass voice;
    voice.name          = "voice";
    voice.priority      = 7;
    voice.min_bandwidth = 2000;
    voice.max_bandwidth = 3000;
    voice.dscp          = "EF";
    voice.classifiers.push_back(domain::TrafficClassifier{
        "rtp", domain::Protocol::Udp, std::nullopt, std::nullopt, std::nullopt,
        domain::PortRange{16384, 32767}, std::nullopt, std::nullopt});

    domain::TrafficClass video;
    video.name          = "video";
    video.priority      = 5;
    video.min_bandwidth = 1000;
    video.dscp          = "AF41";
    video.classifiers.push_back(domain::TrafficClassifier{
        "conferencing", domain::Protocol::Tcp, std::nullopt, std::nullopt, std::nullopt,
        domain::PortRange{443, 443}, std::nullopt, std::nullopt});

    domain::TrafficClass bulk;
    bulk.name          = "bulk";
    bulk.priority      = 1;
    bulk.min_bandwidth = 2000;
    bulk.dscp          = "CS1";

    p.traffic_classes = {voice, video, bulk};
    return p;
}

void print_error(const QosError& err) {
    std::cerr << "error (" << to_string(err.kind) << "): " << err.message << '\n';
    for (const auto& d : err.details) std::cerr << "  - " << d << '\n';
}

void print_allocation(const orchestration::AllocationReport& r) {
    std::cout << fmt::format("\n[{}] guaranteed {} of {} kbps, {} kbps shared\n",
                             queueing::to_string(r.algorithm), r.total_guaranteed, r.bandwidth_limit, r.remaining);
    std::cout << fmt::format("  {:<16} {:>4} {:>10} {:>10} {:>10} {:>10}\n",
                             "class", "prio", "rate", "weight", "shared", "total");
    for (const auto& s : r.shares) {
        std::cout << fmt::format("  {:<16} {:>4} {:>10} {:>10.1f} {:>10.1f} {:>10.1f}\n",
                                 s.class_name, s.priority, s.guaranteed_kbps, s.weight, s.shared_kbps, s.total_kbps);
    }
}

orchestration::NetworkDevice make_device(std::string name, adapters::DeviceVendor vendor, std::string iface) {
    orchestration::NetworkDevice d;
    d.name   = std::move(name);
    d.vendor = vendor;
    d.interfaces.push_back(orchestration::NetworkInterface{1, std::move(iface), std::nullopt, 0});
    return d;
}

} // namespace

int main(int argc, char** argv) {
    auto cfg = argc > 1 ? config::Loader::load_from_file(argv[1]) : Result<config::AppConfig>(config::Loader::defaults());
    if (!cfg) {
        print_error(cfg.error());
        return 1;
    }
    if (auto ok = obs::init_logging(cfg->logging); !ok) {
        print_error(ok.error());
        return 1;
    }
    spdlog::info("qosctl_demo {}", QOSCTL_VERSION);

    auto policy = argc > 2 ? config::load_policy_file(argv[2]) : Result<domain::QoSPolicy>(sample_policy());
    if (!policy) {
        print_error(policy.error());
        return 1;
    }
    if (auto ok = domain::validate_policy(*policy); !ok) {
        print_error(ok.error());
        return 1;
    }

    orchestration::InMemoryPolicyRepository      policies;
    orchestration::InMemoryDeviceRepository      devices;
    orchestration::InMemoryAssociationRepository associations;
    adapters::DryRunExecutor                     executor;
    obs::Observer*                               observer = obs::make_simple_observer();

    const auto policy_id = policies.save(*policy);
    std::cout << fmt::format("Policy {} ({} classes, {} kbps)\n", policy->name, policy->traffic_classes.size(),
                             policy->bandwidth_limit);

    // ---- Bandwidth allocation per algorithm ----
    orchestration::CalculateBandwidthAllocationUseCase calc(policies);
    for (auto algo : {queueing::AlgorithmType::Cbwfq, queueing::AlgorithmType::Llq,
                      queueing::AlgorithmType::FqCodel, queueing::AlgorithmType::Drr}) {
        auto report = calc.execute(policy_id, algo);
        if (!report) {
            std::cout << fmt::format("\n[{}] rejected: {}\n", queueing::to_string(algo), report.error().message);
            continue;
        }
        print_allocation(*report);
    }

    // ---- Vendor rendering through the dry-run executor ----
    struct Target {
        orchestration::NetworkDevice device;
        queueing::AlgorithmType      algorithm;
    };
    const Target targets[] = {
        {make_device("cisco-edge", adapters::DeviceVendor::Cisco, "GigabitEthernet0/1"), queueing::AlgorithmType::Llq},
        {make_device("junos-core", adapters::DeviceVendor::Juniper, "ge-0/0/1"), queueing::AlgorithmType::Cbwfq},
        {make_device("linux-host", adapters::DeviceVendor::Linux, "eth0"), cfg->default_algorithm},
    };

    orchestration::ValidateAndApplyPolicyUseCase apply(orchestration::Dependencies{
        policies, devices, associations, executor, nullptr, observer, cfg->execution.device_timeout});

    int failures = 0;
    for (const auto& t : targets) {
        const auto device_id = devices.save(t.device);
        const auto& iface = t.device.interfaces.front().name;
        const auto r = apply.execute(orchestration::ApplyRequest{policy_id, device_id, iface,
                                                                 domain::Direction::Egress, t.algorithm, false});
        std::cout << fmt::format("\n== {} {} ({}) ==\n", t.device.name, iface, queueing::to_string(t.algorithm));
        if (!r.success) {
            ++failures;
            std::cout << "failed: " << r.message << '\n';
            for (const auto& e : r.errors) std::cout << "  - " << e << '\n';
            continue;
        }
        for (const auto& line : r.commands_generated) std::cout << "  " << line << '\n';
        for (const auto& w : r.warnings) std::cout << "  warning: " << w << '\n';
    }

    const auto counters = observer->snapshot();
    std::cout << fmt::format("\n{} batch(es) rendered, {} applied, {} validation failure(s), {} execution failure(s)\n",
                             executor.batches(), counters.policies_applied, counters.validation_failures,
                             counters.execution_failures);
    return failures == 0 ? 0 : 2;
}
