/**
 * @file sdn_service.cpp
 * @brief Policy construction, bounded parallel deployment and monitoring.
 */
#include "qosctl/sdn/sdn_service.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <thread>
#include <utility>

namespace qosctl::sdn {

std::string_view to_string(SwitchOutcome o) noexcept {
    switch (o) {
        case SwitchOutcome::Deployed:    return "deployed";
        case SwitchOutcome::Partial:     return "partial";
        case SwitchOutcome::QueueFailed: return "queue_failed";
        case SwitchOutcome::MeterFailed: return "meter_failed";
        case SwitchOutcome::Skipped:     return "skipped";
    }
    return "skipped";
}

namespace {

std::string describe(const Result<HttpResponse>& resp) {
    if (!resp) return resp.error().message;
    return fmt::format("HTTP {}", resp->status);
}

bool accepted(const Result<HttpResponse>& resp) {
    return resp && is_success(resp->status);
}

} // namespace

SdnService::SdnService(SdnConfig cfg, HttpClient& http, obs::Observer* observer)
    : cfg_(std::move(cfg)), http_(http), observer_(observer) {
    api_ = make_controller_api(cfg_.controller,
                               ControllerEndpoint{cfg_.url, cfg_.username, cfg_.password, cfg_.request_timeout});
}

// ---------------------------------------------------------------------------
// Policy construction
// ---------------------------------------------------------------------------

SdnQosPolicy SdnService::create_traffic_engineering_policy(const std::string& name,
                                                           const std::vector<domain::TrafficClass>& classes) {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    SdnQosPolicy p;
    p.policy_id   = fmt::format("te_{}_{:%Y%m%d_%H%M%S}_{}", name, fmt::gmtime(now), ++sequence_);
    p.name        = name;
    p.description = fmt::format("Traffic engineering policy {}", name);

    for (std::size_t i = 0; i < classes.size(); ++i) {
        const auto& tc = classes[i];
        const auto id = static_cast<uint32_t>(i + 1);
        p.queues.push_back(make_queue(id, tc));
        p.meters.push_back(make_meter(id, tc));

        OpenFlowRule rule;
        rule.priority = openflow_priority(tc.priority);
        rule.actions  = {
            FlowAction{ActionType::SetQueue, id, {}},
            FlowAction{ActionType::Meter, id, {}},
            FlowAction{ActionType::Output, 0, config::constants::SDN_OUTPUT_PORT},
        };
        if (tc.classifiers.empty()) {
            rule.match = make_match(tc, nullptr);
            p.flows.push_back(rule);
        }
        for (const auto& c : tc.classifiers) {
            rule.match = make_match(tc, &c);
            p.flows.push_back(rule);
        }
    }
    return p;
}

// ---------------------------------------------------------------------------
// Deployment
// ---------------------------------------------------------------------------

Result<HttpResponse> SdnService::send(const HttpRequest& request) {
    const uint32_t attempts = is_idempotent_read(request.method) ? cfg_.read_retries + 1 : 1;
    Result<HttpResponse> last = make_error(ErrorKind::ConfigurationExecution, "request not sent");
    for (uint32_t i = 0; i < attempts; ++i) {
        last = http_.send(request);
        if (last && last->status < 500) return last;
        spdlog::debug("{} {} failed ({}), attempt {}/{}", to_string(request.method), request.url,
                      describe(last), i + 1, attempts);
    }
    return last;
}

Result<Topology> SdnService::discover_topology() {
    std::vector<std::string> bodies;
    for (const auto& req : api_->topology_requests()) {
        auto resp = send(req);
        if (!resp) return qosctl_detail::unexpected<QosError>(resp.error());
        if (resp->status != 200) {
            return make_error(ErrorKind::ConfigurationExecution,
                              fmt::format("topology query {} returned HTTP {}", req.url, resp->status));
        }
        bodies.push_back(std::move(resp->body));
    }
    auto topo = api_->parse_topology(bodies);
    if (topo) {
        spdlog::info("Topology: {} switch(es), {} link(s)", topo->switches.size(), topo->links.size());
    }
    return topo;
}

SwitchReport SdnService::deploy_switch(const SdnQosPolicy& policy, const std::string& switch_id,
                                       std::vector<std::string>& flow_ids) {
    SwitchReport r;
    r.switch_id = switch_id;

    // Queues are port properties on the switch; they are checked here and the
    // set_queue actions refer to them by id.
    for (const auto& q : policy.queues) {
        if (!queue_is_valid(q)) {
            r.outcome = SwitchOutcome::QueueFailed;
            r.errors.push_back(fmt::format("queue {} rejected: min {} bps, max {} bps",
                                           q.queue_id, q.min_rate_bps, q.max_rate_bps));
            spdlog::warn("{}: {}, flows skipped", switch_id, r.errors.back());
            return r;
        }
    }

    for (const auto& m : policy.meters) {
        const auto resp = send(api_->install_meter(switch_id, m));
        if (!accepted(resp)) {
            r.outcome = SwitchOutcome::MeterFailed;
            r.errors.push_back(fmt::format("meter {} rejected: {}", m.meter_id, describe(resp)));
            spdlog::warn("{}: {}, flows skipped", switch_id, r.errors.back());
            return r;
        }
        spdlog::debug("Meter {} installed on {}", m.meter_id, switch_id);
    }

    std::size_t n = 0;
    for (const auto& tmpl : policy.flows) {
        OpenFlowRule rule = tmpl;
        rule.switch_id = switch_id;
        const std::string requested = fmt::format("{}-{}", policy.policy_id, n++);
        const auto resp = send(api_->install_flow(rule, requested));
        if (!accepted(resp)) {
            r.errors.push_back(fmt::format("flow {} rejected: {}", requested, describe(resp)));
            continue;
        }
        flow_ids.push_back(api_->installed_flow_id(*resp, requested));
        ++r.flows_installed;
    }
    r.outcome = r.flows_installed == policy.flows.size() ? SwitchOutcome::Deployed : SwitchOutcome::Partial;
    return r;
}

Result<DeploymentReport> SdnService::deploy(SdnQosPolicy policy, std::vector<std::string> switches,
                                            std::stop_token stop) {
    if (switches.empty()) {
        auto topo = discover_topology();
        if (!topo) return qosctl_detail::unexpected<QosError>(topo.error());
        switches = std::move(topo->switches);
    }
    spdlog::info("Deploying {} to {} switch(es)", policy.policy_id, switches.size());

    DeploymentReport report;
    report.policy_id = policy.policy_id;
    report.switches.resize(switches.size());
    for (std::size_t i = 0; i < switches.size(); ++i) report.switches[i].switch_id = switches[i];

    std::vector<std::vector<std::string>> flow_ids(switches.size());
    std::atomic<std::size_t> next{0};
    const std::size_t workers = std::min(std::max<std::size_t>(cfg_.max_workers, 1), switches.size());
    {
        std::vector<std::jthread> pool;
        pool.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            pool.emplace_back([&] {
                while (!stop.stop_requested()) {
                    const std::size_t i = next.fetch_add(1);
                    if (i >= switches.size()) return;
                    report.switches[i] = deploy_switch(policy, switches[i], flow_ids[i]);
                }
            });
        }
    } // workers joined

    report.cancelled = stop.stop_requested();
    report.attempts  = switches.size() * policy.flows.size();
    for (const auto& s : report.switches) report.successes += s.flows_installed;
    report.success_rate = report.attempts > 0
        ? static_cast<double>(report.successes) / static_cast<double>(report.attempts) : 0.0;
    report.success = report.attempts > 0 && report.success_rate > cfg_.success_threshold;

    spdlog::info("Deployment of {} finished: {}/{} flows ({:.1f}%){}", policy.policy_id, report.successes,
                 report.attempts, report.success_rate * 100.0, report.cancelled ? ", cancelled" : "");

    policy.switches = switches;
    ActivePolicy entry{std::move(policy), {}};
    for (std::size_t i = 0; i < switches.size(); ++i) {
        if (!flow_ids[i].empty()) entry.flow_ids[switches[i]] = std::move(flow_ids[i]);
    }
    {
        std::lock_guard lk(mu_);
        active_[report.policy_id] = std::move(entry);
    }

    obs::notify(observer_, obs::Event{obs::EventKind::DeploymentFinished, report.policy_id,
                                      fmt::format("{}/{} flows", report.successes, report.attempts),
                                      report.success, report.success_rate});
    return report;
}

// ---------------------------------------------------------------------------
// Single switch
// ---------------------------------------------------------------------------

Result<std::string> SdnService::apply_to_switch(const std::string& switch_id, uint32_t port,
                                                const domain::QoSPolicy& policy) {
    if (auto ok = domain::validate_policy(policy); !ok) {
        return qosctl_detail::unexpected<QosError>(ok.error());
    }

    SdnQosPolicy te = create_traffic_engineering_policy(policy.name, policy.traffic_classes);
    te.description = fmt::format("{} on {} port {}", policy.name, switch_id, port);
    for (auto& f : te.flows) f.match.in_port = port;

    std::vector<std::string> ids;
    const SwitchReport r = deploy_switch(te, switch_id, ids);
    if (r.outcome != SwitchOutcome::Deployed) {
        const uint8_t table = te.flows.empty() ? 0 : te.flows.front().table_id;
        for (const auto& id : ids) {
            const auto resp = send(api_->remove_flow(switch_id, table, id));
            if (!accepted(resp)) spdlog::warn("{}: rollback of flow {} failed: {}", switch_id, id, describe(resp));
        }
        obs::notify(observer_, obs::Event{obs::EventKind::ExecutionFailed, switch_id,
                                          fmt::format("{} {}", policy.name, to_string(r.outcome)), false, 0.0});
        return make_error(ErrorKind::ConfigurationExecution,
                          fmt::format("policy {} not applied to {}:{}", policy.name, switch_id, port), r.errors);
    }

    te.switches = {switch_id};
    const std::string id = te.policy_id;
    {
        std::lock_guard lk(mu_);
        ActivePolicy entry{std::move(te), {}};
        entry.flow_ids[switch_id] = std::move(ids);
        active_[id] = std::move(entry);
    }
    spdlog::info("SDN policy {} applied on {}:{}", id, switch_id, port);
    obs::notify(observer_, obs::Event{obs::EventKind::PolicyApplied, id, switch_id, true, 1.0});
    return id;
}

Result<void> SdnService::remove_policy(const std::string& policy_id) {
    ActivePolicy entry;
    {
        std::lock_guard lk(mu_);
        const auto it = active_.find(policy_id);
        if (it == active_.end()) {
            return make_error(ErrorKind::PolicyNotFound, fmt::format("SDN policy {} is not deployed", policy_id));
        }
        entry = it->second;
    }

    const uint8_t table = entry.policy.flows.empty() ? 0 : entry.policy.flows.front().table_id;
    std::map<std::string, std::vector<std::string>> remaining;
    std::vector<std::string> failures;
    for (const auto& [sw, ids] : entry.flow_ids) {
        for (const auto& id : ids) {
            const auto resp = send(api_->remove_flow(sw, table, id));
            // 404: already gone.
            if (accepted(resp) || (resp && resp->status == 404)) continue;
            remaining[sw].push_back(id);
            failures.push_back(fmt::format("{}/{}: {}", sw, id, describe(resp)));
        }
    }

    {
        std::lock_guard lk(mu_);
        if (failures.empty()) {
            active_.erase(policy_id);
        } else if (const auto it = active_.find(policy_id); it != active_.end()) {
            it->second.flow_ids = std::move(remaining);
        }
    }
    if (!failures.empty()) {
        return make_error(ErrorKind::ConfigurationExecution,
                          fmt::format("{} flow(s) of {} could not be removed", failures.size(), policy_id),
                          std::move(failures));
    }
    spdlog::info("SDN policy {} removed", policy_id);
    obs::notify(observer_, obs::Event{obs::EventKind::PolicyRemoved, policy_id, {}, true, 0.0});
    return {};
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

Result<PerformanceReport> SdnService::monitor(const std::string& policy_id) {
    std::vector<std::string> switches;
    {
        std::lock_guard lk(mu_);
        const auto it = active_.find(policy_id);
        if (it == active_.end()) {
            return make_error(ErrorKind::PolicyNotFound, fmt::format("SDN policy {} is not deployed", policy_id));
        }
        switches = it->second.policy.switches;
    }

    PerformanceReport out;
    out.policy_id = policy_id;
    for (const auto& sw : switches) {
        SwitchStatistics st;
        const auto resp = send(api_->flow_statistics(sw));
        if (resp && resp->status == 200) {
            if (auto parsed = api_->parse_flow_statistics(resp->body)) {
                st.reachable = true;
                st.flows     = *parsed;
            } else {
                spdlog::warn("{}: {}", sw, parsed.error().message);
            }
        } else {
            spdlog::warn("{}: statistics unavailable ({})", sw, describe(resp));
        }
        if (st.reachable) {
            out.total_flows   += st.flows.flow_count;
            out.total_bytes   += st.flows.bytes;
            out.total_packets += st.flows.packets;
        }
        out.switches[sw] = st;
    }
    return out;
}

Result<SwitchPolicies> SdnService::applied_policies(const std::string& switch_id) {
    SwitchPolicies out;
    out.switch_id = switch_id;

    auto flows = send(api_->flow_statistics(switch_id));
    if (!flows) return qosctl_detail::unexpected<QosError>(flows.error());
    if (flows->status != 200) {
        return make_error(ErrorKind::ConfigurationExecution,
                          fmt::format("{}: flow query returned HTTP {}", switch_id, flows->status));
    }
    auto stats = api_->parse_flow_statistics(flows->body);
    if (!stats) return qosctl_detail::unexpected<QosError>(stats.error());
    out.flows = stats->flow_count;

    auto meters = send(api_->list_meters(switch_id));
    if (!meters) return qosctl_detail::unexpected<QosError>(meters.error());
    if (meters->status != 200) {
        return make_error(ErrorKind::ConfigurationExecution,
                          fmt::format("{}: meter query returned HTTP {}", switch_id, meters->status));
    }
    auto count = api_->parse_meter_count(meters->body);
    if (!count) return qosctl_detail::unexpected<QosError>(count.error());
    out.meters = *count;

    std::lock_guard lk(mu_);
    for (const auto& [id, entry] : active_) {
        const auto& sws = entry.policy.switches;
        if (std::find(sws.begin(), sws.end(), switch_id) != sws.end()) out.policy_ids.push_back(id);
    }
    return out;
}

std::vector<std::string> SdnService::active_policies() const {
    std::lock_guard lk(mu_);
    std::vector<std::string> ids;
    ids.reserve(active_.size());
    for (const auto& [id, entry] : active_) ids.push_back(id);
    return ids;
}

} // namespace qosctl::sdn
