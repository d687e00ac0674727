#pragma once
/**
 * @file sdn_service.hpp
 * @brief Centralised QoS through an OpenFlow controller.
 * @details Builds traffic-engineering policies from traffic classes, deploys
 *          them across switches with a bounded pool of workers and monitors
 *          their flow counters. Per-switch failures are collected into the
 *          report instead of aborting the batch.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "qosctl/config/constants.hpp"
#include "qosctl/domain/errors.hpp"
#include "qosctl/domain/model.hpp"
#include "qosctl/obs/observability.hpp"
#include "qosctl/sdn/controller_api.hpp"
#include "qosctl/sdn/http_client.hpp"
#include "qosctl/sdn/openflow.hpp"

namespace qosctl::sdn {

/** @struct SdnConfig
 *  @brief Controller endpoint and deployment knobs.
 */
struct SdnConfig {
    ControllerType            controller{ControllerType::Onos};
    std::string               url{"http://127.0.0.1:8181"};
    std::string               username{"onos"};
    std::string               password{"rocks"};
    std::size_t               max_workers{config::constants::SDN_MAX_WORKERS};
    std::chrono::milliseconds request_timeout{config::constants::SDN_REQUEST_TIMEOUT_MS};
    uint32_t                  read_retries{config::constants::SDN_READ_RETRIES};  ///< Extra attempts for GETs
    double                    success_threshold{config::constants::SDN_SUCCESS_THRESHOLD};
};

enum class SwitchOutcome : uint8_t {
    Deployed,     ///< Queues, meters and every flow accepted
    Partial,      ///< Baseline in place, some flows rejected
    QueueFailed,  ///< A queue was rejected; flows skipped
    MeterFailed,  ///< A meter was rejected; flows skipped
    Skipped       ///< Not processed (cancelled)
};

std::string_view to_string(SwitchOutcome o) noexcept;

struct SwitchReport {
    std::string              switch_id;
    SwitchOutcome            outcome{SwitchOutcome::Skipped};
    std::size_t              flows_installed{0};
    std::vector<std::string> errors;
};

/** @struct DeploymentReport
 *  @brief Outcome of deploy().
 */
struct DeploymentReport {
    std::string               policy_id;
    std::vector<SwitchReport> switches;       ///< Same order as the target list
    std::size_t               attempts{0};    ///< switches x flows
    std::size_t               successes{0};   ///< Flows accepted
    double                    success_rate{0.0};
    bool                      success{false}; ///< success_rate > threshold (strict)
    bool                      cancelled{false};
};

struct SwitchStatistics {
    bool           reachable{false};
    FlowStatistics flows;
};

/** @struct PerformanceReport
 *  @brief Per-switch flow counters of one deployed policy and their totals.
 */
struct PerformanceReport {
    std::string                             policy_id;
    std::map<std::string, SwitchStatistics> switches;
    uint64_t                                total_flows{0};
    uint64_t                                total_bytes{0};
    uint64_t                                total_packets{0};
};

/** @struct SwitchPolicies
 *  @brief What a switch currently carries.
 */
struct SwitchPolicies {
    std::string              switch_id;
    uint64_t                 flows{0};
    std::size_t              meters{0};
    std::vector<std::string> policy_ids;  ///< Policies this service deployed there
};

class SdnService {
public:
    /// @p http must outlive the service.
    SdnService(SdnConfig cfg, HttpClient& http, obs::Observer* observer = nullptr);

    /**
     * @brief One queue, one meter and one flow per classifier for each class.
     * @details Flows are templates (switch "*") with set_queue, meter and output
     *          actions; queue and meter ids follow class order starting at 1.
     */
    SdnQosPolicy create_traffic_engineering_policy(const std::string& name,
                                                   const std::vector<domain::TrafficClass>& classes);

    /**
     * @brief Install @p policy on @p switches (topology discovery when empty).
     * @details Each switch gets its queues, then its meters, then its flows; a
     *          queue or meter failure skips that switch's flows. At most
     *          max_workers switches are handled concurrently. Once @p stop is
     *          requested, switches not yet started are reported Skipped.
     * @return Error only when topology discovery fails.
     */
    Result<DeploymentReport> deploy(SdnQosPolicy policy,
                                    std::vector<std::string> switches = {},
                                    std::stop_token stop = {});

    /// Flow counters of every switch a policy was deployed to.
    Result<PerformanceReport> monitor(const std::string& policy_id);

    /**
     * @brief Bind @p policy to one switch port, all or nothing.
     * @return Policy id to pass to remove_policy().
     */
    Result<std::string> apply_to_switch(const std::string& switch_id, uint32_t port,
                                        const domain::QoSPolicy& policy);

    /// Delete every flow recorded for @p policy_id and forget the policy.
    Result<void> remove_policy(const std::string& policy_id);

    /// Flow and meter counts of a switch plus the policies deployed there.
    Result<SwitchPolicies> applied_policies(const std::string& switch_id);

    /// Topology as reported by the controller (reads retried).
    Result<Topology> discover_topology();

    /// Ids of the policies currently tracked.
    std::vector<std::string> active_policies() const;

    const SdnConfig& config() const noexcept { return cfg_; }

private:
    /// Flow ids accepted per switch for one policy.
    struct ActivePolicy {
        SdnQosPolicy                                    policy;
        std::map<std::string, std::vector<std::string>> flow_ids;
    };

    SwitchReport deploy_switch(const SdnQosPolicy& policy, const std::string& switch_id,
                               std::vector<std::string>& flow_ids);

    /// Send with retries when the request is a read.
    Result<HttpResponse> send(const HttpRequest& request);

    SdnConfig                      cfg_;
    HttpClient&                    http_;
    obs::Observer*                 observer_{nullptr};
    std::unique_ptr<ControllerApi> api_;

    mutable std::mutex                  mu_;
    std::map<std::string, ActivePolicy> active_;
    std::atomic<uint64_t>               sequence_{0};
};

} // namespace qosctl::sdn
