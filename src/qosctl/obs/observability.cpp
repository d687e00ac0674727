/**
 * @file observability.cpp
 * @brief spdlog-backed implementation of Observer.
 */
#include "qosctl/obs/observability.hpp"

#include <spdlog/spdlog.h>

#include <mutex>

namespace qosctl::obs {

    const char* to_string(EventKind k) noexcept {
        switch (k) {
            case EventKind::PolicyApplied:      return "policy_applied";
            case EventKind::PolicyRemoved:      return "policy_removed";
            case EventKind::ValidationFailed:   return "validation_failed";
            case EventKind::ExecutionFailed:    return "execution_failed";
            case EventKind::DeploymentFinished: return "deployment_finished";
            case EventKind::FlowClassified:     return "flow_classified";
        }
        return "unknown";
    }

    class SimpleObserver : public Observer {
    public:
        void record(const Event& e) override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                switch (e.kind) {
                    case EventKind::PolicyApplied:    ctr_.policies_applied++; break;
                    case EventKind::PolicyRemoved:    ctr_.policies_removed++; break;
                    case EventKind::ValidationFailed: ctr_.validation_failures++; break;
                    case EventKind::ExecutionFailed:  ctr_.execution_failures++; break;
                    case EventKind::DeploymentFinished:
                        ctr_.deployments++;
                        if (!e.success) ctr_.failed_deployments++;
                        break;
                    case EventKind::FlowClassified:   ctr_.classifications++; break;
                }
            }
            // Per-flow verdicts are high volume; keep them out of info-level output.
            const auto lvl = e.kind == EventKind::FlowClassified ? spdlog::level::debug
                           : e.success ? spdlog::level::info : spdlog::level::warn;
            spdlog::log(lvl, R"({{"event":"{}","subject":"{}","success":{},"value":{:.3f},"detail":"{}"}})",
                        to_string(e.kind), e.subject, e.success, e.value, e.detail);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_simple_observer() {
        static SimpleObserver obs; // process-wide singleton
        return &obs;
    }

} // namespace qosctl::obs
