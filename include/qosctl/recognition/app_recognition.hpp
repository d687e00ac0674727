#pragma once
/**
 * @file app_recognition.hpp
 * @brief Application recognition: four classifiers fused into one verdict.
 * @details Every packet updates the live flow table, then the flow snapshot is
 *          classified by port, payload (DPI), behaviour and headers. Results
 *          with a positive confidence are weighted per method (payload 0.4,
 *          header 0.3, behavioural 0.2, port 0.1) and summed per application.
 *          The header and behavioural classifiers require the signature's
 *          confidence threshold; port and payload results are used as they are.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "qosctl/obs/observability.hpp"
#include "qosctl/recognition/flow_table.hpp"
#include "qosctl/recognition/qos_templates.hpp"
#include "qosctl/recognition/signatures.hpp"

namespace qosctl::recognition {

/** @enum Method
 *  @brief Classification technique.
 */
enum class Method : uint8_t { Port, Payload, Behavioral, Header };

/// "port_based", "payload_based", "behavioral_based", "header_based".
std::string_view to_string(Method m) noexcept;
/// Fusion weight of a method.
double method_weight(Method m) noexcept;

/// Output of a single classifier; confidence 0 means "no opinion".
struct MethodResult {
    Method      method{Method::Port};
    std::string application{"unknown"};
    std::string category{"unclassified"};
    double      confidence{0.0};
};

/// Aggregated score of one candidate application.
struct Candidate {
    std::string         application;
    std::string         category;   ///< Category reported by the first contributing method
    double              confidence{0.0};
    std::vector<Method> methods;
};

/**
 * @struct ClassificationResult
 * @brief Fused verdict for a flow.
 */
struct ClassificationResult {
    std::string            application{"unknown"};
    std::string            category{"unclassified"};
    double                 confidence{0.0};   ///< Capped at 1.0
    std::vector<Method>    methods_used;      ///< Methods behind the winner (all methods when nothing matched)
    std::vector<Candidate> candidates;        ///< Every candidate, first-seen order
};

/// Statistics derived from a flow snapshot.
struct FlowCharacteristics {
    double   duration_s{0.0};
    uint64_t packets{0};
    uint64_t bytes{0};
    double   average_packet_size{0.0};
    double   packets_per_second{0.0};
    double   bytes_per_second{0.0};
    bool     bidirectional{false};
};

/** @struct RecognitionConfig
 *  @brief Flow retention and cleanup knobs.
 */
struct RecognitionConfig {
    FlowTableConfig      table;
    std::chrono::minutes flow_inactivity{30};   ///< Default eviction age
    std::chrono::seconds cleanup_interval{60};  ///< Background cleanup period
};

/// Counters exposed by statistics().
struct RecognitionStats {
    std::size_t                     active_flows{0};
    uint64_t                        packets_observed{0};
    uint64_t                        classifications{0};
    std::map<std::string, uint64_t> by_category;  ///< Winning category -> count
};

/**
 * @class AppRecognitionService
 * @brief Long-lived owner of the flow table and signature set.
 * @details Thread-safe: classify() may be called from any number of threads.
 *          The optional background cleanup runs on its own thread and is
 *          stopped by stop_cleanup() or the destructor.
 */
class AppRecognitionService {
public:
    explicit AppRecognitionService(RecognitionConfig cfg = {}, obs::Observer* observer = nullptr);
    ~AppRecognitionService();

    AppRecognitionService(const AppRecognitionService&) = delete;
    AppRecognitionService& operator=(const AppRecognitionService&) = delete;

    /// Observe a packet and classify its flow (timestamp = now).
    ClassificationResult classify(const PacketObservation& packet);
    /// Same, with an explicit observation time.
    ClassificationResult classify(const PacketObservation& packet, Clock::time_point now);

    // ---- Individual classifiers (pure over a flow snapshot) ----
    MethodResult classify_by_port(const TrafficFlow& flow) const;
    MethodResult classify_by_payload(const TrafficFlow& flow) const;
    MethodResult classify_by_behavior(const TrafficFlow& flow) const;
    MethodResult classify_by_headers(const TrafficFlow& flow) const;

    /**
     * @brief Weighted fusion of method results.
     * @details Ties go to the candidate seen first; the final confidence is
     *          capped at 1.0.
     */
    static ClassificationResult fuse(const std::vector<MethodResult>& results);

    static FlowCharacteristics characteristics(const TrafficFlow& flow);
    /// Matched descriptors / descriptor count (0 for an empty list).
    static double behavioral_score(const FlowCharacteristics& fc, const std::vector<BehaviorPattern>& patterns);

    /// QoS template for a traffic class (see suggest_qos_template()).
    QosTemplate suggest_qos_policy(std::string_view traffic_class) const;

    /// Known traffic classes.
    static std::vector<std::string> traffic_classes();

    /// Evict flows idle for longer than @p max_age; returns the number evicted.
    std::size_t cleanup_old_flows(std::chrono::minutes max_age);
    std::size_t cleanup_old_flows(std::chrono::minutes max_age, Clock::time_point now);

    /// Run cleanup_old_flows(max_age) every @p interval until stopped. Restarts if running.
    void start_cleanup(std::chrono::milliseconds interval, std::chrono::minutes max_age);
    void start_cleanup() { start_cleanup(cfg_.cleanup_interval, cfg_.flow_inactivity); }
    void stop_cleanup();
    bool cleanup_running() const noexcept { return cleanup_.joinable(); }

    RecognitionStats statistics() const;

    const std::vector<ApplicationSignature>& signatures() const noexcept { return signatures_; }
    const FlowTable& flows() const noexcept { return flows_; }

private:
    RecognitionConfig                 cfg_;
    obs::Observer*                    observer_{nullptr};
    std::vector<ApplicationSignature> signatures_;  ///< Read-only after construction
    FlowTable                         flows_;

    std::atomic<uint64_t>             packets_observed_{0};
    std::atomic<uint64_t>             classifications_{0};
    mutable std::mutex                stats_mu_;
    std::map<std::string, uint64_t>   by_category_;

    std::mutex                        cleanup_mu_;
    std::condition_variable_any       cleanup_cv_;
    std::jthread                      cleanup_;
};

} // namespace qosctl::recognition
