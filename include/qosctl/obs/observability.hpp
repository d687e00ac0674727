#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade: control-plane events + counters.
 * @details The default sink counts events and forwards one line per event to
 *          spdlog. Components take an Observer* and treat nullptr as "no sink".
 */

#include <cstdint>
#include <string>

namespace qosctl::obs {

    /** @enum EventKind
     *  @brief Kind of control-plane event.
     */
    enum class EventKind : uint8_t {
        PolicyApplied = 0,   ///< Policy configured on an interface
        PolicyRemoved,       ///< Policy removed from an interface
        ValidationFailed,    ///< Policy rejected before touching a device
        ExecutionFailed,     ///< Device or controller refused the configuration
        DeploymentFinished,  ///< SDN batch completed (success or not)
        FlowClassified       ///< Application recognition produced a verdict
    };

    /** @struct Counters
     *  @brief Process-level counters.
     */
    struct Counters {
        uint64_t policies_applied{0};     ///< Successful applications
        uint64_t policies_removed{0};     ///< Successful removals
        uint64_t validation_failures{0};  ///< Rejected policies
        uint64_t execution_failures{0};   ///< Failed device / controller calls
        uint64_t deployments{0};          ///< SDN batches (any outcome)
        uint64_t failed_deployments{0};   ///< SDN batches below the success threshold
        uint64_t classifications{0};      ///< Recognition verdicts
    };

    /** @struct Event
     *  @brief Payload describing one event.
     */
    struct Event {
        EventKind   kind{EventKind::PolicyApplied};
        std::string subject;     ///< Policy, device or application the event is about
        std::string detail;      ///< Free text (for humans/logs)
        bool        success{true};
        double      value{0.0};  ///< Success rate, confidence, ...
    };

    /// Stable lower-case label ("policy_applied", ...).
    const char* to_string(EventKind k) noexcept;

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single event.
        virtual void record(const Event& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Process-wide spdlog-backed observer.
    Observer* make_simple_observer();

    /// Null-safe helper used by components holding an optional Observer*.
    inline void notify(Observer* o, Event e) {
        if (o != nullptr) o->record(e);
    }

} // namespace qosctl::obs
