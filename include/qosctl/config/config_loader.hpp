#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: JSON documents to AppConfig and QoSPolicy.
 * @details Missing keys keep the named defaults from constants.hpp; a present
 *          key with the wrong type or an out-of-range value is a Parse error
 *          naming the key.
 */

#include <chrono>
#include <string>
#include <string_view>

#include "qosctl/config/constants.hpp"
#include "qosctl/domain/errors.hpp"
#include "qosctl/domain/model.hpp"
#include "qosctl/obs/logging.hpp"
#include "qosctl/queueing/queue_algorithm.hpp"
#include "qosctl/recognition/app_recognition.hpp"
#include "qosctl/sdn/sdn_service.hpp"

namespace qosctl::config {

    /** @struct ExecutionConfig
     *  @brief Device command execution bounds.
     */
    struct ExecutionConfig {
        std::chrono::milliseconds device_timeout{constants::DEVICE_TIMEOUT_MS}; ///< Per device batch
    };

    /** @struct AppConfig
     *  @brief Aggregate of sub-configs required by the control plane.
     */
    struct AppConfig {
        obs::LoggingConfig             logging;      ///< Level and pattern
        recognition::RecognitionConfig recognition;  ///< Flow table and cleanup
        ExecutionConfig                execution;    ///< Device timeout
        sdn::SdnConfig                 sdn;          ///< Controller endpoint and deployment knobs
        queueing::AlgorithmType        default_algorithm{queueing::AlgorithmType::Cbwfq};
    };

    /** @class Loader
     *  @brief Source of configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /// All-defaults configuration.
        static AppConfig defaults();

        /**
         * @brief Load configuration from a JSON file.
         * @return Parse error when the file cannot be read or a key is malformed.
         */
        static Result<AppConfig> load_from_file(const std::string& path);

        /// Same as load_from_file() for an in-memory document.
        static Result<AppConfig> load_from_json(std::string_view text);
    };

    /**
     * @brief Parse a policy document.
     * @details Schema: {name, description?, bandwidth_limit, priority?, is_active?,
     *          traffic_classes: [{name, priority, min_bandwidth, max_bandwidth, dscp,
     *          burst, classifiers: [{protocol, source_ip?, destination_ip?,
     *          source_port_start?, source_port_end?, destination_port_start?,
     *          destination_port_end?, dscp_marking?, vlan?}]}]}.
     *          The result is not validated; run domain::validate_policy() on it.
     */
    Result<domain::QoSPolicy> parse_policy(std::string_view text);

    /// parse_policy() on the contents of a file.
    Result<domain::QoSPolicy> load_policy_file(const std::string& path);

} // namespace qosctl::config
