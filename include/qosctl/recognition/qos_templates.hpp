#pragma once
/**
 * @file qos_templates.hpp
 * @brief QoS policy templates suggested for recognized traffic categories.
 */

#include <string>
#include <string_view>
#include <vector>

namespace qosctl::recognition {

/**
 * @struct QosTemplate
 * @brief Suggested service level for a traffic category.
 */
struct QosTemplate {
    std::string              key;                       ///< Category id ("voice")
    std::vector<std::string> keywords;                  ///< Substrings that select this template
    std::string              name;                      ///< Policy name ("Voice_Policy")
    std::string              description;
    int                      bandwidth_allocation{0};   ///< Percent of the link
    int                      priority{0};               ///< 0..7
    int                      latency_target_ms{0};
    int                      jitter_tolerance_ms{0};
    double                   packet_loss_tolerance{0};  ///< Percent

    bool operator==(const QosTemplate&) const = default;
};

/**
 * @brief Built-in templates in matching order.
 * @details voice, video_conferencing, video_streaming, gaming, web_browsing,
 *          then the keyword-less default.
 */
const std::vector<QosTemplate>& qos_templates();

/**
 * @brief Template for a traffic class or application name.
 * @details The name is lower-cased with spaces turned into underscores, and the
 *          first template with a keyword contained in it wins; its name and
 *          description are suffixed with the caller's original string. Without a
 *          match the default template is returned unchanged.
 */
QosTemplate suggest_qos_template(std::string_view traffic_class);

} // namespace qosctl::recognition
