/**
 * @file qos_templates.cpp
 * @brief Template table and keyword lookup.
 */
#include "qosctl/recognition/qos_templates.hpp"

#include <fmt/format.h>

#include <algorithm>

#include "qosctl/domain/dscp.hpp"

namespace qosctl::recognition {

const std::vector<QosTemplate>& qos_templates() {
    static const std::vector<QosTemplate> table{
        {"voice", {"sip", "rtp", "voice", "voip"},
         "Voice_Policy", "Policy tuned for voice", 15, 7, 20, 10, 0.1},
        {"video_conferencing", {"video", "conference", "webrtc", "zoom", "teams"},
         "VideoConf_Policy", "Policy for video conferencing", 25, 6, 150, 50, 0.5},
        {"video_streaming", {"streaming", "youtube", "netflix", "rtmp"},
         "VideoStream_Policy", "Policy for video streaming", 40, 4, 500, 100, 1.0},
        {"gaming", {"game", "gaming", "steam"},
         "Gaming_Policy", "Policy for online gaming", 20, 5, 50, 20, 0.3},
        {"web_browsing", {"http", "https", "web", "browser"},
         "Web_Policy", "Policy for web browsing", 30, 3, 200, 100, 2.0},
        {"default", {},
         "Default_Policy", "Default policy", 10, 2, 1000, 500, 5.0},
    };
    return table;
}

QosTemplate suggest_qos_template(std::string_view traffic_class) {
    std::string normalized = domain::to_lower(traffic_class);
    std::replace(normalized.begin(), normalized.end(), ' ', '_');

    const auto& table = qos_templates();
    for (const auto& t : table) {
        const bool hit = std::any_of(t.keywords.begin(), t.keywords.end(), [&normalized](const std::string& kw) {
            return normalized.find(kw) != std::string::npos;
        });
        if (hit) {
            QosTemplate custom = t;
            custom.name        = fmt::format("{}_{}", t.name, traffic_class);
            custom.description = fmt::format("{} for {}", t.description, traffic_class);
            return custom;
        }
    }
    return table.back();
}

} // namespace qosctl::recognition
