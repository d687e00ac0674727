/**
 * @file signatures.cpp
 * @brief Built-in application signatures (VoIP, video, gaming, web, mail).
 */
#include "qosctl/recognition/signatures.hpp"

#include <algorithm>
#include <utility>

#include "qosctl/config/constants.hpp"

namespace qosctl::recognition {

using domain::PortRange;
using domain::Protocol;

bool ApplicationSignature::has_port(uint16_t port) const noexcept {
    if (port == 0) return false;
    return std::any_of(ports.begin(), ports.end(), [port](const PortRange& r) {
        return r.start <= port && port <= r.end;
    });
}

std::regex compile_pattern(const std::string& pattern) {
    return std::regex(pattern, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
}

namespace {

PortRange port(uint16_t p) { return PortRange{p, p}; }

BehaviorPattern size_range(uint32_t lo, uint32_t hi) {
    return BehaviorPattern{BehaviorKind::PacketSizeRange, "packet_size_range", lo, hi};
}

BehaviorPattern trait(BehaviorKind kind, std::string name) {
    return BehaviorPattern{kind, std::move(name), 0, 0};
}

BehaviorPattern label(std::string name) {
    return BehaviorPattern{BehaviorKind::Descriptive, std::move(name), 0, 0};
}

ApplicationSignature make(std::string key, std::string app, std::string category,
                          std::vector<Protocol> protocols, std::vector<PortRange> ports,
                          std::vector<std::string> payload,
                          std::vector<std::pair<std::string, std::string>> headers,
                          std::vector<BehaviorPattern> behavior) {
    ApplicationSignature s;
    s.key       = std::move(key);
    s.app_name  = std::move(app);
    s.category  = std::move(category);
    s.protocols = std::move(protocols);
    s.ports     = std::move(ports);
    s.payload_patterns = std::move(payload);
    s.payload_regex.reserve(s.payload_patterns.size());
    for (const auto& p : s.payload_patterns) s.payload_regex.push_back(compile_pattern(p));
    for (auto& [name, pattern] : headers) {
        HeaderPattern h;
        h.name     = std::move(name);
        h.pattern  = std::move(pattern);
        h.compiled = compile_pattern(h.pattern);
        s.headers.push_back(std::move(h));
    }
    s.behavior = std::move(behavior);
    s.confidence_threshold = config::constants::SIGNATURE_THRESHOLD;
    return s;
}

} // namespace

std::vector<ApplicationSignature> load_builtin_signatures() {
    // Byte escapes are resolved by the regex engine, so NUL bytes stay inside
    // the pattern. [\s\S] is "any byte" without relying on a signed char range.
    std::vector<ApplicationSignature> out;
    out.reserve(8);

    out.push_back(make("sip", "SIP", "voice", {Protocol::Udp, Protocol::Tcp}, {port(5060), port(5061)},
                       {R"(INVITE sip:)", R"(SIP/2\.0)", R"(Via: SIP/2\.0)", R"(Content-Type: application/sdp)"},
                       {{"User-Agent", R"(.*SIP.*)"}},
                       {size_range(100, 1500), label("flow_duration"), trait(BehaviorKind::Bidirectional, "bidirectional")}));

    out.push_back(make("rtp", "RTP", "voice", {Protocol::Udp}, {PortRange{16384, 32767}},
                       {R"(\x80[\s\S]{11})"},
                       {},
                       {size_range(160, 200), label("packet_interval"), trait(BehaviorKind::ConstantBitrate, "constant_bitrate")}));

    out.push_back(make("rtmp", "RTMP", "video_streaming", {Protocol::Tcp}, {port(1935)},
                       {R"(\x03\x00\x00\x00)", R"(connect\x00)", R"(play\x00)"},
                       {},
                       {label("variable_bitrate"), label("large_packets"), label("sustained_connection")}));

    out.push_back(make("http_video", "HTTP Video", "video_streaming", {Protocol::Tcp},
                       {port(80), port(443), port(8080)},
                       {R"(GET .+\.m3u8)", R"(GET .+\.ts)", R"(Content-Type: video/)", R"(Range: bytes=)"},
                       {{"Content-Type", R"(video/.*)"}, {"User-Agent", R"(.*(VLC|YouTube|Netflix).*)"}},
                       {label("chunked_download"), label("high_bandwidth")}));

    out.push_back(make("steam", "Steam", "gaming", {Protocol::Tcp, Protocol::Udp}, {port(27015), port(27036)},
                       {R"(Steam.*)", R"(\xFF\xFF\xFF\xFF)"},
                       {},
                       {trait(BehaviorKind::LowLatency, "low_latency_required"), label("irregular_patterns")}));

    out.push_back(make("http", "HTTP", "web_browsing", {Protocol::Tcp}, {port(80)},
                       {R"(GET .+ HTTP/1\.[01])", R"(POST .+ HTTP/1\.[01])", R"(HTTP/1\.[01] \d{3})",
                        R"(Content-Type: text/html)"},
                       {{"Host", R"(.*)"}, {"User-Agent", R"(.*(Mozilla|Chrome|Safari).*)"}},
                       {label("request_response"), label("mixed_content")}));

    out.push_back(make("https", "HTTPS", "web_browsing", {Protocol::Tcp}, {port(443)},
                       {R"(\x16\x03[\x01-\x03])", R"(\x17\x03[\x01-\x03])"},
                       {},
                       {label("encrypted"), label("certificate_exchange")}));

    out.push_back(make("smtp", "SMTP", "email", {Protocol::Tcp}, {port(25), port(587)},
                       {R"(220 .+ SMTP)", R"(EHLO )", R"(MAIL FROM:)", R"(RCPT TO:)"},
                       {},
                       {label("command_response"), label("text_based")}));

    return out;
}

} // namespace qosctl::recognition
