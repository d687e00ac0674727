/**
 * @file app_recognition.cpp
 * @brief Flow bookkeeping, the four classifiers and weighted fusion.
 */
#include "qosctl/recognition/app_recognition.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>

#include "qosctl/config/constants.hpp"

namespace qosctl::recognition {

namespace k = config::constants;

std::string_view to_string(Method m) noexcept {
    switch (m) {
        case Method::Port:       return "port_based";
        case Method::Payload:    return "payload_based";
        case Method::Behavioral: return "behavioral_based";
        case Method::Header:     return "header_based";
    }
    return "port_based";
}

double method_weight(Method m) noexcept {
    switch (m) {
        case Method::Payload:    return k::FUSION_WEIGHT_PAYLOAD;
        case Method::Header:     return k::FUSION_WEIGHT_HEADER;
        case Method::Behavioral: return k::FUSION_WEIGHT_BEHAVIORAL;
        case Method::Port:       return k::FUSION_WEIGHT_PORT;
    }
    return k::FUSION_WEIGHT_PORT;
}

namespace {

MethodResult verdict(Method m, const ApplicationSignature& sig, double confidence) {
    return MethodResult{m, sig.app_name, sig.category, confidence};
}

} // namespace

AppRecognitionService::AppRecognitionService(RecognitionConfig cfg, obs::Observer* observer)
    : cfg_(std::move(cfg)),
      observer_(observer),
      signatures_(load_builtin_signatures()),
      flows_(cfg_.table) {}

AppRecognitionService::~AppRecognitionService() {
    stop_cleanup();
}

// -----------------------------------------------------------------------------
// Entry point
// -----------------------------------------------------------------------------
ClassificationResult AppRecognitionService::classify(const PacketObservation& packet) {
    return classify(packet, Clock::now());
}

ClassificationResult AppRecognitionService::classify(const PacketObservation& packet, Clock::time_point now) {
    packets_observed_.fetch_add(1, std::memory_order_relaxed);
    const TrafficFlow flow = flows_.observe(packet, now);

    // Order is significant: it is the first-seen order used to break ties.
    ClassificationResult out = fuse({classify_by_port(flow),
                                     classify_by_payload(flow),
                                     classify_by_behavior(flow),
                                     classify_by_headers(flow)});

    classifications_.fetch_add(1, std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lk(stats_mu_);
        ++by_category_[out.category];
    }
    obs::notify(observer_, obs::Event{obs::EventKind::FlowClassified, out.application, out.category,
                                      out.confidence > 0.0, out.confidence});
    return out;
}

// -----------------------------------------------------------------------------
// Classifiers
// -----------------------------------------------------------------------------
MethodResult AppRecognitionService::classify_by_port(const TrafficFlow& flow) const {
    for (const auto& sig : signatures_) {
        if (sig.has_port(flow.key.destination_port) || sig.has_port(flow.key.source_port)) {
            return verdict(Method::Port, sig, k::PORT_MATCH_CONFIDENCE);
        }
    }
    return MethodResult{Method::Port};
}

MethodResult AppRecognitionService::classify_by_payload(const TrafficFlow& flow) const {
    MethodResult best{Method::Payload};
    if (flow.payload_samples.empty()) return best;

    for (const auto& sig : signatures_) {
        if (sig.payload_regex.empty()) continue;
        std::size_t hits = 0;
        for (const auto& sample : flow.payload_samples) {
            for (const auto& re : sig.payload_regex) {
                if (std::regex_search(sample, re)) ++hits;
            }
        }
        if (hits == 0) continue;
        const double conf = std::min(k::PAYLOAD_MAX_CONFIDENCE,
                                     static_cast<double>(hits) / static_cast<double>(sig.payload_regex.size()));
        // No signature threshold here; the fusion weight discounts weak matches.
        if (conf > best.confidence) best = verdict(Method::Payload, sig, conf);
    }
    return best;
}

MethodResult AppRecognitionService::classify_by_headers(const TrafficFlow& flow) const {
    if (flow.headers.empty()) return MethodResult{Method::Header};

    static const std::string kMissing;
    for (const auto& sig : signatures_) {
        if (sig.headers.empty()) continue;
        std::size_t hits = 0;
        for (const auto& h : sig.headers) {
            const auto it = flow.headers.find(h.name);
            const std::string& value = it == flow.headers.end() ? kMissing : it->second;
            if (std::regex_search(value, h.compiled)) ++hits;
        }
        const double conf = static_cast<double>(hits) / static_cast<double>(sig.headers.size());
        if (conf >= sig.confidence_threshold) return verdict(Method::Header, sig, conf);
    }
    return MethodResult{Method::Header};
}

MethodResult AppRecognitionService::classify_by_behavior(const TrafficFlow& flow) const {
    const FlowCharacteristics fc = characteristics(flow);

    const ApplicationSignature* best = nullptr;
    double best_score = 0.0;
    for (const auto& sig : signatures_) {
        if (sig.behavior.empty()) continue;
        const double score = behavioral_score(fc, sig.behavior);
        if (score > best_score) {
            best_score = score;
            best = &sig;
        }
    }
    if (best != nullptr && best_score >= best->confidence_threshold) {
        return verdict(Method::Behavioral, *best, best_score);
    }
    return MethodResult{Method::Behavioral};
}

FlowCharacteristics AppRecognitionService::characteristics(const TrafficFlow& flow) {
    FlowCharacteristics fc;
    fc.duration_s = std::chrono::duration<double>(flow.last_seen - flow.first_seen).count();
    fc.packets    = flow.packets;
    fc.bytes      = flow.bytes;

    const double pkts = static_cast<double>(std::max<uint64_t>(flow.packets, 1));
    const double secs = std::max(fc.duration_s, 1.0);
    fc.average_packet_size = static_cast<double>(flow.bytes) / pkts;
    fc.packets_per_second  = static_cast<double>(flow.packets) / secs;
    fc.bytes_per_second    = static_cast<double>(flow.bytes) / secs;
    fc.bidirectional = fc.duration_s > k::BIDIRECTIONAL_MIN_SECONDS &&
                       flow.packets > k::BIDIRECTIONAL_MIN_PACKETS;
    return fc;
}

double AppRecognitionService::behavioral_score(const FlowCharacteristics& fc,
                                               const std::vector<BehaviorPattern>& patterns) {
    double score = 0.0;
    for (const auto& p : patterns) {
        switch (p.kind) {
            case BehaviorKind::PacketSizeRange:
                if (fc.average_packet_size >= p.min_size && fc.average_packet_size <= p.max_size) score += 1.0;
                break;
            case BehaviorKind::ConstantBitrate:
                if (fc.bytes_per_second > 0.0) score += k::CONSTANT_BITRATE_SCORE;
                break;
            case BehaviorKind::Bidirectional:
                if (fc.bidirectional) score += 1.0;
                break;
            case BehaviorKind::LowLatency:
                if (fc.packets_per_second > k::LOW_LATENCY_MIN_PPS) score += 1.0;
                break;
            case BehaviorKind::Descriptive:
                break;
        }
    }
    return score / static_cast<double>(std::max<std::size_t>(patterns.size(), 1));
}

// -----------------------------------------------------------------------------
// Fusion
// -----------------------------------------------------------------------------
ClassificationResult AppRecognitionService::fuse(const std::vector<MethodResult>& results) {
    ClassificationResult out;

    for (const auto& r : results) {
        if (r.confidence <= 0.0) continue;
        auto it = std::find_if(out.candidates.begin(), out.candidates.end(),
                               [&r](const Candidate& c) { return c.application == r.application; });
        if (it == out.candidates.end()) {
            out.candidates.push_back(Candidate{r.application, r.category, 0.0, {}});
            it = std::prev(out.candidates.end());
        }
        it->confidence += r.confidence * method_weight(r.method);
        it->methods.push_back(r.method);
    }

    if (out.candidates.empty()) {
        for (const auto& r : results) out.methods_used.push_back(r.method);
        return out;
    }

    // max_element keeps the first of equal elements.
    const auto best = std::max_element(out.candidates.begin(), out.candidates.end(),
                                       [](const Candidate& a, const Candidate& b) { return a.confidence < b.confidence; });
    out.application  = best->application;
    out.category     = best->category;
    out.confidence   = std::min(1.0, best->confidence);
    out.methods_used = best->methods;
    return out;
}

// -----------------------------------------------------------------------------
// Templates / catalogue
// -----------------------------------------------------------------------------
QosTemplate AppRecognitionService::suggest_qos_policy(std::string_view traffic_class) const {
    return suggest_qos_template(traffic_class);
}

std::vector<std::string> AppRecognitionService::traffic_classes() {
    return {"voice", "video_conferencing", "video_streaming", "gaming",
            "web_browsing", "email", "file_transfer", "database",
            "backup", "monitoring", "management", "unknown"};
}

// -----------------------------------------------------------------------------
// Maintenance
// -----------------------------------------------------------------------------
std::size_t AppRecognitionService::cleanup_old_flows(std::chrono::minutes max_age) {
    return cleanup_old_flows(max_age, Clock::now());
}

std::size_t AppRecognitionService::cleanup_old_flows(std::chrono::minutes max_age, Clock::time_point now) {
    const std::size_t evicted = flows_.evict_older_than(now - max_age);
    if (evicted > 0) {
        spdlog::info("recognition: evicted {} idle flow(s), {} active", evicted, flows_.size());
    }
    return evicted;
}

void AppRecognitionService::start_cleanup(std::chrono::milliseconds interval, std::chrono::minutes max_age) {
    stop_cleanup();
    cleanup_ = std::jthread([this, interval, max_age](std::stop_token st) {
        std::unique_lock<std::mutex> lk(cleanup_mu_);
        while (!st.stop_requested()) {
            // Returns early only when stop is requested.
            if (cleanup_cv_.wait_for(lk, st, interval, [] { return false; })) break;
            if (st.stop_requested()) break;
            lk.unlock();
            cleanup_old_flows(max_age);
            lk.lock();
        }
    });
    spdlog::debug("recognition: cleanup every {} ms, max age {} min",
                  static_cast<long long>(interval.count()), static_cast<long long>(max_age.count()));
}

void AppRecognitionService::stop_cleanup() {
    if (!cleanup_.joinable()) return;
    cleanup_.request_stop();
    cleanup_.join();
    cleanup_ = std::jthread{};
}

RecognitionStats AppRecognitionService::statistics() const {
    RecognitionStats s;
    s.active_flows     = flows_.size();
    s.packets_observed = packets_observed_.load(std::memory_order_relaxed);
    s.classifications  = classifications_.load(std::memory_order_relaxed);
    std::lock_guard<std::mutex> lk(stats_mu_);
    s.by_category = by_category_;
    return s;
}

} // namespace qosctl::recognition
