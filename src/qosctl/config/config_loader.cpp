/**
 * @file config_loader.cpp
 * @brief nlohmann::json backed loader; defaults come from constants.hpp.
 */
#include "qosctl/config/config_loader.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>
#include <utility>

namespace qosctl::config {
    using nlohmann::json;
    using namespace qosctl::config::constants;

    namespace {

        qosctl_detail::unexpected<QosError> bad_key(const std::string& path, std::string_view what) {
            return make_error(ErrorKind::Parse, fmt::format("{}: {}", path, what));
        }

        std::string join(const std::string& parent, std::string_view key) {
            return parent.empty() ? std::string(key) : fmt::format("{}.{}", parent, key);
        }

        /// Sub-object at @p key; nullptr when absent or null.
        Result<const json*> section(const json& obj, const std::string& key, const std::string& path) {
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null()) return static_cast<const json*>(nullptr);
            if (!it->is_object()) return bad_key(path, "expected an object");
            return &*it;
        }

        template <class T>
        Result<T> read_unsigned(const json& obj, const std::string& key, const std::string& parent, T fallback) {
            const std::string path = join(parent, key);
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null()) return fallback;
            if (!it->is_number_unsigned()) return bad_key(path, "expected a non-negative integer");
            const auto v = it->get<uint64_t>();
            if (v > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
                return bad_key(path, fmt::format("{} is out of range", v));
            }
            return static_cast<T>(v);
        }

        Result<int64_t> read_int(const json& obj, const std::string& key, const std::string& parent, int64_t fallback) {
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null()) return fallback;
            if (!it->is_number_integer()) return bad_key(join(parent, key), "expected an integer");
            return it->get<int64_t>();
        }

        Result<double> read_double(const json& obj, const std::string& key, const std::string& parent, double fallback) {
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null()) return fallback;
            if (!it->is_number()) return bad_key(join(parent, key), "expected a number");
            return it->get<double>();
        }

        Result<bool> read_bool(const json& obj, const std::string& key, const std::string& parent, bool fallback) {
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null()) return fallback;
            if (!it->is_boolean()) return bad_key(join(parent, key), "expected true or false");
            return it->get<bool>();
        }

        Result<std::optional<std::string>> read_string(const json& obj, const std::string& key,
                                                       const std::string& parent) {
            auto it = obj.find(key);
            if (it == obj.end() || it->is_null()) return std::optional<std::string>{};
            if (!it->is_string()) return bad_key(join(parent, key), "expected a string");
            return std::optional<std::string>{it->get<std::string>()};
        }

        /// Assign @p out from a Result or bail out of the enclosing function.
#define QOSCTL_READ(out, expr)                                                      \
        do {                                                                        \
            auto qosctl_r_ = (expr);                                                \
            if (!qosctl_r_) return qosctl_detail::unexpected<QosError>(qosctl_r_.error()); \
            out = std::move(*qosctl_r_);                                            \
        } while (0)

        Result<json> parse_document(std::string_view text, std::string_view what) {
            json doc = json::parse(text.begin(), text.end(), nullptr, false);
            if (doc.is_discarded()) return make_error(ErrorKind::Parse, fmt::format("{} is not valid JSON", what));
            if (!doc.is_object()) return make_error(ErrorKind::Parse, fmt::format("{} must be a JSON object", what));
            return doc;
        }

        Result<std::string> read_file(const std::string& path) {
            std::ifstream in(path, std::ios::binary);
            if (!in) return make_error(ErrorKind::Parse, fmt::format("cannot open {}", path));
            return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        }

        // ------------------------------- AppConfig ------------------------------

        Result<void> read_logging(const json& doc, obs::LoggingConfig& out) {
            const json* s = nullptr;
            QOSCTL_READ(s, section(doc, "logging", "logging"));
            if (s == nullptr) return {};
            std::optional<std::string> v;
            QOSCTL_READ(v, read_string(*s, "level", "logging"));
            if (v) out.level = *v;
            QOSCTL_READ(v, read_string(*s, "pattern", "logging"));
            if (v) out.pattern = *v;
            return {};
        }

        Result<void> read_recognition(const json& doc, recognition::RecognitionConfig& out) {
            const json* s = nullptr;
            QOSCTL_READ(s, section(doc, "recognition", "recognition"));
            if (s == nullptr) return {};
            const std::string p = "recognition";

            uint32_t minutes = 0;
            QOSCTL_READ(minutes, read_unsigned<uint32_t>(*s, "flow_inactivity_minutes", p,
                                                         static_cast<uint32_t>(out.flow_inactivity.count())));
            out.flow_inactivity = std::chrono::minutes(minutes);

            uint32_t seconds = 0;
            QOSCTL_READ(seconds, read_unsigned<uint32_t>(*s, "cleanup_interval_seconds", p,
                                                         static_cast<uint32_t>(out.cleanup_interval.count())));
            if (seconds == 0) return bad_key(join(p, "cleanup_interval_seconds"), "must be at least 1");
            out.cleanup_interval = std::chrono::seconds(seconds);

            QOSCTL_READ(out.table.max_payload_samples,
                        read_unsigned<std::size_t>(*s, "max_payload_samples", p, out.table.max_payload_samples));
            QOSCTL_READ(out.table.payload_sample_bytes,
                        read_unsigned<std::size_t>(*s, "payload_sample_bytes", p, out.table.payload_sample_bytes));
            QOSCTL_READ(out.table.shards, read_unsigned<std::size_t>(*s, "shards", p, out.table.shards));
            if (out.table.shards == 0) return bad_key(join(p, "shards"), "must be at least 1");
            return {};
        }

        Result<void> read_execution(const json& doc, ExecutionConfig& out) {
            const json* s = nullptr;
            QOSCTL_READ(s, section(doc, "execution", "execution"));
            if (s == nullptr) return {};
            uint32_t ms = 0;
            QOSCTL_READ(ms, read_unsigned<uint32_t>(*s, "device_timeout_ms", "execution",
                                                    static_cast<uint32_t>(out.device_timeout.count())));
            if (ms == 0) return bad_key("execution.device_timeout_ms", "must be at least 1");
            out.device_timeout = std::chrono::milliseconds(ms);
            return {};
        }

        Result<void> read_sdn(const json& doc, sdn::SdnConfig& out) {
            const json* s = nullptr;
            QOSCTL_READ(s, section(doc, "sdn", "sdn"));
            if (s == nullptr) return {};
            const std::string p = "sdn";

            std::optional<std::string> v;
            QOSCTL_READ(v, read_string(*s, "controller", p));
            if (v) {
                auto c = sdn::parse_controller(*v);
                if (!c) return bad_key(join(p, "controller"), fmt::format("unknown controller '{}'", *v));
                out.controller = *c;
            }
            QOSCTL_READ(v, read_string(*s, "url", p));
            if (v) out.url = *v;
            QOSCTL_READ(v, read_string(*s, "username", p));
            if (v) out.username = *v;
            QOSCTL_READ(v, read_string(*s, "password", p));
            if (v) out.password = *v;

            QOSCTL_READ(out.max_workers, read_unsigned<std::size_t>(*s, "max_workers", p, out.max_workers));
            if (out.max_workers == 0) return bad_key(join(p, "max_workers"), "must be at least 1");

            uint32_t ms = 0;
            QOSCTL_READ(ms, read_unsigned<uint32_t>(*s, "request_timeout_ms", p,
                                                    static_cast<uint32_t>(out.request_timeout.count())));
            out.request_timeout = std::chrono::milliseconds(ms);
            QOSCTL_READ(out.read_retries, read_unsigned<uint32_t>(*s, "read_retries", p, out.read_retries));

            QOSCTL_READ(out.success_threshold, read_double(*s, "success_threshold", p, out.success_threshold));
            if (out.success_threshold < 0.0 || out.success_threshold > 1.0) {
                return bad_key(join(p, "success_threshold"), "must be within [0, 1]");
            }
            return {};
        }

        Result<AppConfig> from_document(const json& doc) {
            AppConfig cfg = Loader::defaults();
            if (auto r = read_logging(doc, cfg.logging); !r) return qosctl_detail::unexpected<QosError>(r.error());
            if (auto r = read_recognition(doc, cfg.recognition); !r) return qosctl_detail::unexpected<QosError>(r.error());
            if (auto r = read_execution(doc, cfg.execution); !r) return qosctl_detail::unexpected<QosError>(r.error());
            if (auto r = read_sdn(doc, cfg.sdn); !r) return qosctl_detail::unexpected<QosError>(r.error());

            std::optional<std::string> algo;
            QOSCTL_READ(algo, read_string(doc, "default_algorithm", ""));
            if (algo) {
                auto t = queueing::parse_algorithm(*algo);
                if (!t) return bad_key("default_algorithm", fmt::format("unknown algorithm '{}'", *algo));
                if (!queueing::is_supported(*t)) {
                    return bad_key("default_algorithm", fmt::format("'{}' has no calculator", *algo));
                }
                cfg.default_algorithm = *t;
            }
            return cfg;
        }

        // ------------------------------- Policies -------------------------------

        Result<std::optional<domain::PortRange>> read_ports(const json& obj, std::string_view prefix,
                                                            const std::string& parent) {
            const std::string start_key = fmt::format("{}_port_start", prefix);
            const std::string end_key   = fmt::format("{}_port_end", prefix);
            uint16_t start = 0;
            uint16_t end   = 0;
            QOSCTL_READ(start, read_unsigned<uint16_t>(obj, start_key, parent, 0));
            QOSCTL_READ(end, read_unsigned<uint16_t>(obj, end_key, parent, 0));
            if (start == 0 && end == 0) return std::optional<domain::PortRange>{};
            if (start == 0) return bad_key(join(parent, end_key), fmt::format("{} requires {}", end_key, start_key));
            if (end == 0) end = start;
            if (end < start) return bad_key(join(parent, end_key), fmt::format("{} is below {}", end, start));
            return std::optional<domain::PortRange>{domain::PortRange{start, end}};
        }

        Result<domain::TrafficClassifier> read_classifier(const json& obj, const std::string& path) {
            if (!obj.is_object()) return bad_key(path, "expected an object");
            domain::TrafficClassifier c;

            std::optional<std::string> v;
            QOSCTL_READ(v, read_string(obj, "name", path));
            if (v) c.name = *v;
            QOSCTL_READ(v, read_string(obj, "protocol", path));
            if (v) {
                auto proto = domain::parse_protocol(*v);
                if (!proto) return bad_key(join(path, "protocol"), fmt::format("unknown protocol '{}'", *v));
                c.protocol = *proto;
            }
            QOSCTL_READ(c.source_ip, read_string(obj, "source_ip", path));
            QOSCTL_READ(c.destination_ip, read_string(obj, "destination_ip", path));
            QOSCTL_READ(c.source_ports, read_ports(obj, "source", path));
            QOSCTL_READ(c.destination_ports, read_ports(obj, "destination", path));
            QOSCTL_READ(c.dscp_marking, read_string(obj, "dscp_marking", path));

            auto it = obj.find("vlan");
            if (it != obj.end() && !it->is_null()) {
                uint16_t vlan = 0;
                QOSCTL_READ(vlan, read_unsigned<uint16_t>(obj, "vlan", path, 0));
                if (vlan > 4095) return bad_key(join(path, "vlan"), fmt::format("{} is not a VLAN id", vlan));
                c.vlan = vlan;
            }
            return c;
        }

        Result<domain::TrafficClass> read_class(const json& obj, const std::string& path) {
            if (!obj.is_object()) return bad_key(path, "expected an object");
            domain::TrafficClass tc;

            std::optional<std::string> v;
            QOSCTL_READ(v, read_string(obj, "name", path));
            if (!v || v->empty()) return bad_key(join(path, "name"), "is required");
            tc.name = *v;
            QOSCTL_READ(tc.priority, read_unsigned<uint8_t>(obj, "priority", path, 0));
            QOSCTL_READ(tc.min_bandwidth, read_unsigned<uint32_t>(obj, "min_bandwidth", path, 0));
            QOSCTL_READ(tc.max_bandwidth, read_unsigned<uint32_t>(obj, "max_bandwidth", path, 0));
            QOSCTL_READ(tc.burst, read_unsigned<uint32_t>(obj, "burst", path, 0));
            QOSCTL_READ(v, read_string(obj, "dscp", path));
            if (v) tc.dscp = *v;

            auto it = obj.find("classifiers");
            if (it != obj.end() && !it->is_null()) {
                if (!it->is_array()) return bad_key(join(path, "classifiers"), "expected an array");
                for (std::size_t i = 0; i < it->size(); ++i) {
                    domain::TrafficClassifier c;
                    QOSCTL_READ(c, read_classifier((*it)[i], fmt::format("{}.classifiers[{}]", path, i)));
                    tc.classifiers.push_back(std::move(c));
                }
            }
            return tc;
        }

        Result<domain::QoSPolicy> policy_from_document(const json& doc) {
            domain::QoSPolicy p;

            std::optional<std::string> v;
            QOSCTL_READ(v, read_string(doc, "name", ""));
            if (!v || v->empty()) return bad_key("name", "is required");
            p.name = *v;
            QOSCTL_READ(v, read_string(doc, "description", ""));
            if (v) p.description = *v;

            if (!doc.contains("bandwidth_limit")) return bad_key("bandwidth_limit", "is required");
            QOSCTL_READ(p.bandwidth_limit, read_unsigned<uint32_t>(doc, "bandwidth_limit", "", 0));

            int64_t priority = 0;
            QOSCTL_READ(priority, read_int(doc, "priority", "", 0));
            if (priority < std::numeric_limits<int32_t>::min() || priority > std::numeric_limits<int32_t>::max()) {
                return bad_key("priority", "is out of range");
            }
            p.priority = static_cast<int32_t>(priority);
            QOSCTL_READ(p.is_active, read_bool(doc, "is_active", "", true));

            auto it = doc.find("traffic_classes");
            if (it != doc.end() && !it->is_null()) {
                if (!it->is_array()) return bad_key("traffic_classes", "expected an array");
                for (std::size_t i = 0; i < it->size(); ++i) {
                    domain::TrafficClass tc;
                    QOSCTL_READ(tc, read_class((*it)[i], fmt::format("traffic_classes[{}]", i)));
                    p.traffic_classes.push_back(std::move(tc));
                }
            }
            return p;
        }

#undef QOSCTL_READ

    } // namespace

    AppConfig Loader::defaults() {
        AppConfig cfg;
        cfg.recognition.flow_inactivity               = std::chrono::minutes(FLOW_INACTIVITY_MINUTES);
        cfg.recognition.cleanup_interval              = std::chrono::seconds(FLOW_CLEANUP_INTERVAL_S);
        cfg.recognition.table.shards                  = FLOW_TABLE_SHARDS;
        cfg.recognition.table.max_payload_samples     = FLOW_MAX_PAYLOAD_SAMPLES;
        cfg.recognition.table.payload_sample_bytes    = FLOW_PAYLOAD_SAMPLE_BYTES;
        cfg.execution.device_timeout                  = std::chrono::milliseconds(DEVICE_TIMEOUT_MS);
        return cfg;
    }

    Result<AppConfig> Loader::load_from_json(std::string_view text) {
        try {
            auto doc = parse_document(text, "configuration");
            if (!doc) return qosctl_detail::unexpected<QosError>(doc.error());
            return from_document(*doc);
        } catch (const json::exception& e) {
            return make_error(ErrorKind::Parse, "configuration could not be read", {e.what()});
        }
    }

    Result<AppConfig> Loader::load_from_file(const std::string& path) {
        auto text = read_file(path);
        if (!text) return qosctl_detail::unexpected<QosError>(text.error());
        return load_from_json(*text);
    }

    Result<domain::QoSPolicy> parse_policy(std::string_view text) {
        try {
            auto doc = parse_document(text, "policy");
            if (!doc) return qosctl_detail::unexpected<QosError>(doc.error());
            return policy_from_document(*doc);
        } catch (const json::exception& e) {
            return make_error(ErrorKind::Parse, "policy could not be read", {e.what()});
        }
    }

    Result<domain::QoSPolicy> load_policy_file(const std::string& path) {
        auto text = read_file(path);
        if (!text) return qosctl_detail::unexpected<QosError>(text.error());
        return parse_policy(*text);
    }

} // namespace qosctl::config
