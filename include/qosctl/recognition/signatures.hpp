#pragma once
/**
 * @file signatures.hpp
 * @brief Application signatures used by the recognition service.
 * @details Signatures are static data compiled once: regexes are built when the
 *          signature set is loaded and only read afterwards, so one set can be
 *          shared by every classifying thread.
 */

#include <cstdint>
#include <regex>
#include <string>
#include <vector>

#include "qosctl/domain/model.hpp"

namespace qosctl::recognition {

/**
 * @enum BehaviorKind
 * @brief Flow-statistics heuristic a behavioural descriptor maps to.
 * @details Descriptive entries have no heuristic; they never match but still
 *          count in the denominator of the behavioural score.
 */
enum class BehaviorKind : uint8_t {
    PacketSizeRange,   ///< Average packet size within [min_size, max_size]
    ConstantBitrate,   ///< Any positive byte rate; scores half a point
    Bidirectional,     ///< Long and busy enough to have seen both directions
    LowLatency,        ///< More than 10 packets per second
    Descriptive        ///< Label only
};

struct BehaviorPattern {
    BehaviorKind kind{BehaviorKind::Descriptive};
    std::string  name;        ///< Descriptor label ("packet_interval", ...)
    uint32_t     min_size{0}; ///< Bytes, PacketSizeRange only
    uint32_t     max_size{0}; ///< Bytes, PacketSizeRange only
};

/// Header name and the regex its value must contain.
struct HeaderPattern {
    std::string name;
    std::string pattern;
    std::regex  compiled;
};

/**
 * @struct ApplicationSignature
 * @brief Identification data for one application.
 */
struct ApplicationSignature {
    std::string                   key;                  ///< Short id ("sip")
    std::string                   app_name;             ///< Reported name ("SIP")
    std::string                   category;             ///< Traffic category ("voice")
    std::vector<domain::Protocol> protocols;            ///< Transport protocols
    std::vector<domain::PortRange> ports;               ///< Well-known ports / ranges
    std::vector<std::string>      payload_patterns;     ///< DPI regexes (source form)
    std::vector<std::regex>       payload_regex;        ///< Compiled payload_patterns
    std::vector<HeaderPattern>    headers;              ///< Header regexes
    std::vector<BehaviorPattern>  behavior;             ///< Behavioural descriptors
    double                        confidence_threshold{0.7};

    /// True if @p port falls in any of the signature's port sets.
    bool has_port(uint16_t port) const noexcept;
};

/**
 * @brief Built-in signature set in evaluation order.
 * @details SIP, RTP, RTMP, HTTP Video, Steam, HTTP, HTTPS, SMTP. Classifiers that
 *          take the first acceptable signature depend on this order.
 */
std::vector<ApplicationSignature> load_builtin_signatures();

/// Compile a DPI/header regex: ECMAScript, case-insensitive.
std::regex compile_pattern(const std::string& pattern);

} // namespace qosctl::recognition
