#pragma once
/**
 * @file errors.hpp
 * @brief Typed error taxonomy and the Result<T> alias used across qosctl.
 * @details Fallible operations return Result<T>; nothing throws across a
 *          component boundary. Validation errors are always produced before any
 *          device or controller is touched.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <version>

// std::expected where the library ships it (C++23), tl::expected otherwise.
#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
#include <expected>
namespace qosctl_detail {
template <class T, class E> using expected   = std::expected<T, E>;
template <class E>          using unexpected = std::unexpected<E>;
}
#else
#include <tl/expected.hpp>
namespace qosctl_detail {
template <class T, class E> using expected   = tl::expected<T, E>;
template <class E>          using unexpected = tl::unexpected<E>;
}
#endif

namespace qosctl {

/**
 * @enum ErrorKind
 * @brief Error categories reported by the core.
 */
enum class ErrorKind : uint8_t {
    Validation = 1,          ///< Bandwidth invariant violated or malformed policy
    LowLatencyValidation,    ///< LLQ strict-priority cap or remaining-bandwidth check failed
    PolicyNotFound,          ///< Policy id unknown to the repository / SDN service
    DeviceNotFound,          ///< Device id unknown
    InterfaceNotFound,       ///< Interface name unknown on the device
    UnsupportedDevice,       ///< Device lacks the required QoS capability or adapter
    UnsupportedAlgorithm,    ///< Algorithm listed but not implemented
    ConfigurationExecution,  ///< Executor / controller call failed
    AlreadyApplied,          ///< Active association exists and reapply was not requested
    Cancelled,               ///< Operation stopped through its stop token
    Parse                    ///< Configuration or policy document could not be parsed
};

/**
 * @struct QosError
 * @brief Error value carried by Result<T>.
 */
struct QosError {
    ErrorKind                kind{ErrorKind::Validation}; ///< Category
    std::string              message;                     ///< Human-readable summary
    std::vector<std::string> details;                     ///< Optional per-item reasons

    bool operator==(const QosError&) const = default;
};

/// Result alias used by every fallible operation.
template <class T>
using Result = qosctl_detail::expected<T, QosError>;

/// Stable label for logs and result objects (e.g. "validation_error").
std::string_view to_string(ErrorKind kind) noexcept;

/// Build the unexpected side of a Result.
inline qosctl_detail::unexpected<QosError>
make_error(ErrorKind kind, std::string message, std::vector<std::string> details = {}) {
    return qosctl_detail::unexpected<QosError>(QosError{kind, std::move(message), std::move(details)});
}

} // namespace qosctl
