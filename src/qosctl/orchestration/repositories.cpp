/**
 * @file repositories.cpp
 * @brief Device helpers shared by the repositories and the use cases.
 */
#include "qosctl/orchestration/repositories.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace qosctl::orchestration {

const NetworkInterface* NetworkDevice::find_interface(std::string_view iface) const noexcept {
    auto it = std::find_if(interfaces.begin(), interfaces.end(),
                           [iface](const NetworkInterface& i) { return i.name == iface; });
    return it == interfaces.end() ? nullptr : &*it;
}

Result<void> check_capability(const NetworkDevice& device, queueing::AlgorithmType algorithm) {
    if (!device.qos_capable) {
        return make_error(ErrorKind::UnsupportedDevice,
                          fmt::format("device {} has no QoS support", device.name));
    }
    if (!device.algorithms.empty() &&
        std::find(device.algorithms.begin(), device.algorithms.end(), algorithm) == device.algorithms.end()) {
        return make_error(ErrorKind::UnsupportedDevice,
                          fmt::format("device {} does not support {}", device.name, queueing::to_string(algorithm)));
    }
    return {};
}

} // namespace qosctl::orchestration
