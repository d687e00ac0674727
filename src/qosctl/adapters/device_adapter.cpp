/**
 * @file device_adapter.cpp
 * @brief Vendor names, adapter factory and shared request checks.
 */
#include "qosctl/adapters/device_adapter.hpp"

#include <fmt/format.h>

#include "qosctl/adapters/cisco_adapter.hpp"
#include "qosctl/adapters/juniper_adapter.hpp"
#include "qosctl/adapters/linux_tc_adapter.hpp"
#include "qosctl/domain/dscp.hpp"

namespace qosctl::adapters {

std::string_view to_string(DeviceVendor v) noexcept {
    switch (v) {
        case DeviceVendor::Cisco:    return "cisco";
        case DeviceVendor::Juniper:  return "juniper";
        case DeviceVendor::Linux:    return "linux";
        case DeviceVendor::OpenFlow: return "openflow";
    }
    return "cisco";
}

std::optional<DeviceVendor> parse_vendor(std::string_view name) noexcept {
    const std::string n = domain::to_lower(name);
    if (n == "cisco" || n == "ios") return DeviceVendor::Cisco;
    if (n == "juniper" || n == "junos") return DeviceVendor::Juniper;
    if (n == "linux" || n == "tc") return DeviceVendor::Linux;
    if (n == "openflow" || n == "sdn") return DeviceVendor::OpenFlow;
    return std::nullopt;
}

Result<std::unique_ptr<DeviceAdapter>> make_adapter(DeviceVendor vendor) {
    switch (vendor) {
        case DeviceVendor::Cisco:   return std::make_unique<CiscoAdapter>();
        case DeviceVendor::Juniper: return std::make_unique<JuniperAdapter>();
        case DeviceVendor::Linux:   return std::make_unique<LinuxTcAdapter>();
        case DeviceVendor::OpenFlow:
            break;
    }
    return make_error(ErrorKind::UnsupportedDevice,
                      fmt::format("no CLI adapter for {} devices", to_string(vendor)));
}

Result<void> check_request(const DeviceAdapter& adapter, const GenerateRequest& request) {
    if (!adapter.supports(request.algorithm)) {
        return make_error(ErrorKind::UnsupportedAlgorithm,
                          fmt::format("{} adapter cannot express {}",
                                      to_string(adapter.vendor()), queueing::to_string(request.algorithm)));
    }
    std::vector<std::string> problems;
    if (request.interface_name.empty()) problems.emplace_back("interface name is empty");
    if (request.policy_name.empty())    problems.emplace_back("policy name is empty");
    if (request.queues.empty())         problems.emplace_back("no queue configuration to render");
    if (!problems.empty()) {
        return make_error(ErrorKind::Validation, "invalid generation request", std::move(problems));
    }
    return {};
}

std::string sanitize_name(std::string_view name, char fill, std::size_t max_len) {
    std::string out;
    out.reserve(name.size());
    for (const char c : name) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                        (c >= '0' && c <= '9') || c == '_' || c == '-';
        out.push_back(ok ? c : fill);
    }
    if (max_len > 0 && out.size() > max_len) out.resize(max_len);
    return out;
}

} // namespace qosctl::adapters
