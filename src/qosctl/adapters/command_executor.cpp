/**
 * @file command_executor.cpp
 * @brief Dry-run executor.
 */
#include "qosctl/adapters/command_executor.hpp"

#include <spdlog/spdlog.h>

#include <fmt/format.h>

namespace qosctl::adapters {

Result<ExecutionResult> DryRunExecutor::execute(const std::string& device,
                                                const CommandList& commands,
                                                std::chrono::milliseconds timeout) {
    spdlog::info("dry-run [{}]: {} command(s), timeout {} ms",
                 device, commands.size(), static_cast<long long>(timeout.count()));
    for (const auto& line : commands) {
        spdlog::debug("dry-run [{}]   {}", device, line);
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        history_.push_back(Batch{device, commands});
    }
    return ExecutionResult{true, fmt::format("dry-run: {} command(s) accepted", commands.size())};
}

std::vector<DryRunExecutor::Batch> DryRunExecutor::history() const {
    std::lock_guard<std::mutex> lk(mu_);
    return history_;
}

std::size_t DryRunExecutor::batches() const {
    std::lock_guard<std::mutex> lk(mu_);
    return history_.size();
}

} // namespace qosctl::adapters
