#pragma once
/**
 * @file command_executor.hpp
 * @brief Pluggable execution of generated command lists on a device.
 * @details Generation is pure; execution (SSH session, subprocess) lives behind
 *          this interface so the orchestration layer can be driven by a real
 *          transport, a dry run, or a scripted fake in tests.
 */

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "qosctl/domain/errors.hpp"

namespace qosctl::adapters {

/// Ordered CLI lines for a device.
using CommandList = std::vector<std::string>;

/**
 * @struct ExecutionResult
 * @brief Outcome reported by the device for a command batch.
 */
struct ExecutionResult {
    bool        success{false};  ///< Device accepted every command
    std::string output;          ///< Free-text transcript or error message
};

class CommandExecutor {
public:
    virtual ~CommandExecutor() = default;

    /**
     * @brief Run @p commands on @p device within @p timeout.
     * @return ExecutionResult for a completed session (which may still report
     *         success = false); ConfigurationExecution error when the session
     *         itself could not be established or timed out.
     */
    virtual Result<ExecutionResult> execute(const std::string& device,
                                            const CommandList& commands,
                                            std::chrono::milliseconds timeout) = 0;
};

/**
 * @class DryRunExecutor
 * @brief Logs every command and reports success without touching a device.
 * @details Keeps a history of the batches it was given.
 */
class DryRunExecutor final : public CommandExecutor {
public:
    struct Batch {
        std::string device;
        CommandList commands;
    };

    Result<ExecutionResult> execute(const std::string& device,
                                    const CommandList& commands,
                                    std::chrono::milliseconds timeout) override;

    /// Copy of the batches executed so far.
    std::vector<Batch> history() const;
    std::size_t batches() const;

private:
    mutable std::mutex mu_;
    std::vector<Batch> history_;
};

} // namespace qosctl::adapters
