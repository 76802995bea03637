/**
 * @file rule_manager.hpp
 * @brief Rule management and orchestration for ufw operations
 * @author ufwctl Development Team
 * @date 2024
 *
 * This file contains the RuleManager class, which turns rule requests into
 * ufw command lines, skips rules that already exist, and normalizes the
 * outcome of every ufw invocation into an OperationResult or an exception.
 */

#pragma once

#include "command_executor.hpp"
#include "config.hpp"
#include "operation_result.hpp"
#include "rule.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace ufwctl {

/**
 * @class RuleManager
 * @brief Front end to the ufw command line tool
 *
 * The RuleManager owns no rule state: ufw is the only source of truth and
 * every check-then-act operation queries it again before deciding. Commands
 * are issued through an Executor supplied by the caller, which makes the
 * manager testable against a scripted executor.
 *
 * Mutating operations are serialized by an internal mutex held across the
 * existence check and the command that follows it, so concurrent callers
 * sharing one manager never add the same rule twice.
 *
 * Every ufw invocation is attempted exactly once. A non-zero exit is thrown
 * as ExecutionFailure carrying the tool's stderr unmodified.
 */
class RuleManager {
public:
    /**
     * @brief Construct a manager
     * @param executor Executor used for every ufw invocation; must outlive the manager
     * @param config Tool name, privilege command and behavior modes
     * @throws std::invalid_argument if config is invalid
     */
    explicit RuleManager(Executor& executor, ControllerConfig config = ControllerConfig{});

    RuleManager(const RuleManager&) = delete;
    RuleManager& operator=(const RuleManager&) = delete;

    // State queries

    /**
     * @brief Raw output of "ufw status"
     * @throws ExecutionFailure if ufw fails
     */
    std::string status();

    /**
     * @brief Whether the firewall is active
     * @throws ExecutionFailure if ufw fails
     *
     * In substring mode any occurrence of "active" in the status report
     * counts, including "inactive". Structured mode requires the exact
     * "Status: active" line.
     */
    bool isEnabled();

    /**
     * @brief Raw output of "ufw status numbered"
     * @throws ExecutionFailure if ufw fails
     */
    std::string listRules();

    /**
     * @brief Check whether a rule is already present
     * @param rule Rule to look for
     * @return true if the configured existence check finds it
     * @throws ExecutionFailure if ufw fails
     */
    bool ruleExists(const RuleSpec& rule);

    // Rule operations

    /**
     * @brief Add a rule unless it already exists
     * @param rule Rule to add, with the verb taken from rule.action()
     * @return Skipped result if the rule exists, success result with the
     *         ufw output otherwise
     * @throws ExecutionFailure if the status query or the verb fails
     */
    OperationResult addRule(const RuleSpec& rule);

    OperationResult allow(const std::string& port_or_service, Protocol protocol = Protocol::Any);
    OperationResult deny(const std::string& port_or_service, Protocol protocol = Protocol::Any);
    OperationResult reject(const std::string& port_or_service, Protocol protocol = Protocol::Any);

    OperationResult allowFromIp(const std::string& ip, const std::string& port = "",
                                Protocol protocol = Protocol::Any);
    OperationResult denyFromIp(const std::string& ip, const std::string& port = "",
                               Protocol protocol = Protocol::Any);
    OperationResult rejectFromIp(const std::string& ip, const std::string& port = "",
                                 Protocol protocol = Protocol::Any);

    // Lifecycle operations, issued unconditionally

    OperationResult enable();
    OperationResult disable();
    OperationResult reload();
    OperationResult reset();
    OperationResult logging();

    // Backup and restore

    /**
     * @brief Redirect "ufw status" into a file
     * @param path Destination path, shell escaped into the command
     * @return Success result whose message names the path
     * @throws ExecutionFailure if the command fails
     *
     * The written content is not read back or validated.
     */
    OperationResult backup(const std::string& path);

    /**
     * @brief Replay a backup file as ufw subcommands
     * @param path File with one ufw subcommand per line
     * @return Success result whose message names the path
     * @throws ReadFailure if the file cannot be read
     * @throws ExecutionFailure on the first failing command; later lines
     *         are not issued and nothing is rolled back
     *
     * The firewall is reset and opened with "allow from any" before the
     * lines are replayed. With RestoreOrder::ResetFirst this happens before
     * the file is read, so an unreadable file still leaves the firewall
     * reset. RestoreOrder::ValidateFirst reads the file first.
     */
    OperationResult restore(const std::string& path);

    /**
     * @brief Full command line for a ufw subcommand
     * @param args Subcommand and its arguments, e.g. "allow 80/tcp"
     * @return e.g. "sudo ufw allow 80/tcp"
     */
    std::string buildCommand(const std::string& args) const;

    const ControllerConfig& config() const { return config_; }

private:
    /**
     * @brief Run a ufw subcommand and return its trimmed stdout
     * @throws ExecutionFailure on non-zero exit
     */
    std::string run(const std::string& args);

    /**
     * @brief Run a complete command line and return its trimmed stdout
     * @throws ExecutionFailure on non-zero exit
     */
    std::string runCommand(const std::string& command);

    bool ruleExistsUnlocked(const RuleSpec& rule);
    OperationResult runLifecycle(const std::string& action, const std::string& args);
    void primeForRestore();
    std::vector<std::string> readRestoreLines(const std::string& path) const;

    Executor& executor_;
    ControllerConfig config_;
    std::mutex mutex_;  ///< Serializes check-then-act and other mutations
};

} // namespace ufwctl
