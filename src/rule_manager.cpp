#include "rule_manager.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "status_parser.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace ufwctl {

namespace {

const char* kComponent = "RuleManager";

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n\f\v";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

} // namespace

RuleManager::RuleManager(Executor& executor, ControllerConfig config)
    : executor_(executor)
    , config_(std::move(config)) {
    if (!config_.isValid()) {
        throw std::invalid_argument("Invalid configuration: " + config_.getErrorMessage());
    }
}

std::string RuleManager::status() {
    return run("status");
}

bool RuleManager::isEnabled() {
    std::string report = status();
    if (config_.existence_check == ExistenceCheck::Structured) {
        return StatusParser::isActive(report);
    }
    return report.find("active") != std::string::npos;
}

std::string RuleManager::listRules() {
    return run("status numbered");
}

bool RuleManager::ruleExists(const RuleSpec& rule) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ruleExistsUnlocked(rule);
}

OperationResult RuleManager::addRule(const RuleSpec& rule) {
    const std::string rendered = rule.render();
    const std::string action = actionToString(rule.action());

    // Held across the status query and the add so that two callers in this
    // process cannot both miss the rule and add it twice
    std::lock_guard<std::mutex> lock(mutex_);

    if (ruleExistsUnlocked(rule)) {
        Logger::log(LogLevel::Info, kComponent, "Rule '" + rendered + "' already exists, skipping " + action);
        return OperationResult::skipped(action, rendered);
    }

    std::string output = run(action + " " + rendered);
    Logger::log(LogLevel::Info, kComponent, "Applied " + action + " " + rendered);
    return OperationResult::success(action, output, rendered);
}

OperationResult RuleManager::allow(const std::string& port_or_service, Protocol protocol) {
    return addRule(RuleSpec::port(port_or_service, protocol, Action::Allow));
}

OperationResult RuleManager::deny(const std::string& port_or_service, Protocol protocol) {
    return addRule(RuleSpec::port(port_or_service, protocol, Action::Deny));
}

OperationResult RuleManager::reject(const std::string& port_or_service, Protocol protocol) {
    return addRule(RuleSpec::port(port_or_service, protocol, Action::Reject));
}

OperationResult RuleManager::allowFromIp(const std::string& ip, const std::string& port,
                                         Protocol protocol) {
    return addRule(RuleSpec::fromIp(ip, port, protocol, Action::Allow));
}

OperationResult RuleManager::denyFromIp(const std::string& ip, const std::string& port,
                                        Protocol protocol) {
    return addRule(RuleSpec::fromIp(ip, port, protocol, Action::Deny));
}

OperationResult RuleManager::rejectFromIp(const std::string& ip, const std::string& port,
                                          Protocol protocol) {
    return addRule(RuleSpec::fromIp(ip, port, protocol, Action::Reject));
}

OperationResult RuleManager::enable() {
    return runLifecycle("enable", config_.assume_yes ? "--force enable" : "enable");
}

OperationResult RuleManager::disable() {
    return runLifecycle("disable", "disable");
}

OperationResult RuleManager::reload() {
    return runLifecycle("reload", "reload");
}

OperationResult RuleManager::reset() {
    return runLifecycle("reset", config_.assume_yes ? "--force reset" : "reset");
}

OperationResult RuleManager::logging() {
    return runLifecycle("logging", "logging on");
}

OperationResult RuleManager::backup(const std::string& path) {
    if (path.empty()) {
        throw std::invalid_argument("Backup path must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    run("status > " + ShellExecutor::escapeShellArg(path));
    Logger::log(LogLevel::Info, kComponent, "Backup written to " + path);
    return OperationResult::success("backup", "Backup saved to " + path + ".");
}

OperationResult RuleManager::restore(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> lines;
    if (config_.restore_order == RestoreOrder::ValidateFirst) {
        // Read the whole file before touching the firewall; an unreadable
        // file leaves the current rule set in place
        lines = readRestoreLines(path);
        primeForRestore();
    } else {
        // Reset before reading; a read failure here leaves the firewall
        // reset and open to all traffic
        primeForRestore();
        lines = readRestoreLines(path);
    }

    Logger::log(LogLevel::Info, kComponent,
                "Replaying " + std::to_string(lines.size()) + " command(s) from " + path);

    // Strictly sequential; the first failure propagates and stops the replay.
    // Lines already applied stay applied, there is no rollback
    for (const auto& line : lines) {
        run(line);
    }

    return OperationResult::success("restore", "Restored from " + path + ".");
}

std::string RuleManager::buildCommand(const std::string& args) const {
    std::string command;
    if (!config_.privilege_command.empty()) {
        command = config_.privilege_command + " ";
    }
    command += config_.tool + " " + args;
    return command;
}

std::string RuleManager::run(const std::string& args) {
    return runCommand(buildCommand(args));
}

std::string RuleManager::runCommand(const std::string& command) {
    CommandResult result = executor_.execute(command);
    if (!result.isSuccess()) {
        Logger::log(LogLevel::Error, kComponent, result.getErrorMessage());
        throw ExecutionFailure(result);
    }
    return trim(result.stdout_output);
}

bool RuleManager::ruleExistsUnlocked(const RuleSpec& rule) {
    // Structured mode compares parsed columns of the numbered listing
    if (config_.existence_check == ExistenceCheck::Structured) {
        auto entries = StatusParser::parse(listRules());
        auto match = StatusParser::findRule(entries, rule);
        if (match) {
            Logger::log(LogLevel::Debug, kComponent,
                        "Rule '" + rule.render() + "' matches " + StatusParser::describe(*match));
        }
        return match.has_value();
    }

    // Substring search: "80" is also found inside "8080/tcp"
    return status().find(rule.render()) != std::string::npos;
}

OperationResult RuleManager::runLifecycle(const std::string& action, const std::string& args) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string output = run(args);
    return OperationResult::success(action, output);
}

void RuleManager::primeForRestore() {
    // Reset wipes every rule; "allow from any" keeps the host reachable
    // while the backup is replayed. Both run as one shell command so the
    // allow only happens when the reset succeeded
    const std::string reset_args = config_.assume_yes ? "--force reset" : "reset";
    Logger::log(LogLevel::Warning, kComponent, "Resetting firewall and allowing all traffic before restore");
    runCommand(buildCommand(reset_args) + " && " + buildCommand("allow from any"));
}

std::vector<std::string> RuleManager::readRestoreLines(const std::string& path) const {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw ReadFailure(path);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ReadFailure(path);
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        std::string command = trim(line);
        if (!command.empty()) {
            lines.push_back(command);
        }
    }

    if (file.bad()) {
        throw ReadFailure(path);
    }

    return lines;
}

} // namespace ufwctl
