/**
 * @file operation_result.hpp
 * @brief Outcome of a mutating ufwctl operation
 * @author ufwctl Development Team
 * @date 2024
 */

#pragma once

#include <optional>
#include <string>
#include <utility>

namespace ufwctl {

/**
 * @class OperationResult
 * @brief Immutable outcome returned by every mutating RuleManager call
 *
 * Failures are never represented here; they are thrown as
 * ExecutionFailure or ReadFailure.
 */
class OperationResult {
public:
    enum class Status {
        Success, ///< The ufw command was issued and succeeded
        Skipped  ///< The rule already existed, nothing was issued
    };

    OperationResult(Status status, std::string action, std::string message,
                    std::optional<std::string> rule = std::nullopt)
        : status_(status)
        , action_(std::move(action))
        , message_(std::move(message))
        , rule_(std::move(rule)) {}

    static OperationResult success(const std::string& action, const std::string& message,
                                   std::optional<std::string> rule = std::nullopt) {
        return OperationResult(Status::Success, action, message, std::move(rule));
    }

    static OperationResult skipped(const std::string& action, const std::string& rule) {
        return OperationResult(Status::Skipped, action,
                               "Rule '" + rule + "' already exists.", rule);
    }

    Status status() const { return status_; }
    const std::string& action() const { return action_; }
    const std::string& message() const { return message_; }
    const std::optional<std::string>& rule() const { return rule_; }

    /**
     * @brief Status as text
     * @return "success" or "skipped"
     */
    std::string statusString() const {
        return status_ == Status::Success ? "success" : "skipped";
    }

    /**
     * @brief Render as a YAML mapping with status, rule, action and message
     * @return YAML document text
     */
    std::string toYaml() const;

private:
    Status status_;
    std::string action_;
    std::string message_;
    std::optional<std::string> rule_;
};

} // namespace ufwctl
