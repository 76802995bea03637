/**
 * @file config.hpp
 * @brief Controller configuration and YAML serialization for ufwctl
 * @author ufwctl Development Team
 * @date 2024
 *
 * This file contains the ControllerConfig structure that selects the ufw
 * binary, the privilege escalation command and the behavior modes of the
 * rule manager, together with its yaml-cpp conversions.
 *
 * Example configuration:
 * @code
 * tool: ufw
 * privilege_command: sudo
 * assume_yes: false
 * existence_check: structured
 * restore_order: validate-first
 * log_level: info
 * @endcode
 */

#pragma once

#include "logger.hpp"
#include <string>
#include <yaml-cpp/yaml.h>

namespace ufwctl {

/**
 * @enum ExistenceCheck
 * @brief How the rule manager decides that a rule already exists
 */
enum class ExistenceCheck {
    Substring,  ///< Search the rule text anywhere in "ufw status"
    Structured  ///< Compare parsed columns of "ufw status numbered"
};

/**
 * @enum RestoreOrder
 * @brief Ordering of the destructive priming step during restore
 */
enum class RestoreOrder {
    ResetFirst,    ///< Reset and allow all, then read the backup file
    ValidateFirst  ///< Read the backup file, then reset and allow all
};

/**
 * @struct ControllerConfig
 * @brief Settings of a RuleManager
 */
struct ControllerConfig {
    std::string tool = "ufw";                 ///< Firewall binary name or path
    std::string privilege_command = "sudo";   ///< Prefix for every invocation, empty for none
    bool assume_yes = false;                  ///< Pass --force to enable and reset
    ExistenceCheck existence_check = ExistenceCheck::Substring;
    RestoreOrder restore_order = RestoreOrder::ResetFirst;
    LogLevel log_level = LogLevel::Warning;

    /**
     * @brief Validate the configuration
     * @return true if the tool name is usable
     */
    bool isValid() const;

    /**
     * @brief Get detailed error message for invalid configurations
     * @return Human-readable error description or empty string if valid
     */
    std::string getErrorMessage() const;
};

std::string existenceCheckToString(ExistenceCheck mode);
std::string restoreOrderToString(RestoreOrder order);

} // namespace ufwctl

namespace YAML {

template<>
struct convert<ufwctl::ExistenceCheck> {
    static Node encode(const ufwctl::ExistenceCheck& mode);
    static bool decode(const Node& node, ufwctl::ExistenceCheck& mode);
};

template<>
struct convert<ufwctl::RestoreOrder> {
    static Node encode(const ufwctl::RestoreOrder& order);
    static bool decode(const Node& node, ufwctl::RestoreOrder& order);
};

template<>
struct convert<ufwctl::LogLevel> {
    static Node encode(const ufwctl::LogLevel& level);
    static bool decode(const Node& node, ufwctl::LogLevel& level);
};

/**
 * @brief YAML conversion for ControllerConfig
 *
 * Keys that are absent keep their default values.
 */
template<>
struct convert<ufwctl::ControllerConfig> {
    static Node encode(const ufwctl::ControllerConfig& config);
    static bool decode(const Node& node, ufwctl::ControllerConfig& config);
};

} // namespace YAML
