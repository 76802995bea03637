/**
 * @file system_utils.hpp
 * @brief System utilities and validation for ufwctl
 * @author ufwctl Development Team
 * @date 2024
 *
 * This file contains the SystemUtils class responsible for checking that
 * the firewall tool and the privilege escalation command are available
 * before any ufw operation is attempted.
 */

#pragma once

#include "config.hpp"
#include <string>
#include <vector>

namespace ufwctl {

/**
 * @class SystemUtils
 * @brief System utilities and validation helper class
 */
class SystemUtils {
public:
    /**
     * @brief Check if the current process is running with root privileges
     * @return true if the effective user ID is 0
     */
    static bool isRunningAsRoot();

    /**
     * @brief Check if a command exists in the system PATH
     * @param command Command name or path
     * @return true if the shell can resolve the command
     */
    static bool commandExists(const std::string& command);

    /**
     * @brief Get the name of the current system user
     * @return Username, or "unknown" if it cannot be resolved
     */
    static std::string getCurrentUser();

    /**
     * @brief Validate all system requirements for the configured tool
     * @param config Controller configuration naming the tool and prefix
     * @return Vector of error messages, empty if all requirements are met
     *
     * The firewall tool must be resolvable. When no privilege command is
     * configured the process must run as root; otherwise the privilege
     * command itself must be resolvable.
     */
    static std::vector<std::string> validateSystemRequirements(const ControllerConfig& config);

    /**
     * @brief Print user, privilege and tool availability to stdout
     * @param config Controller configuration naming the tool and prefix
     */
    static void printSystemInfo(const ControllerConfig& config);
};

} // namespace ufwctl
