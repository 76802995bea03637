#include "system_utils.hpp"
#include "command_executor.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

namespace ufwctl {

bool SystemUtils::isRunningAsRoot() {
    // Effective UID decides privileges, so setuid and sudo both count
    return geteuid() == 0;
}

bool SystemUtils::commandExists(const std::string& command) {
    if (command.empty()) {
        return false;
    }
    std::string check_cmd = "command -v " + ShellExecutor::escapeShellArg(command) + " >/dev/null 2>&1";
    return std::system(check_cmd.c_str()) == 0;
}

std::string SystemUtils::getCurrentUser() {
    struct passwd* pw = getpwuid(geteuid());
    if (pw) {
        return std::string(pw->pw_name);
    }
    return "unknown";
}

std::vector<std::string> SystemUtils::validateSystemRequirements(const ControllerConfig& config) {
    std::vector<std::string> errors;

    if (!commandExists(config.tool)) {
        errors.push_back(config.tool + " command not found in system PATH");
        errors.push_back("Debug: Install with 'apt install ufw' (Ubuntu/Debian)");

        const char* path = std::getenv("PATH");
        if (path) {
            errors.push_back("Debug: Current PATH: " + std::string(path));
        }
    }

    if (config.privilege_command.empty()) {
        if (!isRunningAsRoot()) {
            errors.push_back("No privilege_command configured and not running as root");
            errors.push_back("Debug: Current effective UID is " + std::to_string(geteuid()) +
                             " (root UID is 0)");
        }
    } else {
        // Only the first word is the program, e.g. "sudo -n"
        std::string program = config.privilege_command.substr(0, config.privilege_command.find(' '));
        if (!commandExists(program)) {
            errors.push_back("Privilege command not found in system PATH: " + program);
        }
    }

    return errors;
}

void SystemUtils::printSystemInfo(const ControllerConfig& config) {
    std::cout << "System Information:\n";
    std::cout << "==================\n";
    std::cout << "Effective User: " << getCurrentUser() << " (" << geteuid() << ")\n";
    std::cout << "Running as root: " << (isRunningAsRoot() ? "Yes" : "No") << "\n";
    std::cout << config.tool << " available: " << (commandExists(config.tool) ? "Yes" : "No") << "\n";
    std::cout << "Privilege command: "
              << (config.privilege_command.empty() ? "<none>" : config.privilege_command) << "\n";
    std::cout << "Existence check: " << existenceCheckToString(config.existence_check) << "\n";
    std::cout << "Restore order: " << restoreOrderToString(config.restore_order) << "\n";

    try {
        std::cout << "Working directory: " << std::filesystem::current_path().string() << "\n";
    } catch (const std::filesystem::filesystem_error&) {
        std::cout << "Working directory: <unable to determine>\n";
    }

    std::cout << "\n";
}

} // namespace ufwctl
