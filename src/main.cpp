#include <iostream>
#include <string>
#include <filesystem>
#include "cli_parser.hpp"
#include "command_dispatcher.hpp"
#include "command_executor.hpp"
#include "config_parser.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "rule_manager.hpp"
#include "system_utils.hpp"

int main(int argc, char* argv[]) {
    try {
        // Parse options and the command; throws std::invalid_argument for unknown
        // options, unknown commands and wrong argument counts
        auto options = ufwctl::CLIParser::parse(argc, argv);

        // Help needs neither configuration nor privileges
        if (options.help) {
            ufwctl::CLIParser::printUsage(argv[0]);
            return 0;
        }

        // Built-in defaults apply when no configuration file is given
        ufwctl::ControllerConfig config;
        if (options.config_file) {
            const auto& config_path = *options.config_file;
            // Reject missing files and directories before handing the path to yaml-cpp
            if (!std::filesystem::is_regular_file(config_path)) {
                std::cerr << "Error: Configuration file does not exist or is not a regular file: "
                          << config_path.string() << std::endl;
                return 1;
            }
            config = ufwctl::ConfigParser::loadFromFile(config_path.string());
        }

        // Command line flags override the configured level
        ufwctl::LogLevel level = config.log_level;
        if (options.verbose) {
            level = ufwctl::LogLevel::Debug;
        } else if (options.quiet) {
            level = ufwctl::LogLevel::Error;
        }
        ufwctl::Logger::setLevel(level);

        // System information may be printed on its own or before a command
        if (options.show_info) {
            ufwctl::SystemUtils::printSystemInfo(config);
            if (options.command.empty()) {
                return 0;
            }
        }

        // Check for ufw and the privilege command unless running in debug mode,
        // which allows trying commands on machines without ufw
        if (!options.debug) {
            auto errors = ufwctl::SystemUtils::validateSystemRequirements(config);
            if (!errors.empty()) {
                for (const auto& error : errors) {
                    std::cerr << error << std::endl;
                }
                std::cerr << "\nSystem validation failed. Use --help for usage information." << std::endl;
                return 1;
            }
        } else {
            ufwctl::Logger::log(ufwctl::LogLevel::Info, "main", "Debug mode: skipping system validation");
        }

        // Commands go through the shell; the manager owns all command construction
        ufwctl::ShellExecutor executor;
        ufwctl::RuleManager manager(executor, config);
        return ufwctl::CommandDispatcher::dispatch(manager, options, std::cout);

    } catch (const std::invalid_argument& e) {
        // Usage errors, including malformed rule targets and protocols
        if (std::string(e.what()) == "No action specified") {
            ufwctl::CLIParser::printUsage(argv[0]);
        } else {
            std::cerr << "Error: " << e.what() << std::endl;
            std::cerr << "Use --help for usage information." << std::endl;
        }
        return 2;
    } catch (const ufwctl::ExecutionFailure& e) {
        // Keep the tool's own message intact for the operator
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const ufwctl::ReadFailure& e) {
        // Restore file could not be read; in reset-first order the firewall
        // has already been reset at this point
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "File system error: " << e.what() << std::endl;
        return 1;
    } catch (const std::runtime_error& e) {
        // Configuration parse and validation errors
        std::cerr << "Runtime error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
