/**
 * @file cli_parser.hpp
 * @brief Command line argument parsing for ufwctl
 * @author ufwctl Development Team
 * @date 2024
 *
 * This file contains the CLIParser class responsible for parsing and validating
 * command line arguments for the ufwctl application.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ufwctl {

/**
 * @class CLIParser
 * @brief Command line interface parser for ufwctl
 *
 * Options are parsed with getopt_long up to the first non-option argument,
 * which names the command; everything after it is passed to the command
 * unparsed, so "allow-from 10.0.0.5 22 tcp" needs no quoting.
 */
class CLIParser {
public:
    /**
     * @struct Options
     * @brief Container for parsed command line options
     */
    struct Options {
        std::optional<std::filesystem::path> config_file; ///< Path to YAML configuration file
        bool verbose = false;       ///< Debug level logging
        bool quiet = false;         ///< Error level logging only
        bool debug = false;         ///< Bypass system validation
        bool show_info = false;     ///< Print system information
        bool help = false;          ///< Display help information
        std::string command;        ///< Command name, e.g. "allow"
        std::vector<std::string> args; ///< Command arguments
    };

    /**
     * @brief Parse command line arguments into Options structure
     * @param argc Number of command line arguments
     * @param argv Array of command line argument strings
     * @return Parsed options structure
     * @throws std::invalid_argument if parsing or validation fails
     */
    static Options parse(int argc, char* argv[]);

    /**
     * @brief Print usage information to stdout
     * @param program_name Name of the program executable
     */
    static void printUsage(const std::string& program_name);

    /**
     * @brief Check whether a command name is known
     * @param command Command name
     * @return true for every command listed by printUsage()
     */
    static bool isKnownCommand(const std::string& command);

private:
    /**
     * @brief Validate parsed options for logical consistency
     * @param options The options structure to validate
     * @throws std::invalid_argument if options are inconsistent
     */
    static void validateOptions(const Options& options);
};

} // namespace ufwctl
