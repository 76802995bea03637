/**
 * @file command_dispatcher.hpp
 * @brief Maps parsed CLI commands onto RuleManager operations
 * @author ufwctl Development Team
 * @date 2024
 */

#pragma once

#include "cli_parser.hpp"
#include "rule_manager.hpp"
#include <ostream>

namespace ufwctl {

/**
 * @class CommandDispatcher
 * @brief Runs one CLI command against a RuleManager
 *
 * Query commands write raw ufw text; mutating commands write the
 * OperationResult as YAML.
 */
class CommandDispatcher {
public:
    /**
     * @brief Execute the command named in options
     * @param manager Manager to operate on
     * @param options Parsed and validated options
     * @param out Stream receiving command output
     * @return Process exit code: 0 on success, 1 for "enabled" when inactive
     * @throws std::invalid_argument for a bad protocol or unknown command
     * @throws ExecutionFailure, ReadFailure as raised by the manager
     */
    static int dispatch(RuleManager& manager, const CLIParser::Options& options, std::ostream& out);
};

} // namespace ufwctl
