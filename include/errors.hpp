/**
 * @file errors.hpp
 * @brief Exception types raised by the rule manager
 * @author ufwctl Development Team
 * @date 2024
 */

#pragma once

#include "command_executor.hpp"
#include <stdexcept>
#include <string>

namespace ufwctl {

/**
 * @class ExecutionFailure
 * @brief A ufw invocation exited with a non-zero status
 *
 * what() returns "Error: <stderr>"; the raw stderr text, the command and
 * the exit code are kept unmodified for operator debugging.
 */
class ExecutionFailure : public std::runtime_error {
public:
    explicit ExecutionFailure(const CommandResult& result)
        : std::runtime_error("Error: " + result.stderr_output)
        , stderr_(result.stderr_output)
        , command_(result.command)
        , exit_code_(result.exit_code) {}

    const std::string& stderrText() const { return stderr_; }
    const std::string& command() const { return command_; }
    int exitCode() const { return exit_code_; }

private:
    std::string stderr_;
    std::string command_;
    int exit_code_;
};

/**
 * @class ReadFailure
 * @brief A restore file could not be opened or read
 */
class ReadFailure : public std::runtime_error {
public:
    explicit ReadFailure(const std::string& path)
        : std::runtime_error("Unable to read backup file: " + path)
        , path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace ufwctl
