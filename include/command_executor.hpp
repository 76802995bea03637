/**
 * @file command_executor.hpp
 * @brief Command execution engine for ufwctl
 * @author ufwctl Development Team
 * @date 2024
 *
 * This file contains the Executor interface through which every ufw
 * invocation is issued, and ShellExecutor, the implementation that runs
 * command lines through the system shell and captures their output.
 */

#pragma once

#include <string>

namespace ufwctl {

/**
 * @struct CommandResult
 * @brief Structure representing the result of a command execution
 *
 * Contains the exit status, output streams and the command that was run.
 * Returned by every Executor implementation.
 */
struct CommandResult {
    bool success = false;           ///< Whether the command executed without errors
    int exit_code = -1;            ///< Process exit code (0 = success)
    std::string stdout_output;     ///< Standard output from the command
    std::string stderr_output;     ///< Standard error output from the command
    std::string command;           ///< The actual command that was executed

    /**
     * @brief Check if the command executed successfully
     * @return true if exit code is 0 and success flag is true
     */
    bool isSuccess() const {
        return success && exit_code == 0;
    }

    /**
     * @brief Get error message if command failed
     * @return Error message string or empty string if successful
     *
     * Includes the command, exit code, and stderr output when the
     * command fails.
     */
    std::string getErrorMessage() const {
        if (isSuccess()) {
            return "";
        }

        std::string error = "Command failed: " + command;
        error += " (exit code: " + std::to_string(exit_code) + ")";

        if (!stderr_output.empty()) {
            error += "\nError output: " + stderr_output;
        }

        return error;
    }
};

/**
 * @class Executor
 * @brief Runs a fully formed command line and reports its outcome
 *
 * The rule manager issues every ufw invocation through this interface.
 * Implementations never throw on a non-zero exit; they report it in the
 * returned CommandResult.
 */
class Executor {
public:
    virtual ~Executor() = default;

    /**
     * @brief Execute a command line
     * @param command Full command string, passed to the shell as-is
     * @return CommandResult with execution details
     */
    virtual CommandResult execute(const std::string& command) = 0;
};

/**
 * @class ShellExecutor
 * @brief Executor that runs commands through /bin/sh via popen()
 *
 * Standard output is read from the pipe; standard error is redirected to
 * a private temporary file and read back once the command exits. Shell
 * features such as redirection and && chaining are available to callers.
 */
class ShellExecutor : public Executor {
public:
    CommandResult execute(const std::string& command) override;

    /**
     * @brief Escape shell argument for safe execution
     * @param arg Argument string to escape
     * @return Argument unchanged when it has no shell metacharacters,
     *         otherwise wrapped in single quotes
     */
    static std::string escapeShellArg(const std::string& arg);
};

} // namespace ufwctl
