#include "command_executor.hpp"
#include "logger.hpp"
#include <array>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <sys/wait.h>
#include <unistd.h>

namespace ufwctl {

namespace {

const char* kComponent = "CommandExecutor";

void stripTrailingNewlines(std::string& text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
}

// Owns a mkstemp() file and unlinks it on scope exit.
class TempFile {
public:
    TempFile() {
        const char* tmpdir = std::getenv("TMPDIR");
        path_ = std::string(tmpdir && *tmpdir ? tmpdir : "/tmp") + "/ufwctl_stderr_XXXXXX";
        int fd = mkstemp(&path_[0]);
        if (fd < 0) {
            path_.clear();
            return;
        }
        close(fd);
    }

    ~TempFile() {
        if (!path_.empty()) {
            unlink(path_.c_str());
        }
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    bool valid() const { return !path_.empty(); }
    const std::string& path() const { return path_; }

    std::string read() const {
        std::ifstream in(path_);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

private:
    std::string path_;
};

} // namespace

CommandResult ShellExecutor::execute(const std::string& command) {
    CommandResult result;
    result.command = command;

    Logger::log(LogLevel::Info, kComponent, "Executing command: " + command);

    TempFile stderr_file;
    if (!stderr_file.valid()) {
        result.stderr_output = "Failed to create temporary file for stderr capture";
        Logger::log(LogLevel::Error, kComponent, result.stderr_output);
        return result;
    }

    // Group the command so the redirection covers && chains and redirects
    std::string shell_cmd = "{ " + command + "\n} 2>" + escapeShellArg(stderr_file.path());

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(shell_cmd.c_str(), "r"), pclose);
    if (!pipe) {
        result.exit_code = 1;
        result.stderr_output = "Failed to execute command: " + command;
        Logger::log(LogLevel::Error, kComponent, result.stderr_output);
        return result;
    }

    std::array<char, 4096> buffer;
    std::string output;
    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
        output += buffer.data();
    }

    int status = pclose(pipe.release());
    if (status == -1) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        // Killed by a signal
        result.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }

    result.stdout_output = output;
    result.stderr_output = stderr_file.read();
    stripTrailingNewlines(result.stdout_output);
    stripTrailingNewlines(result.stderr_output);
    result.success = (result.exit_code == 0);

    if (result.success) {
        Logger::log(LogLevel::Debug, kComponent,
                    "Command completed successfully (output: " +
                    std::to_string(result.stdout_output.length()) + " bytes)");
    } else {
        Logger::log(LogLevel::Error, kComponent,
                    "Command failed with exit code: " + std::to_string(result.exit_code));
        if (!result.stderr_output.empty()) {
            Logger::log(LogLevel::Error, kComponent, "Stderr: " + result.stderr_output);
        }
    }

    return result;
}

std::string ShellExecutor::escapeShellArg(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n\r\"'\\$`|&;<>(){}[]?*~#") == std::string::npos) {
        return arg;
    }

    std::string escaped = "'";
    for (char c : arg) {
        if (c == '\'') {
            escaped += "'\"'\"'";  // End quote, escaped single quote, start quote
        } else {
            escaped += c;
        }
    }
    escaped += "'";

    return escaped;
}

} // namespace ufwctl
