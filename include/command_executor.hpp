/**
 * @file command_executor.hpp
 * @brief Command execution engine for tproxy-compose
 * @author tproxy-compose Development Team
 * @date 2024
 *
 * This file contains the CommandRunner interface and its CommandExecutor
 * implementation, which runs an executable directly (no shell) with an
 * argument vector, forwards its output to caller-provided streams and
 * enforces a per-invocation timeout.
 */

#pragma once

#include <chrono>
#include <ostream>
#include <string>
#include <vector>

namespace tproxy {

/**
 * @struct CommandResult
 * @brief Structure representing the result of a command execution
 */
struct CommandResult {
    bool success = false;     ///< Whether the command ran and exited with 0
    int exit_code = -1;       ///< Process exit code, -1 if it never exited normally
    bool timed_out = false;   ///< Whether the command was killed after the timeout
    std::string command;      ///< The command line that was executed
    std::string error;        ///< Execution error detail (exec failure, signal, timeout)

    /**
     * @brief Check if the command executed successfully
     * @return true if exit code is 0 and success flag is true
     */
    bool isSuccess() const {
        return success && exit_code == 0;
    }

    /**
     * @brief Get error message if command failed
     * @return "unexpected exit code: <code>, err: <detail>" or empty string
     *         if successful
     */
    std::string getErrorMessage() const {
        if (isSuccess()) {
            return "";
        }
        std::string detail = error.empty() ? "exit status " + std::to_string(exit_code) : error;
        return "unexpected exit code: " + std::to_string(exit_code) + ", err: " + detail;
    }
};

/**
 * @class CommandRunner
 * @brief Interface for running external programs
 *
 * Implementations must be safe to call from several threads at once.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Run an executable and wait for it to finish
     * @param executable Path of the executable
     * @param args Arguments, not including the program name
     * @param env_vars Extra "KEY=VALUE" variables added to the parent environment
     * @param out Sink for the child's standard output
     * @param err Sink for the child's standard error
     * @param timeout Maximum run time, zero for no limit
     * @return Result of the execution
     */
    virtual CommandResult run(const std::string& executable,
                              const std::vector<std::string>& args,
                              const std::vector<std::string>& env_vars,
                              std::ostream& out,
                              std::ostream& err,
                              std::chrono::milliseconds timeout) = 0;
};

/**
 * @class CommandExecutor
 * @brief fork/exec based CommandRunner
 *
 * The child inherits the parent environment plus the extra variables. Its
 * stdout and stderr are read through pipes and copied to the sinks as the
 * data arrives. When the timeout expires the child is killed with SIGKILL
 * and the result is marked as timed out.
 */
class CommandExecutor : public CommandRunner {
public:
    CommandResult run(const std::string& executable,
                      const std::vector<std::string>& args,
                      const std::vector<std::string>& env_vars,
                      std::ostream& out,
                      std::ostream& err,
                      std::chrono::milliseconds timeout) override;

    /**
     * @brief Format a command line for display
     * @return Environment variables, executable and arguments separated by
     *         spaces, arguments shell-escaped where needed
     */
    static std::string formatCommandLine(const std::string& executable,
                                         const std::vector<std::string>& args,
                                         const std::vector<std::string>& env_vars = {});

private:
    /**
     * @brief Escape shell argument for display
     * @param arg Argument string to escape
     * @return The argument, single-quoted if it contains special characters
     */
    static std::string escapeShellArg(const std::string& arg);
};

} // namespace tproxy
