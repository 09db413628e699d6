/**
 * @file program_loader.hpp
 * @brief Loading and attaching BPF programs through external loader executables
 * @author tproxy-compose Development Team
 * @date 2024
 *
 * Each Program names a loader executable in the programs source directory
 * and computes its arguments. A batch always attempts every program: failures
 * are collected and reported together once the batch is done.
 */

#pragma once

#include "command_executor.hpp"
#include "config.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace tproxy {

/**
 * @struct Program
 * @brief One loader executable and the computation of its arguments
 */
struct Program {
    std::string name;                                 ///< Executable name, relative to the source directory
    std::function<std::vector<std::string>()> flags;  ///< May throw; the error is reported for this program
};

/**
 * @struct LoaderOptions
 * @brief Settings for a ProgramLoader
 */
struct LoaderOptions {
    bool enabled = true;                    ///< When false, loadAndAttach runs nothing
    std::string programs_source_path;
    std::chrono::milliseconds timeout{0};  ///< Per program, zero for no limit
    ExecutionPolicy policy = ExecutionPolicy::Sequential;
    std::vector<std::string> env_vars;      ///< Extra "KEY=VALUE" variables for every program

    /**
     * @brief Derive loader options from the ebpf configuration section
     */
    static LoaderOptions fromConfig(const EbpfConfig& config);
};

/**
 * @struct ProgramFailure
 * @brief Failure of one program of a batch
 */
struct ProgramFailure {
    std::string program;  ///< Program name
    std::string message;  ///< What went wrong
};

/**
 * @struct LoadResult
 * @brief Outcome of a batch, listing every failing program in batch order
 */
struct LoadResult {
    std::vector<ProgramFailure> failures;
    std::size_t attempted = 0;  ///< Number of programs attempted

    bool isSuccess() const { return failures.empty(); }

    /**
     * @brief Get the joined error message of the batch
     * @return "loading and attaching bpf programs failed:\n<e1>\n\t<e2>..."
     *         or empty string if successful
     */
    std::string getErrorMessage() const;
};

/**
 * @class ProgramLoader
 * @brief Runs loader programs through a CommandRunner
 *
 * Before each program the line "Running: <env> <path> <args>" is written to
 * the output sink; a successful run is followed by an empty line. With the
 * concurrent policy every program writes to its own buffer and the buffers
 * are forwarded in batch order once all programs have finished.
 */
class ProgramLoader {
public:
    ProgramLoader(CommandRunner& runner, LoaderOptions options);

    /**
     * @brief Load and attach a batch of programs
     * @param programs Programs in batch order
     * @param out Sink for standard output of the programs
     * @param err Sink for standard error of the programs
     * @return Result listing every failure; never throws for program failures
     */
    LoadResult loadAndAttach(const std::vector<Program>& programs,
                             std::ostream& out,
                             std::ostream& err);

    /**
     * @brief Get the path of a program's executable
     */
    std::string programPath(const Program& program) const;

    const LoaderOptions& getOptions() const { return options_; }

private:
    /**
     * @brief Compute flags of one program and run it
     * @return Error message, or nothing on success
     */
    std::optional<std::string> runProgram(const Program& program,
                                          std::ostream& out,
                                          std::ostream& err);

    CommandRunner& runner_;
    LoaderOptions options_;
};

} // namespace tproxy
