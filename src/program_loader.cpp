#include "program_loader.hpp"
#include "logger.hpp"
#include <filesystem>
#include <future>
#include <sstream>
#include <utility>

namespace tproxy {

namespace {

constexpr const char* kComponent = "ProgramLoader";

struct BufferedRun {
    std::ostringstream out;
    std::ostringstream err;
    std::optional<std::string> error;
};

} // namespace

LoaderOptions LoaderOptions::fromConfig(const EbpfConfig& config) {
    LoaderOptions options;
    options.enabled = config.enabled;
    options.programs_source_path = config.programs_source_path;
    options.timeout = std::chrono::milliseconds(config.timeout_ms);
    options.policy = config.execution;
    return options;
}

std::string LoadResult::getErrorMessage() const {
    if (failures.empty()) {
        return "";
    }

    std::string message = "loading and attaching bpf programs failed:\n";
    for (std::size_t i = 0; i < failures.size(); ++i) {
        if (i > 0) message += "\n\t";
        message += failures[i].program + ": " + failures[i].message;
    }
    return message;
}

ProgramLoader::ProgramLoader(CommandRunner& runner, LoaderOptions options)
    : runner_(runner)
    , options_(std::move(options)) {}

std::string ProgramLoader::programPath(const Program& program) const {
    return (std::filesystem::path(options_.programs_source_path) / program.name).string();
}

LoadResult ProgramLoader::loadAndAttach(const std::vector<Program>& programs,
                                        std::ostream& out,
                                        std::ostream& err) {
    LoadResult result;

    if (!options_.enabled) {
        Logger::debug(kComponent, "eBPF is disabled, no programs loaded");
        return result;
    }

    // Every program is attempted; failures are collected, never thrown
    if (options_.policy == ExecutionPolicy::Sequential) {
        for (const auto& program : programs) {
            ++result.attempted;
            if (auto error = runProgram(program, out, err)) {
                result.failures.push_back({program.name, *error});
            }
        }
    } else {
        // Each program writes into its own buffers so output never interleaves
        std::vector<BufferedRun> runs(programs.size());
        std::vector<std::future<void>> pending;
        pending.reserve(programs.size());

        for (std::size_t i = 0; i < programs.size(); ++i) {
            pending.push_back(std::async(std::launch::async, [this, &programs, &runs, i]() {
                runs[i].error = runProgram(programs[i], runs[i].out, runs[i].err);
            }));
        }
        // runProgram reports failures by value, so get() only waits
        for (auto& future : pending) {
            future.get();
        }

        // Forward buffered output and failures in program order

        for (std::size_t i = 0; i < programs.size(); ++i) {
            ++result.attempted;
            out << runs[i].out.str();
            err << runs[i].err.str();
            if (runs[i].error) {
                result.failures.push_back({programs[i].name, *runs[i].error});
            }
        }
    }

    if (result.isSuccess()) {
        Logger::info(kComponent, "Loaded and attached " + std::to_string(result.attempted) +
                     " program(s)");
    } else {
        Logger::error(kComponent, result.getErrorMessage());
    }
    return result;
}

std::optional<std::string> ProgramLoader::runProgram(const Program& program,
                                                     std::ostream& out,
                                                     std::ostream& err) {
    // A missing flags callback means the program takes no arguments
    std::vector<std::string> flags;
    if (program.flags) {
        try {
            flags = program.flags();
        } catch (const std::exception& e) {
            return "computing flags failed: " + std::string(e.what());
        }
    }

    // Echo the command line before running it
    const std::string path = programPath(program);
    out << "Running: "
        << CommandExecutor::formatCommandLine(path, flags, options_.env_vars) << "\n";

    CommandResult result = runner_.run(path, flags, options_.env_vars, out, err, options_.timeout);
    if (!result.isSuccess()) {
        return result.getErrorMessage();
    }

    // Blank line after a successful program's output
    out << "\n";
    return std::nullopt;
}

} // namespace tproxy
