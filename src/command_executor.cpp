#include "command_executor.hpp"
#include "logger.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <set>
#include <signal.h>
#include <sstream>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>

extern char** environ;

namespace tproxy {

namespace {

constexpr const char* kComponent = "CommandExecutor";
constexpr auto kWaitInterval = std::chrono::milliseconds(10);

// Closes the owned descriptor on destruction
class FileDescriptor {
public:
    FileDescriptor() = default;
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

bool makePipe(FileDescriptor& read_end, FileDescriptor& write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

// Null-terminated array of pointers into strings, which must outlive it
std::vector<char*> toArgv(std::vector<std::string>& strings) {
    std::vector<char*> pointers;
    pointers.reserve(strings.size() + 1);
    for (auto& s : strings) {
        pointers.push_back(s.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

std::string errnoMessage(const std::string& what, int code) {
    return what + ": " + std::strerror(code);
}

std::string envKey(const std::string& entry) {
    return entry.substr(0, entry.find('='));
}

// Parent environment with the extra variables applied on top. A key set in
// both keeps only the extra value, and a key repeated in the extra
// variables keeps its last value.
std::vector<std::string> buildEnvironment(const std::vector<std::string>& env_vars) {
    std::set<std::string> overridden;
    for (const auto& entry : env_vars) {
        overridden.insert(envKey(entry));
    }

    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string parent_entry(*entry);
        if (overridden.count(envKey(parent_entry)) == 0) {
            env.push_back(std::move(parent_entry));
        }
    }

    for (std::size_t i = 0; i < env_vars.size(); ++i) {
        const std::string key = envKey(env_vars[i]);
        bool repeated_later = false;
        for (std::size_t j = i + 1; j < env_vars.size(); ++j) {
            if (envKey(env_vars[j]) == key) {
                repeated_later = true;
                break;
            }
        }
        if (!repeated_later) {
            env.push_back(env_vars[i]);
        }
    }
    return env;
}

// The child leads its own process group, so a negative pid reaches every
// process it started
void killProcessGroup(pid_t pid) {
    if (kill(-pid, SIGKILL) != 0) {
        kill(pid, SIGKILL);
    }
}

} // namespace

CommandResult CommandExecutor::run(const std::string& executable,
                                   const std::vector<std::string>& args,
                                   const std::vector<std::string>& env_vars,
                                   std::ostream& out,
                                   std::ostream& err,
                                   std::chrono::milliseconds timeout) {
    CommandResult result;
    result.command = formatCommandLine(executable, args, env_vars);

    Logger::debug(kComponent, "Executing command: " + result.command);

    if (executable.empty()) {
        result.error = "no executable specified";
        return result;
    }

    // Everything the child needs is prepared before fork(); after it only
    // async-signal-safe calls are allowed
    std::vector<std::string> argv_strings;
    argv_strings.reserve(args.size() + 1);
    argv_strings.push_back(executable);
    argv_strings.insert(argv_strings.end(), args.begin(), args.end());

    std::vector<std::string> env_strings = buildEnvironment(env_vars);

    std::vector<char*> argv = toArgv(argv_strings);
    std::vector<char*> envp = toArgv(env_strings);

    FileDescriptor out_read, out_write, err_read, err_write, exec_read, exec_write;
    if (!makePipe(out_read, out_write) || !makePipe(err_read, err_write) ||
        !makePipe(exec_read, exec_write)) {
        result.error = errnoMessage("creating pipes failed", errno);
        Logger::error(kComponent, result.error);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.error = errnoMessage("fork failed", errno);
        Logger::error(kComponent, result.error);
        return result;
    }

    if (pid == 0) {
        // within forked child; own process group so a timeout kills the
        // whole tree. dup2 clears O_CLOEXEC on the new descriptors
        setpgid(0, 0);
        int dev_null = open("/dev/null", O_RDONLY);
        if (dev_null < 0 || dup2(dev_null, STDIN_FILENO) < 0 ||
            dup2(out_write.get(), STDOUT_FILENO) < 0 ||
            dup2(err_write.get(), STDERR_FILENO) < 0) {
            int code = errno;
            ssize_t ignored = write(exec_write.get(), &code, sizeof(code));
            (void)ignored;
            _exit(127);
        }

        execve(argv[0], argv.data(), envp.data());

        // exec failed, report errno through the CLOEXEC pipe
        int code = errno;
        ssize_t ignored = write(exec_write.get(), &code, sizeof(code));
        (void)ignored;
        _exit(127);
    }

    // Set the group from both sides, the child may not have run yet
    setpgid(pid, pid);

    // Parent keeps only the read ends; EOF arrives once the child and
    // everything it spawned closed their copies
    out_write.reset();
    err_write.reset();
    exec_write.reset();

    const bool has_deadline = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::array<pollfd, 2> fds = {{{out_read.get(), POLLIN, 0}, {err_read.get(), POLLIN, 0}}};
    std::array<std::ostream*, 2> sinks = {&out, &err};
    int open_fds = 2;
    std::array<char, 4096> buffer;

    // Forward output until both pipes are closed or the deadline passes
    while (open_fds > 0 && !result.timed_out) {
        int wait_ms = -1;
        if (has_deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(remaining.count());
        }

        // Wait for data on either pipe, at most until the deadline
        int ready = poll(fds.data(), fds.size(), wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            Logger::error(kComponent, errnoMessage("poll failed", errno));
            break;
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->write(buffer.data(), n);
                sinks[i]->flush();
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                // negative descriptors are ignored by poll()
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }

    if (result.timed_out) {
        killProcessGroup(pid);
    }

    // Reap the child. Without a timeout, or once killed, this blocks;
    // otherwise poll waitpid until the deadline
    int status = 0;
    while (true) {
        bool block = result.timed_out || !has_deadline;
        pid_t waited = waitpid(pid, &status, block ? 0 : WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited < 0) {
            if (errno == EINTR) continue;
            result.error = errnoMessage("waitpid failed", errno);
            Logger::error(kComponent, result.error);
            return result;
        }
        // The child closed its output but is still running
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            killProcessGroup(pid);
            continue;
        }
        std::this_thread::sleep_for(kWaitInterval);
    }

    // A successful execve closed the CLOEXEC pipe without writing to it
    int exec_errno = 0;
    bool exec_failed = read(exec_read.get(), &exec_errno, sizeof(exec_errno)) ==
                       static_cast<ssize_t>(sizeof(exec_errno));

    if (result.timed_out) {
        result.exit_code = -1;
        result.error = "timed out after " + std::to_string(timeout.count()) + "ms";
    } else if (exec_failed) {
        result.exit_code = -1;
        result.error = errnoMessage("exec " + executable, exec_errno);
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.success = result.exit_code == 0;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = -1;
        result.error = "signal: " + std::string(strsignal(WTERMSIG(status)));
    }

    if (result.isSuccess()) {
        Logger::debug(kComponent, "Command completed successfully");
    } else {
        Logger::error(kComponent, "Command '" + result.command + "' failed: " +
                      result.getErrorMessage());
    }

    return result;
}

std::string CommandExecutor::formatCommandLine(const std::string& executable,
                                               const std::vector<std::string>& args,
                                               const std::vector<std::string>& env_vars) {
    std::ostringstream command;
    bool first = true;
    auto put = [&command, &first](const std::string& token) {
        if (!first) command << " ";
        command << token;
        first = false;
    };

    for (const auto& env : env_vars) {
        put(escapeShellArg(env));
    }
    put(escapeShellArg(executable));
    for (const auto& arg : args) {
        put(escapeShellArg(arg));
    }
    return command.str();
}

std::string CommandExecutor::escapeShellArg(const std::string& arg) {
    if (arg.empty()) {
        return "''";
    }
    // If argument contains no special characters, return as-is
    if (arg.find_first_of(" \t\n\r\"'\\$`|&;<>(){}[]?*~") == std::string::npos) {
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

} // namespace tproxy
