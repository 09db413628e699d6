#include "command_executor.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>

namespace tproxy {
namespace {

using std::chrono::milliseconds;

// A process counts as gone once it is reaped or only left as a zombie
bool processGone(const std::string& pid) {
    std::ifstream stat("/proc/" + pid + "/stat");
    std::string line;
    if (!std::getline(stat, line)) {
        return true;
    }
    std::size_t end_of_name = line.rfind(')');
    return end_of_name != std::string::npos && end_of_name + 2 < line.size() &&
           line[end_of_name + 2] == 'Z';
}

bool waitUntilGone(const std::string& pid) {
    for (int attempt = 0; attempt < 200; ++attempt) {
        if (processGone(pid)) {
            return true;
        }
        std::this_thread::sleep_for(milliseconds(10));
    }
    return false;
}

TEST(CommandExecutorTest, ForwardsOutputAndExitCode) {
    CommandExecutor executor;
    std::ostringstream out;
    std::ostringstream err;

    CommandResult result = executor.run("/bin/sh", {"-c", "echo hello; echo oops >&2"}, {},
                                        out, err, milliseconds(5000));

    EXPECT_TRUE(result.isSuccess());
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(out.str(), "hello\n");
    EXPECT_EQ(err.str(), "oops\n");
    EXPECT_EQ(result.getErrorMessage(), "");
}

TEST(CommandExecutorTest, NonZeroExitIsFailure) {
    CommandExecutor executor;
    std::ostringstream out;
    std::ostringstream err;

    CommandResult result = executor.run("/bin/sh", {"-c", "exit 3"}, {}, out, err, milliseconds(0));

    EXPECT_FALSE(result.isSuccess());
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.getErrorMessage(), "unexpected exit code: 3, err: exit status 3");
}

TEST(CommandExecutorTest, ExtraEnvironmentIsPassed) {
    CommandExecutor executor;
    std::ostringstream out;
    std::ostringstream err;

    CommandResult result = executor.run("/bin/sh", {"-c", "printf %s \"$TPROXY_TEST\""},
                                        {"TPROXY_TEST=value"}, out, err, milliseconds(5000));

    EXPECT_TRUE(result.isSuccess());
    EXPECT_EQ(out.str(), "value");
}

TEST(CommandExecutorTest, ExtraEnvironmentOverridesParentValue) {
    ASSERT_EQ(setenv("TPROXY_OVERRIDE_TEST", "parent", 1), 0);

    CommandExecutor executor;
    std::ostringstream out;
    std::ostringstream err;

    CommandResult result = executor.run("/bin/sh", {"-c", "env | grep '^TPROXY_OVERRIDE_TEST='"},
                                        {"TPROXY_OVERRIDE_TEST=first", "TPROXY_OVERRIDE_TEST=override"},
                                        out, err, milliseconds(5000));
    unsetenv("TPROXY_OVERRIDE_TEST");

    EXPECT_TRUE(result.isSuccess());
    EXPECT_EQ(out.str(), "TPROXY_OVERRIDE_TEST=override\n");
}

TEST(CommandExecutorTest, TimeoutKillsTheCommand) {
    CommandExecutor executor;
    std::ostringstream out;
    std::ostringstream err;

    CommandResult result = executor.run("/bin/sh", {"-c", "sleep 10"}, {}, out, err,
                                        milliseconds(200));

    EXPECT_FALSE(result.isSuccess());
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.error, "timed out after 200ms");
}

TEST(CommandExecutorTest, TimeoutKillsProcessesStartedByTheCommand) {
    CommandExecutor executor;
    std::ostringstream out;
    std::ostringstream err;

    CommandResult result = executor.run("/bin/sh", {"-c", "sleep 30 & echo $!; wait"}, {},
                                        out, err, milliseconds(300));

    EXPECT_TRUE(result.timed_out);
    std::string background_pid = out.str();
    while (!background_pid.empty() && background_pid.back() == '\n') {
        background_pid.pop_back();
    }
    ASSERT_FALSE(background_pid.empty());
    EXPECT_TRUE(waitUntilGone(background_pid)) << "sleep " << background_pid << " survived";
}

TEST(CommandExecutorTest, MissingExecutableIsReported) {
    CommandExecutor executor;
    std::ostringstream out;
    std::ostringstream err;

    CommandResult result = executor.run("/nonexistent/loader", {}, {}, out, err, milliseconds(5000));

    EXPECT_FALSE(result.isSuccess());
    EXPECT_EQ(result.error.rfind("exec /nonexistent/loader", 0), 0u);
}

TEST(CommandExecutorTest, FormatCommandLine) {
    EXPECT_EQ(CommandExecutor::formatCommandLine("/kuma/ebpf/mb_tc", {"--bpffs", "/run/kuma/bpf"}),
              "/kuma/ebpf/mb_tc --bpffs /run/kuma/bpf");
    EXPECT_EQ(CommandExecutor::formatCommandLine("/bin/sh", {"-c", "echo hi"}, {"DEBUG=1"}),
              "DEBUG=1 /bin/sh -c 'echo hi'");
    EXPECT_EQ(CommandExecutor::formatCommandLine("/bin/true", {""}), "/bin/true ''");
}

} // namespace
} // namespace tproxy
