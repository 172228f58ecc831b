#include "core/shutdown_signal.hpp"
#include "process/subprocess.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <system_error>
#include <thread>

using namespace std::chrono_literals;

namespace {

SpawnOptions shell(const std::string& script) {
    SpawnOptions options;
    options.argv = {"/bin/sh", "-c", script};
    return options;
}

} // namespace

TEST(Subprocess, ReportsExitCode) {
    auto child = Subprocess::spawn(shell("exit 3"));
    const ExitStatus status = child->wait();

    EXPECT_TRUE(status.exited);
    EXPECT_EQ(status.code, 3);
    EXPECT_FALSE(status.success());
    EXPECT_EQ(status.describe(), "exit code 3");
}

TEST(Subprocess, MissingBinaryThrows) {
    SpawnOptions options;
    options.argv = {"holdtalk-no-such-binary"};
    EXPECT_THROW(Subprocess::spawn(options), std::system_error);
}

TEST(Subprocess, StopWithTermIsGraceful) {
    auto child = Subprocess::spawn(shell("exec sleep 10"));
    bool forced = true;
    const ExitStatus status = child->stop(SIGTERM, 2000ms, &forced);

    EXPECT_FALSE(forced);
    EXPECT_FALSE(status.exited);
    EXPECT_EQ(status.signal, SIGTERM);
    EXPECT_FALSE(child->running());
}

TEST(Subprocess, StopEscalatesToKill) {
    auto child = Subprocess::spawn(shell("trap '' TERM; while :; do sleep 1; done"));
    std::this_thread::sleep_for(200ms);

    bool forced = false;
    const ExitStatus status = child->stop(SIGTERM, 200ms, &forced);

    EXPECT_TRUE(forced);
    EXPECT_EQ(status.signal, SIGKILL);
}

TEST(RunProcess, CollectsStdout) {
    RunResult run = runProcess(shell("printf 'one\\ntwo\\n'"), 5000ms);

    EXPECT_TRUE(run.status.success());
    EXPECT_FALSE(run.timedOut);
    EXPECT_EQ(run.output, "one\ntwo\n");
}

TEST(RunProcess, PassesTheEnvironment) {
    SpawnOptions options = shell("printf '%s' \"$HOLDTALK_VALUE\"");
    options.env = currentEnvironment();
    options.env["HOLDTALK_VALUE"] = "forty-two";

    EXPECT_EQ(runProcess(options, 5000ms).output, "forty-two");
}

TEST(RunProcess, KillsOnTimeout) {
    const auto started = std::chrono::steady_clock::now();
    RunResult run = runProcess(shell("exec sleep 10"), 200ms);

    EXPECT_TRUE(run.timedOut);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(RunProcess, StopsWhenCancelled) {
    ShutdownSignal shutdown;
    shutdown.trigger();

    RunResult run = runProcess(shell("exec sleep 10"), 5000ms, &shutdown);
    EXPECT_TRUE(run.cancelled);
}

TEST(FindExecutable, SearchesPath) {
    EXPECT_TRUE(findExecutable("sh").has_value());
    EXPECT_EQ(findExecutable("/bin/sh"), std::optional<std::string>("/bin/sh"));
    EXPECT_FALSE(findExecutable("holdtalk-no-such-binary").has_value());
    EXPECT_FALSE(findExecutable("").has_value());
}
