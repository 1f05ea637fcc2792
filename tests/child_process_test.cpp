#include "core/process/ChildProcess.hpp"
#include "core/types/Error.hpp"

#include <gtest/gtest.h>

#include <thread>

using core::process::ChildProcess;

TEST(ChildProcessTest, CollectsMergedOutputAndExitCode) {
    ChildProcess child("sh", {"-c", "echo first; echo second >&2; exit 4"});
    child.start();

    std::vector<std::string> lines;
    auto result = child.wait([&lines](const std::string &line) { lines.push_back(line); });

    EXPECT_EQ(result.exitCode, 4);
    EXPECT_FALSE(result.terminated);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(result.output, "first\nsecond\n");
}

TEST(ChildProcessTest, MissingExecutableFailsToStart) {
    ChildProcess child("conveyor-no-such-program", {});
    EXPECT_THROW(child.start(), core::types::ConveyorException);
}

TEST(ChildProcessTest, TerminateStopsTheProcessGroup) {
    ChildProcess child("sh", {"-c", "sleep 30; echo done"}, std::chrono::milliseconds(500));
    child.start();
    EXPECT_TRUE(child.isRunning());

    std::thread canceller([&child]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        child.terminate();
    });

    auto start = std::chrono::steady_clock::now();
    auto result = child.wait();
    canceller.join();

    EXPECT_TRUE(result.terminated);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
    EXPECT_EQ(result.output.find("done"), std::string::npos);
    EXPECT_FALSE(child.isRunning());
}

TEST(ChildProcessTest, CommandLineJoinsArguments) {
    ChildProcess child("miracle_grue", {"-c", "miracle.config", "part.stl"});
    EXPECT_EQ(child.commandLine(), "miracle_grue -c miracle.config part.stl");
}
