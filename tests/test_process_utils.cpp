#include <gtest/gtest.h>

#include "capsule/utils/process_utils.hpp"

#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace capsule::utils;

TEST(ProcessUtilsTest, TakeLineReturnsCompleteLinesOnly) {
    std::string buffer = "{\"a\":1}\n{\"b\":";

    auto first = TakeLine(buffer);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, "{\"a\":1}");
    EXPECT_FALSE(TakeLine(buffer).has_value());
    EXPECT_EQ(buffer, "{\"b\":");

    buffer += "2}\n";
    EXPECT_EQ(TakeLine(buffer).value_or(""), "{\"b\":2}");
    EXPECT_TRUE(buffer.empty());
}

TEST(ProcessUtilsTest, ResolveExecutableFindsShell) {
    auto sh = ResolveExecutable("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_TRUE(sh->is_absolute());

    EXPECT_FALSE(ResolveExecutable("capsule-no-such-interpreter").has_value());
    EXPECT_FALSE(ResolveExecutable("/nonexistent/python3").has_value());
    EXPECT_FALSE(ResolveExecutable("").has_value());
}

TEST(ProcessUtilsTest, FileDescriptorClosesOnReset) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    FileDescriptor read_end(fds[0]);
    FileDescriptor write_end(fds[1]);

    FileDescriptor moved(std::move(write_end));
    EXPECT_FALSE(write_end.IsValid());
    EXPECT_TRUE(moved.IsValid());

    moved.Reset();
    EXPECT_FALSE(moved.IsValid());

    std::string buffer;
    ASSERT_TRUE(SetNonBlocking(read_end.Get()));
    EXPECT_EQ(ReadAvailable(read_end.Get(), buffer), ReadStatus::CLOSED);
}

TEST(ProcessUtilsTest, SendAllAndReadAvailableOverSocketPair) {
    int pair[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, pair), 0);
    FileDescriptor left(pair[0]);
    FileDescriptor right(pair[1]);
    ASSERT_TRUE(SetNonBlocking(right.Get()));

    std::string buffer;
    EXPECT_EQ(ReadAvailable(right.Get(), buffer), ReadStatus::WOULD_BLOCK);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    ASSERT_TRUE(SendAll(left.Get(), "hello\n", deadline));
    EXPECT_EQ(ReadAvailable(right.Get(), buffer), ReadStatus::DATA);
    EXPECT_EQ(TakeLine(buffer).value_or(""), "hello");

    left.Reset();
    EXPECT_EQ(ReadAvailable(right.Get(), buffer), ReadStatus::CLOSED);
    EXPECT_FALSE(SendAll(right.Get(), "late\n", deadline));
}

TEST(ProcessUtilsTest, ReapChildCollectsExitCode) {
    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        _exit(3);
    }

    auto child = ReapChild(pid, std::chrono::milliseconds(2000));
    EXPECT_TRUE(child.reaped);
    EXPECT_FALSE(child.killed);
    EXPECT_EQ(DescribeExitStatus(child.status), "exited with code 3");
}

TEST(ProcessUtilsTest, ReapChildKillsAfterGracePeriod) {
    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        pause();
        _exit(0);
    }

    auto child = ReapChild(pid, std::chrono::milliseconds(50));
    EXPECT_TRUE(child.reaped);
    EXPECT_TRUE(child.killed);
    ASSERT_TRUE(WIFSIGNALED(child.status));
    EXPECT_EQ(DescribeExitStatus(child.status).rfind("terminated by signal 9", 0), 0u);
}
