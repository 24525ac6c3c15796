#include "../../src/internal/subprocess/process.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <unistd.h>
#include <utility>

using namespace strata::subprocess;

TEST(ProcessTest, SpawnEcho)
{
    Process proc;
    proc.spawn("/bin/echo", {"Hello"});

    EXPECT_GT(proc.pid(), 0);
    EXPECT_EQ(proc.output().read_line(), "Hello\n");
    EXPECT_EQ(proc.wait(), 0);
}

TEST(ProcessTest, WriteStdin)
{
    Process proc;
    proc.spawn("/bin/cat", {});

    proc.input().write_all("Hello\n");
    proc.input().close(); // EOF

    EXPECT_EQ(proc.output().read_line(), "Hello\n");
    EXPECT_EQ(proc.wait(), 0);
}

TEST(ProcessTest, ExitCodeIsReported)
{
    Process proc;
    proc.spawn("/bin/sh", {"-c", "exit 7"});
    EXPECT_EQ(proc.wait(), 7);
    EXPECT_FALSE(proc.is_running());
    EXPECT_EQ(proc.try_wait().value_or(-1), 7);
}

TEST(ProcessTest, TerminateReportsSignal)
{
    Process proc;
    proc.spawn("/bin/sleep", {"10"});
    EXPECT_TRUE(proc.is_running());
    EXPECT_FALSE(proc.try_wait().has_value());

    proc.terminate();
    EXPECT_EQ(proc.wait(), 128 + 15);
}

TEST(ProcessTest, MissingExecutableThrows)
{
    Process proc;
    EXPECT_THROW(proc.spawn("/nonexistent/interpreter", {}), std::runtime_error);
}

TEST(ProcessTest, MissingWorkingDirectoryThrows)
{
    Process proc;
    SpawnOptions opts;
    opts.working_directory = "/nonexistent/directory";
    EXPECT_THROW(proc.spawn("/bin/pwd", {}, opts), std::runtime_error);
}

TEST(ProcessTest, WorkingDirectory)
{
    Process proc;
    SpawnOptions opts;
    opts.working_directory = "/";
    proc.spawn("/bin/pwd", {}, opts);

    EXPECT_EQ(proc.output().read_line(), "/\n");
    proc.wait();
}

TEST(ProcessTest, InheritedEnvironmentWithOverride)
{
    ::setenv("STRATA_PROCESS_TEST_PARENT", "parent", 1);

    Process proc;
    SpawnOptions opts;
    opts.environment["TEST_VAR"] = "test_value";
    proc.spawn("/bin/sh", {"-c", "echo \"$TEST_VAR:$STRATA_PROCESS_TEST_PARENT\""}, opts);

    EXPECT_EQ(proc.output().read_line(), "test_value:parent\n");
    proc.wait();
    ::unsetenv("STRATA_PROCESS_TEST_PARENT");
}

TEST(ProcessTest, ExplicitEnvironmentOnly)
{
    ::setenv("STRATA_PROCESS_TEST_SECRET", "leaked", 1);

    Process proc;
    SpawnOptions opts;
    opts.inherit_environment = false;
    opts.environment["ONLY"] = "this";
    proc.spawn("/bin/sh", {"-c", "echo \"${ONLY}:${STRATA_PROCESS_TEST_SECRET}\""}, opts);

    EXPECT_EQ(proc.output().read_line(), "this:\n");
    proc.wait();
    ::unsetenv("STRATA_PROCESS_TEST_SECRET");
}

TEST(ProcessTest, StderrRedirect)
{
    Process proc;
    SpawnOptions opts;
    opts.capture_stderr = true;
    proc.spawn("/bin/sh", {"-c", "echo oops 1>&2"}, opts);

    EXPECT_EQ(proc.errors().read_line(), "oops\n");
    proc.wait();
}

TEST(ProcessTest, WriteToExitedProcessThrowsInsteadOfSignal)
{
    Process proc;
    proc.spawn("/bin/sh", {"-c", "exec 0<&-; exit 0"});
    proc.wait();

    std::string chunk(64 * 1024, 'x');
    EXPECT_THROW(
        {
            for (int i = 0; i < 16; ++i)
                proc.input().write_all(chunk);
        },
        std::runtime_error);
}

TEST(ProcessTest, WaitReadableTimesOut)
{
    Process proc;
    proc.spawn("/bin/sleep", {"1"});
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(proc.output().wait_readable(std::chrono::milliseconds(50)));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(40));
    proc.kill();
    proc.wait();
}

TEST(ProcessTest, ReadReturnsZeroAtEof)
{
    Process proc;
    proc.spawn("/bin/sh", {"-c", "printf abc"});
    char buffer[16];
    std::string out;
    while (true)
    {
        size_t n = proc.output().read_some(buffer, sizeof(buffer));
        if (n == 0)
            break;
        out.append(buffer, n);
    }
    EXPECT_EQ(out, "abc");
    proc.wait();
}

TEST(ProcessTest, FindExecutable)
{
    auto sh = find_executable("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_TRUE(is_executable_file(*sh));

    EXPECT_TRUE(find_executable("/bin/sh").has_value());
    EXPECT_FALSE(find_executable("this_should_not_exist_12345").has_value());
    EXPECT_FALSE(is_executable_file("/etc/hostname-does-not-exist"));
    EXPECT_FALSE(is_executable_file("/"));
}

TEST(FileDescriptorTest, ReleaseAndReset)
{
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);

    FileDescriptor reader(fds[0]);
    FileDescriptor writer(fds[1]);
    EXPECT_TRUE(reader.valid());

    FileDescriptor moved(std::move(writer));
    EXPECT_FALSE(writer.valid());
    EXPECT_EQ(moved.get(), fds[1]);

    int raw = moved.release();
    EXPECT_FALSE(moved.valid());
    moved.reset(raw);
    moved.reset();
    EXPECT_FALSE(moved.valid());

    // Writer closed: the reader sees EOF
    PipeReader pipe(std::move(reader));
    EXPECT_TRUE(pipe.wait_readable(std::chrono::milliseconds(100)));
    char ch;
    EXPECT_EQ(pipe.read_some(&ch, 1), 0u);
}

TEST(ProcessTest, ClosedPipeRejectsIo)
{
    PipeReader reader;
    PipeWriter writer;
    char ch;
    EXPECT_FALSE(reader.wait_readable(std::chrono::milliseconds(0)));
    EXPECT_THROW(reader.read_some(&ch, 1), std::runtime_error);
    EXPECT_THROW(writer.write_all("x"), std::runtime_error);
}
