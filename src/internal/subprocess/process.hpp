#ifndef STRATA_SUBPROCESS_PROCESS_HPP
#define STRATA_SUBPROCESS_PROCESS_HPP

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace strata
{
namespace subprocess
{

// Owns a POSIX file descriptor
class FileDescriptor
{
  public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor()
    {
        reset();
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    int get() const
    {
        return fd_;
    }
    bool valid() const
    {
        return fd_ >= 0;
    }
    int release() noexcept;
    void reset(int fd = -1) noexcept;

  private:
    int fd_ = -1;
};

// Parent side of the child's stdout or stderr
class PipeReader
{
  public:
    PipeReader() = default;
    explicit PipeReader(FileDescriptor fd) : fd_(std::move(fd)) {}

    // Blocks until some bytes arrive. 0 means the child closed its end.
    size_t read_some(char* buffer, size_t size);

    // Reads through the next newline (kept) or until max_size bytes or EOF
    std::string read_line(size_t max_size = 4096);

    // True when a read would not block, which includes EOF
    bool wait_readable(std::chrono::milliseconds timeout);

    void close()
    {
        fd_.reset();
    }
    bool is_open() const
    {
        return fd_.valid();
    }

  private:
    FileDescriptor fd_;
};

// Parent side of the child's stdin
class PipeWriter
{
  public:
    PipeWriter() = default;
    explicit PipeWriter(FileDescriptor fd) : fd_(std::move(fd)) {}

    // Writes every byte or throws std::runtime_error. A reader that went away
    // is reported as an error rather than raising SIGPIPE.
    void write_all(const std::string& data);

    void close()
    {
        fd_.reset();
    }
    bool is_open() const
    {
        return fd_.valid();
    }

  private:
    FileDescriptor fd_;
};

struct SpawnOptions
{
    // Empty keeps the parent's directory
    std::string working_directory;
    // Added to (or, without inheritance, used as) the child's environment
    std::map<std::string, std::string> environment;
    bool inherit_environment = true;
    // stdin and stdout are always piped; stderr only on request
    bool capture_stderr = false;
};

// A child process talking over pipes. Exit statuses follow the shell
// convention: the exit code, or 128 + signal number for a killed child.
class Process
{
  public:
    Process() = default;
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    // Throws std::runtime_error when a pipe, fork, chdir or exec fails.
    // Failures after fork are reported back by the child before it exits.
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const SpawnOptions& options = {});

    PipeWriter& input()
    {
        return stdin_;
    }
    PipeReader& output()
    {
        return stdout_;
    }
    PipeReader& errors()
    {
        return stderr_;
    }

    bool is_running() const;
    std::optional<int> try_wait();
    int wait();
    void terminate();
    void kill();

    long pid() const
    {
        return static_cast<long>(pid_);
    }

  private:
    std::optional<int> reap(bool block) const;
    void send_signal(int signal_number);

    pid_t pid_ = 0;
    mutable bool running_ = false;
    mutable int exit_code_ = -1;
    PipeWriter stdin_;
    PipeReader stdout_;
    PipeReader stderr_;
};

// Resolves a bare name through PATH; names containing '/' are checked directly
std::optional<std::string> find_executable(const std::string& name);

bool is_executable_file(const std::string& path);

} // namespace subprocess
} // namespace strata

#endif // STRATA_SUBPROCESS_PROCESS_HPP
