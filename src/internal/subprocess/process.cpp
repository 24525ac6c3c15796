// POSIX process management for the bridge child

#include "process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <signal.h>
#include <stdexcept>
#include <sys/stat.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

extern char** environ;

namespace strata
{
namespace subprocess
{

namespace
{

std::runtime_error system_error(const std::string& what, int err)
{
    return std::runtime_error(what + ": " + std::strerror(err));
}

struct Pipe
{
    FileDescriptor read_end;
    FileDescriptor write_end;
};

// Both ends are close-on-exec. dup2 onto 0/1/2 clears the flag for the
// copies the child keeps.
Pipe open_pipe()
{
    int fds[2];
    if (::pipe(fds) != 0)
        throw system_error("Failed to create pipe", errno);
    Pipe result{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return result;
}

std::vector<std::string> build_environment(const SpawnOptions& options)
{
    std::vector<std::string> entries;
    if (options.inherit_environment)
    {
        for (char** entry = environ; entry && *entry; ++entry)
        {
            std::string item(*entry);
            if (options.environment.count(item.substr(0, item.find('='))) == 0)
                entries.push_back(std::move(item));
        }
    }
    for (const auto& [key, value] : options.environment)
        entries.push_back(key + "=" + value);
    return entries;
}

std::vector<char*> as_pointer_array(const std::vector<std::string>& strings)
{
    std::vector<char*> pointers;
    pointers.reserve(strings.size() + 1);
    for (const auto& item : strings)
        pointers.push_back(const_cast<char*>(item.c_str()));
    pointers.push_back(nullptr);
    return pointers;
}

int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// Child side after fork: only async-signal-safe calls from here on.
// The report is errno followed by the name of the step that failed.
[[noreturn]] void report_and_exit(int report_fd, const char* step)
{
    int err = errno;
    char buffer[64];
    std::size_t len = std::strlen(step);
    if (len > sizeof(buffer) - sizeof(int))
        len = sizeof(buffer) - sizeof(int);
    std::memcpy(buffer, &err, sizeof(int));
    std::memcpy(buffer + sizeof(int), step, len);
    ssize_t ignored = ::write(report_fd, buffer, sizeof(int) + len);
    (void)ignored;
    _exit(127);
}

} // namespace

// FileDescriptor

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept
{
    if (this != &other)
        reset(other.release());
    return *this;
}

int FileDescriptor::release() noexcept
{
    int fd = fd_;
    fd_ = -1;
    return fd;
}

void FileDescriptor::reset(int fd) noexcept
{
    if (fd_ >= 0)
        ::close(fd_);
    fd_ = fd;
}

// PipeReader

size_t PipeReader::read_some(char* buffer, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    for (;;)
    {
        ssize_t n = ::read(fd_.get(), buffer, size);
        if (n >= 0)
            return static_cast<size_t>(n);
        if (errno != EINTR)
            throw system_error("Read failed", errno);
    }
}

std::string PipeReader::read_line(size_t max_size)
{
    std::string line;
    char ch = 0;
    while (line.size() < max_size && ch != '\n')
    {
        if (read_some(&ch, 1) == 0)
            break;
        line.push_back(ch);
    }
    return line;
}

bool PipeReader::wait_readable(std::chrono::milliseconds timeout)
{
    if (!is_open())
        return false;

    struct pollfd entry;
    entry.fd = fd_.get();
    entry.events = POLLIN;
    entry.revents = 0;

    int result = ::poll(&entry, 1, static_cast<int>(timeout.count()));
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw system_error("poll failed", errno);
    }
    // POLLHUP without POLLIN is EOF, which read_some reports as 0
    return result > 0 && (entry.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

// PipeWriter

void PipeWriter::write_all(const std::string& data)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    // SIGPIPE stays blocked on this thread while writing; any instance we
    // raised is consumed before the mask is restored.
    sigset_t pipe_set;
    sigset_t old_set;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set);

    size_t written = 0;
    int error = 0;
    while (written < data.size())
    {
        ssize_t n = ::write(fd_.get(), data.data() + written, data.size() - written);
        if (n >= 0)
            written += static_cast<size_t>(n);
        else if (errno != EINTR)
        {
            error = errno;
            break;
        }
    }

    if (error == EPIPE)
    {
        struct timespec zero = {0, 0};
        while (sigtimedwait(&pipe_set, nullptr, &zero) > 0)
        {
        }
    }
    pthread_sigmask(SIG_SETMASK, &old_set, nullptr);

    if (error == EPIPE)
        throw std::runtime_error("Broken pipe (process closed stdin)");
    if (error != 0)
        throw system_error("Write failed", error);
}

// Process

Process::~Process()
{
    if (!running_)
        return;
    terminate();
    try
    {
        wait();
    }
    catch (const std::runtime_error&)
    {
        // Reaped by someone else
    }
}

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const SpawnOptions& options)
{
    if (running_)
        throw std::runtime_error("Process already running");

    Pipe in = open_pipe();
    Pipe out = open_pipe();
    Pipe err;
    if (options.capture_stderr)
        err = open_pipe();
    Pipe report = open_pipe();

    // argv and envp are built before fork so the child never allocates
    std::vector<std::string> argv_storage;
    argv_storage.push_back(executable);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    std::vector<std::string> env_storage = build_environment(options);
    std::vector<char*> argv = as_pointer_array(argv_storage);
    std::vector<char*> envp = as_pointer_array(env_storage);

    pid_t pid = ::fork();
    if (pid < 0)
        throw system_error("Failed to fork process", errno);

    if (pid == 0)
    {
        int report_fd = report.write_end.get();
        if (::dup2(in.read_end.get(), STDIN_FILENO) < 0)
            report_and_exit(report_fd, "dup2 stdin");
        if (::dup2(out.write_end.get(), STDOUT_FILENO) < 0)
            report_and_exit(report_fd, "dup2 stdout");
        if (options.capture_stderr && ::dup2(err.write_end.get(), STDERR_FILENO) < 0)
            report_and_exit(report_fd, "dup2 stderr");
        if (!options.working_directory.empty() &&
            ::chdir(options.working_directory.c_str()) != 0)
            report_and_exit(report_fd, "chdir");

        ::execve(executable.c_str(), argv.data(), envp.data());
        report_and_exit(report_fd, "exec");
    }

    pid_ = pid;
    running_ = true;
    exit_code_ = -1;

    // Our copies of the child's ends must go, or EOF never arrives
    in.read_end.reset();
    out.write_end.reset();
    err.write_end.reset();
    report.write_end.reset();

    // The report pipe closes on a successful exec; any bytes mean failure
    char buffer[64];
    ssize_t n;
    do
    {
        n = ::read(report.read_end.get(), buffer, sizeof(buffer));
    } while (n < 0 && errno == EINTR);

    if (n >= static_cast<ssize_t>(sizeof(int)))
    {
        int child_errno = 0;
        std::memcpy(&child_errno, buffer, sizeof(int));
        std::string step(buffer + sizeof(int), static_cast<size_t>(n) - sizeof(int));
        wait();
        throw system_error("Failed to start " + executable + " (" + step + ")", child_errno);
    }

    stdin_ = PipeWriter(std::move(in.write_end));
    stdout_ = PipeReader(std::move(out.read_end));
    stderr_ = PipeReader(std::move(err.read_end));
}

std::optional<int> Process::reap(bool block) const
{
    if (!running_)
        return exit_code_;

    int status = 0;
    pid_t result;
    do
    {
        result = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == 0)
        return std::nullopt;
    if (result != pid_)
        throw system_error("waitpid failed", errno);

    exit_code_ = decode_status(status);
    running_ = false;
    return exit_code_;
}

bool Process::is_running() const
{
    // A zombie still answers kill(0); only waitpid settles it
    try
    {
        return pid_ > 0 && !reap(false).has_value();
    }
    catch (const std::runtime_error&)
    {
        return false;
    }
}

std::optional<int> Process::try_wait()
{
    if (pid_ == 0)
        return -1;
    return reap(false);
}

int Process::wait()
{
    if (pid_ == 0)
        return -1;
    return *reap(true);
}

void Process::send_signal(int signal_number)
{
    if (pid_ > 0 && running_)
        ::kill(pid_, signal_number);
}

void Process::terminate()
{
    send_signal(SIGTERM);
}

void Process::kill()
{
    send_signal(SIGKILL);
}

// Lookup helpers

bool is_executable_file(const std::string& path)
{
    struct stat info;
    if (path.empty() || ::stat(path.c_str(), &info) != 0)
        return false;
    return S_ISREG(info.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    if (name.empty())
        return std::nullopt;

    if (name.find('/') != std::string::npos)
    {
        if (!is_executable_file(name))
            return std::nullopt;
        return fs::path(name).is_absolute() ? name : fs::absolute(name).string();
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr)
        return std::nullopt;

    std::string search_path(path_env);
    size_t start = 0;
    while (start <= search_path.size())
    {
        size_t end = search_path.find(':', start);
        if (end == std::string::npos)
            end = search_path.size();
        if (end > start)
        {
            std::string candidate =
                (fs::path(search_path.substr(start, end - start)) / name).string();
            if (is_executable_file(candidate))
                return candidate;
        }
        start = end + 1;
    }
    return std::nullopt;
}

} // namespace subprocess
} // namespace strata
