#ifndef STRATA_ERRORS_HPP
#define STRATA_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace strata
{

// Base exception
class StrataError : public std::runtime_error
{
  public:
    explicit StrataError(const std::string& message) : std::runtime_error(message) {}
};

// Interpreter or bridge script missing, integrity mismatch, or spawn failure
class LaunchError : public StrataError
{
  public:
    LaunchError(const std::string& message, std::string missing_dependency = "")
        : StrataError(message), missing_dependency_(std::move(missing_dependency))
    {
    }

    // "interpreter", "bridge script", or empty when something else failed
    const std::string& missing_dependency() const
    {
        return missing_dependency_;
    }

  private:
    std::string missing_dependency_;
};

// First message from the bridge was not a ready event carrying the launch nonce
class AuthenticationFailed : public StrataError
{
  public:
    explicit AuthenticationFailed(const std::string& message) : StrataError(message) {}
};

// Bridge process exited while a request was in flight
class ProcessTerminated : public StrataError
{
  public:
    ProcessTerminated(const std::string& message, int exit_code)
        : StrataError(message), exit_code_(exit_code)
    {
    }

    int exit_code() const
    {
        return exit_code_;
    }

  private:
    int exit_code_;
};

// A request is already in flight
class BusyError : public StrataError
{
  public:
    explicit BusyError(const std::string& message) : StrataError(message) {}
};

// Working directory missing, not a directory, or containing NUL bytes
class InvalidWorkingDirectoryError : public StrataError
{
  public:
    InvalidWorkingDirectoryError(const std::string& message, std::string path)
        : StrataError(message), path_(std::move(path))
    {
    }

    const std::string& path() const
    {
        return path_;
    }

  private:
    std::string path_;
};

// Pipe closed or process gone when writing a command
class TransportError : public StrataError
{
  public:
    explicit TransportError(const std::string& message) : StrataError(message) {}
};

// A line from the bridge that is not a JSON object
class JSONDecodeError : public StrataError
{
  public:
    explicit JSONDecodeError(const std::string& message) : StrataError(message) {}
};

} // namespace strata

#endif // STRATA_ERRORS_HPP
