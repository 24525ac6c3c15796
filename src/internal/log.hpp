#ifndef STRATA_INTERNAL_LOG_HPP
#define STRATA_INTERNAL_LOG_HPP

#include <optional>
#include <strata/types.hpp>
#include <string>

namespace strata
{
namespace internal
{

// Routes log records to the configured callback, or to std::cerr when none is
// set (debug records only with STRATA_DEBUG in the environment).
class Logger
{
  public:
    Logger() : Logger(std::nullopt) {}
    explicit Logger(std::optional<LogCallback> callback);

    void log(LogLevel level, const std::string& message) const;

    void debug(const std::string& message) const
    {
        log(LogLevel::Debug, message);
    }
    void info(const std::string& message) const
    {
        log(LogLevel::Info, message);
    }
    void warning(const std::string& message) const
    {
        log(LogLevel::Warning, message);
    }
    void error(const std::string& message) const
    {
        log(LogLevel::Error, message);
    }

  private:
    std::optional<LogCallback> callback_;
    bool debug_enabled_ = false;
};

} // namespace internal
} // namespace strata

#endif // STRATA_INTERNAL_LOG_HPP
