#include "log.hpp"

#include <cstdlib>
#include <iostream>
#include <mutex>

namespace strata
{
namespace internal
{

namespace
{
std::mutex& stderr_mutex()
{
    static std::mutex mutex;
    return mutex;
}

bool debug_env_enabled()
{
    const char* value = std::getenv("STRATA_DEBUG");
    return value != nullptr && value[0] != '\0' && std::string(value) != "0";
}
} // namespace

Logger::Logger(std::optional<LogCallback> callback)
    : callback_(std::move(callback)), debug_enabled_(debug_env_enabled())
{
}

void Logger::log(LogLevel level, const std::string& message) const
{
    if (callback_)
    {
        try
        {
            (*callback_)(level, message);
        }
        catch (const std::exception& e)
        {
            std::lock_guard<std::mutex> lock(stderr_mutex());
            std::cerr << "[strata] log callback threw: " << e.what() << std::endl;
        }
        return;
    }

    if (level == LogLevel::Debug && !debug_enabled_)
        return;
    if (level == LogLevel::Info && !debug_enabled_)
        return;

    std::lock_guard<std::mutex> lock(stderr_mutex());
    std::cerr << "[strata] " << log_level_name(level) << ": " << message << std::endl;
}

} // namespace internal
} // namespace strata
