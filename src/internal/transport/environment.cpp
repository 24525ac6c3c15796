#include "environment.hpp"

#include <cstdlib>

namespace strata
{
namespace internal
{

const std::vector<std::string>& passthrough_variables()
{
    static const std::vector<std::string> names = {
        "PATH",    "HOME",      "USER", "LOGNAME", "SHELL",  "TMPDIR",
        "NODE_PATH", "NVM_DIR", "LANG", "LC_ALL",  "LC_CTYPE", "ANTHROPIC_API_KEY",
    };
    return names;
}

std::optional<std::string> process_environment(const std::string& name)
{
    const char* value = std::getenv(name.c_str());
    if (value == nullptr)
        return std::nullopt;
    return std::string(value);
}

std::map<std::string, std::string> build_bridge_environment(const std::string& nonce,
                                                            const EnvironmentLookup& lookup)
{
    std::map<std::string, std::string> env;
    for (const auto& name : passthrough_variables())
    {
        if (auto value = lookup(name))
            env[name] = *value;
    }

    env["TERM"] = "dumb";
    env["NO_COLOR"] = "1";
    env[kNonceVariable] = nonce;
    return env;
}

} // namespace internal
} // namespace strata
