#ifndef STRATA_INTERNAL_TRANSPORT_ENVIRONMENT_HPP
#define STRATA_INTERNAL_TRANSPORT_ENVIRONMENT_HPP

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace strata
{
namespace internal
{

// Name of the variable carrying the launch nonce
inline constexpr const char* kNonceVariable = "STRATA_BRIDGE_NONCE";

// Looks up one variable of the parent environment
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

// The fixed set of parent variables passed through to the bridge
const std::vector<std::string>& passthrough_variables();

// Lookup backed by getenv
std::optional<std::string> process_environment(const std::string& name);

/// Build the complete child environment: allow-listed parent variables that
/// are set, TERM=dumb, NO_COLOR=1, and the nonce. Nothing else is inherited.
std::map<std::string, std::string> build_bridge_environment(
    const std::string& nonce, const EnvironmentLookup& lookup = process_environment);

} // namespace internal
} // namespace strata

#endif // STRATA_INTERNAL_TRANSPORT_ENVIRONMENT_HPP
