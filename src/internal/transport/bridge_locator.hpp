#ifndef STRATA_INTERNAL_TRANSPORT_BRIDGE_LOCATOR_HPP
#define STRATA_INTERNAL_TRANSPORT_BRIDGE_LOCATOR_HPP

#include "environment.hpp"

#include <optional>
#include <strata/types.hpp>
#include <string>
#include <vector>

namespace strata
{
namespace internal
{

inline constexpr const char* kBridgeScriptName = "strata-bridge.mjs";

struct BridgeLocation
{
    std::string interpreter; // absolute path to node
    std::string script;      // absolute path to the bridge script
};

// Directory containing the running executable, empty if unknown
std::string executable_directory();

// Newest node under <nvm_root>/versions/node/*/bin/node, by numeric version
std::optional<std::string> newest_nvm_node(const std::string& nvm_root);

// Candidate interpreter paths after the explicit option, in search order
std::vector<std::string> interpreter_candidates(const EnvironmentLookup& lookup);

// Candidate script paths after the explicit option, in search order
std::vector<std::string> script_candidates(const EnvironmentLookup& lookup,
                                           const std::string& exe_dir);

/// Resolve interpreter and bridge script. Throws LaunchError naming the
/// missing dependency, or when the script fails its integrity check.
BridgeLocation locate_bridge(const BridgeOptions& options,
                             const EnvironmentLookup& lookup = process_environment,
                             const std::string& exe_dir = executable_directory());

} // namespace internal
} // namespace strata

#endif // STRATA_INTERNAL_TRANSPORT_BRIDGE_LOCATOR_HPP
