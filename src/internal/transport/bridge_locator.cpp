#include "bridge_locator.hpp"

#include "../subprocess/process.hpp"
#include "bridge_verification.hpp"

#include <algorithm>
#include <filesystem>
#include <strata/errors.hpp>
#include <system_error>

namespace strata
{
namespace internal
{

namespace fs = std::filesystem;

namespace
{

// "v20.11.1" -> {20, 11, 1}; non-numeric parts count as 0
std::vector<int> version_key(const std::string& name)
{
    std::vector<int> key;
    std::string text = (!name.empty() && name[0] == 'v') ? name.substr(1) : name;
    size_t start = 0;
    while (start <= text.size())
    {
        size_t end = text.find('.', start);
        if (end == std::string::npos)
            end = text.size();
        std::string part = text.substr(start, end - start);
        int value = 0;
        for (char c : part)
        {
            if (c < '0' || c > '9')
                break;
            value = value * 10 + (c - '0');
        }
        key.push_back(value);
        start = end + 1;
    }
    return key;
}

bool is_readable_file(const std::string& path)
{
    std::error_code ec;
    return !path.empty() && fs::is_regular_file(path, ec);
}

std::string absolute_path(const std::string& path)
{
    std::error_code ec;
    fs::path result = fs::absolute(path, ec);
    return ec ? path : result.lexically_normal().string();
}

} // namespace

std::string executable_directory()
{
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec)
        return "";
    return exe.parent_path().string();
}

std::optional<std::string> newest_nvm_node(const std::string& nvm_root)
{
    std::error_code ec;
    fs::path versions = fs::path(nvm_root) / "versions" / "node";
    if (!fs::is_directory(versions, ec))
        return std::nullopt;

    std::optional<std::string> best;
    std::vector<int> best_key;
    for (const auto& entry : fs::directory_iterator(versions, ec))
    {
        std::string candidate = (entry.path() / "bin" / "node").string();
        if (!subprocess::is_executable_file(candidate))
            continue;
        auto key = version_key(entry.path().filename().string());
        if (!best || key > best_key)
        {
            best = candidate;
            best_key = key;
        }
    }
    return best;
}

std::vector<std::string> interpreter_candidates(const EnvironmentLookup& lookup)
{
    std::vector<std::string> candidates;
    if (auto overridden = lookup("STRATA_NODE_PATH"); overridden && !overridden->empty())
        candidates.push_back(*overridden);

    candidates.push_back("/usr/local/bin/node");
    candidates.push_back("/opt/homebrew/bin/node");

    std::string nvm_root;
    if (auto nvm_dir = lookup("NVM_DIR"); nvm_dir && !nvm_dir->empty())
        nvm_root = *nvm_dir;
    else if (auto home = lookup("HOME"); home && !home->empty())
        nvm_root = (fs::path(*home) / ".nvm").string();
    if (!nvm_root.empty())
    {
        if (auto nvm_node = newest_nvm_node(nvm_root))
            candidates.push_back(*nvm_node);
    }

    candidates.push_back("/usr/bin/node");
    return candidates;
}

std::vector<std::string> script_candidates(const EnvironmentLookup& lookup,
                                           const std::string& exe_dir)
{
    std::vector<std::string> candidates;
    if (auto overridden = lookup("STRATA_BRIDGE_SCRIPT"); overridden && !overridden->empty())
        candidates.push_back(*overridden);

    if (!exe_dir.empty())
    {
        candidates.push_back((fs::path(exe_dir) / "bridge" / kBridgeScriptName).string());
        candidates.push_back(
            (fs::path(exe_dir) / ".." / "share" / "strata" / "bridge" / kBridgeScriptName)
                .lexically_normal()
                .string());
    }
    return candidates;
}

BridgeLocation locate_bridge(const BridgeOptions& options, const EnvironmentLookup& lookup,
                             const std::string& exe_dir)
{
    BridgeLocation location;

    // Interpreter
    if (!options.interpreter_path.empty())
    {
        if (!subprocess::is_executable_file(options.interpreter_path))
            throw LaunchError("Node.js interpreter not found at " + options.interpreter_path,
                              "interpreter");
        location.interpreter = absolute_path(options.interpreter_path);
    }
    else
    {
        for (const auto& candidate : interpreter_candidates(lookup))
        {
            if (subprocess::is_executable_file(candidate))
            {
                location.interpreter = absolute_path(candidate);
                break;
            }
        }
        if (location.interpreter.empty())
        {
            if (auto on_path = subprocess::find_executable("node"))
                location.interpreter = *on_path;
        }
        if (location.interpreter.empty())
            throw LaunchError("Node.js not found. Install Node.js or set STRATA_NODE_PATH.",
                              "interpreter");
    }

    // Script
    if (!options.bridge_script_path.empty())
    {
        if (!is_readable_file(options.bridge_script_path))
            throw LaunchError("Bridge script not found at " + options.bridge_script_path,
                              "bridge script");
        location.script = absolute_path(options.bridge_script_path);
    }
    else
    {
        for (const auto& candidate : script_candidates(lookup, exe_dir))
        {
            if (is_readable_file(candidate))
            {
                location.script = absolute_path(candidate);
                break;
            }
        }
        if (location.script.empty())
            throw LaunchError(std::string("Bridge script ") + kBridgeScriptName +
                                  " not found. Set STRATA_BRIDGE_SCRIPT.",
                              "bridge script");
    }

    std::string error;
    if (!verify_file_hash(location.script, options.bridge_script_sha256, error))
        throw LaunchError(error);

    return location;
}

} // namespace internal
} // namespace strata
