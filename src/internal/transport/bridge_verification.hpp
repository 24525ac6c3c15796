#ifndef STRATA_INTERNAL_TRANSPORT_BRIDGE_VERIFICATION_HPP
#define STRATA_INTERNAL_TRANSPORT_BRIDGE_VERIFICATION_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace strata
{
namespace internal
{

/// Hex-encoded (lowercase) SHA-256 of a file, or nullopt if it cannot be read
std::optional<std::string> compute_file_sha256(const std::filesystem::path& file_path);

/// Check a file against an expected SHA-256. Passes when expected_hash is
/// nullopt. Comparison is case-insensitive; on failure error_message says why.
bool verify_file_hash(const std::filesystem::path& file_path,
                      const std::optional<std::string>& expected_hash,
                      std::string& error_message);

} // namespace internal
} // namespace strata

#endif // STRATA_INTERNAL_TRANSPORT_BRIDGE_VERIFICATION_HPP
