#include "bridge_verification.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <openssl/evp.h>
#include <sstream>

namespace strata
{
namespace internal
{

namespace
{

struct DigestContextDeleter
{
    void operator()(EVP_MD_CTX* ctx) const
    {
        EVP_MD_CTX_free(ctx);
    }
};

std::string to_lower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

std::optional<std::string> compute_file_sha256(const std::filesystem::path& file_path)
{
    std::ifstream file(file_path, std::ios::binary);
    if (!file)
        return std::nullopt;

    std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        return std::nullopt;

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0)
    {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1)
            return std::nullopt;
    }
    if (file.bad())
        return std::nullopt;

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &length) != 1)
        return std::nullopt;

    std::ostringstream oss;
    for (unsigned int i = 0; i < length; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    return oss.str();
}

bool verify_file_hash(const std::filesystem::path& file_path,
                      const std::optional<std::string>& expected_hash, std::string& error_message)
{
    if (!expected_hash)
        return true;

    if (expected_hash->length() != 64)
    {
        error_message = "Invalid hash format: expected 64-character hex string";
        return false;
    }
    if (!std::all_of(expected_hash->begin(), expected_hash->end(),
                     [](unsigned char c) { return std::isxdigit(c) != 0; }))
    {
        error_message = "Invalid hash format: contains non-hex characters";
        return false;
    }

    auto actual = compute_file_sha256(file_path);
    if (!actual)
    {
        error_message = "Failed to compute hash of " + file_path.string();
        return false;
    }

    std::string expected = to_lower(*expected_hash);
    if (expected != *actual)
    {
        error_message = "Bridge script hash mismatch: expected " + expected + " but got " + *actual;
        return false;
    }
    return true;
}

} // namespace internal
} // namespace strata
