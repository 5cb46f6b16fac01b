#include "cli_verification.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <openssl/evp.h>
#include <sstream>

namespace agentmux::internal
{

std::optional<std::string> compute_file_sha256(const std::filesystem::path& file_path)
{
    std::ifstream file(file_path, std::ios::binary);
    if (!file)
        return std::nullopt;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                 &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        return std::nullopt;

    const size_t BUFFER_SIZE = 8192;
    char buffer[BUFFER_SIZE];
    while (file.read(buffer, BUFFER_SIZE) || file.gcount() > 0)
    {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1)
            return std::nullopt;
    }
    if (file.bad())
        return std::nullopt;

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1)
        return std::nullopt;

    // Convert to hex string
    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_len; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);

    return oss.str();
}

bool verify_cli_path_allowed(const std::string& cli_path,
                             const std::vector<std::string>& allowed_paths)
{
    // If no allowlist specified, allow all paths
    if (allowed_paths.empty())
        return true;

    // Normalize both sides; symlinks resolve to their targets
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path normalized_cli = fs::canonical(cli_path, ec);
    if (ec)
        normalized_cli = fs::path(cli_path).lexically_normal();

    for (const auto& allowed : allowed_paths)
    {
        fs::path normalized_allowed = fs::canonical(allowed, ec);
        if (ec)
            normalized_allowed = fs::path(allowed).lexically_normal();

        if (normalized_cli == normalized_allowed)
            return true;
    }

    return false;
}

bool verify_cli_hash(const std::filesystem::path& cli_path,
                     const std::optional<std::string>& expected_hash, std::string& error_message)
{
    // If no hash check requested, always pass
    if (!expected_hash)
        return true;

    // Validate hash format (should be 64 hex characters for SHA256)
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

    auto actual_hash = compute_file_sha256(cli_path);
    if (!actual_hash)
    {
        error_message = "Failed to compute hash of " + cli_path.string();
        return false;
    }

    // Compare hashes (case-insensitive)
    std::string expected_lower = *expected_hash;
    std::transform(expected_lower.begin(), expected_lower.end(), expected_lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (expected_lower != *actual_hash)
    {
        error_message =
            "Executable hash mismatch: expected " + expected_lower + " but got " + *actual_hash;
        return false;
    }

    return true;
}

} // namespace agentmux::internal
