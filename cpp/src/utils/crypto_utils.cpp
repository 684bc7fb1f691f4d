/**
 * @file crypto_utils.cpp
 * @brief Implementation of the libsodium-backed helpers.
 */
#include "utils/crypto_utils.hpp"
#include "fbr_service.hpp"

#include <sodium.h>
#include <chrono>
#include <stdexcept>

namespace filebridge::crypto
{

namespace
{
// sodium_init() is idempotent and thread-safe; the flag only avoids calling it on
// every hash when the module already ran.
std::atomic<bool> g_sodium_initialized{false};

constexpr int kBase64Variant = sodium_base64_VARIANT_ORIGINAL;

bool ensure_sodium_init() noexcept
{
    if (g_sodium_initialized.load(std::memory_order_acquire))
    {
        return true;
    }

    const int result = sodium_init();
    if (result == -1)
    {
        LOGGER_ERROR("[CryptoUtils] sodium_init() failed");
        return false;
    }

    g_sodium_initialized.store(true, std::memory_order_release);
    if (result == 0)
    {
        LOGGER_INFO("[CryptoUtils] libsodium {} initialized", sodium_version_string());
    }
    return true;
}

} // namespace

// ============================================================================
// Base64
// ============================================================================

std::string encode_base64(std::span<const uint8_t> data)
{
    if (data.empty())
    {
        return {};
    }
    if (!ensure_sodium_init())
    {
        throw std::runtime_error("encode_base64: libsodium is not available");
    }
    // sodium_base64_ENCODED_LEN includes the trailing NUL.
    std::string out(sodium_base64_ENCODED_LEN(data.size(), kBase64Variant), '\0');
    sodium_bin2base64(out.data(), out.size(), data.data(), data.size(), kBase64Variant);
    out.resize(out.size() - 1);
    return out;
}

utils::Result<std::vector<uint8_t>, Base64Error> decode_base64(std::string_view text)
{
    using R = utils::Result<std::vector<uint8_t>, Base64Error>;
    if (text.empty())
    {
        return R::ok({});
    }
    if (!ensure_sodium_init())
    {
        return R::error(Base64Error::NotInitialized);
    }

    std::vector<uint8_t> out(text.size() / 4 * 3 + 3);
    size_t bin_len = 0;
    const char *end = nullptr;
    const int rc = sodium_base642bin(out.data(), out.size(), text.data(), text.size(),
                                     nullptr /* no ignored chars */, &bin_len, &end,
                                     kBase64Variant);
    if (rc != 0 || end != text.data() + text.size())
    {
        const auto stop = end != nullptr ? static_cast<int>(end - text.data()) : 0;
        return R::error(Base64Error::Malformed, stop);
    }
    out.resize(bin_len);
    return R::ok(std::move(out));
}

// ============================================================================
// BLAKE2b Hashing
// ============================================================================

bool compute_blake2b(uint8_t *out, const void *data, size_t len) noexcept
{
    if (!ensure_sodium_init())
    {
        return false;
    }
    if (out == nullptr || (data == nullptr && len != 0))
    {
        LOGGER_ERROR("[CryptoUtils] compute_blake2b: null pointer argument");
        return false;
    }

    const int result = crypto_generichash(out, BLAKE2B_HASH_BYTES,
                                          static_cast<const unsigned char *>(data), len,
                                          nullptr, 0); // unkeyed
    if (result != 0)
    {
        LOGGER_ERROR("[CryptoUtils] crypto_generichash failed");
        return false;
    }
    return true;
}

Blake2bDigest compute_blake2b_array(std::span<const uint8_t> data) noexcept
{
    Blake2bDigest hash{};
    if (!compute_blake2b(hash.data(), data.data(), data.size()))
    {
        hash.fill(0);
    }
    return hash;
}

std::string digest_to_hex(const Blake2bDigest &digest)
{
    // sodium_bin2hex writes 2 chars per byte plus a NUL.
    std::string hex(digest.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
    hex.resize(digest.size() * 2);
    return hex;
}

// ============================================================================
// Comparison
// ============================================================================

bool constant_time_equal(std::span<const uint8_t> a, std::span<const uint8_t> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }
    if (a.empty())
    {
        return true;
    }
    if (!ensure_sodium_init())
    {
        return false;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

// ============================================================================
// Lifecycle Integration
// ============================================================================

namespace
{
void crypto_startup(const char *arg)
{
    (void)arg;
    LOGGER_DEBUG("[CryptoUtils] Module starting up...");
    if (!ensure_sodium_init())
    {
        throw std::runtime_error("CryptoUtils: failed to initialize libsodium");
    }
}

void crypto_shutdown(const char *arg)
{
    (void)arg;
    // libsodium needs no explicit cleanup.
    LOGGER_DEBUG("[CryptoUtils] Module shutdown complete");
}

} // namespace

filebridge::utils::ModuleDef GetLifecycleModule()
{
    filebridge::utils::ModuleDef module("CryptoUtils");
    module.add_dependency("filebridge::utils::Logger");
    module.set_startup(crypto_startup);
    module.set_shutdown(crypto_shutdown, std::chrono::milliseconds(1000));
    return module;
}

} // namespace filebridge::crypto
