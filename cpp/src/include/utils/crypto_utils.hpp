#pragma once
/**
 * @file crypto_utils.hpp
 * @brief libsodium-backed helpers used by the transfer layer.
 *
 * - Base64 encode/decode for the encoded (marshalled) wire payload.
 * - BLAKE2b digests for integrity reports.
 * - Constant-time buffer comparison for shared-buffer verification.
 *
 * libsodium is initialized once by the "CryptoUtils" lifecycle module. The public API
 * exposes no libsodium types.
 *
 * @see https://libsodium.gitbook.io/doc/
 */
#include "filebridge_utils_export.h"
#include "module_def.hpp"
#include "result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace filebridge::crypto
{

/** BLAKE2b hash output size in bytes (256-bit = 32 bytes). */
static constexpr size_t BLAKE2B_HASH_BYTES = 32;

using Blake2bDigest = std::array<uint8_t, BLAKE2B_HASH_BYTES>;

// ============================================================================
// Base64
// ============================================================================

/**
 * @brief Failure modes of decode_base64.
 */
enum class Base64Error
{
    Malformed,      ///< characters outside the alphabet, bad padding or truncated input
    NotInitialized, ///< libsodium could not be initialized
};

inline const char *to_string(Base64Error err) noexcept
{
    switch (err)
    {
    case Base64Error::Malformed:
        return "Malformed";
    case Base64Error::NotInitialized:
        return "NotInitialized";
    default:
        return "Unknown";
    }
}

/**
 * @brief Encodes bytes as standard, padded base64 (RFC 4648 alphabet).
 *
 * An empty input yields an empty string.
 */
FILEBRIDGE_UTILS_EXPORT std::string encode_base64(std::span<const uint8_t> data);

/**
 * @brief Decodes standard, padded base64.
 *
 * An empty input decodes to an empty vector. Trailing characters after the padding are
 * rejected. On `Malformed`, `error_code()` holds the offset where parsing stopped.
 */
FILEBRIDGE_UTILS_EXPORT utils::Result<std::vector<uint8_t>, Base64Error>
decode_base64(std::string_view text);

// ============================================================================
// BLAKE2b Hashing
// ============================================================================

/**
 * @brief Computes an unkeyed BLAKE2b-256 hash of `len` bytes at `data`.
 *
 * @param out Output buffer of at least BLAKE2B_HASH_BYTES.
 * @return false if libsodium is unavailable or a pointer is null (`data` may be null
 *         only when `len` is 0).
 */
FILEBRIDGE_UTILS_EXPORT bool compute_blake2b(uint8_t *out, const void *data, size_t len) noexcept;

/**
 * @brief BLAKE2b-256 digest returned by value. All zeros on failure.
 */
FILEBRIDGE_UTILS_EXPORT Blake2bDigest compute_blake2b_array(std::span<const uint8_t> data) noexcept;

/**
 * @brief Lowercase hex string of a digest, for log lines.
 */
FILEBRIDGE_UTILS_EXPORT std::string digest_to_hex(const Blake2bDigest &digest);

// ============================================================================
// Comparison
// ============================================================================

/**
 * @brief Compares two buffers in constant time for their common length (`sodium_memcmp`).
 * @return false if the sizes differ or any byte differs.
 */
FILEBRIDGE_UTILS_EXPORT bool constant_time_equal(std::span<const uint8_t> a,
                                                 std::span<const uint8_t> b) noexcept;

// ============================================================================
// Lifecycle Integration
// ============================================================================

/**
 * @brief Module definition "CryptoUtils" (depends on the Logger). Its startup calls
 *        sodium_init() and throws if libsodium cannot be initialized.
 *
 * @example
 * filebridge::utils::LifecycleGuard lifecycle(filebridge::utils::MakeModDefList(
 *     filebridge::utils::Logger::GetLifecycleModule(),
 *     filebridge::crypto::GetLifecycleModule()));
 */
FILEBRIDGE_UTILS_EXPORT filebridge::utils::ModuleDef GetLifecycleModule();

} // namespace filebridge::crypto
