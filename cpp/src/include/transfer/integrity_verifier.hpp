#pragma once
/**
 * @file integrity_verifier.hpp
 * @brief IntegrityVerifier: compares a shared-buffer read against its reference read.
 *
 * The equality decision is a constant-time `sodium_memcmp` over the full buffers. When it
 * fails, `verify` also fills in where and how much the buffers differ and a BLAKE2b digest of
 * each side, so that one log line identifies the corruption. `describe_mismatch` renders the
 * bounded hex dumps around the first differing byte.
 */
#include "filebridge_utils_export.h"
#include "utils/crypto_utils.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace filebridge::transfer
{

struct VerificationReport
{
    bool match{false};
    size_t compared_bytes{0};
    size_t first_mismatch_offset{0}; ///< valid only when !match
    size_t mismatch_count{0};
    crypto::Blake2bDigest digest_shared{};
    crypto::Blake2bDigest digest_reference{};

    /// @brief One-line summary for logs.
    [[nodiscard]] std::string summary() const;
};

class FILEBRIDGE_UTILS_EXPORT IntegrityVerifier
{
  public:
    /**
     * @param dump_bytes Upper bound of bytes rendered per buffer by describe_mismatch().
     */
    explicit IntegrityVerifier(size_t dump_bytes = 64) noexcept : m_dump_bytes(dump_bytes) {}

    /**
     * @brief Compares `shared` and `reference` over their full length.
     *
     * Buffers of different sizes never match; their common prefix is scanned for the report.
     */
    [[nodiscard]] VerificationReport verify(std::span<const uint8_t> shared,
                                            std::span<const uint8_t> reference) const;

    /**
     * @brief Hex dumps of both buffers starting a little before the first mismatch.
     * @return Empty string when the report is a match.
     */
    [[nodiscard]] std::string describe_mismatch(const VerificationReport &report,
                                                std::span<const uint8_t> shared,
                                                std::span<const uint8_t> reference) const;

    [[nodiscard]] size_t dump_bytes() const noexcept { return m_dump_bytes; }

  private:
    size_t m_dump_bytes;
};

} // namespace filebridge::transfer
