#include "transfer/integrity_verifier.hpp"
#include "fbr_service.hpp"

#include <algorithm>

namespace filebridge::transfer
{

namespace
{
// Dumps start on a 16-byte line boundary up to one line before the first mismatch.
constexpr size_t kDumpLeadBytes = 16;
} // namespace

std::string VerificationReport::summary() const
{
    if (match)
    {
        return fmt::format("match over {} bytes (blake2b {})", compared_bytes,
                           crypto::digest_to_hex(digest_shared));
    }
    return fmt::format("MISMATCH over {} bytes: first at offset {}, {} byte(s) differ, "
                       "blake2b shared={} reference={}",
                       compared_bytes, first_mismatch_offset, mismatch_count,
                       crypto::digest_to_hex(digest_shared),
                       crypto::digest_to_hex(digest_reference));
}

VerificationReport IntegrityVerifier::verify(std::span<const uint8_t> shared,
                                             std::span<const uint8_t> reference) const
{
    VerificationReport report;
    report.compared_bytes = std::max(shared.size(), reference.size());
    report.match = crypto::constant_time_equal(shared, reference);
    if (report.match)
    {
        report.digest_shared = crypto::compute_blake2b_array(shared);
        report.digest_reference = report.digest_shared;
        return report;
    }

    const size_t common = std::min(shared.size(), reference.size());
    bool found = false;
    for (size_t i = 0; i < common; ++i)
    {
        if (shared[i] != reference[i])
        {
            if (!found)
            {
                report.first_mismatch_offset = i;
                found = true;
            }
            ++report.mismatch_count;
        }
    }
    // Bytes past the shorter buffer count as differing.
    const size_t tail = report.compared_bytes - common;
    if (!found && tail > 0)
    {
        report.first_mismatch_offset = common;
    }
    report.mismatch_count += tail;

    report.digest_shared = crypto::compute_blake2b_array(shared);
    report.digest_reference = crypto::compute_blake2b_array(reference);
    return report;
}

std::string IntegrityVerifier::describe_mismatch(const VerificationReport &report,
                                                 std::span<const uint8_t> shared,
                                                 std::span<const uint8_t> reference) const
{
    if (report.match)
    {
        return {};
    }
    size_t start = report.first_mismatch_offset - (report.first_mismatch_offset % 16);
    start = start >= kDumpLeadBytes ? start - kDumpLeadBytes : 0;

    return fmt::format("shared buffer:\n{}reference buffer:\n{}",
                       format_tools::hex_dump(shared, start, m_dump_bytes),
                       format_tools::hex_dump(reference, start, m_dump_bytes));
}

} // namespace filebridge::transfer
