#pragma once
/**
 * @file marshalled_channel.hpp
 * @brief MarshalledChannel: range reads that come back as base64 text in one round trip.
 *
 * This path is slower than the shared-buffer path but needs no cross-thread completion and
 * no buffer shared with the producer, so it doubles as the reference read that the
 * shared-buffer path is verified against.
 */
#include "filebridge_utils_export.h"
#include "transfer/producer_boundary.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace filebridge::transfer
{

class FILEBRIDGE_UTILS_EXPORT MarshalledChannel
{
  public:
    explicit MarshalledChannel(ProducerBoundary &boundary) noexcept : m_boundary(boundary) {}

    /**
     * @brief Reads up to `count` bytes at `position`.
     * @return The decoded bytes; fewer than `count` at the end of the resource, empty past it.
     * @throws TransferError if the producer fails, the payload is not valid base64, or the
     *         producer returned more than `count` bytes.
     */
    [[nodiscard]] std::vector<uint8_t> read(FileRef file_ref, uint64_t position, uint32_t count);

    /**
     * @brief read() into `dest` at `buffer_offset`.
     *
     * The caller guarantees `buffer_offset + count <= dest.size()`.
     * @return Bytes copied.
     */
    uint32_t read_into(FileRef file_ref, uint64_t position, uint32_t count,
                       std::span<uint8_t> dest, uint64_t buffer_offset);

    /**
     * @brief The producer's payload as-is, without decoding. Empty for zero bytes.
     * @throws TransferError if the producer fails.
     */
    [[nodiscard]] std::string read_base64(FileRef file_ref, uint64_t position, uint32_t count);

  private:
    std::string fetch(FileRef file_ref, uint64_t position, uint32_t count);

    ProducerBoundary &m_boundary;
};

} // namespace filebridge::transfer
