#pragma once
/**
 * @file remote_file_stream.hpp
 * @brief RemoteFileStream: a seekable, read-only cursor over one open producer file.
 *
 * The stream owns its FileRef and disposes it through the coordinator on destruction.
 */
#include "filebridge_utils_export.h"
#include "transfer/transfer_coordinator.hpp"

#include <cstdint>
#include <span>
#include <stop_token>
#include <string>

namespace filebridge::transfer
{

enum class SeekOrigin
{
    Begin,
    Current,
    End,
};

class FILEBRIDGE_UTILS_EXPORT RemoteFileStream
{
  public:
    /**
     * @param coordinator Must outlive the stream.
     * @param file_ref    Open ref; the stream takes ownership.
     * @param length      File size as reported by FileInfo.
     */
    RemoteFileStream(TransferCoordinator &coordinator, FileRef file_ref, uint64_t length) noexcept;

    /// @brief Opens file `index` of `element` and sizes the stream from its FileInfo.
    static RemoteFileStream open(TransferCoordinator &coordinator, const std::string &element,
                                 int index);

    ~RemoteFileStream();

    RemoteFileStream(RemoteFileStream &&other) noexcept;
    RemoteFileStream &operator=(RemoteFileStream &&) = delete;
    RemoteFileStream(const RemoteFileStream &) = delete;
    RemoteFileStream &operator=(const RemoteFileStream &) = delete;

    [[nodiscard]] uint64_t length() const noexcept { return m_length; }
    [[nodiscard]] uint64_t position() const noexcept { return m_position; }
    [[nodiscard]] FileRef file_ref() const noexcept { return m_file_ref; }

    /**
     * @brief Moves the cursor. Positions past the end are allowed and read zero bytes.
     * @return The new position.
     * @throws InvalidReadRequest if the result would be negative.
     */
    uint64_t seek(int64_t offset, SeekOrigin origin = SeekOrigin::Begin);

    /**
     * @brief Reads up to `dest.size()` bytes at the cursor and advances it.
     * @return Bytes read; 0 at end of file.
     */
    uint32_t read(std::span<uint8_t> dest, std::stop_token stop = {});

    /**
     * @brief Base64 of up to `count` bytes at the cursor; advances by the decoded length.
     */
    std::string read_base64(uint32_t count, std::stop_token stop = {});

  private:
    TransferCoordinator *m_coordinator;
    FileRef m_file_ref;
    uint64_t m_length;
    uint64_t m_position{0};
};

} // namespace filebridge::transfer
