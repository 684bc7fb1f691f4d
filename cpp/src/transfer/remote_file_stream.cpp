#include "transfer/remote_file_stream.hpp"
#include "transfer/transfer_errors.hpp"
#include "fbr_service.hpp"

#include <algorithm>
#include <limits>

namespace filebridge::transfer
{

namespace
{
// Decoded length of padded base64 text.
uint64_t decoded_length(const std::string &text) noexcept
{
    if (text.empty())
    {
        return 0;
    }
    uint64_t padding = 0;
    if (text.back() == '=')
    {
        ++padding;
        if (text.size() >= 2 && text[text.size() - 2] == '=')
        {
            ++padding;
        }
    }
    return text.size() / 4 * 3 - padding;
}
} // namespace

RemoteFileStream::RemoteFileStream(TransferCoordinator &coordinator, FileRef file_ref,
                                   uint64_t length) noexcept
    : m_coordinator(&coordinator), m_file_ref(file_ref), m_length(length)
{
}

RemoteFileStream RemoteFileStream::open(TransferCoordinator &coordinator,
                                        const std::string &element, int index)
{
    const FileInfo info = coordinator.file_info(element, index);
    const FileRef ref = coordinator.open_read(element, index);
    return RemoteFileStream(coordinator, ref, info.size);
}

RemoteFileStream::RemoteFileStream(RemoteFileStream &&other) noexcept
    : m_coordinator(other.m_coordinator), m_file_ref(other.m_file_ref),
      m_length(other.m_length), m_position(other.m_position)
{
    other.m_coordinator = nullptr;
}

RemoteFileStream::~RemoteFileStream()
{
    if (m_coordinator == nullptr)
    {
        return;
    }
    try
    {
        if (!m_coordinator->dispose(m_file_ref))
        {
            LOGGER_DEBUG("RemoteFileStream: fileRef {} was already disposed.", m_file_ref);
        }
    }
    catch (const std::exception &e)
    {
        LOGGER_WARN("RemoteFileStream: disposing fileRef {} failed: {}", m_file_ref, e.what());
    }
}

uint64_t RemoteFileStream::seek(int64_t offset, SeekOrigin origin)
{
    int64_t base = 0;
    switch (origin)
    {
    case SeekOrigin::Begin:
        base = 0;
        break;
    case SeekOrigin::Current:
        base = static_cast<int64_t>(m_position);
        break;
    case SeekOrigin::End:
        base = static_cast<int64_t>(m_length);
        break;
    }
    if ((offset < 0 && base < -offset) ||
        (offset > 0 && base > std::numeric_limits<int64_t>::max() - offset))
    {
        throw InvalidReadRequest(
            fmt::format("Seek to {} {:+} is out of range.", base, offset));
    }
    m_position = static_cast<uint64_t>(base + offset);
    return m_position;
}

uint32_t RemoteFileStream::read(std::span<uint8_t> dest, std::stop_token stop)
{
    if (m_position >= m_length || dest.empty())
    {
        return 0;
    }
    const auto count = static_cast<uint32_t>(
        std::min<uint64_t>(dest.size(), std::numeric_limits<uint32_t>::max()));
    const uint32_t n =
        m_coordinator->read_range(m_file_ref, m_position, count, dest, 0, std::move(stop));
    m_position += n;
    return n;
}

std::string RemoteFileStream::read_base64(uint32_t count, std::stop_token stop)
{
    if (m_position >= m_length || count == 0)
    {
        return {};
    }
    std::string text =
        m_coordinator->read_range_base64(m_file_ref, m_position, count, std::move(stop));
    m_position += decoded_length(text);
    return text;
}

} // namespace filebridge::transfer
