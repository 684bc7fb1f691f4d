#include "transfer/marshalled_channel.hpp"
#include "transfer/transfer_errors.hpp"
#include "fbr_service.hpp"

#include <algorithm>
#include <cstring>

namespace filebridge::transfer
{

std::string MarshalledChannel::fetch(FileRef file_ref, uint64_t position, uint32_t count)
{
    ReadRequest request{file_ref, position, count, 0};
    std::optional<std::string> payload;
    try
    {
        payload = m_boundary.read_marshalled(request).get();
    }
    catch (const TransferError &)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        throw TransferError(e.what());
    }
    return payload.value_or(std::string{});
}

std::vector<uint8_t> MarshalledChannel::read(FileRef file_ref, uint64_t position, uint32_t count)
{
    const std::string payload = fetch(file_ref, position, count);
    if (payload.empty())
    {
        return {};
    }

    auto decoded = crypto::decode_base64(payload);
    if (decoded.is_error())
    {
        throw TransferError(fmt::format(
            "Producer returned a malformed base64 payload for fileRef {} at position {} "
            "({}, stopped at offset {}).",
            file_ref, position, crypto::to_string(decoded.error()), decoded.error_code()));
    }

    std::vector<uint8_t> bytes = std::move(decoded).content();
    if (bytes.size() > count)
    {
        throw TransferError(fmt::format(
            "Producer returned {} bytes for fileRef {} at position {}, but only {} were requested.",
            bytes.size(), file_ref, position, count));
    }
    LOGGER_TRACE("MarshalledChannel: fileRef {} pos {} count {} -> {} bytes", file_ref, position,
                 count, bytes.size());
    return bytes;
}

uint32_t MarshalledChannel::read_into(FileRef file_ref, uint64_t position, uint32_t count,
                                      std::span<uint8_t> dest, uint64_t buffer_offset)
{
    const std::vector<uint8_t> bytes = read(file_ref, position, count);
    if (!bytes.empty())
    {
        std::memcpy(dest.data() + buffer_offset, bytes.data(), bytes.size());
    }
    return static_cast<uint32_t>(bytes.size());
}

std::string MarshalledChannel::read_base64(FileRef file_ref, uint64_t position, uint32_t count)
{
    return fetch(file_ref, position, count);
}

} // namespace filebridge::transfer
