#pragma once
/**
 * @file transfer_types.hpp
 * @brief Value types shared by the host side and the producer boundary.
 */
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>

#include <nlohmann/json.hpp>

namespace filebridge::transfer
{

/// Opaque producer-side resource handle. Negative values are never valid.
using FileRef = int32_t;

/// Pairs a dispatched shared-buffer read with its completion. Never reused in a process.
using CorrelationId = uint64_t;

/// Largest count one read may request; the parameter block carries it as a signed 32-bit value.
inline constexpr uint32_t kMaxReadCount = static_cast<uint32_t>(INT32_MAX);

/**
 * @brief One range read against a producer resource.
 *
 * `count` is clamped by the caller to the destination capacity and to kMaxReadCount. A `position` at or past the
 * end of the resource reads zero bytes.
 */
struct ReadRequest
{
    FileRef file_ref{-1};
    uint64_t position{0};
    uint32_t count{0};
    uint64_t buffer_offset{0};
};

/**
 * @brief Fixed binary parameter block handed across the boundary with a shared buffer.
 *
 * Standard layout, host byte order (little-endian on every supported platform).
 */
struct UnmarshalledReadParams
{
    uint64_t task_id;
    uint64_t buffer_offset;
    int32_t count;
    int32_t file_ref;
    uint64_t position;
};

static_assert(std::is_standard_layout_v<UnmarshalledReadParams>);
static_assert(offsetof(UnmarshalledReadParams, task_id) == 0);
static_assert(offsetof(UnmarshalledReadParams, buffer_offset) == 8);
static_assert(offsetof(UnmarshalledReadParams, count) == 16);
static_assert(offsetof(UnmarshalledReadParams, file_ref) == 20);
static_assert(offsetof(UnmarshalledReadParams, position) == 24);
static_assert(sizeof(UnmarshalledReadParams) == 32);

/**
 * @brief Metadata of one producer-side file.
 */
struct FileInfo
{
    std::string name;
    uint64_t size{0};
    std::string type; ///< MIME type, empty if unknown
    int64_t last_modified_ms{0}; ///< milliseconds since the Unix epoch
    nlohmann::json non_standard_properties = nlohmann::json::object();
};

// ============================================================================
// Completion outcome
// ============================================================================

struct CompletionSuccess
{
    uint32_t bytes_read;
};

struct CompletionFailure
{
    std::string message;
};

struct CompletionCanceled
{
    std::string reason;
};

/**
 * @brief Result of one shared-buffer dispatch as delivered by the producer (or by a local
 *        cancellation).
 */
using CompletionOutcome = std::variant<CompletionSuccess, CompletionFailure, CompletionCanceled>;

} // namespace filebridge::transfer
