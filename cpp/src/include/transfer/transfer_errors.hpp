#pragma once
/**
 * @file transfer_errors.hpp
 * @brief Exception hierarchy of the transfer layer.
 *
 * Every error a read can end with derives from TransferError, so a caller that only cares
 * about success can catch one type. An unknown correlation id is not an error; it is logged
 * and counted by the registry.
 */
#include "filebridge_utils_export.h"
#include "transfer/transfer_types.hpp"

#include <stdexcept>
#include <string>

namespace filebridge::transfer
{

/**
 * @brief The producer reported a failure, or the read could not complete. The producer's
 *        message is preserved in `what()`.
 */
class FILEBRIDGE_UTILS_EXPORT TransferError : public std::runtime_error
{
  public:
    explicit TransferError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Shared-buffer verification failed.
 *
 * Thrown when both attempts mismatch, and also when the retry matched
 * (`recovered_on_retry() == true`) while the retry policy reports recovered calls as
 * failures. Bytes already copied into the destination must not be trusted.
 */
class FILEBRIDGE_UTILS_EXPORT TransferIntegrityError : public TransferError
{
  public:
    TransferIntegrityError(const std::string &message, const ReadRequest &request,
                           bool recovered_on_retry)
        : TransferError(message), m_request(request), m_recovered_on_retry(recovered_on_retry)
    {
    }

    [[nodiscard]] const ReadRequest &request() const noexcept { return m_request; }
    [[nodiscard]] bool recovered_on_retry() const noexcept { return m_recovered_on_retry; }

  private:
    ReadRequest m_request;
    bool m_recovered_on_retry;
};

/**
 * @brief The producer never reported ready after the configured number of polls.
 */
class FILEBRIDGE_UTILS_EXPORT InitializationTimeoutError : public TransferError
{
  public:
    InitializationTimeoutError(const std::string &message, int polls)
        : TransferError(message), m_polls(polls)
    {
    }

    [[nodiscard]] int polls() const noexcept { return m_polls; }

  private:
    int m_polls;
};

/**
 * @brief The caller's stop token fired, or the coordinator shut down, while waiting.
 */
class FILEBRIDGE_UTILS_EXPORT TransferCanceled : public TransferError
{
  public:
    explicit TransferCanceled(const std::string &message) : TransferError(message) {}
};

/**
 * @brief Local parameter validation failed. Nothing was dispatched.
 */
class FILEBRIDGE_UTILS_EXPORT InvalidReadRequest : public TransferError
{
  public:
    explicit InvalidReadRequest(const std::string &message) : TransferError(message) {}
};

/**
 * @brief The buffer pool's outstanding limit was reached. Nothing was dispatched.
 */
class FILEBRIDGE_UTILS_EXPORT BufferPoolExhausted : public TransferError
{
  public:
    explicit BufferPoolExhausted(const std::string &message) : TransferError(message) {}
};

} // namespace filebridge::transfer
