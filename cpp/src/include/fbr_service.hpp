#pragma once
/**
 * @file fbr_service.hpp
 * @brief Layer 2: base plus the lifecycle-managed services.
 *
 * Lifecycle manager, asynchronous Logger (LOGGER_* macros), backoff strategies,
 * libsodium-backed crypto helpers and the Result<T, E> type.
 */
#include "fbr_base.hpp"

#include "utils/backoff_strategy.hpp"
#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/crypto_utils.hpp"
#include "utils/result.hpp"
