#pragma once
/**
 * @file fbr_transfer.hpp
 * @brief Layer 3: the chunk-transfer layer.
 *
 * Include this from applications that read producer-side resources. It brings in the
 * service layer, the transfer configuration and every public transfer component.
 */
#include "fbr_service.hpp"

#include "utils/transfer_config.hpp"

#include "transfer/transfer_errors.hpp"
#include "transfer/transfer_types.hpp"
#include "transfer/buffer_pool.hpp"
#include "transfer/correlation_registry.hpp"
#include "transfer/producer_boundary.hpp"
#include "transfer/marshalled_channel.hpp"
#include "transfer/integrity_verifier.hpp"
#include "transfer/unmarshalled_channel.hpp"
#include "transfer/transfer_coordinator.hpp"
#include "transfer/remote_file_stream.hpp"
#include "transfer/local_producer.hpp"
