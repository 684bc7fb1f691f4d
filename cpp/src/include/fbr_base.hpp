#pragma once
/**
 * @file fbr_base.hpp
 * @brief Layer 1: platform plus the header-mostly base utilities.
 *
 * Pulls in fbr_platform.hpp, the standard headers the base utilities rely on, fmt,
 * format_tools, debug_info (FBR_PANIC / FBR_DEBUG), ScopeGuard and ModuleDef.
 * Nothing here needs a lifecycle module to be started.
 */
#include "fbr_platform.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/scope_guard.hpp"
#include "utils/module_def.hpp"
