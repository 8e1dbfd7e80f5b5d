#pragma once

/**
 * @file handoff.hpp
 * @brief Main header for handoff - bounded worker pool with synchronous handoff
 *
 * Include this single header to access the full handoff API.
 */

#include "handoff/core/status.hpp"
#include "handoff/core/task.hpp"
#include "handoff/core/channel.hpp"
#include "handoff/core/metrics.hpp"
#include "handoff/core/worker_pool.hpp"

namespace handoff {

/**
 * @brief Library version information
 */
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace handoff
