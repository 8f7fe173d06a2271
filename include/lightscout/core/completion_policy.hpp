/**
 * @file completion_policy.hpp
 * @brief Per-tick decision on whether a discovery run is finished.
 *
 * @copyright Copyright (c) 2024 LightScout Contributors
 * @license MIT License
 */

#pragma once

#include "lightscout/core/export.hpp"

#include <chrono>
#include <cstddef>

namespace lightscout {
namespace core {

enum class Completion {
    CONTINUE,       ///< Keep polling
    LIMIT_REACHED,  ///< Enough distinct devices replied
    TIMED_OUT       ///< Timeout elapsed; outcome depends on the device count
};

/**
 * @brief Evaluate the completion policy for one tick.
 *
 * The reply limit is checked before the timeout, so a run that reaches
 * its limit on the same tick its timeout expires completes as
 * LIMIT_REACHED. A timeout of zero never expires.
 *
 * @param deviceCount Distinct devices currently registered.
 * @param replyLimit Target device count (>= 1).
 * @param elapsed Time since the probe was sent.
 * @param timeout Run timeout, 0 = unbounded.
 */
LIGHTSCOUT_CORE_API Completion evaluateCompletion(size_t deviceCount,
                                                  size_t replyLimit,
                                                  std::chrono::milliseconds elapsed,
                                                  std::chrono::milliseconds timeout);

}  // namespace core
}  // namespace lightscout
