/**
 * @file completion_policy.cpp
 * @brief Completion policy implementation.
 *
 * @copyright Copyright (c) 2024 LightScout Contributors
 * @license MIT License
 */

#include "lightscout/core/completion_policy.hpp"

namespace lightscout {
namespace core {

Completion evaluateCompletion(size_t deviceCount,
                              size_t replyLimit,
                              std::chrono::milliseconds elapsed,
                              std::chrono::milliseconds timeout) {
    if (deviceCount >= replyLimit) {
        return Completion::LIMIT_REACHED;
    }
    if (timeout.count() > 0 && elapsed >= timeout) {
        return Completion::TIMED_OUT;
    }
    return Completion::CONTINUE;
}

}  // namespace core
}  // namespace lightscout
