/**
 * @file logger.cpp
 * @brief Logger helpers that live outside the header.
 *
 * @copyright Copyright (c) 2024 LightScout Contributors
 * @license MIT License
 */

#include "lightscout/utils/logger.hpp"

namespace lightscout {
namespace utils {

LogLevel logLevelFromString(const std::string& name) {
    if (name == "TRACE") return LogLevel::TRACE;
    if (name == "DEBUG") return LogLevel::DEBUG;
    if (name == "INFO")  return LogLevel::INFO;
    if (name == "WARN")  return LogLevel::WARN;
    if (name == "ERROR") return LogLevel::ERROR;
    if (name == "FATAL") return LogLevel::FATAL;
    if (name == "OFF")   return LogLevel::OFF;
    return LogLevel::INFO;
}

}  // namespace utils
}  // namespace lightscout
