/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2026-Present Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

/*
 * The API is thread safe unless the underlying logger object is changed while other threads are
 * logging. Create the logger before issuing requests and reset it after the last one completes.
 */

#pragma once

#include "level.hxx"

#include <fmt/core.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace couchrest::core::logger
{
struct configuration;

/**
 * @return level for the name ("trace", "debug", "info", "warning", "error", "critical", "off"),
 * or level::trace if the name is not recognized
 */
auto
level_from_str(const std::string& str) -> level;

/**
 * Initialize the logger with file and/or console sinks.
 *
 * @return optional error message if something goes wrong
 */
auto
create_file_logger(const configuration& logger_settings) -> std::optional<std::string>;

/**
 * Initialize the logger which writes to stderr
 */
void
create_console_logger();

/**
 * Drop the underlying logger object. Logging is silent until the next create_*_logger() call.
 */
void
reset();

/**
 * Set the log level of all registered spdlog loggers
 */
void
set_log_levels(level lvl);

/**
 * @return true if the message with given severity will be written
 */
auto
should_log(level lvl) -> bool;

namespace detail
{
void
log(const char* file, int line, const char* function, level lvl, std::string_view msg);
} // namespace detail

template<typename String, typename... Args>
inline void
log(const char* file, int line, const char* function, level lvl, const String& msg, Args&&... args)
{
  detail::log(file, line, function, lvl, fmt::format(msg, std::forward<Args>(args)...));
}

void
flush();

auto
is_initialized() -> bool;
} // namespace couchrest::core::logger

#if defined(__GNUC__) || defined(__clang__)
#define COUCHREST_LOGGER_FUNCTION __PRETTY_FUNCTION__
#else
#define COUCHREST_LOGGER_FUNCTION __FUNCTION__
#endif

/**
 * The arguments are not evaluated when the severity is filtered out.
 */
#define COUCHREST_LOG(file, line, function, severity, ...)                                         \
  do {                                                                                             \
    if (couchrest::core::logger::should_log(severity)) {                                           \
      couchrest::core::logger::log(file, line, function, severity, __VA_ARGS__);                   \
    }                                                                                              \
  } while (false)

#define CR_LOG_TRACE(...)                                                                          \
  COUCHREST_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                COUCHREST_LOGGER_FUNCTION,                                                         \
                couchrest::core::logger::level::trace,                                             \
                __VA_ARGS__)
#define CR_LOG_DEBUG(...)                                                                          \
  COUCHREST_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                COUCHREST_LOGGER_FUNCTION,                                                         \
                couchrest::core::logger::level::debug,                                             \
                __VA_ARGS__)
#define CR_LOG_INFO(...)                                                                           \
  COUCHREST_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                COUCHREST_LOGGER_FUNCTION,                                                         \
                couchrest::core::logger::level::info,                                              \
                __VA_ARGS__)
#define CR_LOG_WARNING(...)                                                                        \
  COUCHREST_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                COUCHREST_LOGGER_FUNCTION,                                                         \
                couchrest::core::logger::level::warn,                                              \
                __VA_ARGS__)
#define CR_LOG_ERROR(...)                                                                          \
  COUCHREST_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                COUCHREST_LOGGER_FUNCTION,                                                         \
                couchrest::core::logger::level::err,                                               \
                __VA_ARGS__)
#define CR_LOG_CRITICAL(...)                                                                       \
  COUCHREST_LOG(__FILE__,                                                                          \
                __LINE__,                                                                          \
                COUCHREST_LOGGER_FUNCTION,                                                         \
                couchrest::core::logger::level::critical,                                          \
                __VA_ARGS__)
