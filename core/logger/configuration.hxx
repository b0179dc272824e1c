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

#pragma once

#include "level.hxx"

#include <spdlog/fwd.h>

#include <cstddef>
#include <memory>
#include <string>

namespace couchrest::core::logger
{
struct configuration {
  /**
   * Path of the log file. Rotated files get ".1", ".2", etc. appended before the extension. Empty
   * name disables the file sink.
   */
  std::string filename{};

  /**
   * Number of items in the queue of the asynchronous logger
   */
  std::size_t buffer_size{ 8192 };

  /**
   * 100 MB per cycled file
   */
  std::size_t cycle_size{ 100LLU * 1024 * 1024 };

  std::size_t max_files{ 5 };

  /**
   * Synchronous logger, so that the messages are visible as soon as the call returns
   */
  bool unit_test{ false };

  /**
   * Should messages be passed on to the console via stderr
   */
  bool console{ true };

  level log_level{ level::info };

  level console_sink_log_level{ level::warn };

  /**
   * Custom sink to use, if desired
   */
  std::shared_ptr<spdlog::sinks::sink> sink{ nullptr };
};
} // namespace couchrest::core::logger
