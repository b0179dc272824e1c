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

#include <chrono>
#include <cstddef>
#include <string>

namespace couchrest
{
namespace timeout_defaults
{
constexpr std::chrono::milliseconds request_timeout{ 75'000 };
} // namespace timeout_defaults

/**
 * Options that apply to every request sent by the @ref client.
 *
 * @since 1.0.0
 * @committed
 */
struct client_options {
  /**
   * Time limit for a single request, the transport is expected to enforce it.
   */
  std::chrono::milliseconds timeout{ timeout_defaults::request_timeout };

  /**
   * Appended to the "User-Agent" header of every request.
   */
  std::string user_agent_extra{};

  /**
   * Largest response body (in bytes) the transport should accept. Zero means no limit.
   */
  std::size_t max_body_size{ 0 };
};
} // namespace couchrest
