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

#include "version.hxx"

#include <fmt/core.h>

#ifndef COUCHREST_VERSION_MAJOR
#define COUCHREST_VERSION_MAJOR 0
#endif
#ifndef COUCHREST_VERSION_MINOR
#define COUCHREST_VERSION_MINOR 0
#endif
#ifndef COUCHREST_VERSION_PATCH
#define COUCHREST_VERSION_PATCH 0
#endif
#ifndef COUCHREST_SYSTEM_NAME
#define COUCHREST_SYSTEM_NAME "unknown"
#endif
#ifndef COUCHREST_SYSTEM_PROCESSOR
#define COUCHREST_SYSTEM_PROCESSOR "unknown"
#endif

namespace couchrest::core::meta
{
auto
sdk_version() -> const std::string&
{
  static const std::string version{ fmt::format(
    "{}.{}.{}", COUCHREST_VERSION_MAJOR, COUCHREST_VERSION_MINOR, COUCHREST_VERSION_PATCH) };
  return version;
}

auto
sdk_id() -> const std::string&
{
  static const std::string identifier{ fmt::format(
    "couchrest/{};{}/{}", sdk_version(), COUCHREST_SYSTEM_NAME, COUCHREST_SYSTEM_PROCESSOR) };
  return identifier;
}

auto
user_agent_for_http(const std::string& extra) -> std::string
{
  auto user_agent = sdk_id();
  if (!extra.empty()) {
    user_agent.append("; ").append(extra);
  }
  for (auto& ch : user_agent) {
    if (ch == '\n' || ch == '\r') {
      ch = ' ';
    }
  }
  return user_agent;
}
} // namespace couchrest::core::meta
