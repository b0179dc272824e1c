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

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace couchrest
{
enum class view_sort_order {
  ascending,
  descending,
};

/**
 * Parameters of the view query. Keys are JSON-encoded values, e.g. `"\"apple\""` or `[1,2]`.
 *
 * @since 1.0.0
 * @committed
 */
struct view_query_options {
  std::optional<std::string> key{};
  std::optional<std::string> start_key{};
  std::optional<std::string> end_key{};
  std::optional<std::string> start_key_doc_id{};
  std::optional<std::string> end_key_doc_id{};
  std::optional<bool> inclusive_end{};
  std::optional<bool> reduce{};
  std::optional<bool> group{};
  std::optional<std::uint32_t> group_level{};
  std::optional<bool> include_docs{};
  std::optional<std::uint64_t> limit{};
  std::optional<std::uint64_t> skip{};
  std::optional<view_sort_order> order{};

  /**
   * When not empty, the query is sent as POST with `{"keys": [...]}` body
   */
  std::vector<std::string> keys{};

  /**
   * Extra parameters, passed as is (the values must be already encoded)
   */
  std::map<std::string, std::string> raw{};
};
} // namespace couchrest
