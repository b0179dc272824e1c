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

#include <couchrest/revision.hxx>

#include <fmt/core.h>

#include <algorithm>
#include <charconv>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace couchrest
{
namespace
{
auto
is_hex_digit(char c) -> bool
{
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

auto
validate_digest(std::string_view digest) -> std::optional<errors::revision_parse>
{
  if (!std::all_of(digest.begin(), digest.end(), is_hex_digit)) {
    return errors::revision_parse{ errc::revision_parse::digest_not_all_hex };
  }
  if (digest.empty()) {
    return errors::revision_parse{ errc::revision_parse::digest_parse,
                                   std::make_error_code(std::errc::invalid_argument) };
  }
  return {};
}

auto
parse_sequence(std::string_view text) -> tl::expected<std::uint64_t, errors::revision_parse>
{
  std::uint64_t sequence{};
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, sequence, 10);
  if (ec != std::errc{}) {
    return tl::unexpected(
      errors::revision_parse{ errc::revision_parse::number_parse, std::make_error_code(ec) });
  }
  if (ptr != last) {
    // trailing garbage, e.g. "1x-abc"
    return tl::unexpected(errors::revision_parse{
      errc::revision_parse::number_parse, std::make_error_code(std::errc::invalid_argument) });
  }
  if (sequence == 0) {
    return tl::unexpected(errors::revision_parse{ errc::revision_parse::zero_sequence_number });
  }
  return sequence;
}
} // namespace

revision::revision(std::uint64_t sequence, std::string digest)
  : sequence_{ sequence }
  , digest_{ std::move(digest) }
{
}

auto
revision::parse(std::string_view text) -> tl::expected<revision, errors::revision_parse>
{
  auto separator = text.find('-');
  if (separator == std::string_view::npos) {
    return tl::unexpected(errors::revision_parse{ errc::revision_parse::too_few_parts });
  }

  auto sequence = parse_sequence(text.substr(0, separator));
  if (!sequence) {
    return tl::unexpected(sequence.error());
  }

  auto digest = text.substr(separator + 1);
  if (auto failure = validate_digest(digest); failure) {
    return tl::unexpected(failure.value());
  }
  return revision{ sequence.value(), std::string{ digest } };
}

auto
revision::make(std::uint64_t sequence, std::string digest)
  -> tl::expected<revision, errors::revision_parse>
{
  if (sequence == 0) {
    return tl::unexpected(errors::revision_parse{ errc::revision_parse::zero_sequence_number });
  }
  if (auto failure = validate_digest(digest); failure) {
    return tl::unexpected(failure.value());
  }
  return revision{ sequence, std::move(digest) };
}

auto
revision::to_string() const -> std::string
{
  return fmt::format("{}-{}", sequence_, digest_);
}

auto
revision::operator==(const revision& other) const -> bool
{
  return sequence_ == other.sequence_ && digest_ == other.digest_;
}

auto
revision::operator!=(const revision& other) const -> bool
{
  return !(*this == other);
}

auto
revision::operator<(const revision& other) const -> bool
{
  if (sequence_ == other.sequence_) {
    return digest_ < other.digest_;
  }
  return sequence_ < other.sequence_;
}

auto
revision::operator<=(const revision& other) const -> bool
{
  return !(other < *this);
}

auto
revision::operator>(const revision& other) const -> bool
{
  return other < *this;
}

auto
revision::operator>=(const revision& other) const -> bool
{
  return !(*this < other);
}
} // namespace couchrest
