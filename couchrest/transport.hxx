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

#include <couchrest/error.hxx>
#include <couchrest/http_exchange.hxx>

#include <tl/expected.hpp>

namespace couchrest
{
/**
 * Synchronous HTTP transport used by the @ref client.
 *
 * Implementations own connection handling (sockets, TLS, keep-alive) and must enforce
 * http_request::timeout and http_request::max_body_size. A response with any status code is a
 * successful exchange; only failures to obtain a complete response are reported as errors, as
 * @ref errors::transport for network failures or @ref errors::io for local ones.
 *
 * @since 1.0.0
 * @volatile
 */
class transport
{
public:
  virtual ~transport() = default;

  virtual auto send(const http_request& request) -> tl::expected<http_exchange, error> = 0;
};
} // namespace couchrest
