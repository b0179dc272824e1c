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

#include <tl/expected.hpp>

#include <string>
#include <string_view>

namespace couchrest
{
class document_path;
class design_document_path;

/**
 * Path of the database, rendered as "/{db}".
 *
 * All path types hold decoded logical segments. Each segment is non-empty and has no "/". The
 * rendered form percent-encodes each segment, and @ref parse of the rendered form gives back an
 * equal path.
 *
 * @since 1.0.0
 * @committed
 */
class database_path
{
public:
  static auto make(std::string database) -> tl::expected<database_path, errors::path_parse>;
  static auto parse(std::string_view path) -> tl::expected<database_path, errors::path_parse>;

  [[nodiscard]] auto name() const -> const std::string&
  {
    return name_;
  }

  /**
   * @return path of the document with given id in this database
   */
  [[nodiscard]] auto document(std::string id) const
    -> tl::expected<document_path, errors::path_parse>;

  /**
   * @param name name of the design document without "_design/" prefix
   */
  [[nodiscard]] auto design_document(std::string name) const
    -> tl::expected<design_document_path, errors::path_parse>;

  [[nodiscard]] auto to_string() const -> std::string;

  auto operator==(const database_path& other) const -> bool;
  auto operator!=(const database_path& other) const -> bool;
  auto operator<(const database_path& other) const -> bool;

private:
  friend class document_path;
  friend class attachment_path;
  friend class design_document_path;
  friend class view_path;

  explicit database_path(std::string name);

  std::string name_;
};

class attachment_path;

/**
 * Path of the document, rendered as "/{db}/{doc}".
 *
 * @since 1.0.0
 * @committed
 */
class document_path
{
public:
  static auto make(std::string database, std::string id)
    -> tl::expected<document_path, errors::path_parse>;
  static auto parse(std::string_view path) -> tl::expected<document_path, errors::path_parse>;

  [[nodiscard]] auto database_name() const -> const std::string&
  {
    return database_;
  }

  [[nodiscard]] auto id() const -> const std::string&
  {
    return id_;
  }

  [[nodiscard]] auto database() const -> database_path;

  [[nodiscard]] auto attachment(std::string name) const
    -> tl::expected<attachment_path, errors::path_parse>;

  [[nodiscard]] auto to_string() const -> std::string;

  auto operator==(const document_path& other) const -> bool;
  auto operator!=(const document_path& other) const -> bool;
  auto operator<(const document_path& other) const -> bool;

private:
  friend class attachment_path;

  document_path(std::string database, std::string id);

  std::string database_;
  std::string id_;
};

/**
 * Path of the document attachment, rendered as "/{db}/{doc}/{attachment}".
 *
 * @since 1.0.0
 * @committed
 */
class attachment_path
{
public:
  static auto make(std::string database, std::string id, std::string name)
    -> tl::expected<attachment_path, errors::path_parse>;
  static auto parse(std::string_view path) -> tl::expected<attachment_path, errors::path_parse>;

  [[nodiscard]] auto database_name() const -> const std::string&
  {
    return database_;
  }

  [[nodiscard]] auto document_id() const -> const std::string&
  {
    return id_;
  }

  [[nodiscard]] auto name() const -> const std::string&
  {
    return name_;
  }

  [[nodiscard]] auto database() const -> database_path;
  [[nodiscard]] auto document() const -> document_path;

  [[nodiscard]] auto to_string() const -> std::string;

  auto operator==(const attachment_path& other) const -> bool;
  auto operator!=(const attachment_path& other) const -> bool;
  auto operator<(const attachment_path& other) const -> bool;

private:
  attachment_path(std::string database, std::string id, std::string name);

  std::string database_;
  std::string id_;
  std::string name_;
};

class view_path;

/**
 * Path of the design document, rendered as "/{db}/_design/{ddoc}".
 *
 * @since 1.0.0
 * @committed
 */
class design_document_path
{
public:
  static auto make(std::string database, std::string name)
    -> tl::expected<design_document_path, errors::path_parse>;
  static auto parse(std::string_view path)
    -> tl::expected<design_document_path, errors::path_parse>;

  [[nodiscard]] auto database_name() const -> const std::string&
  {
    return database_;
  }

  [[nodiscard]] auto name() const -> const std::string&
  {
    return name_;
  }

  [[nodiscard]] auto database() const -> database_path;

  [[nodiscard]] auto view(std::string name) const -> tl::expected<view_path, errors::path_parse>;

  [[nodiscard]] auto to_string() const -> std::string;

  auto operator==(const design_document_path& other) const -> bool;
  auto operator!=(const design_document_path& other) const -> bool;
  auto operator<(const design_document_path& other) const -> bool;

private:
  friend class view_path;

  design_document_path(std::string database, std::string name);

  std::string database_;
  std::string name_;
};

/**
 * Path of the view, rendered as "/{db}/_design/{ddoc}/_view/{view}".
 *
 * @since 1.0.0
 * @committed
 */
class view_path
{
public:
  static auto make(std::string database, std::string design_document, std::string name)
    -> tl::expected<view_path, errors::path_parse>;
  static auto parse(std::string_view path) -> tl::expected<view_path, errors::path_parse>;

  [[nodiscard]] auto database_name() const -> const std::string&
  {
    return database_;
  }

  [[nodiscard]] auto design_document_name() const -> const std::string&
  {
    return design_document_;
  }

  [[nodiscard]] auto name() const -> const std::string&
  {
    return name_;
  }

  [[nodiscard]] auto database() const -> database_path;
  [[nodiscard]] auto design_document() const -> design_document_path;

  [[nodiscard]] auto to_string() const -> std::string;

  auto operator==(const view_path& other) const -> bool;
  auto operator!=(const view_path& other) const -> bool;
  auto operator<(const view_path& other) const -> bool;

private:
  view_path(std::string database, std::string design_document, std::string name);

  std::string database_;
  std::string design_document_;
  std::string name_;
};
} // namespace couchrest
