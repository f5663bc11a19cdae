//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <duckdb.h>

#include <filesystem>
#include <string>

#include "controller_types.hpp"
#include "type/type.hpp"

namespace oolong {
class DBController {
 private:
  duckdb_database              db_ = nullptr;

  file_path_t                  db_path_;

  constexpr static const char* init_table_query =
      "CREATE TABLE IF NOT EXISTS Photograph (id BIGINT PRIMARY KEY, content_hash VARCHAR "
      "UNIQUE, stored_image VARCHAR, capture_time TIMESTAMP, camera_model VARCHAR, has_errors "
      "BOOLEAN DEFAULT FALSE, created_at TIMESTAMP, updated_at TIMESTAMP);"
      "CREATE TABLE IF NOT EXISTS PhotoPath (id BIGINT PRIMARY KEY, path VARCHAR NOT NULL, "
      "device VARCHAR NOT NULL, size BIGINT, file_created_at TIMESTAMP, file_modified_at "
      "TIMESTAMP, photograph_id BIGINT, created_at TIMESTAMP, updated_at TIMESTAMP, "
      "UNIQUE (path, device));";

 public:
  /**
   * @brief Open (or create) the catalog database. Tables are created when missing, an
   *        existing catalog is opened as is.
   *
   * @param db_path ":memory:" opens a private in-memory catalog
   */
  explicit DBController(const file_path_t& db_path);
  ~DBController();

  DBController(const DBController&)            = delete;
  DBController& operator=(const DBController&) = delete;

  void InitializeDB();

  auto GetConnectionGuard() -> ConnectionGuard;
  auto GetPath() const -> const file_path_t& { return db_path_; }
};
};  // namespace oolong
