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

#include "storage/controller/db_controller.hpp"

#include <duckdb.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

#include "utils/string/convert.hpp"

namespace oolong {
/**
 * @brief Construct a new DBController::DBController object
 *
 * @param db_path
 */
DBController::DBController(const file_path_t& db_path) : db_path_(db_path) { InitializeDB(); }

/**
 * @brief Destroy the DBController::DBController object
 *
 */
DBController::~DBController() {
  if (db_) {
    duckdb_close(&db_);
  }
}

/**
 * @brief Get a connection guard for the database.
 *
 * @return ConnectionGuard
 */
auto DBController::GetConnectionGuard() -> ConnectionGuard {
  ConnectionGuard guard{nullptr};

  if (duckdb_connect(db_, &guard.conn_) != DuckDBSuccess) {
    throw std::runtime_error("DB cannot be connected");
  }

  return guard;
}

/**
 * @brief Initialize the database by creating necessary tables.
 *
 */
void DBController::InitializeDB() {
  std::string utf8_str = conv::ToValidUtf8(db_path_.string());
  if (db_path_ != ":memory:" && db_path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }
  char* open_error = nullptr;
  if (duckdb_open_ext(utf8_str.c_str(), &db_, nullptr, &open_error) != DuckDBSuccess) {
    std::string message = "DB cannot be opened at '" + utf8_str + "'";
    if (open_error) {
      message += ": ";
      message += open_error;
      duckdb_free(open_error);
    }
    throw std::runtime_error(message);
  }

  auto          guard = GetConnectionGuard();

  duckdb_result result;

  // Run the SQL query to create the tables
  if (duckdb_query(guard.conn_, init_table_query, &result) != DuckDBSuccess) {
    const char* err           = duckdb_result_error(&result);
    std::string error_message = err ? err : "Catalog tables cannot be created";
    duckdb_destroy_result(&result);
    throw std::runtime_error(error_message);
  }
  duckdb_destroy_result(&result);
  spdlog::debug("Catalog opened at '{}'", utf8_str);
}

};  // namespace oolong
