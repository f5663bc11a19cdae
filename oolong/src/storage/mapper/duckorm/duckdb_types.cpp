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

#include "storage/mapper/duckorm/duckdb_types.hpp"

#include <duckdb.h>

#include <cstring>
#include <stdexcept>

namespace duckorm {
void PreparedStatement::RecycleResources() {
  if (stmt_) {
    duckdb_destroy_prepare(&stmt_);
    stmt_ = nullptr;
  }
  duckdb_destroy_result(&result_);
  std::memset(&result_, 0, sizeof(result_));
}

PreparedStatement::PreparedStatement(duckdb_connection con) : con_(con) {
  std::memset(&result_, 0, sizeof(result_));
}

PreparedStatement::PreparedStatement(duckdb_connection con, const std::string& prepare_query)
    : con_(con) {
  std::memset(&result_, 0, sizeof(result_));
  GetStmtGuard(prepare_query);
}

PreparedStatement::~PreparedStatement() { RecycleResources(); }

auto PreparedStatement::GetStmtGuard(const std::string& prepare_query)
    -> duckdb_prepared_statement& {
  if (stmt_) {
    duckdb_destroy_prepare(&stmt_);
    stmt_ = nullptr;
  }
  if (duckdb_prepare(con_, prepare_query.c_str(), &stmt_) != DuckDBSuccess) {
    const char* err = duckdb_prepare_error(stmt_);
    std::string msg = "PreparedStatement failed";
    if (err && std::strlen(err) > 0) {
      msg += ": ";
      msg += err;
    }
    RecycleResources();
    throw std::runtime_error(msg);
  }
  return stmt_;
}

auto TakeString(VarTypes& cell) -> std::unique_ptr<std::string> {
  if (std::holds_alternative<std::monostate>(cell)) {
    return nullptr;
  }
  auto value = std::get_if<std::unique_ptr<std::string>>(&cell);
  if (value == nullptr) {
    throw std::runtime_error("Encounting unmatching types when parsing a VARCHAR cell");
  }
  return std::move(*value);
}

auto TakeInt64(const VarTypes& cell) -> int64_t {
  auto value = std::get_if<int64_t>(&cell);
  if (value == nullptr) {
    throw std::runtime_error("Encounting unmatching types when parsing a BIGINT cell");
  }
  return *value;
}

auto TakeNullableInt64(const VarTypes& cell) -> std::optional<int64_t> {
  if (std::holds_alternative<std::monostate>(cell)) {
    return std::nullopt;
  }
  return TakeInt64(cell);
}

auto TakeBool(const VarTypes& cell) -> bool {
  if (std::holds_alternative<std::monostate>(cell)) {
    return false;
  }
  auto value = std::get_if<bool>(&cell);
  if (value == nullptr) {
    throw std::runtime_error("Encounting unmatching types when parsing a BOOLEAN cell");
  }
  return *value;
}

void PreparedStatement::Execute() {
  if (duckdb_execute_prepared(stmt_, &result_) != DuckDBSuccess) {
    const char* err = duckdb_result_error(&result_);
    throw std::runtime_error(err ? err : "duckdb_execute_prepared failed");
  }
}
}  // namespace duckorm
