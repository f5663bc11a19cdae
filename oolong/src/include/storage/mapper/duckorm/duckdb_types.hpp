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

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace duckorm {
// VARCHAR and TIMESTAMP fields are std::unique_ptr<std::string>, a null pointer maps to NULL.
// NULLABLE_INT64 fields are std::optional<int64_t>.
enum class DuckDBType {
  INT64,
  NULLABLE_INT64,
  VARCHAR,
  BOOLEAN,
  TIMESTAMP,
};

class PreparedStatement {
 private:
  void RecycleResources();

 public:
  duckdb_result             result_;
  duckdb_prepared_statement stmt_ = nullptr;
  duckdb_connection         con_;

  explicit PreparedStatement(duckdb_connection con);
  PreparedStatement(duckdb_connection con, const std::string& prepare_query);
  ~PreparedStatement();

  PreparedStatement(const PreparedStatement&)            = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;

  auto GetStmtGuard(const std::string& prepare_query) -> duckdb_prepared_statement&;

  // Execute the prepared statement, throwing with the DuckDB error on failure
  void Execute();
};

struct DuckFieldDesc {
  const char* name;
  DuckDBType  type;
  size_t      offset;
};

#define FIELD(type, field, field_type) \
  duckorm::DuckFieldDesc { #field, duckorm::DuckDBType::field_type, offsetof(type, field) }

// std::monostate stands for a NULL cell
using VarTypes = std::variant<std::monostate, int64_t, bool, std::unique_ptr<std::string>>;

// Cell accessors for FromRawData. A type mismatch means the schema and the field
// descriptors disagree.
auto TakeString(VarTypes& cell) -> std::unique_ptr<std::string>;
auto TakeInt64(const VarTypes& cell) -> int64_t;
auto TakeNullableInt64(const VarTypes& cell) -> std::optional<int64_t>;
auto TakeBool(const VarTypes& cell) -> bool;
};  // namespace duckorm
