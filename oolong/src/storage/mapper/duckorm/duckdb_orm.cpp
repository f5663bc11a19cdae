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

#include "storage/mapper/duckorm/duckdb_orm.hpp"

#include <duckdb.h>

#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace duckorm {
namespace {
void CheckBind(duckdb_state state, const char* field_name) {
  if (state != DuckDBSuccess) {
    throw std::runtime_error(std::string("Failed to bind field ") + field_name);
  }
}

void BindField(duckdb_prepared_statement stmt, idx_t index, const void* obj,
               const DuckFieldDesc& field) {
  const char* ptr = reinterpret_cast<const char*>(obj) + field.offset;
  switch (field.type) {
    case DuckDBType::INT64: {
      int64_t value = *reinterpret_cast<const int64_t*>(ptr);
      CheckBind(duckdb_bind_int64(stmt, index, value), field.name);
      break;
    }
    case DuckDBType::NULLABLE_INT64: {
      const auto& value = *reinterpret_cast<const std::optional<int64_t>*>(ptr);
      CheckBind(value ? duckdb_bind_int64(stmt, index, *value) : duckdb_bind_null(stmt, index),
                field.name);
      break;
    }
    case DuckDBType::BOOLEAN: {
      bool value = *reinterpret_cast<const bool*>(ptr);
      CheckBind(duckdb_bind_boolean(stmt, index, value), field.name);
      break;
    }
    case DuckDBType::TIMESTAMP:
    case DuckDBType::VARCHAR: {
      const auto& member = *reinterpret_cast<const std::unique_ptr<std::string>*>(ptr);
      CheckBind(member ? duckdb_bind_varchar(stmt, index, member->c_str())
                       : duckdb_bind_null(stmt, index),
                field.name);
      break;
    }
    default:
      throw std::runtime_error("Unsupported DuckFieldType in BindField()");
  }
}

void BindParams(duckdb_prepared_statement stmt, idx_t first_index,
                std::span<const std::string> params) {
  for (size_t i = 0; i < params.size(); ++i) {
    CheckBind(duckdb_bind_varchar(stmt, first_index + i, params[i].c_str()), "where parameter");
  }
}

auto ReadCell(duckdb_result& result, idx_t col, idx_t row, DuckDBType type) -> VarTypes {
  if (duckdb_value_is_null(&result, col, row)) {
    return std::monostate{};
  }
  switch (type) {
    case DuckDBType::INT64:
    case DuckDBType::NULLABLE_INT64:
      return duckdb_value_int64(&result, col, row);
    case DuckDBType::BOOLEAN:
      return duckdb_value_boolean(&result, col, row);
    case DuckDBType::VARCHAR:
    case DuckDBType::TIMESTAMP: {
      char* value = duckdb_value_varchar(&result, col, row);
      auto  out   = std::make_unique<std::string>(value ? value : "");
      duckdb_free(value);
      return out;
    }
    default:
      throw std::runtime_error("Unsupported DuckFieldType in select()");
  }
}
}  // namespace

void insert(duckdb_connection conn, const char* table, const void* obj,
            std::span<const DuckFieldDesc> fields) {
  std::ostringstream sql;
  sql << "INSERT INTO " << table << " (";
  for (size_t i = 0; i < fields.size(); ++i) {
    sql << fields[i].name;
    if (i < fields.size() - 1) {
      sql << ", ";
    }
  }
  sql << ") VALUES (";
  for (size_t i = 0; i < fields.size(); ++i) {
    sql << "?";
    if (i < fields.size() - 1) {
      sql << ", ";
    }
  }
  sql << ");";

  PreparedStatement insert_pre(conn, sql.str());
  for (size_t i = 0; i < fields.size(); ++i) {
    BindField(insert_pre.stmt_, i + 1, obj, fields[i]);
  }
  insert_pre.Execute();
}

void update(duckdb_connection conn, const char* table, const void* obj,
            std::span<const DuckFieldDesc> fields, const char* where_clause,
            std::span<const std::string> params) {
  std::ostringstream sql;
  sql << "UPDATE " << table << " SET ";
  for (size_t i = 0; i < fields.size(); ++i) {
    sql << fields[i].name << " = ?";
    if (i < fields.size() - 1) {
      sql << ", ";
    }
  }
  sql << " WHERE " << where_clause << ";";

  PreparedStatement update_pre(conn, sql.str());
  for (size_t i = 0; i < fields.size(); ++i) {
    BindField(update_pre.stmt_, i + 1, obj, fields[i]);
  }
  BindParams(update_pre.stmt_, fields.size() + 1, params);
  update_pre.Execute();
}

void remove(duckdb_connection conn, const char* table, const char* where_clause,
            std::span<const std::string> params) {
  std::ostringstream sql;
  sql << "DELETE FROM " << table << " WHERE " << where_clause << ";";

  PreparedStatement delete_pre(conn, sql.str());
  BindParams(delete_pre.stmt_, 1, params);
  delete_pre.Execute();
}

std::vector<std::vector<VarTypes>> select(duckdb_connection conn, const char* table,
                                          std::span<const DuckFieldDesc> fields,
                                          const char*                    where_clause,
                                          std::span<const std::string>   params) {
  std::ostringstream sql;
  sql << "SELECT ";
  for (size_t i = 0; i < fields.size(); ++i) {
    sql << fields[i].name;
    if (i < fields.size() - 1) {
      sql << ", ";
    }
  }
  sql << " FROM " << table << " WHERE " << where_clause << ";";

  PreparedStatement select_pre(conn, sql.str());
  BindParams(select_pre.stmt_, 1, params);
  select_pre.Execute();

  if (duckdb_column_count(&select_pre.result_) != fields.size()) {
    throw std::runtime_error("Column count mismatch in select query");
  }

  std::vector<std::vector<VarTypes>> results;
  idx_t                              row_count = duckdb_row_count(&select_pre.result_);
  results.resize(row_count);
  for (idx_t i = 0; i < row_count; ++i) {
    results[i].reserve(fields.size());
    for (size_t j = 0; j < fields.size(); ++j) {
      results[i].emplace_back(ReadCell(select_pre.result_, j, i, fields[j].type));
    }
  }
  return results;
}

int64_t select_scalar(duckdb_connection conn, const std::string& sql) {
  PreparedStatement scalar_pre(conn, sql);
  scalar_pre.Execute();
  if (duckdb_row_count(&scalar_pre.result_) == 0 ||
      duckdb_value_is_null(&scalar_pre.result_, 0, 0)) {
    return 0;
  }
  return duckdb_value_int64(&scalar_pre.result_, 0, 0);
}

void execute(duckdb_connection conn, const std::string& sql) {
  duckdb_result result;
  if (duckdb_query(conn, sql.c_str(), &result) != DuckDBSuccess) {
    const char* err           = duckdb_result_error(&result);
    std::string error_message = err ? err : "duckdb_query failed";
    duckdb_destroy_result(&result);
    throw std::runtime_error(error_message);
  }
  duckdb_destroy_result(&result);
}
}  // namespace duckorm
