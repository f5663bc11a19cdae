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

#include <cstdint>
#include <format>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"

namespace oolong {
template <typename Derived, typename Mappable, typename ID>
class MapperInterface {
 public:
  duckdb_connection conn_;

  explicit MapperInterface(duckdb_connection conn) : conn_(conn) {}

  /**
   * @brief Insert a new record into the table
   *
   * @param obj
   */
  void Insert(const Mappable& obj) {
    duckorm::insert(conn_, Derived::TableName(), &obj, Derived::FieldDesc());
  }

  /**
   * @brief Remove a record from the table by its primary key
   *
   * @param remove_id
   */
  void Remove(const ID remove_id) {
    std::string remove_clause = std::format(Derived::PrimeKeyClause(), remove_id);
    duckorm::remove(conn_, Derived::TableName(), remove_clause.c_str());
  }

  /**
   * @brief Get records from the table by a SQL predicate with "?" placeholders
   *
   * @param where_clause
   * @param params
   * @return std::vector<Mappable>
   */
  auto Get(const char* where_clause, std::span<const std::string> params = {})
      -> std::vector<Mappable> {
    auto raw = duckorm::select(conn_, Derived::TableName(), Derived::FieldDesc(), where_clause,
                               params);
    std::vector<Mappable> result;
    result.reserve(raw.size());
    for (auto& row : raw) {
      result.emplace_back(Derived::FromRawData(std::move(row)));
    }
    return result;
  }

  /**
   * @brief Write the mutable columns of a record, identified by its primary key. Key and
   *        uniqueness columns are never rewritten.
   *
   * @param target_id
   * @param updated
   */
  void Update(const ID target_id, const Mappable& updated) {
    std::string where_clause = std::format(Derived::PrimeKeyClause(), target_id);
    duckorm::update(conn_, Derived::TableName(), &updated, Derived::UpdateFieldDesc(),
                    where_clause.c_str());
  }

  auto Count() -> int64_t {
    return duckorm::select_scalar(conn_,
                                  std::format("SELECT COUNT(*) FROM {};", Derived::TableName()));
  }

  auto MaxId() -> ID {
    return static_cast<ID>(
        duckorm::select_scalar(conn_, std::format("SELECT MAX(id) FROM {};", Derived::TableName())));
  }
};

template <typename Derived>
struct FieldReflectable {
 public:
  using FieldArrayType = std::span<const duckorm::DuckFieldDesc>;
  static constexpr FieldArrayType FieldDesc() { return Derived::field_descs_; }
  static constexpr FieldArrayType UpdateFieldDesc() { return Derived::update_field_descs_; }
  static constexpr uint32_t       FieldCount() { return Derived::field_count_; }
  static constexpr const char*    TableName() { return Derived::table_name_; }
  static constexpr const char*    PrimeKeyClause() { return Derived::prime_key_clause_; }
};
};  // namespace oolong
