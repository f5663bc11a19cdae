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

#include <span>
#include <string>
#include <vector>

#include "duckdb_types.hpp"

namespace duckorm {
// Where clauses use "?" placeholders, filled from params in order as VARCHAR values.
// Placeholders of field values come first in update().
void insert(duckdb_connection conn, const char* table, const void* obj,
            std::span<const DuckFieldDesc> fields);

void update(duckdb_connection conn, const char* table, const void* obj,
            std::span<const DuckFieldDesc> fields, const char* where_clause,
            std::span<const std::string> params = {});

void remove(duckdb_connection conn, const char* table, const char* where_clause,
            std::span<const std::string> params = {});

std::vector<std::vector<VarTypes>> select(duckdb_connection conn, const char* table,
                                          std::span<const DuckFieldDesc> fields,
                                          const char*                    where_clause,
                                          std::span<const std::string>   params = {});

// Single BIGINT produced by a scalar query such as COUNT(*) or MAX(id), 0 when NULL
int64_t select_scalar(duckdb_connection conn, const std::string& sql);

void execute(duckdb_connection conn, const std::string& sql);
}  // namespace duckorm
