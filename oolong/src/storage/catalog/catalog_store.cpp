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

#include "storage/catalog/catalog_store.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>
#include <utility>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "utils/clock/time_provider.hpp"

namespace oolong {
TransactionGuard::TransactionGuard(CatalogStore& store) : store_(store) {
  store_.BeginTransaction();
  active_ = true;
}

TransactionGuard::~TransactionGuard() {
  if (!active_) return;
  try {
    store_.Rollback();
  } catch (const std::exception& e) {
    spdlog::error("Rollback failed: {}", e.what());
  }
}

void TransactionGuard::Commit() {
  if (!active_) {
    throw std::logic_error("Transaction is no longer active");
  }
  // A failed commit leaves the transaction for the destructor to roll back
  store_.Commit();
  active_ = false;
}

void TransactionGuard::Rollback() {
  if (!active_) return;
  active_ = false;
  store_.Rollback();
}

DuckDBCatalogStore::DuckDBCatalogStore(const file_path_t& db_path)
    : controller_(std::make_unique<DBController>(db_path)),
      guard_(controller_->GetConnectionGuard()),
      photograph_service_(guard_.conn_),
      photo_path_service_(guard_.conn_) {
  photograph_ids_.SetStartID(photograph_service_.MaxId());
  photo_path_ids_.SetStartID(photo_path_service_.MaxId());
}

auto DuckDBCatalogStore::FindPhotographByHash(const std::string& content_hash)
    -> std::optional<Photograph> {
  return photograph_service_.GetPhotographByHash(content_hash);
}

auto DuckDBCatalogStore::GetPhotograph(photograph_id_t id) -> std::optional<Photograph> {
  return photograph_service_.GetPhotographById(id);
}

auto DuckDBCatalogStore::CreatePhotograph(Photograph& photograph) -> photograph_id_t {
  Photograph staged  = photograph;
  staged.id_         = photograph_ids_.GenerateID();
  staged.created_at_ = TimeProvider::Now();
  staged.updated_at_ = staged.created_at_;
  photograph_service_.Insert(staged);
  photograph = std::move(staged);
  return photograph.id_;
}

void DuckDBCatalogStore::UpdatePhotograph(Photograph& photograph) {
  if (!photograph.IsPersisted()) {
    throw std::invalid_argument("Cannot update a photograph that was never persisted");
  }
  Photograph staged  = photograph;
  staged.updated_at_ = TimeProvider::Now();
  photograph_service_.Update(staged, staged.id_);
  photograph = std::move(staged);
}

void DuckDBCatalogStore::RemovePhotograph(photograph_id_t id) {
  photo_path_service_.ClearPhotographReference(id);
  photograph_service_.RemoveById(id);
}

auto DuckDBCatalogStore::FindPath(const std::string& path, const device_id_t& device)
    -> std::optional<PhotoPath> {
  return photo_path_service_.GetByLocation(path, device);
}

auto DuckDBCatalogStore::CreateOrUpdatePath(PhotoPath& path) -> photo_path_id_t {
  auto now      = TimeProvider::Now();
  auto existing = photo_path_service_.GetByLocation(path.path_, path.device_);
  if (existing.has_value()) {
    PhotoPath staged   = path;
    staged.id_         = existing->id_;
    staged.created_at_ = existing->created_at_;
    staged.updated_at_ = now;
    photo_path_service_.Update(staged, staged.id_);
    path = std::move(staged);
    return path.id_;
  }

  PhotoPath staged   = path;
  staged.id_         = photo_path_ids_.GenerateID();
  staged.created_at_ = now;
  staged.updated_at_ = now;
  photo_path_service_.Insert(staged);
  path = std::move(staged);
  return path.id_;
}

auto DuckDBCatalogStore::GetPathsOfPhotograph(photograph_id_t id) -> std::vector<PhotoPath> {
  return photo_path_service_.GetByPhotograph(id);
}

auto DuckDBCatalogStore::CountPhotographs() -> int64_t { return photograph_service_.Count(); }

auto DuckDBCatalogStore::CountPaths() -> int64_t { return photo_path_service_.Count(); }

void DuckDBCatalogStore::BeginTransaction() {
  if (in_transaction_) {
    throw std::logic_error("A catalog transaction is already open");
  }
  duckorm::execute(guard_.conn_, "BEGIN TRANSACTION;");
  in_transaction_ = true;
}

void DuckDBCatalogStore::Commit() {
  if (!in_transaction_) {
    throw std::logic_error("No catalog transaction to commit");
  }
  duckorm::execute(guard_.conn_, "COMMIT;");
  in_transaction_ = false;
}

void DuckDBCatalogStore::Rollback() {
  if (!in_transaction_) return;
  in_transaction_ = false;
  duckorm::execute(guard_.conn_, "ROLLBACK;");
}
};  // namespace oolong
