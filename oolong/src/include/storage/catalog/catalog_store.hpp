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

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "catalog/photo_path.hpp"
#include "catalog/photograph.hpp"
#include "storage/controller/db_controller.hpp"
#include "storage/service/photo_path/photo_path_service.hpp"
#include "storage/service/photograph/photograph_service.hpp"
#include "type/type.hpp"
#include "utils/id/id_generator.hpp"

namespace oolong {
/**
 * @brief Record store of the catalog. Every call runs inside the transaction opened by
 *        BeginTransaction when one is active. Failed statements throw std::runtime_error.
 */
class CatalogStore {
 public:
  virtual ~CatalogStore() = default;

  virtual auto FindPhotographByHash(const std::string& content_hash)
      -> std::optional<Photograph>                                            = 0;
  virtual auto GetPhotograph(photograph_id_t id) -> std::optional<Photograph> = 0;

  /**
   * @brief Persist a new photograph. Assigns id_, created_at_ and updated_at_ on the
   *        passed object.
   */
  virtual auto CreatePhotograph(Photograph& photograph) -> photograph_id_t    = 0;

  // Write back the mutable fields of a persisted photograph and stamp updated_at_
  virtual void UpdatePhotograph(Photograph& photograph)                       = 0;

  // Paths referencing the photograph keep existing with a null reference
  virtual void RemovePhotograph(photograph_id_t id)                           = 0;

  virtual auto FindPath(const std::string& path, const device_id_t& device)
      -> std::optional<PhotoPath>                                             = 0;

  /**
   * @brief Insert a path, or update size, file times and the photograph reference in place
   *        when (path_, device_) already exists. Assigns id_ and the bookkeeping times.
   */
  virtual auto CreateOrUpdatePath(PhotoPath& path) -> photo_path_id_t         = 0;

  virtual auto GetPathsOfPhotograph(photograph_id_t id) -> std::vector<PhotoPath> = 0;

  virtual auto CountPhotographs() -> int64_t                                  = 0;
  virtual auto CountPaths() -> int64_t                                        = 0;

  virtual void BeginTransaction()                                             = 0;
  virtual void Commit()                                                       = 0;
  virtual void Rollback()                                                     = 0;
};

/**
 * @brief Scope of one catalog transaction. Rolls back on destruction unless committed.
 */
class TransactionGuard {
 public:
  explicit TransactionGuard(CatalogStore& store);
  ~TransactionGuard();

  TransactionGuard(const TransactionGuard&)            = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;

  void Commit();
  void Rollback();
  auto IsActive() const -> bool { return active_; }

 private:
  CatalogStore& store_;
  bool          active_ = false;
};

class DuckDBCatalogStore final : public CatalogStore {
 public:
  /**
   * @brief Open the catalog at db_path, creating it when missing.
   *
   * @param db_path
   */
  explicit DuckDBCatalogStore(const file_path_t& db_path);

  auto FindPhotographByHash(const std::string& content_hash) -> std::optional<Photograph> override;
  auto GetPhotograph(photograph_id_t id) -> std::optional<Photograph> override;
  auto CreatePhotograph(Photograph& photograph) -> photograph_id_t override;
  void UpdatePhotograph(Photograph& photograph) override;
  void RemovePhotograph(photograph_id_t id) override;

  auto FindPath(const std::string& path, const device_id_t& device)
      -> std::optional<PhotoPath> override;
  auto CreateOrUpdatePath(PhotoPath& path) -> photo_path_id_t override;
  auto GetPathsOfPhotograph(photograph_id_t id) -> std::vector<PhotoPath> override;

  auto CountPhotographs() -> int64_t override;
  auto CountPaths() -> int64_t override;

  void BeginTransaction() override;
  void Commit() override;
  void Rollback() override;

 private:
  std::unique_ptr<DBController>    controller_;
  ConnectionGuard                  guard_;
  PhotographService                photograph_service_;
  PhotoPathService                 photo_path_service_;

  IncrID::IDGenerator<int64_t>     photograph_ids_{0};
  IncrID::IDGenerator<int64_t>     photo_path_ids_{0};

  bool                             in_transaction_ = false;
};
};  // namespace oolong
